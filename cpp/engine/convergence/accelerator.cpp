/*
================================================================================
Convergence: Recycle Accelerators (Implementation)
FILE: cpp/engine/convergence/accelerator.cpp
================================================================================
Purpose:
  - Fixed-point (damped), bounded Wegstein and Aitken updates of the
    recycle state vector.
================================================================================
*/

#include "engine/convergence/accelerator.hpp"

#include "engine/core/error.hpp"
#include "engine/core/numeric.hpp"

#include <cmath>

namespace procsim {

namespace {

constexpr double kTiny = 1e-12;

void require_same_size(const std::vector<double>& x, const std::vector<double>& gx) {
    PROCSIM_ENSURE(x.size() == gx.size(), ErrorCode::kInvalidArgument,
                   "accelerator: guess and update differ in size");
}

} // namespace

// ----------------------------- FixedPoint ------------------------------------

FixedPointAccelerator::FixedPointAccelerator(double relaxation_factor) : w_(relaxation_factor) {
    if (!is_finite(w_) || !(w_ > 0.0) || w_ > 1.0) {
        throw ValidationError("FixedPointAccelerator: relaxation_factor must be (0,1]");
    }
}

std::vector<double> FixedPointAccelerator::next_guess(const std::vector<double>& x,
                                                      const std::vector<double>& gx) {
    require_same_size(x, gx);
    if (w_ == 1.0) return gx;

    std::vector<double> out(gx.size());
    for (std::size_t i = 0; i < gx.size(); ++i) {
        out[i] = (1.0 - w_) * x[i] + w_ * gx[i];
    }
    return out;
}

// ----------------------------- Wegstein --------------------------------------

WegsteinAccelerator::WegsteinAccelerator(double lower_bound, double upper_bound)
    : lo_(lower_bound), hi_(upper_bound) {
    if (!(lo_ < hi_) || hi_ >= 1.0) {
        throw ValidationError("WegsteinAccelerator: bounds must satisfy lower < upper < 1");
    }
}

void WegsteinAccelerator::reset() {
    x_prev_.clear();
    gx_prev_.clear();
}

std::vector<double> WegsteinAccelerator::next_guess(const std::vector<double>& x,
                                                    const std::vector<double>& gx) {
    require_same_size(x, gx);

    if (x_prev_.size() != x.size()) {
        x_prev_ = x;
        gx_prev_ = gx;
        return gx;
    }

    std::vector<double> out(gx.size());
    for (std::size_t i = 0; i < gx.size(); ++i) {
        const double dx = x[i] - x_prev_[i];
        double q = 0.0;
        if (std::fabs(dx) > kTiny) {
            const double s = (gx[i] - gx_prev_[i]) / dx;
            if (is_finite(s) && std::fabs(s - 1.0) > kTiny) {
                q = clamp(s / (s - 1.0), lo_, hi_);
            }
        }
        out[i] = q * x[i] + (1.0 - q) * gx[i];
        if (!is_finite(out[i])) out[i] = gx[i];
    }

    x_prev_ = x;
    gx_prev_ = gx;
    return out;
}

// ----------------------------- Aitken ----------------------------------------

void AitkenAccelerator::reset() {
    x0_.clear();
    x1_.clear();
}

std::vector<double> AitkenAccelerator::next_guess(const std::vector<double>& x,
                                                  const std::vector<double>& gx) {
    require_same_size(x, gx);

    // Start a new substitution pair unless x is the g(x_n) handed out last time.
    if (x1_.size() != x.size() || x != x1_) {
        x0_ = x;
        x1_ = gx;
        return gx;
    }

    // x0_ = x_n, x1_ = x_{n+1}, gx = x_{n+2}
    std::vector<double> out(gx.size());
    for (std::size_t i = 0; i < gx.size(); ++i) {
        const double d1 = x1_[i] - x0_[i];
        const double d2 = gx[i] - 2.0 * x1_[i] + x0_[i];
        const double scale = std::max({std::fabs(gx[i]), std::fabs(x1_[i]), 1.0});
        if (std::fabs(d2) > kTiny * scale) {
            out[i] = x0_[i] - d1 * d1 / d2;
        } else {
            out[i] = gx[i];
        }
        if (!is_finite(out[i])) out[i] = gx[i];
    }

    reset();
    return out;
}

// ----------------------------- Factory ---------------------------------------

std::unique_ptr<RecycleAccelerator> make_accelerator(const ConvergenceSettings& cfg) {
    cfg.validate_or_throw();
    switch (cfg.relaxation_method) {
        case ConvergenceMethod::FixedPoint:
            return std::make_unique<FixedPointAccelerator>(cfg.relaxation_factor);
        case ConvergenceMethod::Wegstein:
            return std::make_unique<WegsteinAccelerator>(cfg.wegstein_lower_bound, cfg.wegstein_upper_bound);
        case ConvergenceMethod::Aitken:
            return std::make_unique<AitkenAccelerator>();
    }
    PROCSIM_THROW(ErrorCode::kInvalidArgument, "make_accelerator: unknown relaxation method");
}

} // namespace procsim
