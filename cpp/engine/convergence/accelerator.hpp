// ============================================================================
// Convergence: Recycle Guess Accelerators
// File: accelerator.hpp
// ============================================================================
//
// Purpose:
// - Pluggable update rule for the recycle (tear) stream guess between
//   iterations of System::converge().
// - State vectors are Stream::state_vector(): flows..., T, P.
//
// Strategies:
// - FixedPoint: x' = (1-w) x + w g(x)   (w = 1 -> direct substitution)
// - Wegstein:   per-component secant slope s, q = s/(s-1) clamped to bounds,
//               x' = q x + (1-q) g(x). First call is plain substitution.
// - Aitken:     two plain substitutions, then delta-squared extrapolation.
//
// Notes:
// - Accelerators hold history; System calls reset() at the start of every
//   converge() so warm starts never mix histories of different samples.
// - Non-negativity of flows is enforced by the caller.
//
// ============================================================================

#pragma once
#include "engine/core/settings.hpp"

#include <memory>
#include <vector>

namespace procsim {

class RecycleAccelerator {
public:
    virtual ~RecycleAccelerator() = default;

    virtual void reset() = 0;

    // x: guess fed into the pass, gx: value the pass produced.
    // Returns the next guess.
    virtual std::vector<double> next_guess(const std::vector<double>& x,
                                           const std::vector<double>& gx) = 0;

    virtual const char* name() const noexcept = 0;
};

class FixedPointAccelerator final : public RecycleAccelerator {
public:
    explicit FixedPointAccelerator(double relaxation_factor = 1.0);

    void reset() override {}
    std::vector<double> next_guess(const std::vector<double>& x,
                                   const std::vector<double>& gx) override;
    const char* name() const noexcept override { return "fixed-point"; }

private:
    double w_;
};

class WegsteinAccelerator final : public RecycleAccelerator {
public:
    WegsteinAccelerator(double lower_bound, double upper_bound);

    void reset() override;
    std::vector<double> next_guess(const std::vector<double>& x,
                                   const std::vector<double>& gx) override;
    const char* name() const noexcept override { return "wegstein"; }

private:
    double lo_;
    double hi_;
    std::vector<double> x_prev_;
    std::vector<double> gx_prev_;
};

class AitkenAccelerator final : public RecycleAccelerator {
public:
    void reset() override;
    std::vector<double> next_guess(const std::vector<double>& x,
                                   const std::vector<double>& gx) override;
    const char* name() const noexcept override { return "aitken"; }

private:
    // x_n and x_{n+1} = g(x_n) of the current substitution pair.
    std::vector<double> x0_;
    std::vector<double> x1_;
};

// Factory from settings (settings are validated here).
std::unique_ptr<RecycleAccelerator> make_accelerator(const ConvergenceSettings& cfg);

} // namespace procsim
