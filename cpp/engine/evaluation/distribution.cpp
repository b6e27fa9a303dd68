/*
================================================================================
Evaluation: Distributions (Implementation)
FILE: cpp/engine/evaluation/distribution.cpp
================================================================================
Purpose:
  - Inverse CDFs for uniform and triangular parameter distributions.
================================================================================
*/

#include "engine/evaluation/distribution.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/numeric.hpp"

#include <cmath>
#include <sstream>

namespace procsim {

Distribution Distribution::uniform(double lower, double upper) {
    Distribution d(DistributionKind::Uniform, lower, 0.5 * (lower + upper), upper);
    d.validate();
    return d;
}

Distribution Distribution::triangular(double lower, double mode, double upper) {
    Distribution d(DistributionKind::Triangular, lower, mode, upper);
    d.validate();
    return d;
}

void Distribution::validate() const {
    if (!is_finite(lower_) || !is_finite(mode_) || !is_finite(upper_)) {
        throw ValidationError("Distribution: bounds must be finite");
    }
    if (!(lower_ < upper_)) {
        throw ValidationError("Distribution: requires lower < upper");
    }
    if (kind_ == DistributionKind::Triangular && (mode_ < lower_ || mode_ > upper_)) {
        throw ValidationError("Distribution: triangular mode outside [lower, upper]");
    }
}

double Distribution::ppf(double u) const noexcept {
    u = is_finite(u) ? clamp(u, 0.0, 1.0) : 0.5;
    const double width = upper_ - lower_;

    if (kind_ == DistributionKind::Uniform) {
        return lower_ + u * width;
    }

    // Triangular: split at F(mode).
    const double Fc = (mode_ - lower_) / width;
    if (u < Fc) {
        return lower_ + std::sqrt(u * width * (mode_ - lower_));
    }
    return upper_ - std::sqrt((1.0 - u) * width * (upper_ - mode_));
}

double Distribution::mean() const noexcept {
    if (kind_ == DistributionKind::Uniform) return 0.5 * (lower_ + upper_);
    return (lower_ + mode_ + upper_) / 3.0;
}

std::string Distribution::describe() const {
    std::ostringstream oss;
    if (kind_ == DistributionKind::Uniform) {
        oss << "Uniform(" << lower_ << ", " << upper_ << ")";
    } else {
        oss << "Triangular(" << lower_ << ", " << mode_ << ", " << upper_ << ")";
    }
    return oss.str();
}

} // namespace procsim
