// ============================================================================
// Evaluation: Parameter Distributions
// File: distribution.hpp
// ============================================================================
//
// Purpose:
// - Uncertainty description for one Model parameter.
// - Supports:
//    - Uniform(lower, upper)
//    - Triangular(lower, mode, upper)
// - Sampling goes through ppf(u): the Model draws unit-cube points with the
//   chosen rule (random, LHS, Halton) and maps each column by inverse CDF.
//
// ============================================================================

#pragma once

#include <cstdint>
#include <string>

namespace procsim {

enum class DistributionKind : std::uint8_t {
    Uniform = 0,
    Triangular = 1
};

class Distribution final {
public:
    static Distribution uniform(double lower, double upper);
    static Distribution triangular(double lower, double mode, double upper);

    // Throws ValidationError.
    void validate() const;

    DistributionKind kind() const noexcept { return kind_; }
    double lower() const noexcept { return lower_; }
    double mode() const noexcept { return mode_; }
    double upper() const noexcept { return upper_; }

    // Inverse CDF; u is clamped to [0,1].
    double ppf(double u) const noexcept;

    double mean() const noexcept;
    bool contains(double x) const noexcept { return x >= lower_ && x <= upper_; }

    std::string describe() const;

private:
    Distribution(DistributionKind kind, double lower, double mode, double upper)
        : kind_(kind), lower_(lower), mode_(mode), upper_(upper) {}

    DistributionKind kind_;
    double lower_;
    double mode_;
    double upper_;
};

} // namespace procsim
