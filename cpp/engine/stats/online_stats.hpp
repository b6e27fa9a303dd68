// ============================================================================
// Stats: Streaming Accumulator for Metric Columns
// File: online_stats.hpp
// ============================================================================
//
// One accumulator per metric column of a Monte Carlo campaign. Successful
// samples are pushed; failed samples and non-finite values are counted as
// missing so a summary can report how much of the campaign it covers.
// Partial accumulators (e.g. per chunk of samples) combine with merge().
//
// ============================================================================

#pragma once
#include "engine/core/numeric.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace procsim::stats {

struct OnlineStats final {
    std::uint64_t n = 0;
    std::uint64_t missing = 0;
    double mean = 0.0;
    double m2 = 0.0; // running sum of squared deviations
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();

    void reset() noexcept { *this = OnlineStats{}; }

    void skip() noexcept { ++missing; }

    void push(double x) noexcept {
        if (!is_finite(x)) {
            skip();
            return;
        }
        ++n;
        lo = std::min(lo, x);
        hi = std::max(hi, x);

        const double d = x - mean;
        mean += d / static_cast<double>(n);
        m2 += d * (x - mean);
        if (!(m2 > 0.0)) m2 = 0.0;
    }

    // Chan et al. pairwise combination.
    void merge(const OnlineStats& o) noexcept {
        missing += o.missing;
        if (o.n == 0) return;
        if (n == 0) {
            const std::uint64_t keep = missing;
            *this = o;
            missing = keep;
            return;
        }
        const double na = static_cast<double>(n);
        const double nb = static_cast<double>(o.n);
        const double d = o.mean - mean;
        const double total = na + nb;
        mean += d * nb / total;
        m2 += o.m2 + d * d * na * nb / total;
        n += o.n;
        lo = std::min(lo, o.lo);
        hi = std::max(hi, o.hi);
    }

    std::uint64_t count() const noexcept { return n; }

    double variance_sample() const noexcept {
        return n < 2 ? 0.0 : m2 / static_cast<double>(n - 1);
    }

    double stddev_sample() const noexcept { return safe_sqrt(variance_sample(), 0.0); }

    double min() const noexcept { return n == 0 ? 0.0 : lo; }
    double max() const noexcept { return n == 0 ? 0.0 : hi; }
};

} // namespace procsim::stats
