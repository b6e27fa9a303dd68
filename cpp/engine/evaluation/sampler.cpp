/*
================================================================================
Evaluation: Unit-Hypercube Samplers (Implementation)
FILE: cpp/engine/evaluation/sampler.cpp
================================================================================
Purpose:
  - Random, Latin hypercube and Halton designs on [0,1)^d.

Notes:
  - xorshift64* keeps every design reproducible from its seed.
================================================================================
*/

#include "engine/evaluation/sampler.hpp"

#include "engine/core/errors.hpp"

#include <numeric>
#include <utility>

namespace procsim {

namespace {

void fill_random(SampleMatrix& m, Rng64& rng) {
    for (auto& row : m) {
        for (double& v : row) v = rng.next_u01();
    }
}

void fill_latin_hypercube(SampleMatrix& m, std::size_t dims, Rng64& rng) {
    const std::size_t n = m.size();
    std::vector<std::size_t> strata(n);

    for (std::size_t d = 0; d < dims; ++d) {
        std::iota(strata.begin(), strata.end(), std::size_t{0});
        // Fisher-Yates
        for (std::size_t i = n; i > 1; --i) {
            std::swap(strata[i - 1], strata[rng.next_index(i)]);
        }
        for (std::size_t i = 0; i < n; ++i) {
            m[i][d] = (static_cast<double>(strata[i]) + rng.next_u01()) / static_cast<double>(n);
        }
    }
}

void fill_halton(SampleMatrix& m, std::size_t dims) {
    const std::vector<std::uint32_t> bases = first_primes(dims);
    for (std::size_t i = 0; i < m.size(); ++i) {
        // Index 0 maps to the origin in every base; start at 1.
        const std::uint64_t k = static_cast<std::uint64_t>(i) + 1;
        for (std::size_t d = 0; d < dims; ++d) {
            m[i][d] = radical_inverse(k, bases[d]);
        }
    }
}

} // namespace

const char* to_string(SamplingRule rule) noexcept {
    switch (rule) {
        case SamplingRule::Random:         return "random";
        case SamplingRule::LatinHypercube: return "lhs";
        case SamplingRule::Halton:         return "halton";
        default:                           return "unknown";
    }
}

std::optional<SamplingRule> parse_sampling_rule(const std::string& s) {
    if (s == "random" || s == "mc") return SamplingRule::Random;
    if (s == "lhs" || s == "latin") return SamplingRule::LatinHypercube;
    if (s == "halton") return SamplingRule::Halton;
    return std::nullopt;
}

double radical_inverse(std::uint64_t i, std::uint32_t base) noexcept {
    const double inv_base = 1.0 / static_cast<double>(base);
    double f = inv_base;
    double r = 0.0;
    while (i > 0) {
        r += f * static_cast<double>(i % base);
        i /= base;
        f *= inv_base;
    }
    return r;
}

std::vector<std::uint32_t> first_primes(std::size_t n) {
    std::vector<std::uint32_t> primes;
    primes.reserve(n);
    for (std::uint32_t c = 2; primes.size() < n; ++c) {
        bool prime = true;
        for (std::uint32_t p : primes) {
            if (p * p > c) break;
            if (c % p == 0) { prime = false; break; }
        }
        if (prime) primes.push_back(c);
    }
    return primes;
}

SampleMatrix unit_samples(std::size_t n, std::size_t dims, SamplingRule rule, std::uint64_t seed) {
    if (n == 0) throw ValidationError("unit_samples: n must be >= 1");
    if (dims == 0) throw ValidationError("unit_samples: dims must be >= 1");
    if (n > 10'000'000) throw ValidationError("unit_samples: n too large");

    SampleMatrix m(n, std::vector<double>(dims, 0.0));
    Rng64 rng(seed);

    switch (rule) {
        case SamplingRule::Random:
            fill_random(m, rng);
            break;
        case SamplingRule::LatinHypercube:
            fill_latin_hypercube(m, dims, rng);
            break;
        case SamplingRule::Halton:
            fill_halton(m, dims);
            break;
        default:
            throw ValidationError("unit_samples: unknown sampling rule");
    }
    return m;
}

} // namespace procsim
