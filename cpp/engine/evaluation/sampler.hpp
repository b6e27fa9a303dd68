// ============================================================================
// Evaluation: Unit-Cube Sampler
// File: sampler.hpp
// ============================================================================
//
// Purpose:
// - Generate n points in [0,1)^dims for Monte Carlo campaigns.
// - Rules:
//    - Random:         independent uniforms
//    - LatinHypercube: one point per stratum and dimension, strata shuffled
//    - Halton:         low-discrepancy radical inverse in the first dims primes
// - Deterministic RNG (xorshift64*) with explicit seed. Halton is
//   unscrambled and ignores the seed.
//
// ============================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace procsim {

using SampleMatrix = std::vector<std::vector<double>>;

enum class SamplingRule : std::uint8_t {
    Random = 0,
    LatinHypercube = 1,
    Halton = 2
};

const char* to_string(SamplingRule rule) noexcept;

// Accepts "random", "lhs"/"latin", "halton". Empty result when unknown.
std::optional<SamplingRule> parse_sampling_rule(const std::string& s);

// Deterministic RNG (xorshift64*).
class Rng64 final {
public:
    explicit Rng64(std::uint64_t seed) : s_(seed ? seed : 0x9e3779b97f4a7c15ull) {}

    std::uint64_t next_u64() noexcept {
        std::uint64_t x = s_;
        x ^= x >> 12;
        x ^= x << 25;
        x ^= x >> 27;
        s_ = x;
        return x * 2685821657736338717ull;
    }

    // Uniform in [0,1)
    double next_u01() noexcept {
        return static_cast<double>(next_u64() >> 11) * (1.0 / 9007199254740992.0); // 2^53
    }

    // Uniform integer in [0, n). n must be > 0.
    std::size_t next_index(std::size_t n) noexcept {
        return static_cast<std::size_t>(next_u64() % static_cast<std::uint64_t>(n));
    }

private:
    std::uint64_t s_;
};

// Radical inverse of i in the given base.
double radical_inverse(std::uint64_t i, std::uint32_t base) noexcept;

// First n primes (2, 3, 5, ...).
std::vector<std::uint32_t> first_primes(std::size_t n);

// n x dims matrix on [0,1). Throws ValidationError for n == 0 or dims == 0.
SampleMatrix unit_samples(std::size_t n, std::size_t dims, SamplingRule rule, std::uint64_t seed);

} // namespace procsim
