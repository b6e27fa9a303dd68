#include <gtest/gtest.h>

#include "engine/core/errors.hpp"
#include "engine/evaluation/distribution.hpp"
#include "engine/evaluation/sampler.hpp"

#include <algorithm>
#include <cstddef>
#include <vector>

using namespace procsim;

TEST(distribution, uniform_ppf_and_mean)
{
    const Distribution d = Distribution::uniform(80.0, 120.0);
    EXPECT_EQ(d.kind(), DistributionKind::Uniform);
    EXPECT_DOUBLE_EQ(d.ppf(0.0), 80.0);
    EXPECT_DOUBLE_EQ(d.ppf(0.25), 90.0);
    EXPECT_DOUBLE_EQ(d.ppf(1.0), 120.0);
    EXPECT_DOUBLE_EQ(d.mean(), 100.0);
    EXPECT_TRUE(d.contains(100.0));
    EXPECT_FALSE(d.contains(79.9));

    // Out-of-range quantiles are clamped.
    EXPECT_DOUBLE_EQ(d.ppf(-1.0), 80.0);
    EXPECT_DOUBLE_EQ(d.ppf(2.0), 120.0);
}

TEST(distribution, triangular_ppf_splits_at_mode)
{
    const Distribution d = Distribution::triangular(0.0, 1.0, 2.0);
    EXPECT_DOUBLE_EQ(d.ppf(0.5), 1.0);
    EXPECT_DOUBLE_EQ(d.ppf(0.0), 0.0);
    EXPECT_DOUBLE_EQ(d.ppf(1.0), 2.0);
    // F(x) = x^2 / 2 below the mode
    EXPECT_NEAR(d.ppf(0.125), 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(d.mean(), 1.0);

    const Distribution skew = Distribution::triangular(0.5, 0.6, 0.7);
    EXPECT_NEAR(skew.mean(), 0.6, 1e-12);
    EXPECT_EQ(skew.describe(), "Triangular(0.5, 0.6, 0.7)");
}

TEST(distribution, rejects_bad_parameters)
{
    EXPECT_THROW(Distribution::uniform(1.0, 1.0), ValidationError);
    EXPECT_THROW(Distribution::uniform(2.0, 1.0), ValidationError);
    EXPECT_THROW(Distribution::triangular(0.0, 3.0, 2.0), ValidationError);
}

TEST(sampler, latin_hypercube_fills_every_stratum)
{
    const std::size_t n = 10;
    const SampleMatrix m = unit_samples(n, 3, SamplingRule::LatinHypercube, 42);
    ASSERT_EQ(m.size(), n);

    for (std::size_t d = 0; d < 3; ++d) {
        std::vector<int> hits(n, 0);
        for (const auto& row : m) {
            ASSERT_EQ(row.size(), 3u);
            ASSERT_GE(row[d], 0.0);
            ASSERT_LT(row[d], 1.0);
            ++hits[static_cast<std::size_t>(row[d] * static_cast<double>(n))];
        }
        EXPECT_TRUE(std::all_of(hits.begin(), hits.end(), [](int h) { return h == 1; }));
    }
}

TEST(sampler, halton_uses_radical_inverse_in_prime_bases)
{
    const SampleMatrix m = unit_samples(4, 2, SamplingRule::Halton, 1);
    EXPECT_DOUBLE_EQ(m[0][0], 0.5);
    EXPECT_DOUBLE_EQ(m[1][0], 0.25);
    EXPECT_DOUBLE_EQ(m[2][0], 0.75);
    EXPECT_NEAR(m[0][1], 1.0 / 3.0, 1e-15);
    EXPECT_NEAR(m[1][1], 2.0 / 3.0, 1e-15);
    EXPECT_NEAR(m[2][1], 1.0 / 9.0, 1e-15);

    // Unscrambled: seed has no effect.
    EXPECT_EQ(m, unit_samples(4, 2, SamplingRule::Halton, 999));

    const std::vector<std::uint32_t> p = first_primes(5);
    EXPECT_EQ(p, (std::vector<std::uint32_t>{2, 3, 5, 7, 11}));
}

TEST(sampler, seed_determines_random_and_lhs)
{
    for (SamplingRule rule : {SamplingRule::Random, SamplingRule::LatinHypercube}) {
        const SampleMatrix a = unit_samples(16, 2, rule, 7);
        const SampleMatrix b = unit_samples(16, 2, rule, 7);
        const SampleMatrix c = unit_samples(16, 2, rule, 8);
        EXPECT_EQ(a, b) << to_string(rule);
        EXPECT_NE(a, c) << to_string(rule);
    }
}

TEST(sampler, rejects_empty_requests)
{
    EXPECT_THROW(unit_samples(0, 2, SamplingRule::Random, 1), ValidationError);
    EXPECT_THROW(unit_samples(2, 0, SamplingRule::Random, 1), ValidationError);
}

TEST(sampler, parses_rule_names)
{
    EXPECT_EQ(parse_sampling_rule("lhs"), SamplingRule::LatinHypercube);
    EXPECT_EQ(parse_sampling_rule("latin"), SamplingRule::LatinHypercube);
    EXPECT_EQ(parse_sampling_rule("mc"), SamplingRule::Random);
    EXPECT_EQ(parse_sampling_rule("halton"), SamplingRule::Halton);
    EXPECT_FALSE(parse_sampling_rule("sobol").has_value());
    EXPECT_STREQ(to_string(SamplingRule::Halton), "halton");
}
