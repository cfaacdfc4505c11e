// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#include <gtest/gtest.h>
#include "mwm/distributions.hpp"
#include "mwm/random_source.hpp"
#include "mwm/statistics.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace mwm {
namespace test {

TEST(StatisticsTest, MeanVarianceMeanSquare) {
    const std::vector<scalar_t> values = {1.0, 2.0, 3.0, 4.0};

    EXPECT_DOUBLE_EQ(statistics::mean(values), 2.5);
    EXPECT_DOUBLE_EQ(statistics::variance(values), 5.0 / 3.0);
    EXPECT_DOUBLE_EQ(statistics::mean_square(values), 7.5);
}

TEST(StatisticsTest, DegenerateSamples) {
    const std::vector<scalar_t> empty;
    const std::vector<scalar_t> single = {1.0};

    EXPECT_THROW(statistics::mean(empty), std::invalid_argument);
    EXPECT_THROW(statistics::mean_square(empty), std::invalid_argument);
    EXPECT_THROW(statistics::variance(single), std::invalid_argument);
    EXPECT_DOUBLE_EQ(statistics::mean(single), 1.0);
}

// Same seed, same stream
TEST(RandomSourceTest, SeededSourceIsReproducible) {
    Mt19937Source a(1234);
    Mt19937Source b(1234);
    Mt19937Source c(4321);

    bool differs = false;
    for (int i = 0; i < 16; ++i) {
        const auto x = a();
        EXPECT_EQ(x, b());
        differs = differs || (x != c());
    }
    EXPECT_TRUE(differs);
}

TEST(RandomSourceTest, FromEntropy) {
    auto source = Mt19937Source::from_entropy();
    ASSERT_NE(source, nullptr);
    (*source)();
}

TEST(GaussianTest, MomentsMatch) {
    Mt19937Source source(42);
    Gaussian gaussian(1.5, 0.25);

    std::vector<scalar_t> draws(20000);
    for (auto& x : draws) {
        x = gaussian.sample(source);
    }

    EXPECT_NEAR(statistics::mean(draws), 1.5, 0.01);
    EXPECT_NEAR(std::sqrt(statistics::variance(draws)), 0.25, 0.01);
}

TEST(GaussianTest, ZeroDeviationIsPointMass) {
    Mt19937Source source(42);
    Gaussian gaussian(3.0, 0.0);

    EXPECT_EQ(gaussian.sample(source), 3.0);
    EXPECT_EQ(gaussian.sample(source), 3.0);
}

TEST(GaussianTest, InvalidParameters) {
    EXPECT_THROW(Gaussian(0.0, -1.0), std::invalid_argument);
    EXPECT_THROW(Gaussian(std::numeric_limits<scalar_t>::quiet_NaN(), 1.0), std::invalid_argument);
    EXPECT_THROW(Gaussian(0.0, std::numeric_limits<scalar_t>::infinity()), std::invalid_argument);
}

// Symmetric multiplier stays in [-1, 1] with mean 0 and variance 1 / (2 beta + 1)
TEST(BetaTest, SymmetricMultiplier) {
    Mt19937Source source(7);
    const scalar_t shape = 2.0;
    Beta beta = Beta::symmetric_multiplier(shape);

    EXPECT_EQ(beta.low(), -1.0);
    EXPECT_EQ(beta.high(), 1.0);

    std::vector<scalar_t> draws(20000);
    for (auto& x : draws) {
        x = beta.sample(source);
        ASSERT_GE(x, -1.0);
        ASSERT_LE(x, 1.0);
    }

    EXPECT_NEAR(statistics::mean(draws), 0.0, 0.02);
    EXPECT_NEAR(statistics::variance(draws), 1.0 / (2.0 * shape + 1.0), 0.01);
}

TEST(BetaTest, AsymmetricOnUnitInterval) {
    Mt19937Source source(11);
    Beta beta(2.0, 6.0);

    std::vector<scalar_t> draws(20000);
    for (auto& x : draws) {
        x = beta.sample(source);
    }

    // alpha / (alpha + beta)
    EXPECT_NEAR(statistics::mean(draws), 0.25, 0.01);
}

TEST(BetaTest, TinyShapesStayInSupport) {
    Mt19937Source source(3);
    Beta beta = Beta::symmetric_multiplier(1e-3);

    for (int i = 0; i < 1000; ++i) {
        const scalar_t x = beta.sample(source);
        ASSERT_TRUE(std::isfinite(x));
        ASSERT_GE(x, -1.0);
        ASSERT_LE(x, 1.0);
    }
}

TEST(BetaTest, InvalidParameters) {
    EXPECT_THROW(Beta(0.0, 1.0), std::invalid_argument);
    EXPECT_THROW(Beta(1.0, -2.0), std::invalid_argument);
    EXPECT_THROW(Beta(1.0, 1.0, 1.0, 1.0), std::invalid_argument);
    EXPECT_THROW(Beta(1.0, 1.0, 2.0, -1.0), std::invalid_argument);
    EXPECT_THROW(Beta(std::numeric_limits<scalar_t>::quiet_NaN(), 1.0), std::invalid_argument);
}

TEST(DistributionTest, CloneKeepsParameters) {
    Gaussian gaussian(1.0, 2.0);
    auto copy = gaussian.clone();

    EXPECT_EQ(copy->name(), gaussian.name());
}

} // namespace test
} // namespace mwm
