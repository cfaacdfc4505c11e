// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#include <gtest/gtest.h>
#include "mwm/estimation.hpp"
#include "mwm/model.hpp"
#include "reference_series.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace mwm {
namespace test {

// Beta recursion

TEST(EstimateBetasTest, FirstOrderRecursion) {
    // beta_0 = 0.5 * 4 - 0.5 = 1.5
    // beta_1 = 0.5 * 2 * 2.5 - 0.5 = 2
    const std::vector<scalar_t> energies = {8.0, 2.0, 1.0};
    const std::vector<scalar_t> betas = estimate_betas(energies);

    ASSERT_EQ(betas.size(), 2u);
    EXPECT_DOUBLE_EQ(betas[0], 1.5);
    EXPECT_DOUBLE_EQ(betas[1], 2.0);
}

TEST(EstimateBetasTest, NonPositiveShapeIsMismatch) {
    // Equal energies give beta_0 = 0
    EXPECT_THROW(estimate_betas({1.0, 1.0}), ModelMismatch);
    // Later scale fails after a valid first one
    EXPECT_THROW(estimate_betas({8.0, 2.0, 100.0}), ModelMismatch);
    // 0 / 0
    EXPECT_THROW(estimate_betas({1.0, 0.0, 0.0}), ModelMismatch);
}

TEST(EstimateBetasTest, NeedsTwoEnergies) {
    EXPECT_THROW(estimate_betas({1.0}), std::invalid_argument);
}

TEST(EstimateGaussianTest, SampleMeanAndDeviation) {
    const Gaussian gaussian = estimate_gaussian({1.0, 2.0, 3.0, 4.0});

    EXPECT_DOUBLE_EQ(gaussian.mean(), 2.5);
    EXPECT_DOUBLE_EQ(gaussian.sd(), std::sqrt(5.0 / 3.0));
}

// Model fitting

class ModelFitTest : public ::testing::Test {
protected:
    void SetUp() override {
        data = reference_series();
    }

    void expect_reference_model(const Model& model) {
        ASSERT_EQ(model.scales(), 3);
        EXPECT_NEAR(model.betas()[0], 1.635153583946054e+01, 1e-14);
        EXPECT_NEAR(model.betas()[1], 2.793188701574629e+00, 1e-14);
        EXPECT_NEAR(model.betas()[2], 3.739374677617142e+00, 1e-14);
        EXPECT_NEAR(model.mean(), 1.184252871226982e+00, 1e-14);
        EXPECT_NEAR(model.sd(), 4.466592147518644e-01, 1e-14);
    }

    std::vector<scalar_t> data;
};

TEST_F(ModelFitTest, ReferenceFitWithBlocks) {
    const Model model = Model::fit(data, 5);

    expect_reference_model(model);
    EXPECT_EQ(model.path_length(), 8u);
}

TEST_F(ModelFitTest, ReferenceFitWithScales) {
    expect_reference_model(Model::fit_with_scales(data, 3));
}

TEST_F(ModelFitTest, ReferenceFitWithConfig) {
    FitConfig by_blocks;
    by_blocks.blocks = 5;
    expect_reference_model(Model::fit(data, by_blocks));

    FitConfig by_scales;
    by_scales.scales = 3;
    expect_reference_model(Model::fit(data, by_scales));
}

// Both derivations land on the same layout and hence the same model
TEST_F(ModelFitTest, BlocksAndScalesAgree) {
    const Model a = Model::fit(data, 5);
    const Model b = Model::fit_with_scales(data, 3);
    const Model c = Model::fit(data, 3);

    EXPECT_EQ(a.betas(), b.betas());
    EXPECT_EQ(a.mean(), b.mean());
    EXPECT_EQ(a.sd(), b.sd());
    EXPECT_EQ(a.betas(), c.betas());
}

TEST_F(ModelFitTest, Deterministic) {
    const Model first = Model::fit(data, 5);
    for (int i = 0; i < 5; ++i) {
        const Model again = Model::fit(data, 5);
        EXPECT_EQ(again.betas(), first.betas());
        EXPECT_EQ(again.mean(), first.mean());
        EXPECT_EQ(again.sd(), first.sd());
    }
}

TEST_F(ModelFitTest, BetaCountMatchesScales) {
    const Model model = Model::fit(data, 2);

    EXPECT_EQ(model.scales(), 4);
    EXPECT_EQ(model.betas().size(), 4u);
    EXPECT_EQ(model.path_length(), 16u);
    for (scalar_t beta : model.betas()) {
        EXPECT_GT(beta, 0.0);
    }
}

TEST_F(ModelFitTest, InvalidConfiguration) {
    EXPECT_THROW(Model::fit(data, 0), InvalidConfiguration);
    EXPECT_THROW(Model::fit(data, 1), InvalidConfiguration);
    EXPECT_THROW(Model::fit_with_scales(data, 0), InvalidConfiguration);
}

TEST_F(ModelFitTest, InsufficientData) {
    EXPECT_THROW(Model::fit(data, 22), InsufficientData);
    EXPECT_THROW(Model::fit_with_scales(data, 5), InsufficientData);
    EXPECT_THROW(Model::fit(std::vector<scalar_t>{1.0, 2.0, 3.0}, 2), InsufficientData);
    EXPECT_THROW(Model::fit(std::vector<scalar_t>{}, 2), InsufficientData);
}

// Alternating signs: the coarse coefficients vanish, so beta_0 < 0
TEST_F(ModelFitTest, AlternatingSeriesIsMismatch) {
    std::vector<scalar_t> alternating(32);
    for (std::size_t i = 0; i < alternating.size(); ++i) {
        alternating[i] = (i % 2 == 0) ? 1.0 : -1.0;
    }

    EXPECT_THROW(Model::fit(alternating, 2), ModelMismatch);
}

// Constant series: every detail is zero and the ratios degenerate
TEST_F(ModelFitTest, ConstantSeriesIsMismatch) {
    const std::vector<scalar_t> constant(32, 0.5);

    EXPECT_THROW(Model::fit(constant, 2), ModelMismatch);
}

TEST_F(ModelFitTest, NonFiniteDataIsMismatch) {
    data[7] = std::numeric_limits<scalar_t>::quiet_NaN();

    EXPECT_THROW(Model::fit(data, 5), ModelMismatch);
}

// Model construction from known parameters

TEST(ModelTest, ConstructFromParameters) {
    const Model model(1.0, 0.5, {2.0, 3.0});

    EXPECT_EQ(model.mean(), 1.0);
    EXPECT_EQ(model.sd(), 0.5);
    EXPECT_EQ(model.scales(), 2);
    EXPECT_EQ(model.path_length(), 4u);
    EXPECT_NE(model.to_string().find("betas=[2, 3]"), std::string::npos);
}

TEST(ModelTest, RejectsInvalidParameters) {
    EXPECT_THROW(Model(1.0, 0.5, {}), InvalidConfiguration);
    EXPECT_THROW(Model(1.0, -0.5, {1.0}), InvalidConfiguration);
    EXPECT_THROW(Model(std::numeric_limits<scalar_t>::infinity(), 0.5, {1.0}), InvalidConfiguration);
    EXPECT_THROW(Model(1.0, 0.5, {1.0, 0.0}), ModelMismatch);
    EXPECT_THROW(Model(1.0, 0.5, {-2.0}), ModelMismatch);
}

} // namespace test
} // namespace mwm
