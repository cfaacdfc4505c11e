// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#pragma once

#include "mwm/common.hpp"
#include "mwm/random_source.hpp"
#include <memory>
#include <string>

namespace mwm {

/**
 * @brief Base class for univariate distributions drawn by the sampler.
 *
 * Implementations hold only their parameters; all randomness comes from the
 * source passed to sample(), so one distribution can be shared by callers
 * that each own a source.
 */
class Distribution {
public:
    /**
     * @brief Virtual destructor.
     */
    virtual ~Distribution() = default;

    /**
     * @brief Draw one variate.
     *
     * @param source Randomness source
     * @return scalar_t Variate
     */
    virtual scalar_t sample(RandomSource& source) const = 0;

    /**
     * @brief Get a string representation of the distribution.
     *
     * @return std::string Distribution with its parameters
     */
    virtual std::string name() const = 0;

    /**
     * @brief Create a copy of this distribution.
     *
     * @return std::unique_ptr<Distribution> New distribution
     */
    virtual std::unique_ptr<Distribution> clone() const = 0;
};

/**
 * @brief Normal distribution N(mean, sd^2).
 */
class Gaussian : public Distribution {
public:
    /**
     * @brief Constructor.
     *
     * @param mean Mean
     * @param sd Standard deviation (0 gives a point mass at the mean)
     */
    Gaussian(scalar_t mean, scalar_t sd);

    scalar_t sample(RandomSource& source) const override;
    std::string name() const override;
    std::unique_ptr<Distribution> clone() const override {
        return std::make_unique<Gaussian>(*this);
    }

    scalar_t mean() const { return mean_; }
    scalar_t sd() const { return sd_; }

private:
    scalar_t mean_;
    scalar_t sd_;
};

/**
 * @brief Beta(alpha, beta) distribution mapped linearly onto [low, high].
 */
class Beta : public Distribution {
public:
    /**
     * @brief Constructor.
     *
     * @param alpha First shape parameter (> 0)
     * @param beta Second shape parameter (> 0)
     * @param low Lower end of the support
     * @param high Upper end of the support (> low)
     */
    Beta(scalar_t alpha, scalar_t beta, scalar_t low = 0.0, scalar_t high = 1.0);

    scalar_t sample(RandomSource& source) const override;
    std::string name() const override;
    std::unique_ptr<Distribution> clone() const override {
        return std::make_unique<Beta>(*this);
    }

    scalar_t alpha() const { return alpha_; }
    scalar_t beta() const { return beta_; }
    scalar_t low() const { return low_; }
    scalar_t high() const { return high_; }

    /**
     * @brief Symmetric Beta(shape, shape) on [-1, 1], the cascade multiplier law.
     *
     * @param shape Shape parameter
     * @return Beta Multiplier distribution
     */
    static Beta symmetric_multiplier(scalar_t shape) {
        return Beta(shape, shape, -1.0, 1.0);
    }

private:
    scalar_t alpha_;
    scalar_t beta_;
    scalar_t low_;
    scalar_t high_;
};

} // namespace mwm
