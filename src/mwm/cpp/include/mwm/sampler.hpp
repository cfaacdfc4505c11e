// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#pragma once

#include "mwm/common.hpp"
#include "mwm/distributions.hpp"
#include "mwm/model.hpp"
#include "mwm/random_source.hpp"
#include <cstddef>
#include <memory>
#include <vector>

namespace mwm {

/**
 * @brief Synthesizes sample paths by a multiplicative binary cascade.
 *
 * A root value z = 2^(-S/2) * Z, Z drawn from the root distribution, is split
 * S times: at level i every node x becomes (1 + a) x and (1 - a) x with a
 * drawn from the level-i multiplier distribution on [-1, 1]. The result has
 * 2^S non-negative values.
 *
 * The sampler holds no mutable state; concurrent calls are safe as long as
 * each caller passes its own random source.
 */
class Sampler {
public:
    /**
     * @brief Constructor from a fitted model.
     *
     * @param model Model supplying the root Gaussian and the Beta shapes
     */
    explicit Sampler(const Model& model);

    /**
     * @brief Constructor from explicit distributions.
     *
     * @param root Distribution of the unscaled root value
     * @param multipliers One multiplier distribution per level, coarse to fine;
     *        every draw must lie in [-1, 1]
     */
    Sampler(std::unique_ptr<Distribution> root,
            std::vector<std::unique_ptr<Distribution>> multipliers);

    /**
     * @brief Draw one path.
     *
     * @param source Randomness source, used exclusively for this call
     * @return std::vector<scalar_t> Path of length 2^S
     * @throws ModelMismatch if the root draw is negative
     */
    std::vector<scalar_t> sample(RandomSource& source) const;

    index_t scales() const { return static_cast<index_t>(multipliers_.size()); }
    std::size_t path_length() const { return std::size_t(1) << multipliers_.size(); }

private:
    std::unique_ptr<Distribution> root_;
    std::vector<std::unique_ptr<Distribution>> multipliers_;
};

/**
 * @brief Draw one path from a model.
 *
 * @param model Fitted model
 * @param source Randomness source
 * @return std::vector<scalar_t> Path of length 2^S
 * @throws ModelMismatch if the root draw is negative
 */
std::vector<scalar_t> sample(const Model& model, RandomSource& source);

} // namespace mwm
