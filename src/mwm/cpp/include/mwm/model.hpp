// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#pragma once

#include "mwm/common.hpp"
#include "mwm/decomposition.hpp"
#include "mwm/distributions.hpp"
#include "mwm/wavelet.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace mwm {

/**
 * @brief How to choose the decomposition layout when fitting.
 *
 * A non-zero scale count takes precedence over the block count.
 */
struct FitConfig {
    index_t blocks = DEFAULT_BLOCKS;  // Minimum coarse count; derives the scales
    index_t scales = 0;               // Fixed number of scales (0 = derive from blocks)
};

/**
 * @brief Multifractal wavelet model with Beta-distributed multipliers.
 *
 * A Gaussian for the coarsest scaling coefficients plus one symmetric Beta
 * shape per dyadic scale, coarse to fine. Immutable once constructed and safe
 * to share between threads.
 */
class Model {
public:
    /**
     * @brief Constructor from known parameters.
     *
     * @param mean Mean of the coarse Gaussian
     * @param sd Standard deviation of the coarse Gaussian
     * @param betas Shape parameter per scale, coarse to fine
     * @throws InvalidConfiguration if betas is empty or sd is negative or not finite
     * @throws ModelMismatch if any shape is not strictly positive
     */
    Model(scalar_t mean, scalar_t sd, std::vector<scalar_t> betas);

    /**
     * @brief Fit with a minimum number of coarse coefficients.
     *
     * @param data Observed series
     * @param blocks Minimum coarse-coefficient count (>= 2); the number of
     *        scales is the largest keeping at least this many
     * @return Model Fitted model
     */
    static Model fit(const std::vector<scalar_t>& data, index_t blocks);

    /**
     * @brief Fit with a fixed number of scales.
     *
     * @param data Observed series
     * @param scales Number of dyadic levels (>= 1)
     * @return Model Fitted model
     */
    static Model fit_with_scales(const std::vector<scalar_t>& data, index_t scales);

    /**
     * @brief Fit using a configuration.
     *
     * @param data Observed series
     * @param config Blocks or scales selection
     * @return Model Fitted model
     */
    static Model fit(const std::vector<scalar_t>& data, const FitConfig& config);

    /**
     * @brief Fit with an explicit layout and wavelet transform.
     *
     * @param data Observed series; only the first layout.size() samples are used
     * @param layout Block and scale counts
     * @param transform Wavelet transform used for the decomposition
     * @return Model Fitted model
     */
    static Model fit(const std::vector<scalar_t>& data, const ScaleLayout& layout,
                     const WaveletTransform& transform = HaarWavelet());

    scalar_t mean() const { return gaussian_.mean(); }
    scalar_t sd() const { return gaussian_.sd(); }
    const Gaussian& gaussian() const { return gaussian_; }
    const std::vector<scalar_t>& betas() const { return betas_; }

    /**
     * @brief Number of scales S.
     */
    index_t scales() const { return static_cast<index_t>(betas_.size()); }

    /**
     * @brief Length of a sampled path, 2^S.
     */
    std::size_t path_length() const { return std::size_t(1) << betas_.size(); }

    /**
     * @brief Get a one-line description of the model.
     *
     * @return std::string Parameters in human-readable form
     */
    std::string to_string() const;

private:
    Gaussian gaussian_;
    std::vector<scalar_t> betas_;
};

} // namespace mwm
