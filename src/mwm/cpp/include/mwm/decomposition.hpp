// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#pragma once

#include "mwm/common.hpp"
#include "mwm/wavelet.hpp"
#include <cstddef>
#include <vector>

namespace mwm {

/**
 * @brief Block count B and scale count S of a dyadic decomposition.
 *
 * A layout uses the first B * 2^S samples of a series.
 */
struct ScaleLayout {
    index_t blocks = 0;   // Coarse (scaling) coefficients at the top level
    index_t scales = 0;   // Number of dyadic levels

    /**
     * @brief Number of samples covered, B * 2^S.
     */
    std::size_t size() const;

    /**
     * @brief Check the layout against a series length.
     *
     * @param length Series length
     * @throws InvalidConfiguration if B < MIN_BLOCKS or S < MIN_SCALES
     * @throws InsufficientData if B * 2^S exceeds the length
     */
    void validate(std::size_t length) const;

    /**
     * @brief Deepest layout keeping at least `blocks` coarse coefficients.
     *
     * S is the largest s with blocks * 2^s <= length, B = floor(length / 2^S).
     * S is capped at MAX_SCALES; a series long enough to need more is rejected
     * rather than fitted over fewer scales.
     *
     * @param length Series length
     * @param blocks Minimum coarse-coefficient count
     * @return ScaleLayout Derived layout
     * @throws InvalidConfiguration if blocks < MIN_BLOCKS, if S would exceed
     *         MAX_SCALES, or if B does not fit in index_t
     * @throws InsufficientData if not even one scale fits
     */
    static ScaleLayout for_blocks(std::size_t length, index_t blocks);

    /**
     * @brief Layout with a fixed number of scales, B = floor(length / 2^S).
     *
     * @param length Series length
     * @param scales Number of dyadic levels
     * @return ScaleLayout Derived layout
     * @throws InvalidConfiguration if scales < MIN_SCALES or B does not fit in index_t
     * @throws InsufficientData if B < MIN_BLOCKS
     */
    static ScaleLayout for_scales(std::size_t length, index_t scales);
};

/**
 * @brief Wavelet coefficients of a truncated series, partitioned by scale.
 */
class Decomposition {
public:
    /**
     * @brief Truncate a series to the layout and transform it.
     *
     * @param data Input series
     * @param layout Validated against data.size()
     * @param transform Wavelet transform to apply
     */
    Decomposition(const std::vector<scalar_t>& data, const ScaleLayout& layout,
                  const WaveletTransform& transform);

    const ScaleLayout& layout() const { return layout_; }

    /**
     * @brief Full coefficient buffer, scaling block first.
     */
    const std::vector<scalar_t>& coefficients() const { return coefficients_; }

    /**
     * @brief Coefficient block i: 0 is the scaling block, 1..S the detail
     * blocks from coarsest to finest.
     *
     * @param i Block index
     * @return std::vector<scalar_t> Copy of the block
     */
    std::vector<scalar_t> block(index_t i) const;

    /**
     * @brief Coarsest scaling coefficients (block 0).
     */
    std::vector<scalar_t> coarse() const { return block(0); }

    /**
     * @brief Mean-square energy of every block, E_0 .. E_S.
     *
     * @return std::vector<scalar_t> Energy sequence of length S + 1
     */
    std::vector<scalar_t> energies() const;

private:
    ScaleLayout layout_;
    std::vector<scalar_t> coefficients_;
};

} // namespace mwm
