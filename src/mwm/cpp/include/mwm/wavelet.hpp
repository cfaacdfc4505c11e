// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#pragma once

#include "mwm/common.hpp"
#include <memory>
#include <string>
#include <vector>

namespace mwm {

/**
 * @brief Base class for in-place, orthogonal, decimating wavelet transforms.
 *
 * After forward() with L levels on a buffer of length N = B * 2^L the buffer
 * holds B scaling coefficients followed by L detail blocks of lengths
 * B, 2B, ..., B * 2^(L-1), ordered coarsest to finest.
 */
class WaveletTransform {
public:
    /**
     * @brief Virtual destructor.
     */
    virtual ~WaveletTransform() = default;

    /**
     * @brief Decompose a buffer in place.
     *
     * @param buffer Signal on input, coefficients on output
     * @param levels Number of decomposition levels
     * @throws std::invalid_argument if the length is not divisible by 2^levels
     */
    virtual void forward(std::vector<scalar_t>& buffer, index_t levels) const = 0;

    /**
     * @brief Reconstruct a signal in place from forward() output.
     *
     * @param buffer Coefficients on input, signal on output
     * @param levels Number of levels used by forward()
     * @throws std::invalid_argument if the length is not divisible by 2^levels
     */
    virtual void inverse(std::vector<scalar_t>& buffer, index_t levels) const = 0;

    /**
     * @brief Get a string representation of the wavelet.
     *
     * @return std::string Wavelet name
     */
    virtual std::string name() const = 0;

    /**
     * @brief Create a copy of this transform.
     *
     * @return std::unique_ptr<WaveletTransform> New transform
     */
    virtual std::unique_ptr<WaveletTransform> clone() const = 0;
};

/**
 * @brief Orthonormal Haar wavelet.
 *
 * Analysis filters are h = (1, 1) / sqrt(2) and g = (1, -1) / sqrt(2).
 */
class HaarWavelet : public WaveletTransform {
public:
    void forward(std::vector<scalar_t>& buffer, index_t levels) const override;
    void inverse(std::vector<scalar_t>& buffer, index_t levels) const override;
    std::string name() const override { return "Haar"; }
    std::unique_ptr<WaveletTransform> clone() const override {
        return std::make_unique<HaarWavelet>(*this);
    }
};

} // namespace mwm
