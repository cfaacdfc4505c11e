// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#include "mwm/wavelet.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace mwm {

namespace {

void check_levels(const std::vector<scalar_t>& buffer, index_t levels) {
    if (levels < 0 || levels > MAX_SCALES) {
        throw std::invalid_argument("Number of wavelet levels out of range");
    }
    const std::size_t block = std::size_t(1) << levels;
    if (buffer.empty() || buffer.size() % block != 0) {
        throw std::invalid_argument("Buffer length must be a positive multiple of 2^levels");
    }
}

} // namespace

void HaarWavelet::forward(std::vector<scalar_t>& buffer, index_t levels) const {
    check_levels(buffer, levels);

    const scalar_t c = std::sqrt(0.5);
    std::vector<scalar_t> work(buffer.size());

    for (index_t level = 0; level < levels; ++level) {
        const std::size_t m = buffer.size() >> level;
        const std::size_t half = m / 2;

        for (std::size_t i = 0; i < half; ++i) {
            const scalar_t x0 = buffer[2 * i];
            const scalar_t x1 = buffer[2 * i + 1];
            work[i] = c * (x0 + x1);
            work[half + i] = c * (x0 - x1);
        }
        std::copy(work.begin(), work.begin() + m, buffer.begin());
    }
}

void HaarWavelet::inverse(std::vector<scalar_t>& buffer, index_t levels) const {
    check_levels(buffer, levels);

    const scalar_t c = std::sqrt(0.5);
    std::vector<scalar_t> work(buffer.size());

    for (index_t level = levels - 1; level >= 0; --level) {
        const std::size_t m = buffer.size() >> level;
        const std::size_t half = m / 2;

        for (std::size_t i = 0; i < half; ++i) {
            const scalar_t a = buffer[i];
            const scalar_t d = buffer[half + i];
            work[2 * i] = c * (a + d);
            work[2 * i + 1] = c * (a - d);
        }
        std::copy(work.begin(), work.begin() + m, buffer.begin());
    }
}

} // namespace mwm
