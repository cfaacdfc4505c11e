// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#include "mwm/decomposition.hpp"
#include "mwm/statistics.hpp"
#include <limits>
#include <sstream>
#include <stdexcept>

namespace mwm {

namespace {

index_t checked_blocks(std::size_t blocks) {
    if (blocks > static_cast<std::size_t>(std::numeric_limits<index_t>::max())) {
        std::ostringstream oss;
        oss << blocks << " coarse coefficients exceed the supported block count";
        throw InvalidConfiguration(oss.str());
    }
    return static_cast<index_t>(blocks);
}

} // namespace

// ScaleLayout implementation

std::size_t ScaleLayout::size() const {
    return static_cast<std::size_t>(blocks) << scales;
}

void ScaleLayout::validate(std::size_t length) const {
    if (blocks < MIN_BLOCKS) {
        std::ostringstream oss;
        oss << "blocks must be at least " << MIN_BLOCKS << " (got " << blocks << ")";
        throw InvalidConfiguration(oss.str());
    }
    if (scales < MIN_SCALES) {
        std::ostringstream oss;
        oss << "scales must be at least " << MIN_SCALES << " (got " << scales << ")";
        throw InvalidConfiguration(oss.str());
    }
    if (scales > MAX_SCALES || (length >> scales) < static_cast<std::size_t>(blocks)) {
        std::ostringstream oss;
        oss << "not enough data: " << blocks << " blocks over " << scales
            << " scales need more than the " << length << " samples available";
        throw InsufficientData(oss.str());
    }
}

ScaleLayout ScaleLayout::for_blocks(std::size_t length, index_t blocks) {
    if (blocks < MIN_BLOCKS) {
        std::ostringstream oss;
        oss << "blocks must be at least " << MIN_BLOCKS << " (got " << blocks << ")";
        throw InvalidConfiguration(oss.str());
    }

    ScaleLayout layout;
    layout.scales = 0;
    while ((length >> (layout.scales + 1)) >= static_cast<std::size_t>(blocks)) {
        if (layout.scales == MAX_SCALES) {
            std::ostringstream oss;
            oss << length << " samples with " << blocks << " blocks need more than "
                << MAX_SCALES << " scales; fit a shorter series or use more blocks";
            throw InvalidConfiguration(oss.str());
        }
        ++layout.scales;
    }
    if (layout.scales < MIN_SCALES) {
        std::ostringstream oss;
        oss << "not enough data: " << length << " samples cannot hold " << blocks
            << " blocks over a single scale";
        throw InsufficientData(oss.str());
    }
    layout.blocks = checked_blocks(length >> layout.scales);
    return layout;
}

ScaleLayout ScaleLayout::for_scales(std::size_t length, index_t scales) {
    if (scales < MIN_SCALES) {
        std::ostringstream oss;
        oss << "scales must be at least " << MIN_SCALES << " (got " << scales << ")";
        throw InvalidConfiguration(oss.str());
    }

    const std::size_t blocks = scales > MAX_SCALES ? 0 : (length >> scales);
    if (blocks < static_cast<std::size_t>(MIN_BLOCKS)) {
        std::ostringstream oss;
        oss << "not enough data: " << length << " samples leave fewer than "
            << MIN_BLOCKS << " blocks at " << scales << " scales";
        throw InsufficientData(oss.str());
    }

    ScaleLayout layout;
    layout.blocks = checked_blocks(blocks);
    layout.scales = scales;
    return layout;
}

// Decomposition implementation

Decomposition::Decomposition(const std::vector<scalar_t>& data, const ScaleLayout& layout,
                             const WaveletTransform& transform)
    : layout_(layout) {
    layout_.validate(data.size());

    coefficients_.assign(data.begin(), data.begin() + layout_.size());
    transform.forward(coefficients_, layout_.scales);
}

std::vector<scalar_t> Decomposition::block(index_t i) const {
    if (i < 0 || i > layout_.scales) {
        throw std::out_of_range("Coefficient block index out of range");
    }

    const std::size_t b = static_cast<std::size_t>(layout_.blocks);
    const std::size_t begin = (i == 0) ? 0 : (b << (i - 1));
    const std::size_t end = b << i;
    return std::vector<scalar_t>(coefficients_.begin() + begin, coefficients_.begin() + end);
}

std::vector<scalar_t> Decomposition::energies() const {
    std::vector<scalar_t> result;
    result.reserve(layout_.scales + 1);
    for (index_t i = 0; i <= layout_.scales; ++i) {
        result.push_back(statistics::mean_square(block(i)));
    }
    return result;
}

} // namespace mwm
