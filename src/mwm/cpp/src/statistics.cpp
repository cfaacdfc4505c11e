// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#include "mwm/statistics.hpp"
#include <stdexcept>

namespace mwm {
namespace statistics {

scalar_t mean(const std::vector<scalar_t>& values) {
    if (values.empty()) {
        throw std::invalid_argument("Mean of an empty sample is undefined");
    }
    scalar_t sum = 0.0;
    for (scalar_t x : values) {
        sum += x;
    }
    return sum / static_cast<scalar_t>(values.size());
}

scalar_t variance(const std::vector<scalar_t>& values) {
    if (values.size() < 2) {
        throw std::invalid_argument("Sample variance requires at least two values");
    }
    const scalar_t m = mean(values);
    scalar_t sum = 0.0;
    for (scalar_t x : values) {
        const scalar_t d = x - m;
        sum += d * d;
    }
    return sum / static_cast<scalar_t>(values.size() - 1);
}

scalar_t mean_square(const std::vector<scalar_t>& values) {
    if (values.empty()) {
        throw std::invalid_argument("Mean square of an empty sample is undefined");
    }
    scalar_t sum = 0.0;
    for (scalar_t x : values) {
        sum += x * x;
    }
    return sum / static_cast<scalar_t>(values.size());
}

} // namespace statistics
} // namespace mwm
