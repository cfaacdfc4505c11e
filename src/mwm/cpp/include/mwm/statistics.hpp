// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#pragma once

#include "mwm/common.hpp"
#include <vector>

namespace mwm {
namespace statistics {

/**
 * @brief Arithmetic mean.
 *
 * @param values Non-empty sample
 * @return scalar_t Mean
 */
scalar_t mean(const std::vector<scalar_t>& values);

/**
 * @brief Unbiased sample variance (divides by n - 1).
 *
 * @param values Sample with at least two values
 * @return scalar_t Variance
 */
scalar_t variance(const std::vector<scalar_t>& values);

/**
 * @brief Average of squared values.
 *
 * @param values Non-empty sample
 * @return scalar_t Mean square
 */
scalar_t mean_square(const std::vector<scalar_t>& values);

} // namespace statistics
} // namespace mwm
