// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#pragma once

#include "mwm/common.hpp"
#include "mwm/distributions.hpp"
#include <vector>

namespace mwm {

/**
 * @brief Beta multiplier shapes from the per-scale energy sequence.
 *
 * With beta_{-1} = 0 and i = 0 .. S-1:
 *
 *     beta_i = 0.5 * (E_i / E_{i+1}) * (beta_{i-1} + 1) - 0.5
 *
 * which relates the energy ratio of adjacent scales to the shape of the
 * symmetric Beta(beta_i, beta_i) multiplier at level i.
 *
 * @param energies E_0 .. E_S, at least two entries
 * @return std::vector<scalar_t> S shape parameters, coarse to fine
 * @throws ModelMismatch as soon as a shape is not strictly positive
 */
std::vector<scalar_t> estimate_betas(const std::vector<scalar_t>& energies);

/**
 * @brief Gaussian fitted to the coarsest scaling coefficients.
 *
 * @param coarse Scaling coefficients, at least two
 * @return Gaussian Sample mean and sample standard deviation
 */
Gaussian estimate_gaussian(const std::vector<scalar_t>& coarse);

} // namespace mwm
