// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#include "mwm/estimation.hpp"
#include "mwm/statistics.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace mwm {

std::vector<scalar_t> estimate_betas(const std::vector<scalar_t>& energies) {
    if (energies.size() < 2) {
        throw std::invalid_argument("At least two energies are needed to estimate a shape");
    }

    const std::size_t scales = energies.size() - 1;
    std::vector<scalar_t> betas;
    betas.reserve(scales);

    scalar_t previous = 0.0;
    for (std::size_t i = 0; i < scales; ++i) {
        const scalar_t eta = energies[i] / energies[i + 1];
        const scalar_t beta = eta * 0.5 * (previous + 1.0) - 0.5;

        // NaN (0/0 energies) is rejected along with non-positive shapes
        if (!(beta > 0.0)) {
            std::ostringstream oss;
            oss << "the model is not appropriate for the data (shape at scale " << i
                << " is " << beta << ")";
            throw ModelMismatch(oss.str());
        }

        betas.push_back(beta);
        previous = beta;
    }

    return betas;
}

Gaussian estimate_gaussian(const std::vector<scalar_t>& coarse) {
    const scalar_t mu = statistics::mean(coarse);
    const scalar_t sd = std::sqrt(statistics::variance(coarse));
    return Gaussian(mu, sd);
}

} // namespace mwm
