// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#include "mwm/sampler.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace mwm {

Sampler::Sampler(const Model& model) : root_(model.gaussian().clone()) {
    multipliers_.reserve(model.betas().size());
    for (scalar_t beta : model.betas()) {
        multipliers_.push_back(std::make_unique<Beta>(Beta::symmetric_multiplier(beta)));
    }
}

Sampler::Sampler(std::unique_ptr<Distribution> root,
                 std::vector<std::unique_ptr<Distribution>> multipliers)
    : root_(std::move(root)), multipliers_(std::move(multipliers)) {
    if (!root_) {
        throw std::invalid_argument("Sampler needs a root distribution");
    }
    if (multipliers_.empty() || multipliers_.size() > static_cast<std::size_t>(MAX_SCALES)) {
        throw std::invalid_argument("Sampler needs between 1 and MAX_SCALES multiplier levels");
    }
    for (const auto& multiplier : multipliers_) {
        if (!multiplier) {
            throw std::invalid_argument("Sampler multiplier distribution is null");
        }
    }
}

std::vector<scalar_t> Sampler::sample(RandomSource& source) const {
    const index_t levels = scales();
    std::vector<scalar_t> path(path_length(), 0.0);

    const scalar_t z = std::pow(2.0, -0.5 * levels) * root_->sample(source);
    if (z < 0.0) {
        std::ostringstream oss;
        oss << "the model is not appropriate for the data (negative root value " << z << ")";
        throw ModelMismatch(oss.str());
    }
    path[0] = z;

    // Nodes are expanded from the highest index down so that writing the
    // children of j at 2j and 2j+1 never clobbers a parent not yet expanded.
    for (index_t i = 0; i < levels; ++i) {
        const Distribution& multiplier = *multipliers_[i];
        for (std::size_t j = (std::size_t(1) << i); j-- > 0;) {
            const scalar_t x = path[j];
            const scalar_t a = multiplier.sample(source);
            path[2 * j] = (1.0 + a) * x;
            path[2 * j + 1] = (1.0 - a) * x;
        }
    }

    return path;
}

std::vector<scalar_t> sample(const Model& model, RandomSource& source) {
    return Sampler(model).sample(source);
}

} // namespace mwm
