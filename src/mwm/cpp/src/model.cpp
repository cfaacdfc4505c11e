// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#include "mwm/model.hpp"
#include "mwm/estimation.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace mwm {

namespace {

Gaussian make_gaussian(scalar_t mean, scalar_t sd) {
    if (!std::isfinite(mean) || !std::isfinite(sd) || sd < 0.0) {
        throw InvalidConfiguration("the coarse Gaussian needs a finite mean and a finite, non-negative deviation");
    }
    return Gaussian(mean, sd);
}

} // namespace

Model::Model(scalar_t mean, scalar_t sd, std::vector<scalar_t> betas)
    : gaussian_(make_gaussian(mean, sd)), betas_(std::move(betas)) {
    if (betas_.empty()) {
        throw InvalidConfiguration("a model needs at least one scale");
    }
    if (betas_.size() > static_cast<std::size_t>(MAX_SCALES)) {
        throw InvalidConfiguration("too many scales for a model");
    }
    for (std::size_t i = 0; i < betas_.size(); ++i) {
        if (!(betas_[i] > 0.0) || !std::isfinite(betas_[i])) {
            std::ostringstream oss;
            oss << "shape at scale " << i << " must be finite and positive (got "
                << betas_[i] << ")";
            throw ModelMismatch(oss.str());
        }
    }
}

Model Model::fit(const std::vector<scalar_t>& data, index_t blocks) {
    return fit(data, ScaleLayout::for_blocks(data.size(), blocks));
}

Model Model::fit_with_scales(const std::vector<scalar_t>& data, index_t scales) {
    return fit(data, ScaleLayout::for_scales(data.size(), scales));
}

Model Model::fit(const std::vector<scalar_t>& data, const FitConfig& config) {
    if (config.scales != 0) {
        return fit_with_scales(data, config.scales);
    }
    return fit(data, config.blocks);
}

Model Model::fit(const std::vector<scalar_t>& data, const ScaleLayout& layout,
                 const WaveletTransform& transform) {
    const Decomposition decomposition(data, layout, transform);

    std::vector<scalar_t> betas = estimate_betas(decomposition.energies());
    const Gaussian gaussian = estimate_gaussian(decomposition.coarse());

    return Model(gaussian.mean(), gaussian.sd(), std::move(betas));
}

std::string Model::to_string() const {
    std::ostringstream oss;
    oss << std::setprecision(15);
    oss << "mu=" << mean() << " sd=" << sd() << " betas=[";
    for (std::size_t i = 0; i < betas_.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << betas_[i];
    }
    oss << "]";
    return oss.str();
}

} // namespace mwm
