// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#include "mwm/distributions.hpp"
#include <cmath>
#include <random>
#include <sstream>
#include <stdexcept>

namespace mwm {

// Gaussian implementation

Gaussian::Gaussian(scalar_t mean, scalar_t sd) : mean_(mean), sd_(sd) {
    if (!std::isfinite(mean)) {
        throw std::invalid_argument("Gaussian mean must be finite");
    }
    if (!std::isfinite(sd) || sd < 0.0) {
        throw std::invalid_argument("Gaussian standard deviation must be finite and non-negative");
    }
}

scalar_t Gaussian::sample(RandomSource& source) const {
    if (sd_ == 0.0) {
        return mean_;
    }
    std::normal_distribution<scalar_t> dist(mean_, sd_);
    return dist(source);
}

std::string Gaussian::name() const {
    std::ostringstream oss;
    oss << "Gaussian(" << mean_ << ", " << sd_ << ")";
    return oss.str();
}

// Beta implementation

Beta::Beta(scalar_t alpha, scalar_t beta, scalar_t low, scalar_t high)
    : alpha_(alpha), beta_(beta), low_(low), high_(high) {
    if (!(alpha > 0.0) || !(beta > 0.0) || !std::isfinite(alpha) || !std::isfinite(beta)) {
        throw std::invalid_argument("Beta shape parameters must be finite and positive");
    }
    if (!std::isfinite(low) || !std::isfinite(high) || !(low < high)) {
        throw std::invalid_argument("Beta support must be a finite interval with low < high");
    }
}

scalar_t Beta::sample(RandomSource& source) const {
    // X / (X + Y) with X ~ Gamma(alpha), Y ~ Gamma(beta) is Beta(alpha, beta)
    std::gamma_distribution<scalar_t> gamma_alpha(alpha_, 1.0);
    std::gamma_distribution<scalar_t> gamma_beta(beta_, 1.0);

    scalar_t x = 0.0;
    scalar_t y = 0.0;
    do {
        x = gamma_alpha(source);
        y = gamma_beta(source);
    } while (!(x + y > 0.0));  // both draws underflow for tiny shapes

    const scalar_t u = x / (x + y);
    return low_ + (high_ - low_) * u;
}

std::string Beta::name() const {
    std::ostringstream oss;
    oss << "Beta(" << alpha_ << ", " << beta_ << ", [" << low_ << ", " << high_ << "])";
    return oss.str();
}

} // namespace mwm
