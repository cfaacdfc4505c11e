// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#include "mwm/random_source.hpp"

namespace mwm {

std::unique_ptr<RandomSource> Mt19937Source::from_entropy() {
    std::random_device rd;
    const std::uint64_t seed = (static_cast<std::uint64_t>(rd()) << 32) | rd();
    return std::make_unique<Mt19937Source>(seed);
}

} // namespace mwm
