// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#pragma once

#include "mwm/common.hpp"
#include <cstdint>
#include <limits>
#include <memory>
#include <random>

namespace mwm {

/**
 * @brief Source of uniformly distributed random bits.
 *
 * Satisfies the UniformRandomBitGenerator requirements, so any standard
 * library distribution can draw from it. A source is not safe for concurrent
 * use; give each sampling thread its own.
 */
class RandomSource {
public:
    using result_type = std::uint64_t;

    /**
     * @brief Virtual destructor.
     */
    virtual ~RandomSource() = default;

    static constexpr result_type min() { return 0; }
    static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }

    /**
     * @brief Produce the next 64 random bits.
     *
     * @return result_type Uniform value in [min(), max()]
     */
    virtual result_type operator()() = 0;
};

/**
 * @brief Random source backed by a 64-bit Mersenne Twister.
 */
class Mt19937Source : public RandomSource {
public:
    /**
     * @brief Constructor.
     *
     * @param seed Seed for reproducible streams
     */
    explicit Mt19937Source(std::uint64_t seed) : engine_(seed) {}

    result_type operator()() override { return engine_(); }

    /**
     * @brief Create a source seeded from std::random_device.
     *
     * @return std::unique_ptr<RandomSource> New source
     */
    static std::unique_ptr<RandomSource> from_entropy();

private:
    std::mt19937_64 engine_;
};

} // namespace mwm
