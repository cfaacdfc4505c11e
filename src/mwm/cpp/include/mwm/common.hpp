// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <stdexcept>

namespace mwm {

// Type definitions
using scalar_t = double;  // All estimation is carried out in double precision
using index_t = int32_t;  // Index type

// Constants
constexpr index_t MIN_BLOCKS = 2;          // Smallest usable coarse-coefficient count
constexpr index_t MIN_SCALES = 1;          // Smallest usable number of dyadic levels
constexpr index_t MAX_SCALES = 30;         // Paths of length 2^30 are the practical ceiling
constexpr index_t DEFAULT_BLOCKS = 8;      // Default minimum coarse count for the driver

/**
 * @brief Categories of failure reported by fitting and sampling.
 */
enum class ErrorKind {
    InvalidConfiguration,  // Zero scales, or fewer than MIN_BLOCKS blocks
    InsufficientData,      // Series too short for the requested layout
    ModelMismatch          // Data (or a draw) incompatible with the cascade model
};

/**
 * @brief Get the name of an error kind.
 *
 * @param kind Error kind
 * @return std::string Name, e.g. "ModelMismatch"
 */
std::string to_string(ErrorKind kind);

/**
 * @brief Base class of all errors raised by the model.
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidConfiguration : public Error {
public:
    explicit InvalidConfiguration(const std::string& message)
        : Error(ErrorKind::InvalidConfiguration, message) {}
};

class InsufficientData : public Error {
public:
    explicit InsufficientData(const std::string& message)
        : Error(ErrorKind::InsufficientData, message) {}
};

class ModelMismatch : public Error {
public:
    explicit ModelMismatch(const std::string& message)
        : Error(ErrorKind::ModelMismatch, message) {}
};

} // namespace mwm
