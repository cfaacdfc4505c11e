// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#include "mwm/common.hpp"

namespace mwm {

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidConfiguration:
            return "InvalidConfiguration";
        case ErrorKind::InsufficientData:
            return "InsufficientData";
        case ErrorKind::ModelMismatch:
            return "ModelMismatch";
    }
    return "Unknown";
}

} // namespace mwm
