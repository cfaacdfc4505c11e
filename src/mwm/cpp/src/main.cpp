// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#include "mwm/synth.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    return mwm::synth::run_cli(argc, argv, std::cout, std::cerr);
}
