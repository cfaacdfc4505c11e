// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>
#include <cstdint>
#include <cstring>
#include <memory>
#include <vector>

#include "mwm/common.hpp"
#include "mwm/decomposition.hpp"
#include "mwm/model.hpp"
#include "mwm/random_source.hpp"
#include "mwm/sampler.hpp"

namespace py = pybind11;

// Convert std::vector<double> to numpy array
py::array_t<double> vector_to_numpy(const std::vector<double>& vec) {
    py::array_t<double> array(vec.size());
    auto buf = array.request();
    double* ptr = static_cast<double*>(buf.ptr);
    std::memcpy(ptr, vec.data(), vec.size() * sizeof(double));
    return array;
}

// Convert numpy array to std::vector<double>
std::vector<double> numpy_to_vector(const py::array_t<double, py::array::c_style | py::array::forcecast>& array) {
    auto buf = array.request();
    if (buf.ndim != 1) {
        throw std::runtime_error("Array must have 1 dimension");
    }
    const double* ptr = static_cast<const double*>(buf.ptr);
    return std::vector<double>(ptr, ptr + buf.size);
}

PYBIND11_MODULE(_mwm, m) {
    m.doc() = "C++ backend for the multifractal wavelet model";

    // Version information
    m.attr("__version__") = "0.1.0";

    // Errors
    static py::exception<mwm::Error> error(m, "Error");
    static py::exception<mwm::InvalidConfiguration> invalid_configuration(
        m, "InvalidConfiguration", error.ptr());
    static py::exception<mwm::InsufficientData> insufficient_data(
        m, "InsufficientData", error.ptr());
    static py::exception<mwm::ModelMismatch> model_mismatch(
        m, "ModelMismatch", error.ptr());

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) {
                std::rethrow_exception(p);
            }
        } catch (const mwm::InvalidConfiguration& e) {
            invalid_configuration(e.what());
        } catch (const mwm::InsufficientData& e) {
            insufficient_data(e.what());
        } catch (const mwm::ModelMismatch& e) {
            model_mismatch(e.what());
        } catch (const mwm::Error& e) {
            error(e.what());
        }
    });

    // Model
    py::class_<mwm::Model>(m, "Model")
        .def(py::init<double, double, std::vector<double>>(),
             py::arg("mean"), py::arg("sd"), py::arg("betas"))
        .def_property_readonly("mean", &mwm::Model::mean)
        .def_property_readonly("sd", &mwm::Model::sd)
        .def_property_readonly("betas", &mwm::Model::betas)
        .def_property_readonly("scales", &mwm::Model::scales)
        .def_property_readonly("path_length", &mwm::Model::path_length)
        .def("__repr__", [](const mwm::Model& self) {
            return "Model(" + self.to_string() + ")";
        });

    m.def("fit", [](py::array_t<double, py::array::c_style | py::array::forcecast> data, int blocks) {
            return mwm::Model::fit(numpy_to_vector(data), blocks);
        }, py::arg("data"), py::arg("blocks") = mwm::DEFAULT_BLOCKS,
        "Fit a model keeping at least `blocks` coarse coefficients");

    m.def("fit_with_scales", [](py::array_t<double, py::array::c_style | py::array::forcecast> data, int scales) {
            return mwm::Model::fit_with_scales(numpy_to_vector(data), scales);
        }, py::arg("data"), py::arg("scales"),
        "Fit a model over a fixed number of dyadic scales");

    m.def("energies", [](py::array_t<double, py::array::c_style | py::array::forcecast> data, int blocks) {
            const auto series = numpy_to_vector(data);
            const auto layout = mwm::ScaleLayout::for_blocks(series.size(), blocks);
            const mwm::Decomposition decomposition(series, layout, mwm::HaarWavelet());
            return vector_to_numpy(decomposition.energies());
        }, py::arg("data"), py::arg("blocks") = mwm::DEFAULT_BLOCKS,
        "Per-scale wavelet energies E_0 .. E_S");

    m.def("sample", [](const mwm::Model& model, py::object seed) {
            std::unique_ptr<mwm::RandomSource> source;
            if (seed.is_none()) {
                source = mwm::Mt19937Source::from_entropy();
            } else {
                source = std::make_unique<mwm::Mt19937Source>(seed.cast<std::uint64_t>());
            }
            return vector_to_numpy(mwm::sample(model, *source));
        }, py::arg("model"), py::arg("seed") = py::none(),
        "Draw one synthetic path of length 2^scales");
}
