#include <pybind11/gil_safe_call_once.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <optional>
#include <string>
#include <vector>

#include "vscore/batch.hpp"
#include "vscore/errors.hpp"
#include "vscore/parser.hpp"
#include "vscore/score_engine.hpp"
#include "vscore/serializer.hpp"
#include "vscore/severity.hpp"

namespace py = pybind11;

PYBIND11_MODULE(vscore_python, m) {
    m.doc() = "Pybind11 bindings for the vscore CVSS scoring engine.";

    // args: (message, kind, metric, value, missing)
    PYBIND11_CONSTINIT static py::gil_safe_call_once_and_store<py::object> vector_error_storage;
    vector_error_storage.call_once_and_store_result(
        [&]() { return py::exception<vscore::VectorError>(m, "VectorError"); });
    py::register_exception_translator([](std::exception_ptr pointer) {
        try {
            if (pointer) {
                std::rethrow_exception(pointer);
            }
        } catch (const vscore::VectorError& exc) {
            py::tuple args = py::make_tuple(exc.what(), vscore::error_kind_name(exc.kind()), exc.metric(),
                                            exc.value(), exc.missing());
            PyErr_SetObject(vector_error_storage.get_stored().ptr(), args.ptr());
        }
    });

    py::enum_<vscore::Version>(m, "Version")
        .value("V3_1", vscore::Version::kV3_1)
        .value("V4_0", vscore::Version::kV4_0);

    py::enum_<vscore::Severity>(m, "Severity")
        .value("NONE", vscore::Severity::kNone)
        .value("LOW", vscore::Severity::kLow)
        .value("MEDIUM", vscore::Severity::kMedium)
        .value("HIGH", vscore::Severity::kHigh)
        .value("CRITICAL", vscore::Severity::kCritical);

    py::class_<vscore::ParsedVector>(m, "ParsedVector")
        .def_readonly("version", &vscore::ParsedVector::version)
        .def_readonly("metrics", &vscore::ParsedVector::metrics);

    py::class_<vscore::ScoreResult>(m, "ScoreResult")
        .def_readonly("version", &vscore::ScoreResult::version)
        .def_readonly("vector_string", &vscore::ScoreResult::vector_string)
        .def_readonly("base_score", &vscore::ScoreResult::base_score)
        .def_readonly("base_severity", &vscore::ScoreResult::base_severity)
        .def_readonly("temporal_score", &vscore::ScoreResult::temporal_score)
        .def_readonly("temporal_severity", &vscore::ScoreResult::temporal_severity)
        .def_readonly("threat_score", &vscore::ScoreResult::threat_score)
        .def_readonly("threat_severity", &vscore::ScoreResult::threat_severity)
        .def_readonly("environmental_score", &vscore::ScoreResult::environmental_score)
        .def_readonly("environmental_severity", &vscore::ScoreResult::environmental_severity)
        .def_readonly("supplemental", &vscore::ScoreResult::supplemental)
        .def_readonly("impact_score", &vscore::ScoreResult::impact_score)
        .def_readonly("exploitability_score", &vscore::ScoreResult::exploitability_score);

    py::class_<vscore::BatchOutcome>(m, "BatchOutcome")
        .def_readonly("row", &vscore::BatchOutcome::row)
        .def_readonly("input", &vscore::BatchOutcome::input)
        .def_readonly("result", &vscore::BatchOutcome::result)
        .def_readonly("error", &vscore::BatchOutcome::error)
        .def_property_readonly("error_kind",
                               [](const vscore::BatchOutcome& outcome) -> std::optional<std::string> {
                                   if (!outcome.error_kind.has_value()) {
                                       return std::nullopt;
                                   }
                                   return vscore::error_kind_name(*outcome.error_kind);
                               })
        .def_property_readonly("ok", &vscore::BatchOutcome::ok);

    m.def("parse_vector", &vscore::parse_vector, py::arg("text"));
    m.def("serialize_vector",
          py::overload_cast<vscore::Version, const vscore::MetricSet&>(&vscore::serialize_vector),
          py::arg("version"), py::arg("metrics"));
    m.def("score_vector", &vscore::score_vector, py::arg("text"));
    m.def("severity", &vscore::severity, py::arg("score"));
    m.def("severity_name", &vscore::severity_name, py::arg("severity"));
    m.def("round_up", &vscore::round_up, py::arg("value"));
    m.def("score_row", &vscore::score_row, py::arg("row"), py::arg("text"));
    m.def("score_batch",
          [](const std::vector<std::string>& vectors, int workers, bool fail_fast) {
              vscore::BatchScorer scorer(vscore::BatchConfig{workers, fail_fast});
              return scorer.score_all(vectors);
          },
          py::arg("vectors"), py::arg("workers") = 1, py::arg("fail_fast") = false,
          py::call_guard<py::gil_scoped_release>());
}
