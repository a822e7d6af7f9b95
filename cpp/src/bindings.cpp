#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <optional>
#include <string>
#include <utility>

#include "riskband/band.hpp"
#include "riskband/lifecycle.hpp"
#include "riskband/metrics.hpp"
#include "riskband/packets.hpp"
#include "riskband/router.hpp"
#include "riskband/selector.hpp"
#include "riskband/sweep.hpp"

namespace py = pybind11;

PYBIND11_MODULE(riskband_python, m) {
    m.doc() = "Pybind11 bindings for the riskband threshold selection and routing core.";

    py::register_exception<riskband::InvalidInput>(m, "InvalidInput", PyExc_ValueError);

    py::enum_<riskband::ScoreCheck>(m, "ScoreCheck")
        .value("STRICT", riskband::ScoreCheck::kStrict)
        .value("ALLOW_OUT_OF_RANGE", riskband::ScoreCheck::kAllowOutOfRange);

    py::enum_<riskband::ConstraintState>(m, "ConstraintState")
        .value("UNCONSTRAINED", riskband::ConstraintState::kUnconstrained)
        .value("SATISFIED", riskband::ConstraintState::kSatisfied)
        .value("RELAXED", riskband::ConstraintState::kRelaxed);

    py::enum_<riskband::Route>(m, "Route")
        .value("LOW_RISK", riskband::Route::kLowRisk)
        .value("REVIEW", riskband::Route::kReview)
        .value("HIGH_RISK", riskband::Route::kHighRisk);

    py::enum_<riskband::Action>(m, "Action")
        .value("AUTO_APPROVE", riskband::Action::kAutoApprove)
        .value("MANUAL_REVIEW", riskband::Action::kManualReview)
        .value("INTERVENE_OR_BLOCK", riskband::Action::kInterveneOrBlock);

    py::enum_<riskband::ThresholdStatus>(m, "ThresholdStatus")
        .value("PROPOSED", riskband::ThresholdStatus::kProposed)
        .value("ACTIVE", riskband::ThresholdStatus::kActive)
        .value("SUPERSEDED", riskband::ThresholdStatus::kSuperseded);

    py::class_<riskband::ThresholdMetrics>(m, "ThresholdMetrics")
        .def(py::init<>())
        .def_readonly("t", &riskband::ThresholdMetrics::threshold)
        .def_readonly("tp", &riskband::ThresholdMetrics::tp)
        .def_readonly("fp", &riskband::ThresholdMetrics::fp)
        .def_readonly("tn", &riskband::ThresholdMetrics::tn)
        .def_readonly("fn", &riskband::ThresholdMetrics::fn)
        .def_readonly("precision", &riskband::ThresholdMetrics::precision)
        .def_readonly("recall", &riskband::ThresholdMetrics::recall)
        .def_readonly("fpr", &riskband::ThresholdMetrics::fpr)
        .def_readonly("fnr", &riskband::ThresholdMetrics::fnr)
        .def_readonly("f1", &riskband::ThresholdMetrics::f1);

    py::class_<riskband::SweepResult>(m, "SweepResult")
        .def_readonly("step", &riskband::SweepResult::step)
        .def_readonly("rows", &riskband::SweepResult::rows)
        .def("__len__", &riskband::SweepResult::size);

    py::class_<riskband::OperatingThreshold>(m, "OperatingThreshold")
        .def_readonly("threshold", &riskband::OperatingThreshold::threshold)
        .def_readonly("constraint", &riskband::OperatingThreshold::constraint)
        .def_readonly("precision_floor", &riskband::OperatingThreshold::precision_floor)
        .def_readonly("metrics", &riskband::OperatingThreshold::metrics)
        .def_property_readonly("floor_relaxed", &riskband::OperatingThreshold::floor_relaxed);

    py::class_<riskband::Band>(m, "Band")
        .def(py::init<double, double>(), py::arg("t1"), py::arg("t2"))
        .def_readonly("t1", &riskband::Band::t1)
        .def_readonly("t2", &riskband::Band::t2);

    py::class_<riskband::ScoredCase>(m, "ScoredCase")
        .def(py::init<>())
        .def(py::init([](std::string identifier, double score, std::optional<bool> label) {
                 return riskband::ScoredCase{std::move(identifier), score, label};
             }),
             py::arg("identifier"), py::arg("score"), py::arg("label") = py::none())
        .def_readwrite("identifier", &riskband::ScoredCase::identifier)
        .def_readwrite("score", &riskband::ScoredCase::score)
        .def_readwrite("label", &riskband::ScoredCase::label);

    py::class_<riskband::DecisionPacket>(m, "DecisionPacket")
        .def_readonly("identifier", &riskband::DecisionPacket::identifier)
        .def_readonly("score", &riskband::DecisionPacket::score)
        .def_readonly("t1", &riskband::DecisionPacket::t1)
        .def_readonly("t2", &riskband::DecisionPacket::t2)
        .def_readonly("route", &riskband::DecisionPacket::route)
        .def_readonly("action", &riskband::DecisionPacket::action)
        .def_readonly("model_name", &riskband::DecisionPacket::model_name)
        .def_readonly("threshold_version", &riskband::DecisionPacket::threshold_version);

    py::class_<riskband::ThresholdRecord>(m, "ThresholdRecord")
        .def_readonly("version_number", &riskband::ThresholdRecord::version_number)
        .def_readonly("version", &riskband::ThresholdRecord::version)
        .def_readonly("operating", &riskband::ThresholdRecord::operating)
        .def_readonly("band", &riskband::ThresholdRecord::band)
        .def_readonly("status", &riskband::ThresholdRecord::status);

    py::class_<riskband::FeedbackConfig>(m, "FeedbackConfig")
        .def(py::init<>())
        .def_readwrite("step", &riskband::FeedbackConfig::step)
        .def_readwrite("precision_floor", &riskband::FeedbackConfig::precision_floor)
        .def_readwrite("check", &riskband::FeedbackConfig::check)
        .def_readwrite("workers", &riskband::FeedbackConfig::workers);

    py::class_<riskband::FeedbackReport>(m, "FeedbackReport")
        .def_readonly("active_metrics", &riskband::FeedbackReport::active_metrics)
        .def_readonly("candidate_sweep", &riskband::FeedbackReport::candidate_sweep)
        .def_readonly("candidate_version", &riskband::FeedbackReport::candidate_version)
        .def_readonly("candidate", &riskband::FeedbackReport::candidate)
        .def_readonly("threshold_moved", &riskband::FeedbackReport::threshold_moved);

    py::class_<riskband::ThresholdRegistry>(m, "ThresholdRegistry")
        .def(py::init([](std::string model_name, double band_width) {
                 return riskband::ThresholdRegistry(std::move(model_name), band_width);
             }),
             py::arg("model_name"), py::arg("band_width") = 0.05)
        .def("propose", &riskband::ThresholdRegistry::propose, py::return_value_policy::copy)
        .def("promote", &riskband::ThresholdRegistry::promote, py::return_value_policy::copy)
        .def("active", [](const riskband::ThresholdRegistry& registry) -> std::optional<riskband::ThresholdRecord> {
            const auto* record = registry.active();
            if (record == nullptr) {
                return std::nullopt;
            }
            return *record;
        })
        .def_property_readonly("records", &riskband::ThresholdRegistry::records)
        .def("evaluate_feedback", &riskband::ThresholdRegistry::evaluate_feedback, py::arg("labels"),
             py::arg("scores"), py::arg("config") = riskband::FeedbackConfig{});

    m.def("safe_ratio", &riskband::safe_ratio, py::arg("numerator"), py::arg("denominator"));
    m.def("evaluate", &riskband::evaluate, py::arg("labels"), py::arg("scores"), py::arg("t"),
          py::arg("check") = riskband::ScoreCheck::kStrict);
    m.def("make_grid", &riskband::make_grid, py::arg("step") = 0.05);
    m.def("sweep", &riskband::sweep, py::arg("labels"), py::arg("scores"), py::arg("step") = 0.05,
          py::arg("check") = riskband::ScoreCheck::kStrict, py::arg("workers") = 1U);
    m.def("select_threshold", &riskband::select_threshold, py::arg("sweep"),
          py::arg("precision_floor") = std::optional<double>(0.30));
    m.def("make_band", &riskband::make_band, py::arg("t"), py::arg("band_width") = 0.05);
    m.def("route", py::overload_cast<double, double, double>(&riskband::route), py::arg("score"), py::arg("t1"),
          py::arg("t2"));
    m.def("action_from_route", py::overload_cast<riskband::Route>(&riskband::action_from_route), py::arg("route"));
    m.def("action_from_route", py::overload_cast<const std::string&>(&riskband::action_from_route),
          py::arg("route"));
    m.def("build_packets", &riskband::build_packets, py::arg("cases"), py::arg("t1"), py::arg("t2"),
          py::arg("model_name"), py::arg("threshold_version"), py::arg("check") = riskband::ScoreCheck::kStrict,
          py::arg("workers") = 1U);
}
