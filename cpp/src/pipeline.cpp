#include "riskband/pipeline.hpp"

#include <map>
#include <string>

#include "riskband/common.hpp"

namespace riskband {

ScoreCheck score_check(const RiskbandSettings& settings) {
    return settings.input.allow_out_of_range ? ScoreCheck::kAllowOutOfRange : ScoreCheck::kStrict;
}

FeedbackConfig feedback_config(const RiskbandSettings& settings) {
    FeedbackConfig config;
    config.step = settings.sweep.step;
    config.precision_floor = settings.selection.precision_floor;
    config.check = score_check(settings);
    config.workers = settings.sweep.workers;
    return config;
}

CalibrationResult calibrate(const std::vector<bool>& labels, const std::vector<double>& scores,
                            const RiskbandSettings& settings, const Logger& logger) {
    settings.validate();
    const auto check = score_check(settings);

    CalibrationResult result;
    result.sweep = sweep(labels, scores, settings.sweep.step, check, settings.sweep.workers);
    result.operating = select_threshold(result.sweep, settings.selection.precision_floor);
    result.chosen_metrics = evaluate(labels, scores, result.operating.threshold, check);

    if (result.operating.floor_relaxed()) {
        logger.warn("precision_floor_relaxed",
                    {{"model", settings.model_name},
                     {"precision_floor", format_double(*settings.selection.precision_floor)},
                     {"threshold", format_double(result.operating.threshold)}});
    }
    logger.info("calibration_complete", {{"model", settings.model_name},
                                         {"samples", std::to_string(labels.size())},
                                         {"grid_points", std::to_string(result.sweep.size())},
                                         {"threshold", format_double(result.operating.threshold)},
                                         {"constraint", to_string(result.operating.constraint)},
                                         {"fnr", format_double(result.chosen_metrics.fnr)},
                                         {"precision", format_double(result.chosen_metrics.precision)}});
    return result;
}

ModelRun activate_model(const std::vector<bool>& labels, const std::vector<double>& scores,
                        const RiskbandSettings& settings, const Logger& logger) {
    ModelRun run{settings, calibrate(labels, scores, settings, logger),
                 ThresholdRegistry(settings.model_name, settings.band.band_width), std::string()};
    const std::string proposed = run.registry.propose(run.calibration.operating).version;
    run.version = run.registry.promote(proposed).version;
    return run;
}

SummaryEntry summary_entry(const ModelRun& run) {
    const auto* active = run.registry.find(run.version);
    if (active == nullptr || !active->band.has_value()) {
        throw InvalidInput("no banded threshold " + run.version + " for model " + run.settings.model_name);
    }
    return SummaryEntry{run.settings.model_name, active->version, run.calibration.operating, *active->band,
                        run.calibration.chosen_metrics};
}

std::vector<DecisionPacket> route_cases(const std::vector<ScoredCase>& cases, const ThresholdRegistry& registry,
                                        const RiskbandSettings& settings, const Logger& logger) {
    const auto* active = registry.active();
    if (active == nullptr || !active->band.has_value()) {
        throw InvalidInput("routing requires an ACTIVE threshold for model " + registry.model_name());
    }

    const auto& band = *active->band;
    auto packets = build_packets(cases, band.t1, band.t2, registry.model_name(), active->version,
                                 score_check(settings), settings.sweep.workers);

    std::map<Route, size_t> counts;
    for (const auto& packet : packets) {
        counts[packet.route] += 1;
    }
    logger.info("cases_routed", {{"model", registry.model_name()},
                                 {"threshold_version", active->version},
                                 {"cases", std::to_string(packets.size())},
                                 {"low_risk", std::to_string(counts[Route::kLowRisk])},
                                 {"review", std::to_string(counts[Route::kReview])},
                                 {"high_risk", std::to_string(counts[Route::kHighRisk])}});
    return packets;
}

FeedbackReport apply_feedback(ThresholdRegistry& registry, const std::vector<bool>& labels,
                              const std::vector<double>& scores, const RiskbandSettings& settings,
                              const Logger& logger) {
    settings.validate();
    const auto* active = registry.active();
    const std::string active_version = active != nullptr ? active->version : "";

    auto report = registry.evaluate_feedback(labels, scores, feedback_config(settings));

    if (report.candidate.floor_relaxed()) {
        logger.warn("precision_floor_relaxed", {{"model", registry.model_name()},
                                                {"threshold", format_double(report.candidate.threshold)}});
    }
    logger.info("feedback_evaluated", {{"model", registry.model_name()},
                                       {"active_version", active_version},
                                       {"active_fnr", format_double(report.active_metrics.fnr)},
                                       {"active_precision", format_double(report.active_metrics.precision)},
                                       {"candidate_version", report.candidate_version},
                                       {"threshold_moved", report.threshold_moved ? "true" : "false"}});
    return report;
}

}  // namespace riskband
