#ifndef RISKBAND_PIPELINE_HPP
#define RISKBAND_PIPELINE_HPP

#include <string>
#include <vector>

#include "riskband/config.hpp"
#include "riskband/lifecycle.hpp"
#include "riskband/logging.hpp"
#include "riskband/packets.hpp"
#include "riskband/reporting.hpp"
#include "riskband/selector.hpp"
#include "riskband/sweep.hpp"

namespace riskband {

struct CalibrationResult {
    SweepResult sweep{};
    OperatingThreshold operating{};
    ThresholdMetrics chosen_metrics{};
};

ScoreCheck score_check(const RiskbandSettings& settings);
FeedbackConfig feedback_config(const RiskbandSettings& settings);

// Offline stage: sweep the labeled scores and select the operating threshold.
CalibrationResult calibrate(const std::vector<bool>& labels, const std::vector<double>& scores,
                            const RiskbandSettings& settings, const Logger& logger = get_logger("pipeline"));

// One model carried through calibration and activation of its first threshold.
struct ModelRun {
    RiskbandSettings settings;  // narrowed with RiskbandSettings::for_model
    CalibrationResult calibration;
    ThresholdRegistry registry;
    std::string version;        // the ACTIVE threshold version
};

// Calibrates one model, then proposes and promotes the selected threshold in
// a fresh registry. settings must already be narrowed to that model.
ModelRun activate_model(const std::vector<bool>& labels, const std::vector<double>& scores,
                        const RiskbandSettings& settings, const Logger& logger = get_logger("pipeline"));

SummaryEntry summary_entry(const ModelRun& run);

// Online stage: packets for every case under the registry's ACTIVE threshold.
std::vector<DecisionPacket> route_cases(const std::vector<ScoredCase>& cases, const ThresholdRegistry& registry,
                                        const RiskbandSettings& settings,
                                        const Logger& logger = get_logger("pipeline"));

// Feedback stage: score the ACTIVE threshold on outcomes and propose a successor.
FeedbackReport apply_feedback(ThresholdRegistry& registry, const std::vector<bool>& labels,
                              const std::vector<double>& scores, const RiskbandSettings& settings,
                              const Logger& logger = get_logger("pipeline"));

}  // namespace riskband

#endif  // RISKBAND_PIPELINE_HPP
