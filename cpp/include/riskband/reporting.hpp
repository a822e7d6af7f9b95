#ifndef RISKBAND_REPORTING_HPP
#define RISKBAND_REPORTING_HPP

#include <istream>
#include <string>
#include <vector>

#include "riskband/band.hpp"
#include "riskband/config.hpp"
#include "riskband/lifecycle.hpp"
#include "riskband/metrics.hpp"
#include "riskband/packets.hpp"
#include "riskband/selector.hpp"
#include "riskband/sweep.hpp"

namespace riskband {

struct LabeledData {
    std::vector<bool> labels;
    std::vector<double> scores;
};

struct SummaryEntry {
    std::string model_name;
    std::string threshold_version;
    OperatingThreshold operating{};
    Band band{};
    ThresholdMetrics chosen_metrics{};
};

LabeledData read_labeled_csv(std::istream& input, const InputConfig& config);
LabeledData read_labeled_csv(const std::string& path, const InputConfig& config);
std::vector<ScoredCase> read_cases_csv(std::istream& input, const InputConfig& config);
std::vector<ScoredCase> read_cases_csv(const std::string& path, const InputConfig& config);

std::string render_sweep_csv(const SweepResult& sweep);
std::string render_packets_csv(const std::vector<DecisionPacket>& packets);
std::string render_metrics_json(const ThresholdMetrics& metrics);
std::string render_summary_json(const std::vector<SummaryEntry>& entries);
std::string render_feedback_json(const FeedbackReport& report, const std::string& active_version);

// Writes content in one piece; throws std::runtime_error if the file cannot be written.
void write_text_file(const std::string& path, const std::string& content);

}  // namespace riskband

#endif  // RISKBAND_REPORTING_HPP
