#ifndef RISKBAND_LIFECYCLE_HPP
#define RISKBAND_LIFECYCLE_HPP

#include <optional>
#include <string>
#include <vector>

#include "riskband/band.hpp"
#include "riskband/logging.hpp"
#include "riskband/metrics.hpp"
#include "riskband/selector.hpp"

namespace riskband {

enum class ThresholdStatus {
    kProposed,
    kActive,
    kSuperseded,
};

std::string to_string(ThresholdStatus status);

struct ThresholdRecord {
    int version_number = 0;
    std::string version;
    OperatingThreshold operating{};
    std::optional<Band> band;
    ThresholdStatus status = ThresholdStatus::kProposed;
};

struct FeedbackConfig {
    double step = 0.05;
    std::optional<double> precision_floor = 0.30;
    ScoreCheck check = ScoreCheck::kStrict;
    unsigned workers = 1;
};

struct FeedbackReport {
    ThresholdMetrics active_metrics{};
    SweepResult candidate_sweep{};
    std::string candidate_version;
    OperatingThreshold candidate{};
    bool threshold_moved = false;
};

std::string make_threshold_version(const std::string& model_name, int version_number, double threshold);

// Versioned operating thresholds for one model. Records move
// PROPOSED -> ACTIVE -> SUPERSEDED; promotion is always an explicit call.
class ThresholdRegistry {
public:
    explicit ThresholdRegistry(std::string model_name, double band_width = 0.05,
                               Logger logger = get_logger("ThresholdRegistry"));

    const ThresholdRecord& propose(const OperatingThreshold& operating);
    const ThresholdRecord& promote(const std::string& version);

    const ThresholdRecord* active() const;
    const ThresholdRecord* find(const std::string& version) const;
    const std::vector<ThresholdRecord>& records() const;
    const std::string& model_name() const;

    // Scores the active threshold against observed outcomes and proposes the
    // threshold the same outcomes would select.
    FeedbackReport evaluate_feedback(const std::vector<bool>& labels, const std::vector<double>& scores,
                                     const FeedbackConfig& config);

private:
    ThresholdRecord* find_mutable(const std::string& version);

    std::string model_name_;
    double band_width_ = 0.05;
    std::vector<ThresholdRecord> records_;
    Logger logger_;
};

}  // namespace riskband

#endif  // RISKBAND_LIFECYCLE_HPP
