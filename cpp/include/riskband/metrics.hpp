#ifndef RISKBAND_METRICS_HPP
#define RISKBAND_METRICS_HPP

#include <cstdint>
#include <vector>

#include "riskband/errors.hpp"

namespace riskband {

struct ThresholdMetrics {
    double threshold = 0.0;
    std::int64_t tp = 0;
    std::int64_t fp = 0;
    std::int64_t tn = 0;
    std::int64_t fn = 0;
    double precision = 0.0;
    double recall = 0.0;
    double fpr = 0.0;
    double fnr = 0.0;
    double f1 = 0.0;

    std::int64_t total() const { return tp + fp + tn + fn; }
    std::int64_t positives() const { return tp + fn; }
};

// numerator / denominator, or 0.0 when the denominator is zero.
double safe_ratio(double numerator, double denominator);

// Confusion counts and ratios with a case predicted positive iff score >= threshold.
ThresholdMetrics evaluate(const std::vector<bool>& labels, const std::vector<double>& scores,
                          double threshold, ScoreCheck check = ScoreCheck::kStrict);

// evaluate() without the input checks. Callers validate once with
// check_labeled_input and then count at as many thresholds as they need.
ThresholdMetrics count_at_threshold(const std::vector<bool>& labels, const std::vector<double>& scores,
                                    double threshold);

void check_labeled_input(const std::vector<bool>& labels, const std::vector<double>& scores,
                         ScoreCheck check);

}  // namespace riskband

#endif  // RISKBAND_METRICS_HPP
