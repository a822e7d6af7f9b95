#include "riskband/metrics.hpp"

#include <string>

namespace riskband {

double safe_ratio(double numerator, double denominator) {
    if (denominator == 0.0) {
        return 0.0;
    }
    return numerator / denominator;
}

void check_labeled_input(const std::vector<bool>& labels, const std::vector<double>& scores,
                         ScoreCheck check) {
    if (labels.empty()) {
        throw InvalidInput("labeled dataset must be non-empty");
    }
    if (labels.size() != scores.size()) {
        throw InvalidInput("labels and scores differ in length (" + std::to_string(labels.size()) +
                           " vs " + std::to_string(scores.size()) + ")");
    }
    for (size_t i = 0; i < scores.size(); ++i) {
        const auto problem = score_problem(scores[i], check);
        if (!problem.empty()) {
            throw InvalidInput("scores[" + std::to_string(i) + "]: " + problem);
        }
    }
}

ThresholdMetrics evaluate(const std::vector<bool>& labels, const std::vector<double>& scores,
                          double threshold, ScoreCheck check) {
    check_unit_interval(threshold, "threshold");
    check_labeled_input(labels, scores, check);
    return count_at_threshold(labels, scores, threshold);
}

ThresholdMetrics count_at_threshold(const std::vector<bool>& labels, const std::vector<double>& scores,
                                    double threshold) {
    ThresholdMetrics result;
    result.threshold = threshold;
    for (size_t i = 0; i < scores.size(); ++i) {
        const bool predicted = scores[i] >= threshold;
        const bool actual = labels[i];
        if (predicted && actual) {
            result.tp += 1;
        } else if (predicted) {
            result.fp += 1;
        } else if (actual) {
            result.fn += 1;
        } else {
            result.tn += 1;
        }
    }

    const auto tp = static_cast<double>(result.tp);
    const auto fp = static_cast<double>(result.fp);
    const auto tn = static_cast<double>(result.tn);
    const auto fn = static_cast<double>(result.fn);

    result.precision = safe_ratio(tp, tp + fp);
    result.recall = safe_ratio(tp, tp + fn);
    // Derived from recall so that fnr == 1 - recall holds bit for bit.
    result.fnr = (tp + fn) > 0.0 ? 1.0 - result.recall : 0.0;
    result.fpr = safe_ratio(fp, fp + tn);
    result.f1 = safe_ratio(2.0 * result.precision * result.recall, result.precision + result.recall);
    return result;
}

}  // namespace riskband
