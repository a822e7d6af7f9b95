#include "riskband/selector.hpp"

#include <algorithm>
#include <vector>

namespace riskband {

namespace {

bool lower_fnr_then_threshold(const ThresholdMetrics& lhs, const ThresholdMetrics& rhs) {
    if (lhs.fnr != rhs.fnr) {
        return lhs.fnr < rhs.fnr;
    }
    return lhs.threshold < rhs.threshold;
}

const ThresholdMetrics& min_fnr_row(const std::vector<const ThresholdMetrics*>& rows) {
    return **std::min_element(rows.begin(), rows.end(),
                              [](const ThresholdMetrics* lhs, const ThresholdMetrics* rhs) {
                                  return lower_fnr_then_threshold(*lhs, *rhs);
                              });
}

}  // namespace

std::string to_string(ConstraintState state) {
    switch (state) {
        case ConstraintState::kUnconstrained:
            return "unconstrained";
        case ConstraintState::kSatisfied:
            return "satisfied";
        case ConstraintState::kRelaxed:
            return "relaxed";
    }
    return "unconstrained";
}

OperatingThreshold select_threshold(const SweepResult& sweep, std::optional<double> precision_floor) {
    if (sweep.empty()) {
        throw InvalidInput("cannot select a threshold from an empty sweep");
    }
    if (precision_floor.has_value()) {
        check_unit_interval(*precision_floor, "precision_floor");
    }

    std::vector<const ThresholdMetrics*> all;
    std::vector<const ThresholdMetrics*> eligible;
    all.reserve(sweep.rows.size());
    for (const auto& row : sweep.rows) {
        all.push_back(&row);
        if (precision_floor.has_value() && row.precision >= *precision_floor) {
            eligible.push_back(&row);
        }
    }

    OperatingThreshold result;
    result.precision_floor = precision_floor;
    if (!precision_floor.has_value()) {
        result.constraint = ConstraintState::kUnconstrained;
        result.metrics = min_fnr_row(all);
    } else if (eligible.empty()) {
        result.constraint = ConstraintState::kRelaxed;
        result.metrics = min_fnr_row(all);
    } else {
        result.constraint = ConstraintState::kSatisfied;
        result.metrics = min_fnr_row(eligible);
    }
    result.threshold = result.metrics.threshold;
    return result;
}

}  // namespace riskband
