#ifndef RISKBAND_SELECTOR_HPP
#define RISKBAND_SELECTOR_HPP

#include <optional>
#include <string>

#include "riskband/metrics.hpp"
#include "riskband/sweep.hpp"

namespace riskband {

enum class ConstraintState {
    kUnconstrained,  // no precision floor requested
    kSatisfied,      // chosen row meets the floor
    kRelaxed,        // no row met the floor; chosen from the full sweep
};

std::string to_string(ConstraintState state);

struct OperatingThreshold {
    double threshold = 0.0;
    ConstraintState constraint = ConstraintState::kUnconstrained;
    std::optional<double> precision_floor;
    ThresholdMetrics metrics{};

    bool floor_relaxed() const { return constraint == ConstraintState::kRelaxed; }
};

// Minimizes FNR, restricted to rows with precision >= precision_floor when a
// floor is given. Ties on FNR go to the smallest threshold.
OperatingThreshold select_threshold(const SweepResult& sweep,
                                    std::optional<double> precision_floor = 0.30);

}  // namespace riskband

#endif  // RISKBAND_SELECTOR_HPP
