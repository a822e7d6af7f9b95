#include "riskband/errors.hpp"

#include <cmath>

#include "riskband/common.hpp"

namespace riskband {

std::string score_problem(double score, ScoreCheck check) {
    if (!std::isfinite(score)) {
        return "score is not finite";
    }
    if (check == ScoreCheck::kStrict && (score < 0.0 || score > 1.0)) {
        return "score " + format_double(score) + " outside [0, 1]";
    }
    return std::string();
}

void check_unit_interval(double value, const std::string& name) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw InvalidInput(name + " must be within [0, 1], got " + format_double(value));
    }
}

}  // namespace riskband
