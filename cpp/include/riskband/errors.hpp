#ifndef RISKBAND_ERRORS_HPP
#define RISKBAND_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace riskband {

// Raised when a caller-supplied value breaks a documented precondition.
class InvalidInput : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ScoreCheck {
    kStrict,            // finite and inside [0, 1]
    kAllowOutOfRange,   // finite only
};

// Empty when the score passes the check, otherwise what is wrong with it.
std::string score_problem(double score, ScoreCheck check);

void check_unit_interval(double value, const std::string& name);

}  // namespace riskband

#endif  // RISKBAND_ERRORS_HPP
