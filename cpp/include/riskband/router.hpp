#ifndef RISKBAND_ROUTER_HPP
#define RISKBAND_ROUTER_HPP

#include <optional>
#include <string>
#include <vector>

#include "riskband/band.hpp"

namespace riskband {

enum class Route {
    kLowRisk,
    kReview,
    kHighRisk,
};

enum class Action {
    kAutoApprove,
    kManualReview,
    kInterveneOrBlock,
};

std::string to_string(Route route);
std::string to_string(Action action);
std::optional<Route> parse_route(const std::string& name);

// score < t1 -> low_risk, t1 <= score < t2 -> review, score >= t2 -> high_risk.
Route route(double score, double t1, double t2);
Route route(double score, const Band& band);

// Routes every score; output index i belongs to scores[i].
std::vector<Route> route_batch(const std::vector<double>& scores, const Band& band, unsigned workers = 1);

Action action_from_route(Route route);
// Unknown names resolve to manual_review.
Action action_from_route(const std::string& route_name);

}  // namespace riskband

#endif  // RISKBAND_ROUTER_HPP
