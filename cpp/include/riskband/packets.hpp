#ifndef RISKBAND_PACKETS_HPP
#define RISKBAND_PACKETS_HPP

#include <optional>
#include <string>
#include <vector>

#include "riskband/band.hpp"
#include "riskband/errors.hpp"
#include "riskband/router.hpp"

namespace riskband {

struct ScoredCase {
    std::string identifier;
    double score = 0.0;
    std::optional<bool> label;
};

struct DecisionPacket {
    std::string identifier;
    double score = 0.0;
    double t1 = 0.0;
    double t2 = 0.0;
    Route route = Route::kReview;
    Action action = Action::kManualReview;
    std::string model_name;
    std::string threshold_version;
};

// One packet per case, in input order. t1, t2, model_name and
// threshold_version are stamped on every packet.
std::vector<DecisionPacket> build_packets(const std::vector<ScoredCase>& cases, double t1, double t2,
                                          const std::string& model_name, const std::string& threshold_version,
                                          ScoreCheck check = ScoreCheck::kStrict, unsigned workers = 1);

}  // namespace riskband

#endif  // RISKBAND_PACKETS_HPP
