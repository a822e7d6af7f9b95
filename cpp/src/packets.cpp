#include "riskband/packets.hpp"

#include <string>

namespace riskband {

std::vector<DecisionPacket> build_packets(const std::vector<ScoredCase>& cases, double t1, double t2,
                                          const std::string& model_name, const std::string& threshold_version,
                                          ScoreCheck check, unsigned workers) {
    std::vector<double> scores;
    scores.reserve(cases.size());
    for (size_t i = 0; i < cases.size(); ++i) {
        const auto problem = score_problem(cases[i].score, check);
        if (!problem.empty()) {
            throw InvalidInput("case '" + cases[i].identifier + "' (index " + std::to_string(i) + "): " + problem);
        }
        scores.push_back(cases[i].score);
    }

    const auto routes = route_batch(scores, Band{t1, t2}, workers);

    std::vector<DecisionPacket> packets;
    packets.reserve(cases.size());
    for (size_t i = 0; i < cases.size(); ++i) {
        packets.push_back(DecisionPacket{cases[i].identifier, cases[i].score, t1, t2, routes[i],
                                         action_from_route(routes[i]), model_name, threshold_version});
    }
    return packets;
}

}  // namespace riskband
