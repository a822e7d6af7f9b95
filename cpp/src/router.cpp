#include "riskband/router.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <thread>

#include "riskband/common.hpp"
#include "riskband/errors.hpp"

namespace riskband {

namespace {

void check_band(double t1, double t2) {
    if (std::isnan(t1) || std::isnan(t2)) {
        throw InvalidInput("band edges must not be NaN");
    }
    if (t1 > t2) {
        throw InvalidInput("band edges out of order: t1 " + format_double(t1) + " > t2 " + format_double(t2));
    }
}

Route classify(double score, double t1, double t2) {
    if (score < t1) {
        return Route::kLowRisk;
    }
    if (score < t2) {
        return Route::kReview;
    }
    return Route::kHighRisk;
}

}  // namespace

std::string to_string(Route route) {
    switch (route) {
        case Route::kLowRisk:
            return "low_risk";
        case Route::kReview:
            return "review";
        case Route::kHighRisk:
            return "high_risk";
    }
    return "review";
}

std::string to_string(Action action) {
    switch (action) {
        case Action::kAutoApprove:
            return "auto_approve";
        case Action::kManualReview:
            return "manual_review";
        case Action::kInterveneOrBlock:
            return "intervene_or_block";
    }
    return "manual_review";
}

std::optional<Route> parse_route(const std::string& name) {
    if (name == "low_risk") {
        return Route::kLowRisk;
    }
    if (name == "review") {
        return Route::kReview;
    }
    if (name == "high_risk") {
        return Route::kHighRisk;
    }
    return std::nullopt;
}

Route route(double score, double t1, double t2) {
    check_band(t1, t2);
    if (std::isnan(score)) {
        throw InvalidInput("cannot route a NaN score");
    }
    return classify(score, t1, t2);
}

Route route(double score, const Band& band) {
    return route(score, band.t1, band.t2);
}

std::vector<Route> route_batch(const std::vector<double>& scores, const Band& band, unsigned workers) {
    check_band(band.t1, band.t2);
    for (size_t i = 0; i < scores.size(); ++i) {
        if (std::isnan(scores[i])) {
            throw InvalidInput("cannot route a NaN score at index " + std::to_string(i));
        }
    }

    std::vector<Route> routes(scores.size(), Route::kReview);
    const size_t thread_count = std::min<size_t>(std::max(1U, workers), scores.size());
    if (thread_count <= 1) {
        for (size_t i = 0; i < scores.size(); ++i) {
            routes[i] = classify(scores[i], band.t1, band.t2);
        }
        return routes;
    }

    // Contiguous chunks; classify cannot throw once the inputs are checked.
    const size_t chunk = (scores.size() + thread_count - 1) / thread_count;
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (size_t begin = 0; begin < scores.size(); begin += chunk) {
        const size_t end = std::min(scores.size(), begin + chunk);
        threads.emplace_back([&, begin, end]() {
            for (size_t i = begin; i < end; ++i) {
                routes[i] = classify(scores[i], band.t1, band.t2);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    return routes;
}

Action action_from_route(Route route) {
    switch (route) {
        case Route::kLowRisk:
            return Action::kAutoApprove;
        case Route::kHighRisk:
            return Action::kInterveneOrBlock;
        case Route::kReview:
            return Action::kManualReview;
    }
    return Action::kManualReview;
}

Action action_from_route(const std::string& route_name) {
    const auto parsed = parse_route(route_name);
    if (!parsed.has_value()) {
        return Action::kManualReview;
    }
    return action_from_route(*parsed);
}

}  // namespace riskband
