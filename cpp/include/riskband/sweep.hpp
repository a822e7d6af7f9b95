#ifndef RISKBAND_SWEEP_HPP
#define RISKBAND_SWEEP_HPP

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "riskband/metrics.hpp"

namespace riskband {

struct SweepResult {
    double step = 0.05;
    std::vector<ThresholdMetrics> rows;

    bool empty() const { return rows.empty(); }
    size_t size() const { return rows.size(); }
};

// Largest grid make_grid will build; finer steps are rejected (0.001 gives 999).
constexpr size_t kMaxGridPoints = 10000;

// Decimal places needed to represent step exactly (0.05 -> 2, 0.1 -> 1).
int step_decimals(double step);

// step, 2*step, ... strictly below 1.0, each rounded to step_decimals(step).
// Throws InvalidInput when the grid would be empty or exceed kMaxGridPoints.
std::vector<double> make_grid(double step);

// Evaluates every grid point. With workers > 1 the points are spread over
// threads; rows always come back in ascending threshold order.
SweepResult sweep(const std::vector<bool>& labels, const std::vector<double>& scores, double step = 0.05,
                  ScoreCheck check = ScoreCheck::kStrict, unsigned workers = 1);

// Exhaustive search over an arbitrary grid. Returns the first point (in grid
// order) with the largest objective value, or nullopt for an empty grid.
template <typename Point, typename Objective>
std::optional<std::pair<Point, double>> grid_search(const std::vector<Point>& grid, Objective objective) {
    std::optional<std::pair<Point, double>> best;
    for (const auto& point : grid) {
        const double value = objective(point);
        if (!best.has_value() || value > best->second) {
            best = std::make_pair(point, value);
        }
    }
    return best;
}

}  // namespace riskband

#endif  // RISKBAND_SWEEP_HPP
