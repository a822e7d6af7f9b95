#include "riskband/sweep.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <string>
#include <thread>

#include "riskband/common.hpp"

namespace riskband {

namespace {

constexpr int kMaxStepDecimals = 10;

double round_to(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

}  // namespace

int step_decimals(double step) {
    for (int decimals = 0; decimals < kMaxStepDecimals; ++decimals) {
        const double scaled = step * std::pow(10.0, decimals);
        const double nearest = std::round(scaled);
        // Relative to the scaled value so tiny steps do not pass at zero decimals.
        if (nearest != 0.0 && std::fabs(scaled - nearest) <= 1e-9 * std::fabs(scaled)) {
            return decimals;
        }
    }
    return kMaxStepDecimals;
}

std::vector<double> make_grid(double step) {
    if (!std::isfinite(step) || step <= 0.0 || step >= 1.0) {
        throw InvalidInput("sweep step must be within (0, 1), got " + format_double(step));
    }
    // Upper bound on the number of multiples below 1.0, before any rounding.
    const double bound = std::ceil(1.0 / step);
    if (bound > static_cast<double>(kMaxGridPoints) + 1.0) {
        throw InvalidInput("sweep step " + format_double(step) + " yields more than " +
                           std::to_string(kMaxGridPoints) + " grid points");
    }
    const auto count = static_cast<size_t>(bound);
    const int decimals = step_decimals(step);

    std::vector<double> grid;
    grid.reserve(count);
    // Multiples of step rather than repeated addition so error does not accumulate.
    for (size_t index = 1; index <= count; ++index) {
        const double point = round_to(step * static_cast<double>(index), decimals);
        if (point >= 1.0) {
            break;
        }
        if (point <= 0.0 || (!grid.empty() && point <= grid.back())) {
            continue;
        }
        grid.push_back(point);
    }
    if (grid.empty()) {
        throw InvalidInput("sweep step " + format_double(step) + " yields no grid points");
    }
    return grid;
}

SweepResult sweep(const std::vector<bool>& labels, const std::vector<double>& scores, double step,
                  ScoreCheck check, unsigned workers) {
    const auto grid = make_grid(step);
    // Validated once here; the grid points below count without re-checking.
    check_labeled_input(labels, scores, check);

    SweepResult result;
    result.step = step;
    result.rows.resize(grid.size());

    if (workers <= 1 || grid.size() <= 1) {
        for (size_t i = 0; i < grid.size(); ++i) {
            result.rows[i] = count_at_threshold(labels, scores, grid[i]);
        }
        return result;
    }

    const size_t thread_count = std::min<size_t>(workers, grid.size());
    std::vector<std::thread> threads;
    std::vector<std::exception_ptr> errors(thread_count);
    threads.reserve(thread_count);
    for (size_t worker = 0; worker < thread_count; ++worker) {
        threads.emplace_back([&, worker]() {
            try {
                // Each worker owns the slots worker, worker + thread_count, ...
                for (size_t i = worker; i < grid.size(); i += thread_count) {
                    result.rows[i] = count_at_threshold(labels, scores, grid[i]);
                }
            } catch (...) {
                errors[worker] = std::current_exception();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
    return result;
}

}  // namespace riskband
