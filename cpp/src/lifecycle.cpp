#include "riskband/lifecycle.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "riskband/common.hpp"

namespace riskband {

std::string to_string(ThresholdStatus status) {
    switch (status) {
        case ThresholdStatus::kProposed:
            return "PROPOSED";
        case ThresholdStatus::kActive:
            return "ACTIVE";
        case ThresholdStatus::kSuperseded:
            return "SUPERSEDED";
    }
    return "PROPOSED";
}

std::string make_threshold_version(const std::string& model_name, int version_number, double threshold) {
    return model_name + "_v" + std::to_string(version_number) + "_t" + format_double(threshold);
}

ThresholdRegistry::ThresholdRegistry(std::string model_name, double band_width, Logger logger)
    : model_name_(std::move(model_name)), band_width_(band_width), logger_(std::move(logger)) {
    if (model_name_.empty()) {
        throw InvalidInput("model_name must be non-empty");
    }
    if (!std::isfinite(band_width_) || band_width_ < 0.0) {
        throw InvalidInput("band_width must be finite and >= 0, got " + format_double(band_width_));
    }
}

const ThresholdRecord& ThresholdRegistry::propose(const OperatingThreshold& operating) {
    check_unit_interval(operating.threshold, "threshold");
    ThresholdRecord record;
    record.version_number = static_cast<int>(records_.size()) + 1;
    record.version = make_threshold_version(model_name_, record.version_number, operating.threshold);
    record.operating = operating;
    record.status = ThresholdStatus::kProposed;
    records_.push_back(std::move(record));
    const auto& proposed = records_.back();
    logger_.info("threshold_proposed", {{"version", proposed.version},
                                        {"constraint", to_string(proposed.operating.constraint)}});
    return proposed;
}

const ThresholdRecord& ThresholdRegistry::promote(const std::string& version) {
    auto* record = find_mutable(version);
    if (record == nullptr) {
        throw InvalidInput("unknown threshold version " + version);
    }
    if (record->status != ThresholdStatus::kProposed) {
        throw InvalidInput("threshold version " + version + " is " + to_string(record->status) +
                           ", only PROPOSED versions can be promoted");
    }

    // Build the band first so a failure leaves the registry unchanged.
    const Band band = make_band(record->operating.threshold, band_width_);
    std::string superseded;
    for (auto& other : records_) {
        if (other.status == ThresholdStatus::kActive) {
            other.status = ThresholdStatus::kSuperseded;
            superseded = other.version;
        }
    }
    record->band = band;
    record->status = ThresholdStatus::kActive;
    logger_.info("threshold_promoted", {{"version", version},
                                        {"t1", format_double(band.t1)},
                                        {"t2", format_double(band.t2)},
                                        {"superseded", superseded}});
    return *record;
}

const ThresholdRecord* ThresholdRegistry::active() const {
    auto it = std::find_if(records_.begin(), records_.end(), [](const ThresholdRecord& record) {
        return record.status == ThresholdStatus::kActive;
    });
    return it == records_.end() ? nullptr : &*it;
}

const ThresholdRecord* ThresholdRegistry::find(const std::string& version) const {
    auto it = std::find_if(records_.begin(), records_.end(), [&](const ThresholdRecord& record) {
        return record.version == version;
    });
    return it == records_.end() ? nullptr : &*it;
}

ThresholdRecord* ThresholdRegistry::find_mutable(const std::string& version) {
    auto it = std::find_if(records_.begin(), records_.end(), [&](const ThresholdRecord& record) {
        return record.version == version;
    });
    return it == records_.end() ? nullptr : &*it;
}

const std::vector<ThresholdRecord>& ThresholdRegistry::records() const {
    return records_;
}

const std::string& ThresholdRegistry::model_name() const {
    return model_name_;
}

FeedbackReport ThresholdRegistry::evaluate_feedback(const std::vector<bool>& labels,
                                                    const std::vector<double>& scores,
                                                    const FeedbackConfig& config) {
    const auto* current = active();
    if (current == nullptr) {
        throw InvalidInput("feedback requires an ACTIVE threshold for model " + model_name_);
    }

    FeedbackReport report;
    report.active_metrics = evaluate(labels, scores, current->operating.threshold, config.check);
    report.candidate_sweep = sweep(labels, scores, config.step, config.check, config.workers);
    report.candidate = select_threshold(report.candidate_sweep, config.precision_floor);
    report.threshold_moved = report.candidate.threshold != current->operating.threshold;
    // propose() may reallocate records_, so current is not used past this point.
    report.candidate_version = propose(report.candidate).version;
    return report;
}

}  // namespace riskband
