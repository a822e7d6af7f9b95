#include "riskband/config.hpp"
#include "riskband/logging.hpp"
#include "riskband/pipeline.hpp"
#include "riskband/reporting.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " --config <path> --labeled <csv> [--cases <csv>] [--outcomes <csv>] [--out <dir>]\n";
}

std::string output_path(const std::string& directory, const std::string& file_name) {
    return (std::filesystem::path(directory) / file_name).string();
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string labeled_path;
    std::string cases_path;
    std::string outcomes_path;
    std::string out_dir;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string* target = nullptr;
        if (arg == "--config") {
            target = &config_path;
        } else if (arg == "--labeled") {
            target = &labeled_path;
        } else if (arg == "--cases") {
            target = &cases_path;
        } else if (arg == "--outcomes") {
            target = &outcomes_path;
        } else if (arg == "--out") {
            target = &out_dir;
        } else {
            print_usage(argv[0]);
            return 1;
        }
        if (i + 1 >= argc) {
            print_usage(argv[0]);
            return 1;
        }
        *target = argv[++i];
    }

    if (config_path.empty() || labeled_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        const auto settings = riskband::RiskbandSettings::from_toml(config_path);
        riskband::configure_logging(settings.logging);
        auto logger = riskband::get_logger("cli");
        if (out_dir.empty()) {
            out_dir = settings.output.directory;
        }
        std::filesystem::create_directories(out_dir);

        std::vector<riskband::SummaryEntry> summary;
        for (const auto& model_config : settings.model_list()) {
            const auto model_settings = settings.for_model(model_config);
            const std::string& model = model_settings.model_name;

            const auto labeled = riskband::read_labeled_csv(labeled_path, model_settings.input);
            auto run = riskband::activate_model(labeled.labels, labeled.scores, model_settings);
            riskband::write_text_file(output_path(out_dir, model + "_threshold_sweep.csv"),
                                      riskband::render_sweep_csv(run.calibration.sweep));
            summary.push_back(riskband::summary_entry(run));

            if (!cases_path.empty()) {
                const auto cases = riskband::read_cases_csv(cases_path, model_settings.input);
                const auto packets = riskband::route_cases(cases, run.registry, model_settings);
                riskband::write_text_file(output_path(out_dir, model + "_decision_packet.csv"),
                                          riskband::render_packets_csv(packets));
            }

            if (!outcomes_path.empty()) {
                const auto outcomes = riskband::read_labeled_csv(outcomes_path, model_settings.input);
                const auto report =
                    riskband::apply_feedback(run.registry, outcomes.labels, outcomes.scores, model_settings);
                riskband::write_text_file(output_path(out_dir, model + "_feedback_sweep.csv"),
                                          riskband::render_sweep_csv(report.candidate_sweep));
                riskband::write_text_file(output_path(out_dir, model + "_feedback.json"),
                                          riskband::render_feedback_json(report, run.version));
            }

            logger.info("model_complete", {{"model", model}, {"threshold_version", run.version}});
        }

        // Written once, after every model, so the file always covers the whole run.
        riskband::write_text_file(output_path(out_dir, "summary.json"), riskband::render_summary_json(summary));
        logger.info("run_complete", {{"models", std::to_string(summary.size())}, {"output_dir", out_dir}});
    } catch (const std::exception& exc) {
        std::cerr << "riskband error: " << exc.what() << "\n";
        return 1;
    }

    return 0;
}
