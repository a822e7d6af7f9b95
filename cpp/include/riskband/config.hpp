#ifndef RISKBAND_CONFIG_HPP
#define RISKBAND_CONFIG_HPP

#include <optional>
#include <string>
#include <vector>

namespace riskband {

struct LoggingConfig {
    std::string level = "INFO";
    bool json = true;
    std::optional<std::string> log_file = std::nullopt;
    int max_bytes = 1'000'000;
    int backup_count = 3;
};

struct SweepConfig {
    double step = 0.05;
    unsigned workers = 1;
};

struct SelectionConfig {
    std::optional<double> precision_floor = 0.30;
};

struct BandConfig {
    double band_width = 0.05;
};

struct InputConfig {
    std::string id_column = "Customer_ID";
    std::string score_column = "score";
    std::string label_column = "Delinquent_Account";
    bool allow_out_of_range = false;
};

struct OutputConfig {
    std::string directory = "reports_out";
};

// One scored model in a multi-model run; its scores sit in score_column of
// the shared labeled and case files.
struct ModelConfig {
    std::string name;
    std::string score_column;
};

struct RiskbandSettings {
    std::string model_name = "model";
    std::vector<ModelConfig> models;  // [[models]] tables; empty means model_name alone
    LoggingConfig logging{};
    SweepConfig sweep{};
    SelectionConfig selection{};
    BandConfig band{};
    InputConfig input{};
    OutputConfig output{};

    // Throws InvalidInput naming the first out-of-range value.
    void validate() const;

    // The configured models, or model_name reading input.score_column when
    // no [[models]] table is present.
    std::vector<ModelConfig> model_list() const;

    // A copy narrowed to one model: model_name and input.score_column are
    // taken from the entry and models is cleared.
    RiskbandSettings for_model(const ModelConfig& model) const;

    static RiskbandSettings from_toml(const std::string& path);
    static RiskbandSettings from_toml_string(const std::string& text);
};

}  // namespace riskband

#endif  // RISKBAND_CONFIG_HPP
