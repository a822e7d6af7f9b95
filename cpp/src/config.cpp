#include "riskband/config.hpp"

#include <cmath>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>

#include "riskband/common.hpp"
#include "riskband/errors.hpp"
#include "riskband/sweep.hpp"

namespace riskband {

namespace {

bool parse_bool(const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    throw std::runtime_error("invalid boolean: " + value);
}

std::optional<std::string> parse_optional_string(const std::string& value) {
    auto stripped = strip_quotes(trim(value));
    const auto lowered = to_lower(stripped);
    if (lowered == "null" || lowered == "none") {
        return std::nullopt;
    }
    return stripped;
}

double parse_double(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::runtime_error("invalid number for " + key + ": " + value);
    }
}

int parse_int(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::runtime_error("invalid integer for " + key + ": " + value);
    }
}

// Strips a trailing comment, leaving '#' inside quotes alone.
std::string strip_comment(const std::string& line) {
    char quote = '\0';
    for (size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quote != '\0') {
            if (ch == quote) {
                quote = '\0';
            }
        } else if (ch == '"' || ch == '\'') {
            quote = ch;
        } else if (ch == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

RiskbandSettings parse(std::istream& input) {
    RiskbandSettings settings;
    std::string current_section;
    std::string line;

    while (std::getline(input, line)) {
        line = trim(strip_comment(line));
        if (line.empty()) {
            continue;
        }
        if (line.size() >= 4 && line.compare(0, 2, "[[") == 0 && line.compare(line.size() - 2, 2, "]]") == 0) {
            current_section = trim(line.substr(2, line.size() - 4));
            if (current_section != "models") {
                throw std::runtime_error("unsupported array table: " + current_section);
            }
            settings.models.emplace_back();
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        auto key = trim(line.substr(0, eq_pos));
        auto value = trim(line.substr(eq_pos + 1));

        if (current_section.empty()) {
            if (key == "model_name") {
                settings.model_name = strip_quotes(value);
            }
        } else if (current_section == "logging") {
            if (key == "level") {
                settings.logging.level = strip_quotes(value);
            } else if (key == "json") {
                settings.logging.json = parse_bool(value);
            } else if (key == "log_file") {
                settings.logging.log_file = parse_optional_string(value);
            } else if (key == "max_bytes") {
                settings.logging.max_bytes = parse_int(key, value);
            } else if (key == "backup_count") {
                settings.logging.backup_count = parse_int(key, value);
            }
        } else if (current_section == "sweep") {
            if (key == "step") {
                settings.sweep.step = parse_double(key, value);
            } else if (key == "workers") {
                const int workers = parse_int(key, value);
                if (workers < 1) {
                    throw InvalidInput("sweep.workers must be >= 1");
                }
                settings.sweep.workers = static_cast<unsigned>(workers);
            }
        } else if (current_section == "selection") {
            if (key == "precision_floor") {
                auto parsed = parse_optional_string(value);
                if (parsed.has_value()) {
                    settings.selection.precision_floor = parse_double(key, *parsed);
                } else {
                    settings.selection.precision_floor = std::nullopt;
                }
            }
        } else if (current_section == "band") {
            if (key == "band_width") {
                settings.band.band_width = parse_double(key, value);
            }
        } else if (current_section == "input") {
            if (key == "id_column") {
                settings.input.id_column = strip_quotes(value);
            } else if (key == "score_column") {
                settings.input.score_column = strip_quotes(value);
            } else if (key == "label_column") {
                settings.input.label_column = strip_quotes(value);
            } else if (key == "allow_out_of_range") {
                settings.input.allow_out_of_range = parse_bool(value);
            }
        } else if (current_section == "models") {
            if (settings.models.empty()) {
                throw std::runtime_error("models keys must follow a [[models]] header");
            }
            if (key == "name") {
                settings.models.back().name = strip_quotes(value);
            } else if (key == "score_column") {
                settings.models.back().score_column = strip_quotes(value);
            }
        } else if (current_section == "output") {
            if (key == "directory") {
                settings.output.directory = strip_quotes(value);
            }
        }
    }

    settings.validate();
    return settings;
}

}  // namespace

void RiskbandSettings::validate() const {
    if (model_name.empty()) {
        throw InvalidInput("model_name must be non-empty");
    }
    try {
        make_grid(sweep.step);
    } catch (const InvalidInput& error) {
        throw InvalidInput(std::string("sweep.step: ") + error.what());
    }
    if (sweep.workers < 1) {
        throw InvalidInput("sweep.workers must be >= 1");
    }
    if (selection.precision_floor.has_value()) {
        check_unit_interval(*selection.precision_floor, "selection.precision_floor");
    }
    if (!std::isfinite(band.band_width) || band.band_width < 0.0) {
        throw InvalidInput("band.band_width must be finite and >= 0, got " + format_double(band.band_width));
    }
    if (input.id_column.empty() || input.score_column.empty() || input.label_column.empty()) {
        throw InvalidInput("input column names must be non-empty");
    }
    std::set<std::string> names;
    for (size_t i = 0; i < models.size(); ++i) {
        const auto& model = models[i];
        const std::string where = "models[" + std::to_string(i) + "]";
        if (model.name.empty()) {
            throw InvalidInput(where + ".name must be non-empty");
        }
        if (model.score_column.empty()) {
            throw InvalidInput(where + ".score_column must be non-empty");
        }
        if (!names.insert(model.name).second) {
            throw InvalidInput("duplicate model name: " + model.name);
        }
    }
}

std::vector<ModelConfig> RiskbandSettings::model_list() const {
    if (!models.empty()) {
        return models;
    }
    return {ModelConfig{model_name, input.score_column}};
}

RiskbandSettings RiskbandSettings::for_model(const ModelConfig& model) const {
    RiskbandSettings narrowed = *this;
    narrowed.model_name = model.name;
    narrowed.input.score_column = model.score_column;
    narrowed.models.clear();
    return narrowed;
}

RiskbandSettings RiskbandSettings::from_toml(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("unable to open config file: " + path);
    }
    return parse(file);
}

RiskbandSettings RiskbandSettings::from_toml_string(const std::string& text) {
    std::istringstream input(text);
    return parse(input);
}

}  // namespace riskband
