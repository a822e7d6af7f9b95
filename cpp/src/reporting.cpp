#include "riskband/reporting.hpp"

#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>

#include "riskband/common.hpp"
#include "riskband/errors.hpp"
#include "riskband/logging.hpp"

namespace riskband {

namespace {

constexpr const char* kUtf8Bom = "\xEF\xBB\xBF";

struct CsvTable {
    std::map<std::string, size_t> columns;
    std::vector<std::pair<size_t, std::vector<std::string>>> rows;  // (line number, fields)
};

CsvTable read_table(std::istream& input) {
    CsvTable table;
    std::string line;
    size_t line_number = 0;
    bool header_seen = false;
    while (std::getline(input, line)) {
        ++line_number;
        // Spreadsheet exports often lead with a byte order mark.
        if (line_number == 1 && line.compare(0, 3, kUtf8Bom) == 0) {
            line.erase(0, 3);
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            continue;
        }
        auto fields = split_record(line);
        for (auto& field : fields) {
            field = trim(field);
        }
        if (!header_seen) {
            for (size_t i = 0; i < fields.size(); ++i) {
                table.columns[fields[i]] = i;
            }
            header_seen = true;
            continue;
        }
        table.rows.emplace_back(line_number, std::move(fields));
    }
    if (!header_seen) {
        throw std::runtime_error("CSV input has no header row");
    }
    return table;
}

size_t require_column(const CsvTable& table, const std::string& name) {
    auto it = table.columns.find(name);
    if (it == table.columns.end()) {
        throw std::runtime_error("CSV input is missing column '" + name + "'");
    }
    return it->second;
}

const std::string& field_at(const std::vector<std::string>& fields, size_t index, size_t line_number) {
    if (index >= fields.size()) {
        throw std::runtime_error("CSV line " + std::to_string(line_number) + " has too few fields");
    }
    return fields[index];
}

double parse_score(const std::string& text, size_t line_number) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (text.empty() || consumed != text.size()) {
        throw InvalidInput("malformed score '" + text + "' on line " + std::to_string(line_number));
    }
    return value;
}

bool parse_label(const std::string& text, size_t line_number) {
    const auto lowered = to_lower(text);
    if (lowered == "1" || lowered == "true" || lowered == "1.0") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "0.0") {
        return false;
    }
    throw InvalidInput("malformed label '" + text + "' on line " + std::to_string(line_number));
}

std::ifstream open_input(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("unable to open input file: " + path);
    }
    return file;
}

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char ch : value) {
        if (ch == '"') {
            quoted += "\"\"";
        } else {
            quoted.push_back(ch);
        }
    }
    quoted += "\"";
    return quoted;
}

std::string json_string(const std::string& value) {
    return "\"" + json_escape(value) + "\"";
}

std::string json_optional(const std::optional<double>& value) {
    return value.has_value() ? format_double(*value) : "null";
}

}  // namespace

LabeledData read_labeled_csv(std::istream& input, const InputConfig& config) {
    const auto table = read_table(input);
    const size_t score_index = require_column(table, config.score_column);
    const size_t label_index = require_column(table, config.label_column);

    LabeledData data;
    data.labels.reserve(table.rows.size());
    data.scores.reserve(table.rows.size());
    for (const auto& [line_number, fields] : table.rows) {
        data.scores.push_back(parse_score(field_at(fields, score_index, line_number), line_number));
        data.labels.push_back(parse_label(field_at(fields, label_index, line_number), line_number));
    }
    return data;
}

LabeledData read_labeled_csv(const std::string& path, const InputConfig& config) {
    auto file = open_input(path);
    return read_labeled_csv(file, config);
}

std::vector<ScoredCase> read_cases_csv(std::istream& input, const InputConfig& config) {
    const auto table = read_table(input);
    const size_t id_index = require_column(table, config.id_column);
    const size_t score_index = require_column(table, config.score_column);
    const auto label_it = table.columns.find(config.label_column);

    std::vector<ScoredCase> cases;
    cases.reserve(table.rows.size());
    for (const auto& [line_number, fields] : table.rows) {
        ScoredCase scored;
        scored.identifier = field_at(fields, id_index, line_number);
        scored.score = parse_score(field_at(fields, score_index, line_number), line_number);
        if (label_it != table.columns.end() && label_it->second < fields.size() &&
            !fields[label_it->second].empty()) {
            scored.label = parse_label(fields[label_it->second], line_number);
        }
        cases.push_back(std::move(scored));
    }
    return cases;
}

std::vector<ScoredCase> read_cases_csv(const std::string& path, const InputConfig& config) {
    auto file = open_input(path);
    return read_cases_csv(file, config);
}

std::string render_sweep_csv(const SweepResult& sweep) {
    std::ostringstream out;
    out << "t,tp,fp,tn,fn,precision,recall,fpr,fnr,f1\n";
    for (const auto& row : sweep.rows) {
        out << format_double(row.threshold) << ',' << row.tp << ',' << row.fp << ',' << row.tn << ',' << row.fn
            << ',' << format_double(row.precision) << ',' << format_double(row.recall) << ','
            << format_double(row.fpr) << ',' << format_double(row.fnr) << ',' << format_double(row.f1) << '\n';
    }
    return out.str();
}

std::string render_packets_csv(const std::vector<DecisionPacket>& packets) {
    std::ostringstream out;
    out << "identifier,score,t1,t2,route,action,model_name,threshold_version\n";
    for (const auto& packet : packets) {
        out << csv_field(packet.identifier) << ',' << format_double(packet.score) << ','
            << format_double(packet.t1) << ',' << format_double(packet.t2) << ',' << to_string(packet.route)
            << ',' << to_string(packet.action) << ',' << csv_field(packet.model_name) << ','
            << csv_field(packet.threshold_version) << '\n';
    }
    return out.str();
}

std::string render_metrics_json(const ThresholdMetrics& metrics) {
    std::ostringstream out;
    out << "{\"t\": " << format_double(metrics.threshold) << ", \"tp\": " << metrics.tp
        << ", \"fp\": " << metrics.fp << ", \"tn\": " << metrics.tn << ", \"fn\": " << metrics.fn
        << ", \"precision\": " << format_double(metrics.precision)
        << ", \"recall\": " << format_double(metrics.recall) << ", \"fpr\": " << format_double(metrics.fpr)
        << ", \"fnr\": " << format_double(metrics.fnr) << ", \"f1\": " << format_double(metrics.f1) << "}";
    return out.str();
}

std::string render_summary_json(const std::vector<SummaryEntry>& entries) {
    std::ostringstream out;
    out << "{";
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        out << (i == 0 ? "\n" : ",\n") << "  " << json_string(entry.model_name) << ": {\n"
            << "    \"chosen_threshold\": " << format_double(entry.operating.threshold) << ",\n"
            << "    \"t1\": " << format_double(entry.band.t1) << ",\n"
            << "    \"t2\": " << format_double(entry.band.t2) << ",\n"
            << "    \"constraint\": " << json_string(to_string(entry.operating.constraint)) << ",\n"
            << "    \"precision_floor\": " << json_optional(entry.operating.precision_floor) << ",\n"
            << "    \"threshold_version\": " << json_string(entry.threshold_version) << ",\n"
            << "    \"metrics\": " << render_metrics_json(entry.chosen_metrics) << "\n"
            << "  }";
    }
    out << (entries.empty() ? "}\n" : "\n}\n");
    return out.str();
}

std::string render_feedback_json(const FeedbackReport& report, const std::string& active_version) {
    std::ostringstream out;
    out << "{\n"
        << "  \"active_version\": " << json_string(active_version) << ",\n"
        << "  \"active_metrics\": " << render_metrics_json(report.active_metrics) << ",\n"
        << "  \"candidate_version\": " << json_string(report.candidate_version) << ",\n"
        << "  \"candidate_threshold\": " << format_double(report.candidate.threshold) << ",\n"
        << "  \"candidate_constraint\": " << json_string(to_string(report.candidate.constraint)) << ",\n"
        << "  \"candidate_metrics\": " << render_metrics_json(report.candidate.metrics) << ",\n"
        << "  \"threshold_moved\": " << (report.threshold_moved ? "true" : "false") << "\n"
        << "}\n";
    return out.str();
}

void write_text_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("unable to open output file: " + path);
    }
    file << content;
    file.flush();
    if (!file) {
        throw std::runtime_error("failed writing output file: " + path);
    }
}

}  // namespace riskband
