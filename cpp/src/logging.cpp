#include "riskband/logging.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace riskband {

namespace {

struct LogSink {
    LogLevel level = LogLevel::kInfo;
    bool json = true;
    std::optional<std::string> log_file = std::nullopt;
    int max_bytes = 0;
    int backup_count = 0;
    std::unique_ptr<std::ofstream> file_stream;
    std::mutex mutex;
};

LogSink& sink() {
    static LogSink instance;
    return instance;
}

LogLevel parse_level(const std::string& level) {
    if (level == "DEBUG") {
        return LogLevel::kDebug;
    }
    if (level == "WARN" || level == "WARNING") {
        return LogLevel::kWarn;
    }
    if (level == "ERROR") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return "DEBUG";
        case LogLevel::kInfo:
            return "INFO";
        case LogLevel::kWarn:
            return "WARN";
        case LogLevel::kError:
            return "ERROR";
    }
    return "INFO";
}

double unix_seconds() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

// Shifts log -> log.1 -> log.2 ... once the active file reaches max_bytes.
void rotate_if_needed(LogSink& log_sink) {
    if (!log_sink.log_file.has_value() || log_sink.max_bytes <= 0 || log_sink.backup_count <= 0) {
        return;
    }

    const std::filesystem::path base_path(*log_sink.log_file);
    std::error_code ec;
    const auto size = std::filesystem::file_size(base_path, ec);
    if (ec || size < static_cast<std::uintmax_t>(log_sink.max_bytes)) {
        return;
    }

    log_sink.file_stream.reset();
    for (int index = log_sink.backup_count - 1; index >= 1; --index) {
        std::filesystem::path source = base_path;
        source += "." + std::to_string(index);
        if (!std::filesystem::exists(source, ec)) {
            continue;
        }
        std::filesystem::path destination = base_path;
        destination += "." + std::to_string(index + 1);
        std::filesystem::rename(source, destination, ec);
    }
    std::filesystem::path rotated = base_path;
    rotated += ".1";
    std::filesystem::rename(base_path, rotated, ec);
    log_sink.file_stream = std::make_unique<std::ofstream>(base_path, std::ios::app);
}

}  // namespace

std::string json_escape(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (unsigned char ch : value) {
        switch (ch) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (ch < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", ch);
                    escaped += buffer;
                } else {
                    escaped.push_back(static_cast<char>(ch));
                }
        }
    }
    return escaped;
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::log(LogLevel level, const std::string& event, const LogFields& fields) const {
    auto& log_sink = sink();
    std::lock_guard<std::mutex> guard(log_sink.mutex);
    if (static_cast<int>(level) < static_cast<int>(log_sink.level)) {
        return;
    }
    rotate_if_needed(log_sink);
    std::ostream& output = log_sink.file_stream ? static_cast<std::ostream&>(*log_sink.file_stream) : std::cout;

    std::ostringstream line;
    if (log_sink.json) {
        line << "{\"ts\":" << std::fixed << std::setprecision(3) << unix_seconds() << ",\"level\":\""
             << level_name(level) << "\",\"logger\":\"" << json_escape(name_) << "\",\"event\":\""
             << json_escape(event) << "\"";
        for (const auto& [key, value] : fields) {
            line << ",\"" << json_escape(key) << "\":\"" << json_escape(value) << "\"";
        }
        line << "}";
    } else {
        line << level_name(level) << " " << name_ << " " << event;
        if (!fields.empty()) {
            line << " |";
            for (const auto& [key, value] : fields) {
                line << " " << key << "=" << value;
            }
        }
    }
    output << line.str() << '\n';
    output.flush();
}

void Logger::debug(const std::string& event, const LogFields& fields) const {
    log(LogLevel::kDebug, event, fields);
}

void Logger::info(const std::string& event, const LogFields& fields) const {
    log(LogLevel::kInfo, event, fields);
}

void Logger::warn(const std::string& event, const LogFields& fields) const {
    log(LogLevel::kWarn, event, fields);
}

void Logger::error(const std::string& event, const LogFields& fields) const {
    log(LogLevel::kError, event, fields);
}

void configure_logging(const LoggingConfig& config) {
    auto& log_sink = sink();
    std::lock_guard<std::mutex> guard(log_sink.mutex);
    log_sink.level = parse_level(config.level);
    log_sink.json = config.json;
    log_sink.log_file = config.log_file;
    log_sink.max_bytes = config.max_bytes;
    log_sink.backup_count = config.backup_count;
    log_sink.file_stream.reset();

    if (config.log_file.has_value()) {
        auto stream = std::make_unique<std::ofstream>(*config.log_file, std::ios::app);
        if (!stream->is_open()) {
            throw std::runtime_error("unable to open log file: " + *config.log_file);
        }
        log_sink.file_stream = std::move(stream);
    }
}

Logger get_logger(const std::string& name) {
    return Logger("riskband." + name);
}

}  // namespace riskband
