#ifndef RISKBAND_LOGGING_HPP
#define RISKBAND_LOGGING_HPP

#include <map>
#include <string>

#include "riskband/config.hpp"

namespace riskband {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError,
};

using LogFields = std::map<std::string, std::string>;

class Logger {
public:
    explicit Logger(std::string name);

    void log(LogLevel level, const std::string& event, const LogFields& fields = {}) const;

    void debug(const std::string& event, const LogFields& fields = {}) const;
    void info(const std::string& event, const LogFields& fields = {}) const;
    void warn(const std::string& event, const LogFields& fields = {}) const;
    void error(const std::string& event, const LogFields& fields = {}) const;

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

void configure_logging(const LoggingConfig& config);
Logger get_logger(const std::string& name);

std::string json_escape(const std::string& value);

}  // namespace riskband

#endif  // RISKBAND_LOGGING_HPP
