#ifndef RISKBAND_COMMON_HPP
#define RISKBAND_COMMON_HPP

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace riskband {

inline std::string ltrim(std::string value) {
    auto it = std::find_if_not(value.begin(), value.end(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(value.begin(), it);
    return value;
}

inline std::string rtrim(std::string value) {
    auto it = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(it.base(), value.end());
    return value;
}

inline std::string trim(std::string value) {
    return rtrim(ltrim(std::move(value)));
}

inline std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

// Splits one CSV record. Double-quoted fields may contain the delimiter and
// escaped quotes ("").
inline std::vector<std::string> split_record(std::string_view line, char delimiter = ',') {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quoted) {
            if (ch == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                current.push_back('"');
                ++i;
            } else if (ch == '"') {
                quoted = false;
            } else {
                current.push_back(ch);
            }
        } else if (ch == '"') {
            quoted = true;
        } else if (ch == delimiter) {
            fields.push_back(current);
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    fields.push_back(current);
    return fields;
}

inline std::string strip_quotes(std::string value) {
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                              (value.front() == '\'' && value.back() == '\''))) {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

// Shortest decimal text that parses back to the same double (0.35, not
// 0.34999999999999998).
inline std::string format_double(double value) {
    for (int precision = 1; precision <= std::numeric_limits<double>::max_digits10; ++precision) {
        std::ostringstream out;
        out << std::setprecision(precision) << value;
        if (std::strtod(out.str().c_str(), nullptr) == value) {
            return out.str();
        }
    }
    std::ostringstream out;
    out << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return out.str();
}

}  // namespace riskband

#endif  // RISKBAND_COMMON_HPP
