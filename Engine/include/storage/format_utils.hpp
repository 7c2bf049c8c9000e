#pragma once

#include <nlohmann/json.hpp>
#include <cmath>
#include <optional>
#include <cstdlib>
#include <string>
#include <vector>

namespace Broadsheet {

// Shared value formatting for id signatures, precision checks and the tabular export.

// Shortest decimal text that round-trips to the same double ("48.2082", "16.0", "1e-05").
inline std::string format_double(double value) {
    return nlohmann::json(value).dump();
}

inline std::string format_optional(const std::optional<double>& value) {
    return value ? format_double(*value) : std::string();
}

inline std::string format_optional(const std::optional<std::string>& value) {
    return value ? *value : std::string();
}

// Round half away from zero to a fixed number of decimal places.
inline double round_to(double value, int places) {
    const double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

// Decimal places of the shortest representation written out in plain notation:
// 48.2082 -> 4, 1.5e-05 (0.000015) -> 6, 1e-05 -> 5, 2.5e+20 -> 0.
inline int decimal_places(double value) {
    const std::string text = format_double(value);
    const auto exp_pos = text.find_first_of("eE");
    const std::string mantissa = text.substr(0, exp_pos);

    int digits = 0;
    const auto dot = mantissa.find('.');
    if (dot != std::string::npos) {
        for (size_t i = dot + 1; i < mantissa.size() && mantissa[i] >= '0' && mantissa[i] <= '9'; ++i) {
            ++digits;
        }
    }
    if (exp_pos != std::string::npos) {
        digits -= std::atoi(text.c_str() + exp_pos + 1);
    }
    return digits > 0 ? digits : 0;
}

// Provenance lists are serialized as a single delimiter-joined field.
inline std::string join_sources(const std::vector<std::string>& sources, char delimiter = '|') {
    std::string out;
    for (size_t i = 0; i < sources.size(); ++i) {
        if (i) out.push_back(delimiter);
        out.append(sources[i]);
    }
    return out;
}

} // namespace Broadsheet
