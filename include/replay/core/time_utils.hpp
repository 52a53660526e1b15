// time_utils.hpp
// Timestamp parsing and formatting helpers shared by the CSV loaders and exporters

#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include "exceptions.hpp"

namespace replay {

// Parses a local calendar date (and optional time) into nanoseconds since epoch
inline std::chrono::nanoseconds parseTimestamp(const std::string& text,
                                               const std::string& format = "%Y-%m-%d") {
    std::tm tm = {};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, format.c_str());
    if (ss.fail()) {
        throw DataException("Cannot parse timestamp '" + text + "' with format '" + format + "'");
    }
    tm.tm_isdst = -1;

    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        throw DataException("Timestamp out of range: '" + text + "'");
    }
    auto time_point = std::chrono::system_clock::from_time_t(t);
    return std::chrono::duration_cast<std::chrono::nanoseconds>(time_point.time_since_epoch());
}

inline std::string formatTimestamp(std::chrono::nanoseconds timestamp,
                                   const std::string& format = "%Y-%m-%d") {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timestamp);
    std::time_t t = static_cast<std::time_t>(seconds.count());
    std::tm tm = {};
    localtime_r(&t, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, format.c_str());
    return out.str();
}

inline std::chrono::nanoseconds currentTimestamp() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch());
}

} // namespace replay
