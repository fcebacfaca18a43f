#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace usync::util {

inline std::string timestampToString(const std::time_t ts) {
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&ts), "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::time_t parseTimestampFromString(const std::string& iso) {
    std::tm tm = {};
    std::istringstream ss(iso);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        // date-only form
        tm = {};
        std::istringstream dateOnly(iso);
        dateOnly >> std::get_time(&tm, "%Y-%m-%d");
        if (dateOnly.fail()) throw std::runtime_error("Failed to parse timestamp: " + iso);
    }
    return timegm(&tm); // returns UTC-based time_t
}

}
