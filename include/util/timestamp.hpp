#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace ms::util {

inline std::string timestampToString(const std::time_t ts) {
    std::ostringstream oss;
    std::tm tm{};
    gmtime_r(&ts, &tm);
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

// "2024-01-31T10:00:00.000Z" as found in ListObjectsV2 responses
inline std::optional<std::time_t> parseIsoTimestamp(const std::string& iso) {
    std::tm tm = {};
    std::istringstream ss(iso.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) return std::nullopt;
    return timegm(&tm);
}

// "Wed, 31 Jan 2024 10:00:00 GMT" as found in Last-Modified headers
inline std::optional<std::time_t> parseHttpDate(const std::string& s) {
    std::tm tm = {};
    std::istringstream ss(s);
    ss.imbue(std::locale::classic());
    ss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (ss.fail()) return std::nullopt;
    return timegm(&tm);
}

inline std::string getCurrentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&now_c, &tm);
    char buffer[17];
    strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
    return {buffer};
}

} // namespace ms::util
