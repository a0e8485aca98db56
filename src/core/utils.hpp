#pragma once

#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace trade_sim {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Shared date and money helpers used across the engine.
 */
namespace utils {

/**
 * Format timestamp as date string (e.g., "2024-01-15").
 */
inline std::string ts_to_date(Timestamp ts) {
    auto t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return std::string(buf);
}

/**
 * Parse date string ("YYYY-MM-DD") to a midnight UTC Timestamp.
 */
inline std::optional<Timestamp> parse_date(const std::string& s) {
    if (s.empty()) return std::nullopt;
    std::tm tm{};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (ss.fail()) return std::nullopt;
    return Timestamp{} + std::chrono::seconds(timegm(&tm));
}

/**
 * Build a midnight UTC Timestamp from calendar fields.
 */
inline Timestamp make_date(int year, int month, int day) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    return Timestamp{} + std::chrono::seconds(timegm(&tm));
}

/**
 * Round a currency amount to the smallest currency unit (cents by default).
 */
inline double round_money(double amount, int decimals = 2) {
    double scale = std::pow(10.0, decimals);
    return std::round(amount * scale) / scale;
}

} // namespace utils
} // namespace trade_sim
