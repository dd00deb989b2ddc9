#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <random>
#include <sstream>
#include <string>

namespace tradeflow {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Shared time/id helpers used by the engine, adapters and controllers.
 */
namespace utils {

inline int64_t ts_to_ns(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(ts.time_since_epoch()).count();
}

inline int64_t ts_to_ms(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp ms_to_ts(int64_t ms) {
    return Timestamp{} + std::chrono::milliseconds(ms);
}

/**
 * Format timestamp as ISO 8601 string with milliseconds (e.g., "2024-01-15T10:30:00.250Z").
 */
inline std::string ts_to_iso(Timestamp ts) {
    auto t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    int64_t ms = ts_to_ms(ts) % 1000;
    if (ms < 0) ms += 1000;
    std::ostringstream ss;
    ss << buf << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return ss.str();
}

/**
 * Parse ISO 8601 timestamp string to Timestamp.
 * Supports: "2024-01-15T10:30:00Z", "2024-01-15T10:30:00.250Z" or "2024-01-15T10:30:00"
 */
inline std::optional<Timestamp> parse_iso_ts(const std::string& s) {
    if (s.empty()) return std::nullopt;
    std::tm tm{};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) return std::nullopt;
    Timestamp ts = Timestamp{} + std::chrono::seconds(timegm(&tm));
    if (ss.peek() == '.') {
        ss.get();
        int ms = 0;
        int digits = 0;
        while (std::isdigit(ss.peek()) && digits < 3) {
            ms = ms * 10 + (ss.get() - '0');
            ++digits;
        }
        while (digits++ < 3) ms *= 10;
        ts += std::chrono::milliseconds(ms);
    }
    return ts;
}

/**
 * Parse timestamp from ISO or numeric epoch (seconds or milliseconds).
 */
inline std::optional<Timestamp> parse_ts_any(const std::string& s) {
    if (s.empty()) return std::nullopt;

    bool all_digits = std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c); });

    if (all_digits) {
        int64_t v = std::stoll(s);
        if (s.size() >= 13) {
            return Timestamp{} + std::chrono::milliseconds(v);
        }
        return Timestamp{} + std::chrono::seconds(v);
    }
    return parse_iso_ts(s);
}

/**
 * Generate a UUID-like ID.
 */
inline std::string generate_id() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << (dist(gen) & 0xFFFFFFFF) << "-";
    ss << std::setw(4) << (dist(gen) & 0xFFFF) << "-";
    ss << std::setw(4) << ((dist(gen) & 0x0FFF) | 0x4000) << "-";
    ss << std::setw(4) << ((dist(gen) & 0x3FFF) | 0x8000) << "-";
    ss << std::setw(12) << (dist(gen) & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

inline std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace utils
} // namespace tradeflow
