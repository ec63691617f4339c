#pragma once

#include <string>
#include <string_view>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <random>
#include <format>
#include <ctime>
#include <iostream>
#include <mutex>

namespace ztgate::utils {

// ============================================================================
// UUID Generation
// ============================================================================

inline std::string generate_uuid() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = dis(gen);
    uint64_t low = dis(gen);

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
        static_cast<uint32_t>(high >> 32),
        static_cast<uint16_t>((high >> 16) & 0xFFFF),
        static_cast<uint16_t>(high & 0xFFFF),
        static_cast<uint16_t>(low >> 48),
        low & 0xFFFFFFFFFFFF);
}

// ============================================================================
// Time Utilities
// ============================================================================

inline std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    ::localtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    char tz_buf[8];
    std::strftime(tz_buf, sizeof(tz_buf), "%z", &tm_buf);

    return std::format("{}.{:03d}{}", time_buf, static_cast<int>(ms.count()), tz_buf);
}

/// Hour of day [0, 23] in the deployment's local time zone.
inline int local_hour(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf;
    ::localtime_r(&time, &tm_buf);
    return tm_buf.tm_hour;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

// ============================================================================
// JSON String Utilities
// ============================================================================

/**
 * @brief Escape a string for safe embedding in a JSON string value.
 * Handles: " \ \n \r \t and other control characters
 */
[[nodiscard]] inline std::string escape_json(std::string_view s) {
    std::string result;
    result.reserve(s.size() + s.size() / 8);
    for (const char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    result += std::format("\\u{:04x}", static_cast<int>(c));
                } else {
                    result += c;
                }
        }
    }
    return result;
}

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<int>& min_level() {
        static std::atomic<int> level{static_cast<int>(Level::INFO)};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (static_cast<int>(level) < min_level().load(std::memory_order_relaxed)) {
            return;
        }

        const char* tag = "";
        switch (level) {
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::min_level().store(static_cast<int>(level), std::memory_order_relaxed);
}

inline bool is_valid_level(std::string_view name) {
    return name == "info" || name == "warn" || name == "warning" || name == "error";
}

/// Accepts "info", "warn"/"warning", "error"; anything else leaves the level unchanged.
inline bool set_level(std::string_view name) {
    if (name == "info") { set_level(Level::INFO); return true; }
    if (name == "warn" || name == "warning") { set_level(Level::WARN); return true; }
    if (name == "error") { set_level(Level::ERROR); return true; }
    return false;
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace ztgate::utils
