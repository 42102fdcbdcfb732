#include "mnemo/core/types.h"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>

namespace mnemo {
namespace core {

const std::vector<MemoryCategory>& all_categories() {
    static const std::vector<MemoryCategory> categories = {
        MemoryCategory::REQUIREMENT,
        MemoryCategory::DECISION,
        MemoryCategory::PATTERN,
        MemoryCategory::ISSUE,
        MemoryCategory::LEARNING,
        MemoryCategory::CONTEXT
    };
    return categories;
}

std::string to_string(MemoryCategory category) {
    switch (category) {
        case MemoryCategory::REQUIREMENT: return "requirement";
        case MemoryCategory::DECISION: return "decision";
        case MemoryCategory::PATTERN: return "pattern";
        case MemoryCategory::ISSUE: return "issue";
        case MemoryCategory::LEARNING: return "learning";
        case MemoryCategory::CONTEXT: return "context";
    }
    return "context";
}

std::optional<MemoryCategory> parse_category(const std::string& name) {
    for (auto category : all_categories()) {
        if (to_string(category) == name) {
            return category;
        }
    }
    return std::nullopt;
}

Timestamp now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string format_iso8601(Timestamp ts) {
    std::time_t seconds = static_cast<std::time_t>(ts / 1000);
    int millis = static_cast<int>(ts % 1000);
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }
    std::tm tm_utc{};
    gmtime_r(&seconds, &tm_utc);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
                  tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec, millis);
    return buf;
}

std::optional<Timestamp> parse_iso8601(const std::string& text) {
    std::tm tm_utc{};
    int millis = 0;
    int consumed = 0;
    int fields = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                             &tm_utc.tm_year, &tm_utc.tm_mon, &tm_utc.tm_mday,
                             &tm_utc.tm_hour, &tm_utc.tm_min, &tm_utc.tm_sec, &consumed);
    if (fields < 6) {
        return std::nullopt;
    }

    // Optional fractional seconds, any precision; only milliseconds are kept
    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        int digits = 0;
        ++pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }

    tm_utc.tm_year -= 1900;
    tm_utc.tm_mon -= 1;
    std::time_t seconds = timegm(&tm_utc);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return static_cast<Timestamp>(seconds) * 1000 + millis;
}

double clamp_unit(double value) {
    if (std::isnan(value) || value < 0.0) return 0.0;
    if (value > 1.0) return 1.0;
    return value;
}

} // namespace core
} // namespace mnemo
