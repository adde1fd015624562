#pragma once

#include <chrono>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace codebox::utils {

using TimePoint = std::chrono::system_clock::time_point;

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline TimePoint Now() {
    return std::chrono::system_clock::now();
}

// Random version 4 UUID in canonical lower-case form.
std::string GenerateUuid();

// UTC, second precision: 2024-05-01T12:00:00Z
std::string FormatIsoUtc(TimePoint time);

// Accepts RFC 3339 timestamps as produced by docker and FormatIsoUtc.
// Fractional seconds are truncated. Returns nullopt for zero/invalid times.
std::optional<TimePoint> ParseIsoUtc(const std::string& text);

std::string Trim(const std::string& value);

std::string ToLower(std::string value);

}  // namespace codebox::utils
