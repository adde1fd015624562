#include "utils/common.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>

namespace codebox::utils {

std::string GenerateUuid() {
    static const char* kChars = "0123456789abcdef";
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string id;
    id.reserve(36);
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            id.push_back('-');
        }
        int nibble = dist(gen);
        if (i == 12) {
            nibble = 4;
        } else if (i == 16) {
            nibble = 8 | (nibble & 3);
        }
        id.push_back(kChars[nibble]);
    }
    return id;
}

std::string FormatIsoUtc(TimePoint time) {
    const auto t = std::chrono::system_clock::to_time_t(time);
    std::tm utc_time{};
    gmtime_r(&t, &utc_time);
    std::ostringstream oss;
    oss << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<TimePoint> ParseIsoUtc(const std::string& text) {
    if (text.size() < 19) {
        return std::nullopt;
    }
    std::tm parsed{};
    std::istringstream stream(text.substr(0, 19));
    stream >> std::get_time(&parsed, "%Y-%m-%dT%H:%M:%S");
    if (stream.fail()) {
        return std::nullopt;
    }
    // docker reports 0001-01-01T00:00:00Z for containers that never finished
    if (parsed.tm_year + 1900 < 1971) {
        return std::nullopt;
    }
    const auto seconds = timegm(&parsed);
    if (seconds < 0) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

std::string Trim(const std::string& value) {
    auto begin = std::find_if(value.begin(), value.end(), [](unsigned char c) {
        return !std::isspace(c);
    });
    auto end = std::find_if(value.rbegin(), value.rend(), [](unsigned char c) {
        return !std::isspace(c);
    }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

}  // namespace codebox::utils
