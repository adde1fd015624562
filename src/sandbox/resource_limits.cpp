#include "sandbox/resource_limits.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "core/errors.hpp"
#include "utils/common.hpp"

namespace codebox::sandbox {

std::uint64_t ParseMemoryLimit(const std::string& value) {
    const auto text = utils::ToLower(utils::Trim(value));
    if (text.empty()) {
        throw ResourceError("Empty memory limit");
    }
    std::size_t digits = 0;
    while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits]))) {
        ++digits;
    }
    if (digits == 0) {
        throw ResourceError("Invalid memory limit: " + value);
    }
    const auto suffix = text.substr(digits);
    std::uint64_t multiplier = 1;
    if (suffix.empty() || suffix == "b") {
        multiplier = 1;
    } else if (suffix == "k" || suffix == "kb") {
        multiplier = 1024ull;
    } else if (suffix == "m" || suffix == "mb") {
        multiplier = 1024ull * 1024;
    } else if (suffix == "g" || suffix == "gb") {
        multiplier = 1024ull * 1024 * 1024;
    } else {
        throw ResourceError("Invalid memory limit unit: " + value);
    }

    std::uint64_t amount = 0;
    try {
        amount = std::stoull(text.substr(0, digits));
    } catch (const std::out_of_range&) {
        throw ResourceError("Memory limit out of range: " + value);
    }
    if (amount == 0) {
        throw ResourceError("Memory limit must be positive: " + value);
    }
    if (amount > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        throw ResourceError("Memory limit out of range: " + value);
    }
    return amount * multiplier;
}

int CpuSlots(double cpus) {
    if (!(cpus > 0.0)) {
        return 1;
    }
    return std::max(1, static_cast<int>(std::ceil(cpus)));
}

}  // namespace codebox::sandbox
