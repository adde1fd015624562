#pragma once

#include <cstdint>
#include <string>

namespace codebox::sandbox {

struct ResourceLimits {
    std::uint64_t memory_bytes = 512ull * 1024 * 1024;
    double cpus = 1.0;
    // 0 = unlimited
    std::uint64_t max_output_bytes = 0;
};

// "512m", "1g", "256k", "1024b" or plain bytes, case-insensitive. Throws
// ResourceError for anything else, and for zero.
std::uint64_t ParseMemoryLimit(const std::string& value);

// Number of logical CPUs a fractional budget occupies (at least 1).
int CpuSlots(double cpus);

}  // namespace codebox::sandbox
