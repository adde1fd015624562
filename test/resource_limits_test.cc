#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "sandbox/resource_limits.hpp"

using codebox::ResourceError;
using codebox::sandbox::CpuSlots;
using codebox::sandbox::ParseMemoryLimit;

// NOLINTNEXTLINE
TEST(parse_memory_limit, units) {
    EXPECT_EQ(ParseMemoryLimit("512m"), 512ull * 1024 * 1024);
    EXPECT_EQ(ParseMemoryLimit("1g"), 1024ull * 1024 * 1024);
    EXPECT_EQ(ParseMemoryLimit("256k"), 256ull * 1024);
    EXPECT_EQ(ParseMemoryLimit("1024b"), 1024ull);
    EXPECT_EQ(ParseMemoryLimit("4096"), 4096ull);
}

// NOLINTNEXTLINE
TEST(parse_memory_limit, case_and_whitespace) {
    EXPECT_EQ(ParseMemoryLimit(" 2GB "), 2ull * 1024 * 1024 * 1024);
    EXPECT_EQ(ParseMemoryLimit("64Mb"), 64ull * 1024 * 1024);
}

// NOLINTNEXTLINE
TEST(parse_memory_limit, rejects_garbage) {
    EXPECT_THROW(ParseMemoryLimit(""), ResourceError);
    EXPECT_THROW(ParseMemoryLimit("m"), ResourceError);
    EXPECT_THROW(ParseMemoryLimit("12x"), ResourceError);
    EXPECT_THROW(ParseMemoryLimit("-1m"), ResourceError);
    EXPECT_THROW(ParseMemoryLimit("1.5g"), ResourceError);
    EXPECT_THROW(ParseMemoryLimit("0"), ResourceError);
    EXPECT_THROW(ParseMemoryLimit("99999999999999999999g"), ResourceError);
    EXPECT_THROW(ParseMemoryLimit("99999999999999g"), ResourceError);
}

// NOLINTNEXTLINE
TEST(cpu_slots, rounds_up) {
    EXPECT_EQ(CpuSlots(1.0), 1);
    EXPECT_EQ(CpuSlots(0.5), 1);
    EXPECT_EQ(CpuSlots(1.5), 2);
    EXPECT_EQ(CpuSlots(4.0), 4);
    EXPECT_EQ(CpuSlots(0.0), 1);
    EXPECT_EQ(CpuSlots(-3.0), 1);
}
