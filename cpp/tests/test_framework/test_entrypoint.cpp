// tests/test_framework/test_entrypoint.cpp
/**
 * @file test_entrypoint.cpp
 * @brief Main entry point shared by every checkedval test executable.
 *
 * Pins the process-wide random source to a fixed seed unless `CHECKEDVAL_RANDOM_SEED`
 * is set, so randomized tests are reproducible by default, and keeps the Logger at its
 * environment-configured level. Then runs GoogleTest.
 */
#include "ckv_bounded.hpp"

#include <cstdint>
#include <cstdlib>

#include <gtest/gtest.h>

#include "test_entrypoint.h"

namespace
{
constexpr std::uint64_t kDefaultTestSeed = 0x5eed'c0de'2024ULL;
}

std::uint64_t test_random_seed()
{
    if (const char *raw = std::getenv("CHECKEDVAL_RANDOM_SEED"))
    {
        auto parsed = checkedval::bounded::parse_integer<std::uint64_t>(raw);
        if (parsed.is_ok())
            return parsed.content();
    }
    return kDefaultTestSeed;
}

int main(int argc, char **argv)
{
    const auto seed = test_random_seed();
    checkedval::bounded::seed_random_source(seed);
    LOGGER_INFO("{}: random source seeded with {}", checkedval::platform::get_executable_name(),
                seed);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
