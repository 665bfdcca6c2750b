#pragma once
/**
 * @file random_source.hpp
 * @brief The process-wide random source behind `HardClamp::random()` and friends.
 *
 * A single 64-bit Mersenne Twister shared by the whole process and guarded by a mutex.
 * It is seeded on first use from the environment variable `CHECKEDVAL_RANDOM_SEED`
 * (a decimal unsigned integer) when set, otherwise from `std::random_device`.
 */
#include <cstdint>

#include "checkedval_utils_export.h"

namespace checkedval::bounded
{

/**
 * @brief Draws a uniformly distributed integer from [0, span].
 */
CHECKEDVAL_UTILS_EXPORT std::uint64_t random_offset(std::uint64_t span);

/**
 * @brief Reseeds the process-wide source; subsequent draws are reproducible.
 */
CHECKEDVAL_UTILS_EXPORT void seed_random_source(std::uint64_t seed);

} // namespace checkedval::bounded
