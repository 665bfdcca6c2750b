/**
 * @file test_random.cpp
 * @brief Layer 2 tests for the seedable random source behind `random()`.
 */
#include "ckv_bounded.hpp"
#include "test_entrypoint.h"

#include <cstdint>
#include <limits>
#include <vector>

#include <gtest/gtest.h>

using namespace checkedval::bounded;

namespace
{
std::vector<std::uint64_t> draw(std::uint64_t span, int count)
{
    std::vector<std::uint64_t> out;
    out.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i)
        out.push_back(random_offset(span));
    return out;
}

class RandomSourceTest : public ::testing::Test
{
  protected:
    // Leave the process-wide source in its documented state for later tests.
    void TearDown() override { seed_random_source(test_random_seed()); }
};
} // namespace

TEST_F(RandomSourceTest, SameSeedReplaysSameSequence)
{
    seed_random_source(1234);
    const auto first = draw(1'000'000, 32);
    seed_random_source(1234);
    EXPECT_EQ(draw(1'000'000, 32), first);

    seed_random_source(4321);
    EXPECT_NE(draw(1'000'000, 32), first);
}

TEST_F(RandomSourceTest, ZeroSpanAlwaysYieldsZero)
{
    for (int i = 0; i < 16; ++i)
        EXPECT_EQ(random_offset(0), 0u);
}

TEST_F(RandomSourceTest, OffsetsStayWithinSpan)
{
    for (auto v : draw(3, 200))
        EXPECT_LE(v, 3u);
    // The full 64-bit span must not overflow the distribution bounds.
    (void)random_offset(std::numeric_limits<std::uint64_t>::max());
}

TEST_F(RandomSourceTest, SeededWrappersAreReproducible)
{
    using Level = HardClamp<std::int64_t, Panicking, -5'000'000'000, 5'000'000'000>;

    seed_random_source(77);
    const auto a = Level::random();
    const auto b = SoftClamp<std::int32_t, Saturating, -3, 3>::random();
    seed_random_source(77);
    EXPECT_EQ(Level::random(), a);
    EXPECT_EQ((SoftClamp<std::int32_t, Saturating, -3, 3>::random().get_unchecked()), b.get_unchecked());
    EXPECT_TRUE(b.is_valid());
}
