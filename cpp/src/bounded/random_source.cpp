#include "bounded/random_source.hpp"
#include "ckv_base.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <optional>
#include <random>

namespace checkedval::bounded
{

namespace
{
constexpr const char *kSeedEnvVar = "CHECKEDVAL_RANDOM_SEED";

struct RandomSource
{
    std::mutex mutex;
    std::optional<std::mt19937_64> engine;
};

RandomSource &source()
{
    // Function-local static avoids static-init-order issues.
    static RandomSource instance;
    return instance;
}

std::uint64_t initial_seed()
{
    if (const char *raw = std::getenv(kSeedEnvVar))
    {
        std::uint64_t seed = 0;
        const char *end = raw + std::strlen(raw);
        const auto [ptr, ec] = std::from_chars(raw, end, seed);
        if (ec == std::errc() && ptr == end)
        {
            LOGGER_INFO("random source seeded from {}={}", kSeedEnvVar, seed);
            return seed;
        }
        LOGGER_WARN("ignoring malformed {} value '{}'", kSeedEnvVar, format_tools::excerpt(raw));
    }
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
}
} // anonymous namespace

std::uint64_t random_offset(std::uint64_t span)
{
    auto &src = source();
    std::lock_guard<std::mutex> lock(src.mutex);
    if (!src.engine)
    {
        src.engine.emplace(initial_seed());
    }
    std::uniform_int_distribution<std::uint64_t> dist(0, span);
    return dist(*src.engine);
}

void seed_random_source(std::uint64_t seed)
{
    auto &src = source();
    std::lock_guard<std::mutex> lock(src.mutex);
    src.engine.emplace(seed);
}

} // namespace checkedval::bounded
