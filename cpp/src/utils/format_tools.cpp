#include "ckv_base.hpp"

#include <fmt/chrono.h>

#include <cctype>

namespace checkedval::format_tools
{

// With HAVE_FMT_CHRONO_SUBSECONDS the build detected fmt support for printing the
// microsecond fraction directly; otherwise the fraction is appended in a second step.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
#if defined(HAVE_FMT_CHRONO_SUBSECONDS) && HAVE_FMT_CHRONO_SUBSECONDS
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", tp_us);
#else
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
#endif
}

std::string normalized_token(std::string_view input)
{
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = input.find_last_not_of(" \t\r\n");
    std::string out(input.substr(first, last - first + 1));
    for (auto &c : out)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string excerpt(std::string_view text, std::size_t max_len)
{
    const bool truncated = text.size() > max_len;
    std::string out(truncated ? text.substr(0, max_len) : text);
    for (auto &c : out)
    {
        if (std::iscntrl(static_cast<unsigned char>(c)))
            c = '?';
    }
    if (truncated)
        out += "...";
    return out;
}

} // namespace checkedval::format_tools
