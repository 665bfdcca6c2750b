#pragma once
/**
 * @file parse.hpp
 * @brief Text to integer conversion for the clamp `parse` functions.
 *
 * Accepts an optional sign ('+' always, '-' for signed types) followed by decimal
 * digits and nothing else; no surrounding whitespace. Failures are `ParseFailed`.
 * Range checking against limits is left to the caller, so malformed text and an
 * out-of-range value stay distinct errors.
 */
#include <charconv>
#include <string_view>
#include <system_error>

#include "bounded/error.hpp"

namespace checkedval::bounded
{

template <BoundedInteger T>
[[nodiscard]] Result<T, Error> parse_integer(std::string_view text)
{
    using R = Result<T, Error>;
    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '+')
    {
        digits.remove_prefix(1);
        if (!digits.empty() && (digits.front() == '-' || digits.front() == '+'))
            return R::error(Error::parse_failed(text, "repeated sign"));
    }
    if (digits.empty())
        return R::error(Error::parse_failed(text, "no digits"));

    T value{};
    const char *end = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(digits.data(), end, value);
    if (ec == std::errc::result_out_of_range)
        return R::error(Error::parse_failed(text, "not representable in the value type"));
    if (ec != std::errc())
        return R::error(Error::parse_failed(text, "not an integer"));
    if (ptr != end)
        return R::error(Error::parse_failed(text, "unexpected trailing characters"));
    return R::ok(value);
}

} // namespace checkedval::bounded
