#pragma once
/**
 * @file json.hpp
 * @brief nlohmann_json support for clamps, views and runtime limits.
 *
 * Wrappers serialize as their raw inner value only; limits, behavior and validators
 * are never written. Decoding re-runs construction-time validation:
 *  - HardClamp: an out-of-range value is an error (never clamped),
 *  - SoftClamp and View: any representable value is accepted, valid or not.
 *
 * `j.get<HardClamp<...>>()` reports failures by raising `ViolationError`; `decode` and
 * `decode_view` return them as `Result` instead. A JSON number that does not fit the
 * value type is always ParseFailed.
 *
 * Runtime limits are configured as `{"lower": <int>, "upper": <int>}`.
 */
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include "bounded/capabilities.hpp"
#include "bounded/hard_clamp.hpp"
#include "bounded/limits.hpp"
#include "bounded/soft_clamp.hpp"
#include "bounded/view.hpp"

namespace checkedval::bounded
{

namespace detail
{
// Invalid UTF-8 inside string values is replaced, so echoing the input never throws.
inline std::string dump_for_message(const nlohmann::json &j)
{
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
} // namespace detail

/**
 * @brief Reads an integral JSON number into T, rejecting floats, non-numbers and
 *        values not representable in T.
 */
template <BoundedInteger T>
[[nodiscard]] Result<T, Error> json_to_integer(const nlohmann::json &j)
{
    using R = Result<T, Error>;
    if (!j.is_number_integer())
        return R::error(Error::parse_failed(detail::dump_for_message(j), "expected an integer"));

    wide_int raw = 0;
    if (j.is_number_unsigned())
        raw = static_cast<wide_int>(j.get<std::uint64_t>());
    else
        raw = static_cast<wide_int>(j.get<std::int64_t>());

    if (!fits_in<T>(raw))
        return R::error(Error::parse_failed(detail::dump_for_message(j), "not representable in the value type"));
    return R::ok(static_cast<T>(raw));
}

/**
 * @brief Decodes a clamp from its raw JSON value.
 */
template <ClampedWrapper W>
[[nodiscard]] Result<W, Error> decode(const nlohmann::json &j)
{
    auto raw = json_to_integer<typename W::value_type>(j);
    if (raw.is_error())
        return utils::fail(std::move(raw).error());
    return W::from_raw(raw.content());
}

/**
 * @brief Parses @p text as JSON, then decodes it like decode().
 */
template <ClampedWrapper W>
[[nodiscard]] Result<W, Error> decode_text(std::string_view text)
{
    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        return Result<W, Error>::error(Error::parse_failed(text, e.what()));
    }
    return decode<W>(j);
}

/**
 * @brief Decodes a View's item and pairs it with @p validator. The item is not validated.
 */
template <typename T, typename V = AnyValidator<T>>
    requires ValidatorFor<V, T>
[[nodiscard]] Result<View<T, V>, Error> decode_view(const nlohmann::json &j, V validator = V{})
{
    using R = Result<View<T, V>, Error>;
    if constexpr (BoundedInteger<T>)
    {
        auto item = json_to_integer<T>(j);
        if (item.is_error())
            return utils::fail(std::move(item).error());
        return R::ok(View<T, V>(item.content(), std::move(validator)));
    }
    else
    {
        try
        {
            return R::ok(View<T, V>(j.get<T>(), std::move(validator)));
        }
        catch (const nlohmann::json::exception &e)
        {
            return R::error(Error::parse_failed(detail::dump_for_message(j), e.what()));
        }
    }
}

/**
 * @brief Reads `{"lower": .., "upper": ..}`.
 *
 * Missing or ill-typed fields give ParseFailed; lower > upper gives ConfigurationInvalid.
 */
template <BoundedInteger T>
[[nodiscard]] Result<RuntimeLimits<T>, Error> limits_from_json(const nlohmann::json &j)
{
    using R = Result<RuntimeLimits<T>, Error>;
    if (!j.is_object())
        return R::error(Error::parse_failed(detail::dump_for_message(j), "limits must be a JSON object"));
    if (!j.contains("lower") || !j.contains("upper"))
        return R::error(Error::parse_failed(detail::dump_for_message(j), "limits need both 'lower' and 'upper'"));

    auto lower = json_to_integer<T>(j["lower"]);
    if (lower.is_error())
        return utils::fail(std::move(lower).error());
    auto upper = json_to_integer<T>(j["upper"]);
    if (upper.is_error())
        return utils::fail(std::move(upper).error());
    return RuntimeLimits<T>::create(lower.content(), upper.content());
}

template <BoundedInteger T>
[[nodiscard]] nlohmann::json limits_to_json(const RuntimeLimits<T> &limits)
{
    return nlohmann::json{{"lower", limits.lower()}, {"upper", limits.upper()}};
}

namespace detail
{
template <typename W> W decode_or_raise(const nlohmann::json &j)
{
    auto decoded = decode<W>(j);
    if (decoded.is_error())
        raise_violation(std::move(decoded).error());
    return std::move(decoded).content();
}
} // namespace detail

} // namespace checkedval::bounded

namespace nlohmann
{

template <checkedval::bounded::BoundedInteger T, checkedval::bounded::BehaviorPolicy B, T Lower,
          T Upper>
struct adl_serializer<checkedval::bounded::HardClamp<T, B, Lower, Upper>>
{
    using clamp_type = checkedval::bounded::HardClamp<T, B, Lower, Upper>;

    static void to_json(json &j, const clamp_type &clamp) { j = clamp.to_raw(); }

    static clamp_type from_json(const json &j)
    {
        return checkedval::bounded::detail::decode_or_raise<clamp_type>(j);
    }
};

template <checkedval::bounded::BoundedInteger T, checkedval::bounded::BehaviorPolicy B, T Lower,
          T Upper>
struct adl_serializer<checkedval::bounded::SoftClamp<T, B, Lower, Upper>>
{
    using clamp_type = checkedval::bounded::SoftClamp<T, B, Lower, Upper>;

    static void to_json(json &j, const clamp_type &clamp) { j = clamp.to_raw(); }

    static clamp_type from_json(const json &j)
    {
        return checkedval::bounded::detail::decode_or_raise<clamp_type>(j);
    }
};

template <typename T, typename V>
    requires checkedval::bounded::ValidatorFor<V, T>
struct adl_serializer<checkedval::bounded::View<T, V>>
{
    using view_type = checkedval::bounded::View<T, V>;

    static void to_json(json &j, const view_type &view) { j = view.get(); }

    static view_type from_json(const json &j)
        requires std::default_initializable<V>
    {
        auto decoded = checkedval::bounded::decode_view<T, V>(j);
        if (decoded.is_error())
            checkedval::bounded::raise_violation(std::move(decoded).error());
        return std::move(decoded).content();
    }
};

} // namespace nlohmann
