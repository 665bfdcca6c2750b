#include "bounded/error.hpp"

namespace checkedval::bounded
{

const char *to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::OutOfBounds:
        return "OutOfBounds";
    case ErrorKind::ValidationFailed:
        return "ValidationFailed";
    case ErrorKind::ConfigurationInvalid:
        return "ConfigurationInvalid";
    case ErrorKind::DivideByZero:
        return "DivideByZero";
    case ErrorKind::MachineOverflow:
        return "MachineOverflow";
    case ErrorKind::ParseFailed:
        return "ParseFailed";
    case ErrorKind::LeaseHeld:
        return "LeaseHeld";
    default:
        return "Unknown";
    }
}

const char *to_string(BoundSide side) noexcept
{
    switch (side)
    {
    case BoundSide::None:
        return "None";
    case BoundSide::Lower:
        return "Lower";
    case BoundSide::Upper:
        return "Upper";
    default:
        return "Unknown";
    }
}

std::string Error::describe() const
{
    if (message.empty())
        return to_string(kind);
    return fmt::format("{}: {}", to_string(kind), message);
}

Error Error::validation_failed(std::string reason)
{
    return Error{ErrorKind::ValidationFailed, BoundSide::None, std::move(reason)};
}

Error Error::divide_by_zero()
{
    return Error{ErrorKind::DivideByZero, BoundSide::None, "division or remainder by zero"};
}

Error Error::machine_overflow(std::string_view operation)
{
    return Error{ErrorKind::MachineOverflow, BoundSide::None,
                 fmt::format("'{}' overflows the 128-bit intermediate or uses an invalid shift count",
                             operation)};
}

Error Error::parse_failed(std::string_view input, std::string_view detail)
{
    return Error{ErrorKind::ParseFailed, BoundSide::None,
                 fmt::format("cannot parse '{}': {}", format_tools::excerpt(input), detail)};
}

Error Error::lease_held()
{
    return Error{ErrorKind::LeaseHeld, BoundSide::None,
                 "a guard is already open on this value"};
}

ViolationError::ViolationError(Error error)
    : std::runtime_error(error.describe()), m_error(std::move(error))
{
}

} // namespace checkedval::bounded
