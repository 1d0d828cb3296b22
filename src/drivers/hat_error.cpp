#include "hat_error.hpp"

const char* to_string(HatErrorKind kind)
{
    switch(kind)
    {
    case HatErrorKind::DeviceNotFound:
        return "DeviceNotFound";
    case HatErrorKind::TransferError:
        return "TransferError";
    case HatErrorKind::InvalidAccess:
        return "InvalidAccess";
    case HatErrorKind::OutOfRange:
        return "OutOfRange";
    case HatErrorKind::BoardMismatch:
        return "BoardMismatch";
    }
    return "Unknown";
}

HatError::HatError(HatErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(to_string(kind)) + ": " + message), _kind(kind)
{}
