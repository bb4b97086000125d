/// @file error.cpp
/// @brief Human-readable names for error codes.

#include "core/error.hpp"

namespace chronoring
{

std::string_view to_string(TimeSourceError error)
{
    switch (error)
    {
        case TimeSourceError::DnsResolutionFailed: return "DNS resolution failed";
        case TimeSourceError::SocketError:         return "socket error";
        case TimeSourceError::Timeout:             return "timeout";
        case TimeSourceError::MalformedResponse:   return "malformed response";
        case TimeSourceError::NoServerReachable:   return "no server reachable";
        case TimeSourceError::Cancelled:           return "cancelled";
    }
    return "unknown time source error";
}

std::string_view to_string(CalendarDomainError error)
{
    switch (error)
    {
        case CalendarDomainError::BeforeEpoch: return "instant precedes calendar epoch";
    }
    return "unknown calendar error";
}

std::string_view to_string(ConfigError error)
{
    switch (error)
    {
        case ConfigError::InvalidTimezone:         return "invalid timezone";
        case ConfigError::LatitudeOutOfRange:      return "latitude out of range";
        case ConfigError::LongitudeOutOfRange:     return "longitude out of range";
        case ConfigError::NonPositivePulsarPeriod: return "non-positive pulsar period";
        case ConfigError::PulsarPeriodTooLong:     return "pulsar period longer than one day";
        case ConfigError::DuplicatePulsarName:     return "duplicate pulsar name";
        case ConfigError::InvalidPulseWidth:       return "invalid pulse width";
        case ConfigError::NonPositiveInterval:     return "non-positive interval";
        case ConfigError::IntervalTooLong:         return "interval longer than one day";
        case ConfigError::UnknownLogLevel:         return "unknown log level";
        case ConfigError::ParseError:              return "parse error";
        case ConfigError::FileNotFound:            return "file not found";
    }
    return "unknown configuration error";
}

} // namespace chronoring
