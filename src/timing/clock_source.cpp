/// @file clock_source.cpp
/// @brief System and manual clock sources.

#include "timing/clock_source.hpp"

#include <chrono>

namespace chronoring::timing
{

Instant SystemClockSource::now() const
{
    return std::chrono::time_point_cast<Duration>(std::chrono::system_clock::now());
}

ManualClockSource::ManualClockSource(Instant start)
    : m_micros(start.time_since_epoch().count())
{
}

Instant ManualClockSource::now() const
{
    return Instant{Duration{m_micros.load()}};
}

void ManualClockSource::set(Instant instant)
{
    m_micros.store(instant.time_since_epoch().count());
}

void ManualClockSource::advance(Duration delta)
{
    m_micros.fetch_add(delta.count());
}

} // namespace chronoring::timing
