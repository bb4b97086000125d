#pragma once

/// @file snapshot.hpp
/// @brief Immutable per-tick aggregate handed to renderers.

#include "astro/earth_rotation.hpp"
#include "astro/pulsar_simulator.hpp"
#include "astro/solar_position.hpp"
#include "calendar/hebrew_calendar.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "timing/local_clock.hpp"
#include "timing/network_time_sync.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace chronoring::engine
{
    /// @brief Trust information for the atomic-time ring.
    struct AtomicTimeState
    {
        timing::SyncStatus status = timing::SyncStatus::Unsynced;
        Duration applied_offset{0};
        std::optional<Instant> last_sync_instant;
        std::optional<Duration> last_round_trip;
        std::string last_server;
    };

    /// @brief Hebrew ring contents; `date` is empty when the Instant has no Hebrew date.
    struct HebrewRing
    {
        std::optional<calendar::HebrewDate> date;
        std::optional<CalendarDomainError> error;
        std::string_view month_name;
        std::optional<std::string_view> holiday;
        f64 year_progress = 0.0;
    };

    /// @brief Everything computed for one tick, all from the same Instant.
    struct Snapshot
    {
        u64 sequence = 0;
        Instant instant{};

        AtomicTimeState atomic;
        timing::LocalClockState local;
        HebrewRing hebrew;
        astro::SolarPosition solar;
        astro::RotationState rotation;
        std::vector<astro::PulsarState> pulsars;
    };

} // namespace chronoring::engine
