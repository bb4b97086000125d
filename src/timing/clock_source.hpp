#pragma once

/// @file clock_source.hpp
/// @brief Local clock abstraction: the only place the engine reads wall-clock time.

#include "core/types.hpp"

#include <atomic>

namespace chronoring::timing
{
    /// @brief Source of raw, uncorrected local time.
    ///
    /// Implementations must be safe to call concurrently: the sync worker and
    /// the tick thread both read it.
    class ClockSource
    {
    public:
        virtual ~ClockSource() = default;

        /// @brief Current local clock reading, UTC-anchored.
        [[nodiscard]] virtual Instant now() const = 0;
    };

    /// @brief Reads std::chrono::system_clock.
    class SystemClockSource final : public ClockSource
    {
    public:
        [[nodiscard]] Instant now() const override;
    };

    /// @brief Clock whose reading is set explicitly (tests, replays, fixed-time rendering).
    class ManualClockSource final : public ClockSource
    {
    public:
        explicit ManualClockSource(Instant start);

        [[nodiscard]] Instant now() const override;

        void set(Instant instant);
        void advance(Duration delta);

    private:
        std::atomic<i64> m_micros;  ///< Microseconds since the Unix epoch
    };

} // namespace chronoring::timing
