#pragma once

/// @file temporal_engine.hpp
/// @brief Orchestrates the time source and the calculators into Snapshots.

#include "core/config.hpp"
#include "engine/snapshot.hpp"
#include "timing/clock_source.hpp"
#include "timing/network_time_sync.hpp"
#include "timing/ntp_client.hpp"
#include "timing/time_zone.hpp"

#include <atomic>
#include <memory>

namespace chronoring::engine
{
    /// @brief Produces one Snapshot per tick.
    ///
    /// tick() reads the network-corrected time exactly once and passes that
    /// Instant to every calculator, so all parts of a Snapshot agree. It
    /// never touches the network; synchronization runs on the worker owned
    /// by the NetworkTimeSync.
    class TemporalEngine
    {
    public:
        /// @brief Build an engine on the system clock and UDP NTP.
        /// @return nullptr if the configuration is invalid (the problem is logged).
        [[nodiscard]] static std::unique_ptr<TemporalEngine> create(core::EngineConfig config);

        /// @brief Build an engine with explicit clock and NTP transport.
        [[nodiscard]] static std::unique_ptr<TemporalEngine> create(core::EngineConfig config,
                                                                    std::unique_ptr<timing::ClockSource> clock,
                                                                    std::unique_ptr<timing::NtpQuery> query);

        ~TemporalEngine();

        TemporalEngine(const TemporalEngine&) = delete;
        TemporalEngine& operator=(const TemporalEngine&) = delete;

        /// @brief Compute a Snapshot for the current corrected time.
        [[nodiscard]] Snapshot tick();

        /// @brief Compute a Snapshot from an already obtained time reading (no clock read).
        [[nodiscard]] Snapshot compute(const timing::TimeReading& reading);

        /// @brief Start the periodic sync worker.
        void start();
        void stop();

        /// @brief Forward a manual resync trigger. False if coalesced.
        bool request_sync();

        [[nodiscard]] timing::NetworkTimeSync& time_sync() { return *m_sync; }
        [[nodiscard]] const core::EngineConfig& config() const { return m_config; }
        [[nodiscard]] const timing::TimeZone& time_zone() const { return m_zone; }

    private:
        TemporalEngine(core::EngineConfig config,
                       timing::TimeZone zone,
                       std::unique_ptr<timing::NetworkTimeSync> sync);

        core::EngineConfig m_config;
        timing::TimeZone m_zone;
        std::unique_ptr<timing::NetworkTimeSync> m_sync;
        std::atomic<u64> m_sequence{0};
    };

} // namespace chronoring::engine
