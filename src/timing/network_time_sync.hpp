#pragma once

/// @file network_time_sync.hpp
/// @brief Maintains the network-corrected time offset from a list of NTP servers.

#include "core/error.hpp"
#include "core/types.hpp"
#include "timing/clock_source.hpp"
#include "timing/ntp_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace chronoring::timing
{
    enum class SyncStatus : u8
    {
        Unsynced,  ///< No offset has ever been obtained
        Synced,    ///< Offset is fresh
        Stale,     ///< Offset older than the staleness threshold
        Failed,    ///< Last attempt failed; a previous offset is still applied
    };

    [[nodiscard]] std::string_view to_string(SyncStatus status);

    /// @brief Snapshot of the synchronization bookkeeping.
    struct TimeSourceState
    {
        Instant raw_local_time{};
        std::optional<Duration> network_offset;
        std::optional<Instant> last_sync_instant;  ///< Corrected time of the last success
        SyncStatus sync_status = SyncStatus::Unsynced;

        std::string last_server;
        std::optional<Duration> last_round_trip;
        std::optional<TimeSourceError> last_error;

        u64 successful_syncs = 0;
        u64 failed_syncs = 0;
    };

    /// @brief Outcome of one sync() call.
    struct SyncResult
    {
        SyncStatus status = SyncStatus::Failed;
        std::optional<Duration> offset;
        std::optional<Duration> round_trip;
        std::string server;
        std::optional<TimeSourceError> error;
    };

    /// @brief Best available time with its quality.
    struct TimeReading
    {
        Instant instant;       ///< Local clock plus the applied offset
        SyncStatus status = SyncStatus::Unsynced;
        Duration applied_offset{0};

        std::optional<Instant> last_sync_instant;
        std::optional<Duration> last_round_trip;
        std::string last_server;
    };

    struct SyncSettings
    {
        std::vector<std::string> servers;
        std::chrono::milliseconds timeout{2000};
        Duration sync_interval = std::chrono::seconds{60};
        Duration staleness_threshold = std::chrono::seconds{600};
    };

    /// @brief Network time synchronization with a periodic background worker.
    ///
    /// now() never blocks on the network. Sync attempts are serialized, and
    /// request_sync() coalesces triggers that arrive while one is outstanding.
    /// A failed sync keeps the last good offset.
    class NetworkTimeSync
    {
    public:
        NetworkTimeSync(std::unique_ptr<ClockSource> clock,
                        std::unique_ptr<NtpQuery> query,
                        SyncSettings settings);
        ~NetworkTimeSync();

        NetworkTimeSync(const NetworkTimeSync&) = delete;
        NetworkTimeSync& operator=(const NetworkTimeSync&) = delete;

        /// @brief Query the servers in order until one answers (blocking).
        SyncResult sync(const std::vector<std::string>& servers, std::chrono::milliseconds timeout);

        /// @brief sync() with the configured servers and timeout.
        SyncResult sync();

        /// @brief Local clock corrected by the last good offset.
        [[nodiscard]] TimeReading now() const;

        /// @brief Current bookkeeping, staleness evaluated at the time of the call.
        [[nodiscard]] TimeSourceState state() const;

        /// @brief Launch the periodic worker; triggers an immediate first sync.
        void start();

        /// @brief Cancel any outstanding attempt between servers and join the worker.
        void stop();

        /// @brief Ask the worker for an immediate sync.
        /// @return false if a sync is already outstanding or the worker is not running.
        bool request_sync();

        [[nodiscard]] bool sync_in_flight() const { return m_in_flight.load(); }

        /// @brief Block until no sync is outstanding or the timeout elapses.
        bool wait_until_idle(std::chrono::milliseconds timeout) const;

        [[nodiscard]] const ClockSource& clock() const { return *m_clock; }
        [[nodiscard]] const SyncSettings& settings() const { return m_settings; }

    private:
        void apply_sync_result(const SyncResult& result);
        [[nodiscard]] SyncStatus effective_status(const TimeSourceState& state, Instant corrected) const;
        void run();
        void finish_sync();

        std::unique_ptr<ClockSource> m_clock;
        std::unique_ptr<NtpQuery> m_query;
        SyncSettings m_settings;

        mutable std::mutex m_state_mutex;
        TimeSourceState m_state;

        std::mutex m_sync_mutex;  ///< Serializes network attempts

        // Worker
        std::thread m_worker;
        std::atomic<bool> m_running{false};
        std::atomic<bool> m_cancel{false};
        std::atomic<bool> m_in_flight{false};
        bool m_sync_requested = false;  ///< Guarded by m_worker_mutex
        std::mutex m_worker_mutex;
        std::condition_variable m_worker_cv;

        mutable std::mutex m_idle_mutex;
        mutable std::condition_variable m_idle_cv;
    };

} // namespace chronoring::timing
