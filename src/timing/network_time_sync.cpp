/// @file network_time_sync.cpp
/// @brief Offset bookkeeping and the periodic sync worker.

#include "timing/network_time_sync.hpp"
#include "core/logger.hpp"

#include <variant>

namespace chronoring::timing
{

std::string_view to_string(SyncStatus status)
{
    switch (status)
    {
        case SyncStatus::Unsynced: return "unsynced";
        case SyncStatus::Synced:   return "synced";
        case SyncStatus::Stale:    return "stale";
        case SyncStatus::Failed:   return "failed";
    }
    return "unknown";
}

NetworkTimeSync::NetworkTimeSync(std::unique_ptr<ClockSource> clock,
                                 std::unique_ptr<NtpQuery> query,
                                 SyncSettings settings)
    : m_clock(std::move(clock))
    , m_query(std::move(query))
    , m_settings(std::move(settings))
{
}

NetworkTimeSync::~NetworkTimeSync()
{
    stop();
}

// -----------------------------------------------------------------
// Sync attempt
// -----------------------------------------------------------------

SyncResult NetworkTimeSync::sync()
{
    return sync(m_settings.servers, m_settings.timeout);
}

SyncResult NetworkTimeSync::sync(const std::vector<std::string>& servers,
                                 std::chrono::milliseconds timeout)
{
    std::lock_guard guard(m_sync_mutex);

    if (servers.empty())
    {
        CHR_CORE_WARN("Time sync: no NTP servers configured");
    }

    for (const auto& host : servers)
    {
        if (m_cancel.load())
        {
            CHR_CORE_DEBUG("Time sync: cancelled before querying '{}'", host);
            return SyncResult{.status = SyncStatus::Failed, .error = TimeSourceError::Cancelled};
        }

        const NtpQueryResult response = m_query->query(host, timeout, *m_clock);

        if (const auto* sample = std::get_if<NtpSample>(&response))
        {
            SyncResult result{
                .status     = SyncStatus::Synced,
                .offset     = sample->offset,
                .round_trip = sample->round_trip,
                .server     = host,
            };
            apply_sync_result(result);

            CHR_CORE_INFO("Time sync: {} offset {} us, round trip {} us, stratum {}",
                          host, sample->offset.count(), sample->round_trip.count(), sample->stratum);
            return result;
        }

        CHR_CORE_WARN("Time sync: '{}' failed ({})", host, to_string(std::get<TimeSourceError>(response)));
    }

    SyncResult result{.status = SyncStatus::Failed, .error = TimeSourceError::NoServerReachable};
    apply_sync_result(result);

    CHR_CORE_ERROR("Time sync: none of {} server(s) reachable", servers.size());
    return result;
}

void NetworkTimeSync::apply_sync_result(const SyncResult& result)
{
    const Instant local = m_clock->now();

    std::lock_guard lock(m_state_mutex);

    if (result.status == SyncStatus::Synced && result.offset)
    {
        m_state.network_offset = result.offset;
        m_state.last_sync_instant = local + *result.offset;
        m_state.sync_status = SyncStatus::Synced;
        m_state.last_server = result.server;
        m_state.last_round_trip = result.round_trip;
        m_state.last_error.reset();
        ++m_state.successful_syncs;
        return;
    }

    // Keep the last good offset; only the status reflects the failure
    m_state.last_error = result.error;
    m_state.sync_status = m_state.network_offset ? SyncStatus::Failed : SyncStatus::Unsynced;
    ++m_state.failed_syncs;
}

// -----------------------------------------------------------------
// Readers
// -----------------------------------------------------------------

SyncStatus NetworkTimeSync::effective_status(const TimeSourceState& state, Instant corrected) const
{
    if (state.sync_status == SyncStatus::Synced && state.last_sync_instant &&
        corrected - *state.last_sync_instant > m_settings.staleness_threshold)
    {
        return SyncStatus::Stale;
    }
    return state.sync_status;
}

TimeReading NetworkTimeSync::now() const
{
    const Instant local = m_clock->now();

    std::lock_guard lock(m_state_mutex);
    const Duration offset = m_state.network_offset.value_or(Duration::zero());
    const Instant corrected = local + offset;

    return TimeReading{
        .instant           = corrected,
        .status            = effective_status(m_state, corrected),
        .applied_offset    = offset,
        .last_sync_instant = m_state.last_sync_instant,
        .last_round_trip   = m_state.last_round_trip,
        .last_server       = m_state.last_server,
    };
}

TimeSourceState NetworkTimeSync::state() const
{
    const Instant local = m_clock->now();

    std::lock_guard lock(m_state_mutex);
    TimeSourceState copy = m_state;
    copy.raw_local_time = local;
    copy.sync_status = effective_status(m_state, local + m_state.network_offset.value_or(Duration::zero()));
    return copy;
}

// -----------------------------------------------------------------
// Worker
// -----------------------------------------------------------------

void NetworkTimeSync::start()
{
    if (m_worker.joinable())
    {
        return;
    }

    m_cancel.store(false);
    m_running.store(true);
    m_worker = std::thread([this] { run(); });

    request_sync();
}

void NetworkTimeSync::stop()
{
    if (!m_worker.joinable())
    {
        return;
    }

    {
        std::lock_guard lock(m_worker_mutex);
        m_running.store(false);
        m_cancel.store(true);
    }
    m_worker_cv.notify_all();
    m_worker.join();

    {
        std::lock_guard lock(m_worker_mutex);
        m_sync_requested = false;
    }
    finish_sync();

    // Cancellation only ends the worker's attempt; manual sync() keeps working
    m_cancel.store(false);
}

bool NetworkTimeSync::request_sync()
{
    {
        std::lock_guard lock(m_worker_mutex);

        if (!m_running.load())
        {
            CHR_CORE_WARN("Time sync: resync requested but the worker is not running");
            return false;
        }

        bool expected = false;
        if (!m_in_flight.compare_exchange_strong(expected, true))
        {
            CHR_CORE_DEBUG("Time sync: resync already in flight, request coalesced");
            return false;
        }

        m_sync_requested = true;
    }

    m_worker_cv.notify_one();
    return true;
}

bool NetworkTimeSync::wait_until_idle(std::chrono::milliseconds timeout) const
{
    std::unique_lock lock(m_idle_mutex);
    return m_idle_cv.wait_for(lock, timeout, [this] { return !m_in_flight.load(); });
}

void NetworkTimeSync::finish_sync()
{
    {
        std::lock_guard lock(m_idle_mutex);
        m_in_flight.store(false);
    }
    m_idle_cv.notify_all();
}

void NetworkTimeSync::run()
{
    CHR_CORE_DEBUG("Time sync worker started (interval {} s)",
                   std::chrono::duration_cast<std::chrono::seconds>(m_settings.sync_interval).count());

    std::unique_lock lock(m_worker_mutex);
    while (m_running.load())
    {
        const bool requested = m_worker_cv.wait_for(lock, m_settings.sync_interval,
            [this] { return m_sync_requested || !m_running.load(); });

        if (!m_running.load())
        {
            break;
        }

        if (requested)
        {
            // request_sync() already claimed the in-flight flag
            m_sync_requested = false;
        }
        else
        {
            bool expected = false;
            if (!m_in_flight.compare_exchange_strong(expected, true))
            {
                continue;
            }
        }

        lock.unlock();
        const SyncResult result = sync();
        finish_sync();
        lock.lock();

        if (result.error == TimeSourceError::Cancelled)
        {
            break;
        }
    }

    CHR_CORE_DEBUG("Time sync worker stopped");
}

} // namespace chronoring::timing
