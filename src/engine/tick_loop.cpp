/// @file tick_loop.cpp
/// @brief Fixed-rate tick thread.

#include "engine/tick_loop.hpp"

#include "core/logger.hpp"
#include "engine/temporal_engine.hpp"

#include <chrono>

namespace chronoring::engine
{

TickLoop::TickLoop(TemporalEngine& engine, Duration interval)
    : m_engine(engine)
    , m_interval(interval)
{
}

TickLoop::~TickLoop()
{
    stop();
}

void TickLoop::set_listener(Listener listener)
{
    m_listener = std::move(listener);
}

void TickLoop::start()
{
    if (m_thread.joinable())
    {
        return;
    }

    m_running.store(true);
    m_thread = std::thread([this] { run(); });
}

void TickLoop::stop()
{
    if (!m_thread.joinable())
    {
        return;
    }

    {
        std::lock_guard lock(m_stop_mutex);
        m_running.store(false);
    }
    m_stop_cv.notify_all();
    m_thread.join();
}

std::shared_ptr<const Snapshot> TickLoop::latest() const
{
    std::lock_guard lock(m_latest_mutex);
    return m_latest;
}

// -----------------------------------------------------------------
// Tick thread
//
// Deadlines advance by whole intervals from the start time so that a
// slow tick does not shift every later one. Missed deadlines are
// skipped rather than replayed.
// -----------------------------------------------------------------

void TickLoop::run()
{
    using clock = std::chrono::steady_clock;

    CHR_CORE_DEBUG("Tick loop started ({} ms)", std::chrono::duration_cast<std::chrono::milliseconds>(m_interval).count());

    auto next = clock::now();
    while (m_running.load())
    {
        auto snapshot = std::make_shared<const Snapshot>(m_engine.tick());
        {
            std::lock_guard lock(m_latest_mutex);
            m_latest = snapshot;
        }
        m_ticks.fetch_add(1);

        if (m_listener)
        {
            m_listener(snapshot);
        }

        next += m_interval;
        const auto now = clock::now();
        if (next < now)
        {
            const auto behind = (now - next) / m_interval + 1;
            next += behind * m_interval;
        }

        std::unique_lock lock(m_stop_mutex);
        m_stop_cv.wait_until(lock, next, [this] { return !m_running.load(); });
    }

    CHR_CORE_DEBUG("Tick loop stopped after {} tick(s)", m_ticks.load());
}

} // namespace chronoring::engine
