#pragma once

/// @file tick_loop.hpp
/// @brief Background thread producing Snapshots at a fixed interval.

#include "core/types.hpp"
#include "engine/snapshot.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace chronoring::engine
{
    class TemporalEngine;

    /// @brief Calls TemporalEngine::tick() every interval and publishes the result.
    ///
    /// The newest Snapshot is swapped in under a lock; latest() may be called
    /// from any thread. The listener runs on the tick thread.
    class TickLoop
    {
    public:
        using Listener = std::function<void(const std::shared_ptr<const Snapshot>&)>;

        TickLoop(TemporalEngine& engine, Duration interval);
        ~TickLoop();

        TickLoop(const TickLoop&) = delete;
        TickLoop& operator=(const TickLoop&) = delete;

        /// @brief Set before start().
        void set_listener(Listener listener);

        void start();
        void stop();

        /// @brief Most recent Snapshot, or nullptr before the first tick.
        [[nodiscard]] std::shared_ptr<const Snapshot> latest() const;

        [[nodiscard]] u64 tick_count() const { return m_ticks.load(); }
        [[nodiscard]] bool running() const { return m_running.load(); }

    private:
        void run();

        TemporalEngine& m_engine;
        Duration m_interval;
        Listener m_listener;

        mutable std::mutex m_latest_mutex;
        std::shared_ptr<const Snapshot> m_latest;

        std::thread m_thread;
        std::atomic<bool> m_running{false};
        std::atomic<u64> m_ticks{0};
        std::mutex m_stop_mutex;
        std::condition_variable m_stop_cv;
    };

} // namespace chronoring::engine
