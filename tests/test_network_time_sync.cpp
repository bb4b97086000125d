/// @file test_network_time_sync.cpp
/// @brief Unit tests for chronoring::timing::NetworkTimeSync.
///
/// The network is replaced by scripted NtpQuery fakes and the local clock
/// by a ManualClockSource, so every case is deterministic and offline.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/error.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "timing/clock_source.hpp"
#include "timing/network_time_sync.hpp"
#include "timing/ntp_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace chronoring;
using namespace chronoring::timing;
using namespace std::chrono_literals;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    chronoring::core::Logger::init(spdlog::level::warn, "chronoring_tests.log");
    const int result = doctest::Context(argc, argv).run();
    chronoring::core::Logger::shutdown();
    return result;
}

// =================================================================
// Fakes
// =================================================================

// 2024-06-15 22:30:00 UTC
static const Instant kStart{std::chrono::seconds{1718490600}};

/// @brief Answers every query through a replaceable function and records the hosts asked.
class ScriptedQuery final : public NtpQuery
{
public:
    using Script = std::function<NtpQueryResult(const std::string& host)>;

    explicit ScriptedQuery(Script script) : m_script(std::move(script)) {}

    NtpQueryResult query(const std::string& host, std::chrono::milliseconds, const ClockSource&) override
    {
        {
            std::lock_guard lock(m_mutex);
            m_hosts.push_back(host);
        }
        return m_script(host);
    }

    void set_script(Script script)
    {
        m_script = std::move(script);
    }

    [[nodiscard]] std::vector<std::string> hosts() const
    {
        std::lock_guard lock(m_mutex);
        return m_hosts;
    }

private:
    Script m_script;
    mutable std::mutex m_mutex;
    std::vector<std::string> m_hosts;
};

/// @brief Blocks every query until released, then fails it with a timeout.
class GatedQuery final : public NtpQuery
{
public:
    NtpQueryResult query(const std::string&, std::chrono::milliseconds, const ClockSource&) override
    {
        std::unique_lock lock(m_mutex);
        ++m_calls;
        m_entered_cv.notify_all();
        m_release_cv.wait(lock, [this] { return m_released; });
        return TimeSourceError::Timeout;
    }

    void release()
    {
        {
            std::lock_guard lock(m_mutex);
            m_released = true;
        }
        m_release_cv.notify_all();
    }

    bool wait_entered(std::chrono::milliseconds timeout)
    {
        std::unique_lock lock(m_mutex);
        return m_entered_cv.wait_for(lock, timeout, [this] { return m_calls > 0; });
    }

    [[nodiscard]] int calls() const
    {
        std::lock_guard lock(m_mutex);
        return m_calls;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_entered_cv;
    std::condition_variable m_release_cv;
    bool m_released = false;
    int m_calls = 0;
};

static NtpQueryResult answer(Duration offset)
{
    return NtpSample{.offset = offset, .round_trip = 20ms, .stratum = 2};
}

static SyncSettings settings(std::vector<std::string> servers)
{
    return SyncSettings{
        .servers = std::move(servers),
        .timeout = 100ms,
        .sync_interval = 60s,
        .staleness_threshold = 600s,
    };
}

// =================================================================
// Single attempts
// =================================================================

TEST_CASE("Unsynced before the first attempt: raw local time")
{
    NetworkTimeSync sync(std::make_unique<ManualClockSource>(kStart),
                         std::make_unique<ScriptedQuery>([](const std::string&) { return answer(1s); }),
                         settings({"a"}));

    const TimeReading reading = sync.now();
    CHECK(reading.instant == kStart);
    CHECK(reading.status == SyncStatus::Unsynced);
    CHECK(reading.applied_offset == Duration::zero());
    CHECK_FALSE(reading.last_sync_instant.has_value());
}

TEST_CASE("First reachable server wins")
{
    auto query = std::make_unique<ScriptedQuery>([](const std::string& host) -> NtpQueryResult {
        if (host == "down.example")
        {
            return TimeSourceError::Timeout;
        }
        return answer(1500ms);
    });
    ScriptedQuery* script = query.get();

    NetworkTimeSync sync(std::make_unique<ManualClockSource>(kStart), std::move(query),
                         settings({"down.example", "up.example", "never.example"}));

    const SyncResult result = sync.sync();
    CHECK(result.status == SyncStatus::Synced);
    CHECK(result.server == "up.example");
    CHECK(result.offset == 1500ms);
    CHECK(result.round_trip == 20ms);
    const std::vector<std::string> asked{"down.example", "up.example"};
    CHECK(script->hosts() == asked);

    const TimeReading reading = sync.now();
    CHECK(reading.instant == kStart + 1500ms);
    CHECK(reading.status == SyncStatus::Synced);
    CHECK(reading.applied_offset == 1500ms);
    CHECK(reading.last_server == "up.example");
    CHECK(reading.last_sync_instant == kStart + 1500ms);

    const TimeSourceState state = sync.state();
    CHECK(state.raw_local_time == kStart);
    CHECK(state.successful_syncs == 1);
    CHECK_FALSE(state.last_error.has_value());
}

TEST_CASE("Every server failing leaves the clock usable and unsynced")
{
    NetworkTimeSync sync(std::make_unique<ManualClockSource>(kStart),
                         std::make_unique<ScriptedQuery>([](const std::string&) -> NtpQueryResult {
                             return TimeSourceError::DnsResolutionFailed;
                         }),
                         settings({"a", "b"}));

    const SyncResult result = sync.sync();
    CHECK(result.status == SyncStatus::Failed);
    CHECK(result.error == TimeSourceError::NoServerReachable);
    CHECK_FALSE(result.offset.has_value());

    const TimeReading reading = sync.now();
    CHECK(reading.instant == kStart);
    CHECK(reading.status == SyncStatus::Unsynced);

    const TimeSourceState state = sync.state();
    CHECK(state.failed_syncs == 1);
    CHECK(state.last_error == TimeSourceError::NoServerReachable);
}

TEST_CASE("Empty server list is a failed attempt")
{
    NetworkTimeSync sync(std::make_unique<ManualClockSource>(kStart),
                         std::make_unique<ScriptedQuery>([](const std::string&) { return answer(1s); }),
                         settings({}));

    const SyncResult result = sync.sync();
    CHECK(result.status == SyncStatus::Failed);
    CHECK(result.error == TimeSourceError::NoServerReachable);
}

TEST_CASE("Failure after success keeps the last good offset")
{
    auto query = std::make_unique<ScriptedQuery>([](const std::string&) { return answer(-2s); });
    ScriptedQuery* script = query.get();

    NetworkTimeSync sync(std::make_unique<ManualClockSource>(kStart), std::move(query), settings({"a"}));
    REQUIRE(sync.sync().status == SyncStatus::Synced);

    script->set_script([](const std::string&) -> NtpQueryResult { return TimeSourceError::SocketError; });
    const SyncResult result = sync.sync();
    CHECK(result.status == SyncStatus::Failed);

    const TimeReading reading = sync.now();
    CHECK(reading.status == SyncStatus::Failed);
    CHECK(reading.applied_offset == -2s);
    CHECK(reading.instant == kStart - 2s);

    const TimeSourceState state = sync.state();
    CHECK(state.network_offset == -2s);
    CHECK(state.successful_syncs == 1);
    CHECK(state.failed_syncs == 1);
}

TEST_CASE("Offset goes stale after the threshold")
{
    auto clock = std::make_unique<ManualClockSource>(kStart);
    ManualClockSource* manual = clock.get();

    NetworkTimeSync sync(std::move(clock),
                         std::make_unique<ScriptedQuery>([](const std::string&) { return answer(250ms); }),
                         settings({"a"}));
    REQUIRE(sync.sync().status == SyncStatus::Synced);

    manual->advance(600s);
    CHECK(sync.now().status == SyncStatus::Synced);

    manual->advance(1s);
    CHECK(sync.now().status == SyncStatus::Stale);
    CHECK(sync.state().sync_status == SyncStatus::Stale);
    CHECK(sync.now().instant == kStart + 601s + 250ms);

    // A fresh success clears it
    REQUIRE(sync.sync().status == SyncStatus::Synced);
    CHECK(sync.now().status == SyncStatus::Synced);
}

// =================================================================
// Worker
// =================================================================

TEST_CASE("Resync requests are refused while the worker is stopped")
{
    NetworkTimeSync sync(std::make_unique<ManualClockSource>(kStart),
                         std::make_unique<ScriptedQuery>([](const std::string&) { return answer(1s); }),
                         settings({"a"}));

    CHECK_FALSE(sync.request_sync());
    CHECK_FALSE(sync.sync_in_flight());
}

TEST_CASE("start() performs an immediate sync")
{
    NetworkTimeSync sync(std::make_unique<ManualClockSource>(kStart),
                         std::make_unique<ScriptedQuery>([](const std::string&) { return answer(3s); }),
                         settings({"a"}));

    sync.start();
    REQUIRE(sync.wait_until_idle(2000ms));
    CHECK(sync.now().status == SyncStatus::Synced);
    CHECK(sync.now().applied_offset == 3s);

    // Idle worker accepts a new request
    CHECK(sync.request_sync());
    REQUIRE(sync.wait_until_idle(2000ms));
    CHECK(sync.state().successful_syncs == 2);

    sync.stop();
}

TEST_CASE("Overlapping resync requests coalesce into one attempt")
{
    auto query = std::make_unique<GatedQuery>();
    GatedQuery* gate = query.get();

    NetworkTimeSync sync(std::make_unique<ManualClockSource>(kStart), std::move(query), settings({"a"}));

    sync.start();
    REQUIRE(gate->wait_entered(2000ms));
    CHECK(sync.sync_in_flight());

    CHECK_FALSE(sync.request_sync());
    CHECK_FALSE(sync.request_sync());

    gate->release();
    REQUIRE(sync.wait_until_idle(2000ms));
    CHECK(gate->calls() == 1);

    sync.stop();
    CHECK(gate->calls() == 1);
}

TEST_CASE("stop() cancels the remaining servers")
{
    auto query = std::make_unique<GatedQuery>();
    GatedQuery* gate = query.get();

    NetworkTimeSync sync(std::make_unique<ManualClockSource>(kStart), std::move(query),
                         settings({"first", "second", "third"}));

    sync.start();
    REQUIRE(gate->wait_entered(2000ms));

    std::thread stopper([&sync] { sync.stop(); });
    std::this_thread::sleep_for(200ms);
    gate->release();
    stopper.join();

    CHECK(gate->calls() == 1);
    CHECK_FALSE(sync.sync_in_flight());

    // A cancelled attempt is not recorded as a failure
    CHECK(sync.state().failed_syncs == 0);
    CHECK(sync.now().status == SyncStatus::Unsynced);
}

TEST_CASE("Manual sync still queries servers after the worker stopped")
{
    auto query = std::make_unique<ScriptedQuery>([](const std::string&) { return answer(750ms); });
    ScriptedQuery* script = query.get();

    NetworkTimeSync sync(std::make_unique<ManualClockSource>(kStart), std::move(query), settings({"a"}));

    sync.start();
    REQUIRE(sync.wait_until_idle(2000ms));
    sync.stop();
    REQUIRE(script->hosts().size() == 1);

    const SyncResult result = sync.sync();
    CHECK(result.status == SyncStatus::Synced);
    CHECK_FALSE(result.error.has_value());
    CHECK(script->hosts().size() == 2);
    CHECK(sync.state().successful_syncs == 2);

    // And the worker can be started again
    sync.start();
    REQUIRE(sync.wait_until_idle(2000ms));
    CHECK(script->hosts().size() == 3);
    sync.stop();
}
