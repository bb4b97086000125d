// src/main.cpp - Chronoring command-line front end
//
//  1. Load configuration (file or defaults)
//  2. Build the temporal engine and start network time sync
//  3. Tick at the configured rate, printing each snapshot
//  4. Stop after --ticks N ticks, or on Ctrl-C
//
// --compact prints one summary line per tick instead of the full panel.

#include "core/config.hpp"
#include "core/config_loader.hpp"
#include "core/logger.hpp"
#include "engine/temporal_engine.hpp"
#include "engine/tick_loop.hpp"
#include "rendering/snapshot_printer.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <variant>

using namespace chronoring;

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) {
    g_interrupted.store(true);
}

struct CliOptions {
    std::optional<std::string> config_path;
    u64 ticks = 0;  // 0 = until interrupted
    bool compact = false;
    bool ok = true;
};

CliOptions parseArgs(int argc, char** argv) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--ticks" && i + 1 < argc) {
            const std::string_view n = argv[++i];
            auto [ptr, ec] = std::from_chars(n.data(), n.data() + n.size(), opts.ticks);
            if (ec != std::errc{} || ptr != n.data() + n.size()) {
                std::cerr << "chronoring: invalid tick count '" << n << "'\n";
                opts.ok = false;
            }
        } else if (arg == "--compact") {
            opts.compact = true;
        } else if (!arg.starts_with("--") && !opts.config_path) {
            opts.config_path = std::string(arg);
        } else {
            std::cerr << "usage: chronoring [config-file] [--ticks N] [--compact]\n";
            opts.ok = false;
        }
    }
    return opts;
}

} // anonymous namespace

int main(int argc, char** argv) {
    const CliOptions opts = parseArgs(argc, argv);
    if (!opts.ok) return 2;

    core::Logger::init(spdlog::level::info);

    // -----------------------------------------------------------------------
    // 1. Configuration
    // -----------------------------------------------------------------------
    core::EngineConfig config;
    if (opts.config_path) {
        core::ConfigResult loaded = core::ConfigLoader::load(*opts.config_path);
        if (const auto* issue = std::get_if<ConfigIssue>(&loaded)) {
            CHR_CRITICAL("Configuration rejected: {} ({})", to_string(issue->code), issue->detail);
            core::Logger::shutdown();
            return 1;
        }
        config = std::get<core::EngineConfig>(std::move(loaded));
    }

    // validate_config() has accepted the level name
    const auto level = core::parse_log_level(config.log_level).value_or(spdlog::level::info);
    core::Logger::init(level, config.log_file);

    // -----------------------------------------------------------------------
    // 2. Engine
    // -----------------------------------------------------------------------
    auto engine = engine::TemporalEngine::create(config);
    if (!engine) {
        CHR_CRITICAL("Engine could not be created");
        core::Logger::shutdown();
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    engine->start();

    // -----------------------------------------------------------------------
    // 3. Tick loop
    // -----------------------------------------------------------------------
    SnapshotPrinter printer;
    std::mutex out_mutex;

    engine::TickLoop loop(*engine, config.tick_interval);
    loop.set_listener([&](const std::shared_ptr<const engine::Snapshot>& snap) {
        std::lock_guard lock(out_mutex);
        if (opts.compact) {
            std::cout << printer.summaryLine(*snap) << '\n';
        } else {
            printer.renderSnapshot(std::cout, *snap);
        }
        std::cout.flush();
    });

    CHR_INFO("Chronoring running ({} ms ticks{})",
             std::chrono::duration_cast<std::chrono::milliseconds>(config.tick_interval).count(),
             opts.ticks > 0 ? ", " + std::to_string(opts.ticks) + " tick(s)" : std::string(", Ctrl-C to stop"));

    loop.start();

    // -----------------------------------------------------------------------
    // 4. Wait for the tick budget or a signal
    // -----------------------------------------------------------------------
    while (!g_interrupted.load()) {
        if (opts.ticks > 0 && loop.tick_count() >= opts.ticks) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    loop.stop();
    engine->stop();

    const timing::TimeSourceState state = engine->time_sync().state();
    CHR_INFO("Stopped after {} tick(s); {} successful / {} failed sync(s), status {}",
             loop.tick_count(), state.successful_syncs, state.failed_syncs,
             timing::to_string(state.sync_status));

    core::Logger::shutdown();
    return 0;
}
