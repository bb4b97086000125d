/// @file temporal_engine.cpp
/// @brief Implementation of the per-tick orchestration.

#include "engine/temporal_engine.hpp"

#include "core/logger.hpp"

#include <variant>

namespace chronoring::engine
{

std::unique_ptr<TemporalEngine> TemporalEngine::create(core::EngineConfig config)
{
    return create(std::move(config),
                  std::make_unique<timing::SystemClockSource>(),
                  std::make_unique<timing::UdpNtpQuery>());
}

std::unique_ptr<TemporalEngine> TemporalEngine::create(core::EngineConfig config,
                                                       std::unique_ptr<timing::ClockSource> clock,
                                                       std::unique_ptr<timing::NtpQuery> query)
{
    if (auto issue = core::validate_config(config))
    {
        CHR_CORE_CRITICAL("Engine: invalid configuration: {} ({})", to_string(issue->code), issue->detail);
        return nullptr;
    }

    // validate_config() already resolved it once
    auto zone = timing::TimeZone::resolve(config.timezone);
    if (!zone)
    {
        return nullptr;
    }

    timing::SyncSettings settings{
        .servers             = config.ntp_servers,
        .timeout             = config.ntp_timeout,
        .sync_interval       = config.sync_interval,
        .staleness_threshold = config.staleness_threshold,
    };

    auto sync = std::make_unique<timing::NetworkTimeSync>(std::move(clock), std::move(query), std::move(settings));

    CHR_CORE_INFO("Engine: timezone {}, location {:.4f}, {:.4f}, {} NTP server(s), {} pulsar(s)",
                  zone->id(), config.location.latitude_deg, config.location.longitude_deg,
                  config.ntp_servers.size(), config.pulsars.size());

    return std::unique_ptr<TemporalEngine>(new TemporalEngine(std::move(config), std::move(*zone), std::move(sync)));
}

TemporalEngine::TemporalEngine(core::EngineConfig config,
                               timing::TimeZone zone,
                               std::unique_ptr<timing::NetworkTimeSync> sync)
    : m_config(std::move(config))
    , m_zone(std::move(zone))
    , m_sync(std::move(sync))
{
}

TemporalEngine::~TemporalEngine()
{
    stop();
}

// -----------------------------------------------------------------
// Tick
// -----------------------------------------------------------------

Snapshot TemporalEngine::tick()
{
    return compute(m_sync->now());
}

Snapshot TemporalEngine::compute(const timing::TimeReading& reading)
{
    const Instant instant = reading.instant;

    Snapshot snapshot{
        .sequence = m_sequence.fetch_add(1) + 1,
        .instant  = instant,
        .atomic   = AtomicTimeState{
            .status            = reading.status,
            .applied_offset    = reading.applied_offset,
            .last_sync_instant = reading.last_sync_instant,
            .last_round_trip   = reading.last_round_trip,
            .last_server       = reading.last_server,
        },
    };

    snapshot.local = timing::LocalClock::compute(instant, m_zone);

    // Same Instant, but the Hebrew day turns over at local midnight
    const calendar::HebrewConversion hebrew =
        calendar::HebrewCalendarConverter::convert(instant, snapshot.local.utc_offset);
    if (const auto* date = std::get_if<calendar::HebrewDate>(&hebrew))
    {
        snapshot.hebrew.date = *date;
        snapshot.hebrew.month_name = calendar::HebrewCalendarConverter::month_name(date->month, date->leap_year);
        snapshot.hebrew.holiday = calendar::HebrewCalendarConverter::holiday(*date);
        snapshot.hebrew.year_progress = calendar::HebrewCalendarConverter::year_progress(*date);
    }
    else
    {
        const CalendarDomainError error = std::get<CalendarDomainError>(hebrew);
        snapshot.hebrew.error = error;
        CHR_CORE_WARN("Engine: Hebrew date unavailable ({})", to_string(error));
    }

    snapshot.solar = astro::SolarPositionCalculator::compute(instant);
    snapshot.rotation = astro::EarthRotationModel::compute(instant, m_config.location, snapshot.solar);
    snapshot.pulsars = astro::PulsarSimulator::compute(instant, m_config.pulsars, m_config.tick_interval);

    return snapshot;
}

// -----------------------------------------------------------------
// Sync lifecycle
// -----------------------------------------------------------------

void TemporalEngine::start()
{
    m_sync->start();
}

void TemporalEngine::stop()
{
    m_sync->stop();
}

bool TemporalEngine::request_sync()
{
    return m_sync->request_sync();
}

} // namespace chronoring::engine
