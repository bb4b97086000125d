/// @file pulsar_simulator.cpp
/// @brief Implementation of the stateless pulsar phase computation.

#include "astro/pulsar_simulator.hpp"

#include <algorithm>
#include <limits>

namespace chronoring::astro
{

namespace
{

// 2000-01-01 12:00:00 UTC in Unix seconds
constexpr i64 kJ2000UnixSeconds = 946728000;

// Largest period for which the microsecond-to-nanosecond scaling below fits in i64
constexpr i64 kMaxPeriodNs = std::numeric_limits<i64>::max() / 1000;

/// @brief Mathematical modulo, result in [0, m) for m > 0.
i64 floor_mod(i64 value, i64 modulus)
{
    const i64 r = value % modulus;
    return r < 0 ? r + modulus : r;
}

} // anonymous namespace

Instant PulsarSimulator::epoch()
{
    return Instant{std::chrono::seconds{kJ2000UnixSeconds}};
}

std::vector<PulsarState> PulsarSimulator::compute(Instant instant,
                                                  const std::vector<PulsarConfig>& pulsars,
                                                  Duration tick_interval)
{
    std::vector<PulsarState> states;
    states.reserve(pulsars.size());

    for (std::size_t i = 0; i < pulsars.size(); ++i)
    {
        states.push_back(compute_one(instant, pulsars[i], static_cast<u32>(i), tick_interval));
    }

    return states;
}

// -----------------------------------------------------------------
// Phase from elapsed time
//
// r = (t − epoch − offset) mod P, in nanoseconds. The elapsed time is
// held in microseconds, so it is reduced modulo P before scaling to
// nanoseconds; this stays inside i64 for any period below ~106 days.
//
// Pulses in the half-open interval (t − dt, t] are the multiples of P
// in that window: none when r ≥ dt, otherwise ceil((dt − r) / P).
// -----------------------------------------------------------------

PulsarState PulsarSimulator::compute_one(Instant instant,
                                         const PulsarConfig& pulsar,
                                         u32 id,
                                         Duration tick_interval)
{
    const i64 period_ns = pulsar.period.count();

    if (period_ns <= 0 || period_ns > kMaxPeriodNs)
    {
        return PulsarState{
            .id                 = id,
            .display_name       = pulsar.display_name,
            .period             = pulsar.period,
            .phase_offset       = pulsar.phase_offset,
            .current_phase      = 0.0,
            .pulsed             = false,
            .pulses_in_interval = 0,
            .intensity          = 0.0,
        };
    }

    const i64 elapsed_us = (instant - epoch()).count();
    const i64 elapsed_mod = floor_mod(elapsed_us, period_ns);
    const i64 offset_mod = floor_mod(pulsar.phase_offset.count(), period_ns);
    const i64 remainder_ns = floor_mod(floor_mod(elapsed_mod * 1000, period_ns) - offset_mod, period_ns);

    const f64 phase = static_cast<f64>(remainder_ns) / static_cast<f64>(period_ns);

    const i64 interval_ns = std::max<i64>(0, tick_interval.count()) * 1000;
    u64 pulses = 0;
    if (remainder_ns < interval_ns)
    {
        pulses = static_cast<u64>((interval_ns - remainder_ns + period_ns - 1) / period_ns);
    }

    // Triangular profile centred on phase 0
    const f64 distance = std::min(phase, 1.0 - phase);
    const f64 half_width = pulsar.pulse_width * 0.5;
    const f64 intensity = distance < half_width ? 1.0 - distance / half_width : 0.0;

    return PulsarState{
        .id                 = id,
        .display_name       = pulsar.display_name,
        .period             = pulsar.period,
        .phase_offset       = pulsar.phase_offset,
        .current_phase      = phase,
        .pulsed             = pulses > 0,
        .pulses_in_interval = pulses,
        .intensity          = intensity,
    };
}

std::vector<PulsarConfig> PulsarSimulator::builtin_catalog()
{
    using std::chrono::microseconds;
    using std::chrono::milliseconds;

    return {
        PulsarConfig{.display_name = "PSR B0531+21 (Crab)", .period = milliseconds{33}},
        PulsarConfig{.display_name = "PSR B1937+21",        .period = microseconds{1558}},
        PulsarConfig{.display_name = "PSR J0737-3039",      .period = microseconds{22700}},
        PulsarConfig{.display_name = "PSR B1919+21",        .period = milliseconds{1337}},
    };
}

} // namespace chronoring::astro
