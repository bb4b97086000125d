#pragma once

/// @file pulsar_simulator.hpp
/// @brief Stateless pulse-phase simulation for a set of pulsars.

#include "core/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace chronoring::astro
{
    /// @brief One simulated pulsar.
    struct PulsarConfig
    {
        std::string display_name;
        std::chrono::nanoseconds period{0};        ///< Rotation period, > 0
        std::chrono::nanoseconds phase_offset{0};  ///< Shifts the first pulse after the epoch
        f64 pulse_width = 0.1;                      ///< Pulse profile width as a fraction of the period, (0, 1]
    };

    /// @brief Pulse state of one pulsar at one Instant.
    struct PulsarState
    {
        u32 id;                                ///< Index of the pulsar in the configuration
        std::string display_name;
        std::chrono::nanoseconds period;
        std::chrono::nanoseconds phase_offset;
        f64 current_phase;                     ///< [0, 1), 0 = pulse peak
        bool pulsed;                           ///< Phase crossed 0 during the last tick interval
        u64 pulses_in_interval;                ///< Number of crossings during the last tick interval
        f64 intensity;                         ///< Triangular pulse profile, 1 at the peak, 0 off-pulse
    };

    /// @brief Computes pulsar phases directly from elapsed time.
    ///
    /// phase = frac((now − epoch − phase_offset) / period), evaluated with integer
    /// nanosecond modulo arithmetic, so the result depends only on the Instant:
    /// calling compute() twice for the same Instant gives identical output and
    /// nothing accumulates across ticks. The epoch is J2000.0 (2000-01-01 12:00 UTC).
    class PulsarSimulator
    {
    public:
        PulsarSimulator() = delete;

        /// @brief Phase reference shared by all pulsars.
        [[nodiscard]] static Instant epoch();

        /// @brief Compute the state of every configured pulsar.
        /// @param instant Current instant.
        /// @param pulsars Pulsar set; the result is indexed the same way.
        /// @param tick_interval Length of the tick that ended at `instant`, used for the pulse flag.
        [[nodiscard]] static std::vector<PulsarState> compute(Instant instant,
                                                              const std::vector<PulsarConfig>& pulsars,
                                                              Duration tick_interval);

        /// @brief Compute the state of a single pulsar.
        ///
        /// A period that is not positive, or too long to scale to nanoseconds,
        /// gives a silent state: phase 0, no pulses, zero intensity.
        [[nodiscard]] static PulsarState compute_one(Instant instant,
                                                     const PulsarConfig& pulsar,
                                                     u32 id,
                                                     Duration tick_interval);

        /// @brief The four pulsars shown by default.
        [[nodiscard]] static std::vector<PulsarConfig> builtin_catalog();
    };

} // namespace chronoring::astro
