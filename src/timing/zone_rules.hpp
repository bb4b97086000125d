#pragma once

/// @file zone_rules.hpp
/// @brief Offset rules of an IANA zone, read from a compiled TZif file (RFC 8536).

#include "core/types.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chronoring::timing
{
    /// @brief One local time type: offset, DST flag and abbreviation.
    struct LocalTimeType
    {
        std::chrono::seconds utc_offset{0};
        bool is_dst = false;
        std::string abbreviation;
    };

    /// @brief A POSIX TZ rule string such as "CET-1CEST,M3.5.0,M10.5.0/3".
    ///
    /// TZif files carry one of these as a footer; it describes every instant
    /// after the last explicit transition.
    class PosixTzRule
    {
    public:
        /// @return The rule, or std::nullopt if the string is malformed or empty.
        [[nodiscard]] static std::optional<PosixTzRule> parse(std::string_view text);

        [[nodiscard]] LocalTimeType lookup(i64 unix_seconds) const;

        [[nodiscard]] bool has_dst() const { return m_dst.has_value(); }

    private:
        /// Day of a transition: Jn (1..365, no Feb 29), n (0..365) or Mm.w.d.
        struct TransitionDate
        {
            enum class Kind : u8 { Julian, ZeroBased, MonthWeekDay };

            Kind kind = Kind::MonthWeekDay;
            i32 day = 0;    ///< Jn / n value, or weekday 0 = Sunday for Mm.w.d
            i32 month = 0;  ///< 1..12 for Mm.w.d
            i32 week = 0;   ///< 1..5 for Mm.w.d, 5 = last
            i64 time = 7200;  ///< Local seconds after midnight, may be negative or > 24 h
        };

        struct DstPart
        {
            LocalTimeType type;
            TransitionDate start;
            TransitionDate end;
        };

        [[nodiscard]] static i64 transition_utc(i32 year, const TransitionDate& date, std::chrono::seconds offset);

        LocalTimeType m_std;
        std::optional<DstPart> m_dst;
    };

    /// @brief Transition table of one zone. Immutable once loaded.
    class ZoneRules
    {
    public:
        /// @brief Read a TZif file.
        /// @return The rules, or std::nullopt if the file is missing or not valid TZif.
        [[nodiscard]] static std::optional<ZoneRules> load(const std::filesystem::path& path);

        /// @brief Decode TZif bytes (versions 1 to 4).
        [[nodiscard]] static std::optional<ZoneRules> parse(std::span<const u8> data);

        /// @brief Local time type in effect at a Unix time.
        [[nodiscard]] LocalTimeType lookup(i64 unix_seconds) const;

        [[nodiscard]] std::size_t transition_count() const { return m_transitions.size(); }

    private:
        std::vector<i64> m_transitions;       ///< Unix seconds, ascending
        std::vector<u8> m_transition_types;   ///< Index into m_types per transition
        std::vector<LocalTimeType> m_types;
        std::optional<PosixTzRule> m_footer;
    };

} // namespace chronoring::timing
