/// @file zone_rules.cpp
/// @brief TZif decoding and POSIX TZ rule evaluation.

#include "timing/zone_rules.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <iterator>

namespace chronoring::timing
{

namespace
{

constexpr std::size_t kHeaderSize = 44;
constexpr i64 kSecondsPerDay = 86400;

/// @brief Forward-only view over a POSIX TZ string.
struct Cursor
{
    std::string_view rest;

    [[nodiscard]] bool empty() const { return rest.empty(); }
    [[nodiscard]] char peek() const { return rest.empty() ? '\0' : rest.front(); }

    bool consume(char c)
    {
        if (peek() != c)
        {
            return false;
        }
        rest.remove_prefix(1);
        return true;
    }

    std::optional<i32> number()
    {
        i32 value = 0;
        auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), value);
        if (ec != std::errc{} || ptr == rest.data())
        {
            return std::nullopt;
        }
        rest.remove_prefix(static_cast<std::size_t>(ptr - rest.data()));
        return value;
    }
};

bool is_alpha(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/// @brief Zone abbreviation: three or more letters, or any "<...>" quoted form.
std::optional<std::string> parse_name(Cursor& cur)
{
    if (cur.consume('<'))
    {
        const auto close = cur.rest.find('>');
        if (close == std::string_view::npos || close == 0)
        {
            return std::nullopt;
        }
        std::string name(cur.rest.substr(0, close));
        cur.rest.remove_prefix(close + 1);
        return name;
    }

    std::size_t length = 0;
    while (length < cur.rest.size() && is_alpha(cur.rest[length]))
    {
        ++length;
    }
    if (length < 3)
    {
        return std::nullopt;
    }
    std::string name(cur.rest.substr(0, length));
    cur.rest.remove_prefix(length);
    return name;
}

/// @brief [+-]hh[:mm[:ss]] in seconds.
std::optional<i64> parse_hms(Cursor& cur, i32 max_hours)
{
    i64 sign = 1;
    if (cur.consume('-'))
    {
        sign = -1;
    }
    else
    {
        cur.consume('+');
    }

    const auto hours = cur.number();
    if (!hours || *hours < 0 || *hours > max_hours)
    {
        return std::nullopt;
    }
    i64 total = static_cast<i64>(*hours) * 3600;

    for (const i64 scale : {60, 1})
    {
        if (!cur.consume(':'))
        {
            break;
        }
        const auto part = cur.number();
        if (!part || *part < 0 || *part > 59)
        {
            return std::nullopt;
        }
        total += *part * scale;
    }

    return sign * total;
}

bool is_leap(i32 year)
{
    return std::chrono::year{year}.is_leap();
}

u32 read_be32(std::span<const u8> bytes, std::size_t offset)
{
    return (static_cast<u32>(bytes[offset]) << 24) | (static_cast<u32>(bytes[offset + 1]) << 16) |
           (static_cast<u32>(bytes[offset + 2]) << 8) | static_cast<u32>(bytes[offset + 3]);
}

i64 read_be64(std::span<const u8> bytes, std::size_t offset)
{
    u64 value = 0;
    for (std::size_t i = 0; i < 8; ++i)
    {
        value = (value << 8) | bytes[offset + i];
    }
    return static_cast<i64>(value);
}

/// @brief The six counts of a TZif header.
struct TzifCounts
{
    u32 isutcnt = 0;
    u32 isstdcnt = 0;
    u32 leapcnt = 0;
    u32 timecnt = 0;
    u32 typecnt = 0;
    u32 charcnt = 0;

    /// Size of the data block that follows the header.
    [[nodiscard]] u64 block_size(u64 time_size) const
    {
        return static_cast<u64>(timecnt) * time_size + timecnt + static_cast<u64>(typecnt) * 6 + charcnt +
               static_cast<u64>(leapcnt) * (time_size + 4) + isstdcnt + isutcnt;
    }
};

std::optional<TzifCounts> read_header(std::span<const u8> data, std::size_t offset)
{
    if (data.size() < offset + kHeaderSize)
    {
        return std::nullopt;
    }
    if (data[offset] != 'T' || data[offset + 1] != 'Z' || data[offset + 2] != 'i' || data[offset + 3] != 'f')
    {
        return std::nullopt;
    }

    TzifCounts counts{
        .isutcnt  = read_be32(data, offset + 20),
        .isstdcnt = read_be32(data, offset + 24),
        .leapcnt  = read_be32(data, offset + 28),
        .timecnt  = read_be32(data, offset + 32),
        .typecnt  = read_be32(data, offset + 36),
        .charcnt  = read_be32(data, offset + 40),
    };

    if (counts.typecnt == 0 || counts.typecnt > 256 || counts.charcnt == 0 ||
        (counts.isutcnt != 0 && counts.isutcnt != counts.typecnt) ||
        (counts.isstdcnt != 0 && counts.isstdcnt != counts.typecnt))
    {
        return std::nullopt;
    }
    return counts;
}

} // anonymous namespace

// -----------------------------------------------------------------
// POSIX TZ rule
//
// std offset [dst [offset] [,start[/time],end[/time]]]
//
// Offsets count hours west of Greenwich, so "CET-1" is UTC+1. The
// start time is in standard local time, the end time in daylight time.
// -----------------------------------------------------------------

std::optional<PosixTzRule> PosixTzRule::parse(std::string_view text)
{
    Cursor cur{text};
    PosixTzRule rule;

    auto std_name = parse_name(cur);
    if (!std_name)
    {
        return std::nullopt;
    }
    const auto std_offset = parse_hms(cur, 24);
    if (!std_offset)
    {
        return std::nullopt;
    }
    rule.m_std = LocalTimeType{std::chrono::seconds{-*std_offset}, false, std::move(*std_name)};

    if (cur.empty())
    {
        return rule;
    }

    auto dst_name = parse_name(cur);
    if (!dst_name)
    {
        return std::nullopt;
    }

    DstPart dst;
    dst.type = LocalTimeType{rule.m_std.utc_offset + std::chrono::hours{1}, true, std::move(*dst_name)};

    const char next = cur.peek();
    if (next == '+' || next == '-' || (next >= '0' && next <= '9'))
    {
        const auto dst_offset = parse_hms(cur, 24);
        if (!dst_offset)
        {
            return std::nullopt;
        }
        dst.type.utc_offset = std::chrono::seconds{-*dst_offset};
    }

    const auto parse_date = [&cur](TransitionDate& date) -> bool {
        if (cur.consume('M'))
        {
            const auto month = cur.number();
            if (!month || !cur.consume('.'))
            {
                return false;
            }
            const auto week = cur.number();
            if (!week || !cur.consume('.'))
            {
                return false;
            }
            const auto weekday = cur.number();
            if (!weekday || *month < 1 || *month > 12 || *week < 1 || *week > 5 || *weekday < 0 || *weekday > 6)
            {
                return false;
            }
            date = TransitionDate{.kind = TransitionDate::Kind::MonthWeekDay, .day = *weekday,
                                  .month = *month, .week = *week};
        }
        else if (cur.consume('J'))
        {
            const auto day = cur.number();
            if (!day || *day < 1 || *day > 365)
            {
                return false;
            }
            date = TransitionDate{.kind = TransitionDate::Kind::Julian, .day = *day};
        }
        else
        {
            const auto day = cur.number();
            if (!day || *day < 0 || *day > 365)
            {
                return false;
            }
            date = TransitionDate{.kind = TransitionDate::Kind::ZeroBased, .day = *day};
        }

        if (cur.consume('/'))
        {
            const auto time = parse_hms(cur, 167);
            if (!time)
            {
                return false;
            }
            date.time = *time;
        }
        return true;
    };

    if (cur.empty())
    {
        // No rule given: the POSIX default (US rules since 2007)
        dst.start = TransitionDate{.month = 3, .week = 2};
        dst.end = TransitionDate{.month = 11, .week = 1};
    }
    else if (!cur.consume(',') || !parse_date(dst.start) || !cur.consume(',') || !parse_date(dst.end) ||
             !cur.empty())
    {
        return std::nullopt;
    }

    rule.m_dst = std::move(dst);
    return rule;
}

i64 PosixTzRule::transition_utc(i32 year, const TransitionDate& date, std::chrono::seconds offset)
{
    using namespace std::chrono;

    const sys_days jan1{std::chrono::year{year} / January / 1};
    sys_days day = jan1;

    switch (date.kind)
    {
        case TransitionDate::Kind::Julian:
        {
            // Feb 29 is never counted
            i32 day_of_year = date.day - 1;
            if (is_leap(year) && date.day >= 60)
            {
                ++day_of_year;
            }
            day = jan1 + days{day_of_year};
            break;
        }
        case TransitionDate::Kind::ZeroBased:
            day = jan1 + days{date.day};
            break;
        case TransitionDate::Kind::MonthWeekDay:
        {
            const std::chrono::month m{static_cast<unsigned>(date.month)};
            const sys_days first{std::chrono::year{year} / m / 1};
            const i32 first_weekday = static_cast<i32>(weekday{first}.c_encoding());
            day = first + days{(date.day - first_weekday + 7) % 7 + (date.week - 1) * 7};
            // Week 5 means the last such weekday of the month
            while (year_month_day{day}.month() != m)
            {
                day -= days{7};
            }
            break;
        }
    }

    return day.time_since_epoch().count() * kSecondsPerDay + date.time - offset.count();
}

LocalTimeType PosixTzRule::lookup(i64 unix_seconds) const
{
    using namespace std::chrono;

    if (!m_dst)
    {
        return m_std;
    }

    const sys_seconds local_std{seconds{unix_seconds + m_std.utc_offset.count()}};
    const i32 year = static_cast<i32>(year_month_day{floor<days>(local_std)}.year());

    const i64 start = transition_utc(year, m_dst->start, m_std.utc_offset);
    const i64 end = transition_utc(year, m_dst->end, m_dst->type.utc_offset);

    // Southern-hemisphere rules have the DST period wrapping the new year
    const bool in_dst = start < end ? (unix_seconds >= start && unix_seconds < end)
                                    : !(unix_seconds >= end && unix_seconds < start);
    return in_dst ? m_dst->type : m_std;
}

// -----------------------------------------------------------------
// TZif
//
// Version 1 data uses 32-bit times. Version 2+ files repeat the header
// and data with 64-bit times, followed by "\n<POSIX TZ>\n".
// -----------------------------------------------------------------

std::optional<ZoneRules> ZoneRules::parse(std::span<const u8> data)
{
    auto counts = read_header(data, 0);
    if (!counts)
    {
        return std::nullopt;
    }

    const u8 version = data[4];
    std::size_t offset = kHeaderSize;
    u64 time_size = 4;

    if (version >= '2')
    {
        const u64 skip = counts->block_size(4);
        if (data.size() < offset + skip)
        {
            return std::nullopt;
        }
        offset += static_cast<std::size_t>(skip);

        counts = read_header(data, offset);
        if (!counts)
        {
            return std::nullopt;
        }
        offset += kHeaderSize;
        time_size = 8;
    }

    if (data.size() < offset + counts->block_size(time_size))
    {
        return std::nullopt;
    }

    ZoneRules rules;
    rules.m_transitions.reserve(counts->timecnt);
    for (u32 i = 0; i < counts->timecnt; ++i)
    {
        const i64 at = time_size == 8 ? read_be64(data, offset)
                                      : static_cast<i64>(static_cast<i32>(read_be32(data, offset)));
        if (!rules.m_transitions.empty() && at <= rules.m_transitions.back())
        {
            return std::nullopt;
        }
        rules.m_transitions.push_back(at);
        offset += static_cast<std::size_t>(time_size);
    }

    rules.m_transition_types.assign(data.begin() + static_cast<std::ptrdiff_t>(offset),
                                    data.begin() + static_cast<std::ptrdiff_t>(offset + counts->timecnt));
    offset += counts->timecnt;
    for (const u8 type : rules.m_transition_types)
    {
        if (type >= counts->typecnt)
        {
            return std::nullopt;
        }
    }

    const std::size_t info_offset = offset;
    const std::size_t chars_offset = info_offset + static_cast<std::size_t>(counts->typecnt) * 6;
    const std::string_view chars(reinterpret_cast<const char*>(data.data() + chars_offset), counts->charcnt);

    for (u32 i = 0; i < counts->typecnt; ++i)
    {
        const std::size_t at = info_offset + static_cast<std::size_t>(i) * 6;
        const auto utoff = static_cast<i32>(read_be32(data, at));
        const u8 isdst = data[at + 4];
        const u8 desigidx = data[at + 5];
        if (desigidx >= counts->charcnt || isdst > 1)
        {
            return std::nullopt;
        }

        const std::string_view tail = chars.substr(desigidx);
        rules.m_types.push_back(LocalTimeType{
            std::chrono::seconds{utoff},
            isdst == 1,
            std::string(tail.substr(0, tail.find('\0'))),
        });
    }

    offset += static_cast<std::size_t>(counts->block_size(time_size) - static_cast<u64>(counts->timecnt) * time_size -
                                       counts->timecnt);

    if (version >= '2' && offset < data.size())
    {
        if (data[offset] != '\n')
        {
            return std::nullopt;
        }
        const std::string_view rest(reinterpret_cast<const char*>(data.data() + offset + 1), data.size() - offset - 1);
        const auto newline = rest.find('\n');
        if (newline == std::string_view::npos)
        {
            return std::nullopt;
        }

        const std::string_view footer = rest.substr(0, newline);
        if (!footer.empty())
        {
            rules.m_footer = PosixTzRule::parse(footer);
            if (!rules.m_footer)
            {
                CHR_CORE_WARN("TZif footer '{}' not understood; using the transition table only", footer);
            }
        }
    }

    return rules;
}

std::optional<ZoneRules> ZoneRules::load(const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        return std::nullopt;
    }

    const std::vector<u8> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto rules = parse(bytes);
    if (!rules)
    {
        CHR_CORE_WARN("'{}' is not a valid TZif file", path.string());
    }
    return rules;
}

LocalTimeType ZoneRules::lookup(i64 unix_seconds) const
{
    if (m_transitions.empty() || unix_seconds >= m_transitions.back())
    {
        if (m_footer)
        {
            return m_footer->lookup(unix_seconds);
        }
        if (m_transitions.empty())
        {
            return m_types.front();
        }
    }

    if (unix_seconds < m_transitions.front())
    {
        return m_types.front();
    }

    const auto it = std::upper_bound(m_transitions.begin(), m_transitions.end(), unix_seconds);
    const auto index = static_cast<std::size_t>(std::distance(m_transitions.begin(), it)) - 1;
    return m_types[m_transition_types[index]];
}

} // namespace chronoring::timing
