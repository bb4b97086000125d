/// @file hebrew_calendar.cpp
/// @brief Implementation of the arithmetic Hebrew calendar.
///
/// Follows the day-number formulation of Dershowitz & Reingold,
/// "Calendrical Calculations", ch. 8.

#include "calendar/hebrew_calendar.hpp"

#include <array>
#include <chrono>

namespace chronoring::calendar
{

namespace
{

// R.D. of 1970-01-01
constexpr i64 kUnixEpochRataDie = 719163;

// Parts per day (1 hour = 1080 parts)
constexpr i64 kPartsPerDay = 25920;

// Mean year length 35975351 / 98496 days, for the year estimate
constexpr f64 kMeanYearDays = 35975351.0 / 98496.0;

constexpr std::array<std::string_view, 13> kMonthNames{
    "Nisan", "Iyyar", "Sivan", "Tammuz", "Av", "Elul",
    "Tishri", "Marheshvan", "Kislev", "Tevet", "Shevat", "Adar", "Adar II",
};

i64 floor_div(i64 a, i64 b)
{
    const i64 q = a / b;
    return (a % b != 0 && (a < 0) != (b < 0)) ? q - 1 : q;
}

i64 floor_mod(i64 a, i64 b)
{
    return a - b * floor_div(a, b);
}

bool long_marheshvan(i32 year_length)
{
    return year_length == 355 || year_length == 385;
}

bool short_kislev(i32 year_length)
{
    return year_length == 353 || year_length == 383;
}

i32 month_length(HebrewMonth month, i32 year_length, bool leap)
{
    switch (month)
    {
        case HebrewMonth::Iyyar:
        case HebrewMonth::Tammuz:
        case HebrewMonth::Elul:
        case HebrewMonth::Tevet:
        case HebrewMonth::AdarII:
            return 29;
        case HebrewMonth::Adar:
            return leap ? 30 : 29;
        case HebrewMonth::Marheshvan:
            return long_marheshvan(year_length) ? 30 : 29;
        case HebrewMonth::Kislev:
            return short_kislev(year_length) ? 29 : 30;
        default:
            return 30;
    }
}

HebrewMonth next_month(HebrewMonth month)
{
    return static_cast<HebrewMonth>(static_cast<u8>(month) + 1);
}

} // anonymous namespace

// -----------------------------------------------------------------
// Leap cycle and year lengths
// -----------------------------------------------------------------

bool HebrewCalendarConverter::is_leap_year(i32 year)
{
    return floor_mod(7 * static_cast<i64>(year) + 1, 19) < 7;
}

HebrewMonth HebrewCalendarConverter::last_month_of_year(i32 year)
{
    return is_leap_year(year) ? HebrewMonth::AdarII : HebrewMonth::Adar;
}

// -----------------------------------------------------------------
// Molad of Tishri
//
// months elapsed = ⌊(235y − 234) / 19⌋
// parts elapsed  = 12084 + 13753 × months
// days           = 29 × months + ⌊parts / 25920⌋
//
// A further day is added when the result would put Rosh Hashanah on
// Sunday, Wednesday or Friday.
// -----------------------------------------------------------------

i64 HebrewCalendarConverter::elapsed_days(i32 year)
{
    const i64 months = floor_div(235 * static_cast<i64>(year) - 234, 19);
    const i64 parts = 12084 + 13753 * months;
    const i64 days = 29 * months + floor_div(parts, kPartsPerDay);

    return floor_mod(3 * (days + 1), 7) < 3 ? days + 1 : days;
}

i32 HebrewCalendarConverter::year_length_correction(i32 year)
{
    const i64 ny0 = elapsed_days(year - 1);
    const i64 ny1 = elapsed_days(year);
    const i64 ny2 = elapsed_days(year + 1);

    if (ny2 - ny1 == 356)
    {
        return 2;
    }
    if (ny1 - ny0 == 382)
    {
        return 1;
    }
    return 0;
}

i64 HebrewCalendarConverter::new_year(i32 year)
{
    return kEpochRataDie + elapsed_days(year) + year_length_correction(year);
}

i32 HebrewCalendarConverter::days_in_year(i32 year)
{
    return static_cast<i32>(new_year(year + 1) - new_year(year));
}

i32 HebrewCalendarConverter::days_in_month(i32 year, HebrewMonth month)
{
    return month_length(month, days_in_year(year), is_leap_year(year));
}

YearType HebrewCalendarConverter::year_type(i32 year)
{
    const i32 length = days_in_year(year);
    if (short_kislev(length))
    {
        return YearType::Deficient;
    }
    return long_marheshvan(length) ? YearType::Complete : YearType::Regular;
}

// -----------------------------------------------------------------
// Hebrew date → R.D.
//
// Count from Tishri 1. Months before Tishri (Nisan..Elul) come after
// the Adars of the same year.
// -----------------------------------------------------------------

i64 HebrewCalendarConverter::to_rata_die(i32 year, HebrewMonth month, i32 day)
{
    const i32 length = days_in_year(year);
    const bool leap = is_leap_year(year);
    const HebrewMonth last = last_month_of_year(year);

    i64 rd = new_year(year) + day - 1;

    if (month < HebrewMonth::Tishri)
    {
        for (HebrewMonth m = HebrewMonth::Tishri; m <= last; m = next_month(m))
        {
            rd += month_length(m, length, leap);
        }
        for (HebrewMonth m = HebrewMonth::Nisan; m < month; m = next_month(m))
        {
            rd += month_length(m, length, leap);
        }
    }
    else
    {
        for (HebrewMonth m = HebrewMonth::Tishri; m < month; m = next_month(m))
        {
            rd += month_length(m, length, leap);
        }
    }

    return rd;
}

// -----------------------------------------------------------------
// R.D. → Hebrew date
// -----------------------------------------------------------------

HebrewConversion HebrewCalendarConverter::from_rata_die(i64 rata_die)
{
    if (rata_die < kEpochRataDie)
    {
        return CalendarDomainError::BeforeEpoch;
    }

    // The estimate never overshoots; walk forward to the containing year
    const auto approx = static_cast<i32>(
        static_cast<f64>(rata_die - kEpochRataDie) / kMeanYearDays) + 1;
    i32 year = approx > 1 ? approx - 1 : 1;
    while (new_year(year + 1) <= rata_die)
    {
        ++year;
    }

    const i32 length = days_in_year(year);
    const bool leap = is_leap_year(year);

    HebrewMonth month = rata_die < to_rata_die(year, HebrewMonth::Nisan, 1)
                      ? HebrewMonth::Tishri
                      : HebrewMonth::Nisan;
    while (rata_die > to_rata_die(year, month, month_length(month, length, leap)))
    {
        month = next_month(month);
    }

    const auto day = static_cast<i32>(rata_die - to_rata_die(year, month, 1)) + 1;

    return HebrewDate{
        .year          = year,
        .month         = month,
        .day           = day,
        .leap_year     = leap,
        .day_of_year   = static_cast<i32>(rata_die - new_year(year)) + 1,
        .days_in_year  = length,
        .days_in_month = month_length(month, length, leap),
    };
}

i64 HebrewCalendarConverter::rata_die(Instant instant, std::chrono::seconds utc_offset)
{
    using namespace std::chrono;

    const sys_days civil_day = floor<days>(instant + utc_offset);
    return kUnixEpochRataDie + civil_day.time_since_epoch().count();
}

HebrewConversion HebrewCalendarConverter::convert(Instant instant, std::chrono::seconds utc_offset)
{
    return from_rata_die(rata_die(instant, utc_offset));
}

// -----------------------------------------------------------------
// Names, festivals, ring position
// -----------------------------------------------------------------

std::string_view HebrewCalendarConverter::month_name(HebrewMonth month, bool leap_year)
{
    if (month == HebrewMonth::Adar && leap_year)
    {
        return "Adar I";
    }
    return kMonthNames[static_cast<std::size_t>(month) - 1];
}

std::optional<std::string_view> HebrewCalendarConverter::holiday(const HebrewDate& date)
{
    const HebrewMonth purim_month = date.leap_year ? HebrewMonth::AdarII : HebrewMonth::Adar;

    switch (date.month)
    {
        case HebrewMonth::Nisan:
            if (date.day == 15) return "Pesach";
            break;
        case HebrewMonth::Sivan:
            if (date.day == 6) return "Shavuot";
            break;
        case HebrewMonth::Tishri:
            if (date.day == 1) return "Rosh Hashanah";
            if (date.day == 10) return "Yom Kippur";
            if (date.day == 15) return "Sukkot";
            break;
        case HebrewMonth::Kislev:
            if (date.day == 25) return "Hanukkah";
            break;
        default:
            break;
    }

    if (date.month == purim_month && date.day == 14)
    {
        return "Purim";
    }
    return std::nullopt;
}

f64 HebrewCalendarConverter::year_progress(const HebrewDate& date)
{
    return static_cast<f64>(date.day_of_year - 1) / static_cast<f64>(date.days_in_year);
}

} // namespace chronoring::calendar
