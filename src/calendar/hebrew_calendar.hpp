#pragma once

/// @file hebrew_calendar.hpp
/// @brief Gregorian ↔ Hebrew calendar conversion (arithmetic calendar, molad-based).

#include "core/error.hpp"
#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string_view>
#include <variant>

namespace chronoring::calendar
{
    /// @brief Hebrew months, numbered from Nisan as in the biblical count.
    ///
    /// The civil year starts at Tishri (7). In a leap year Adar (12) is Adar I
    /// and Adar II (13) follows it; common years have no month 13.
    enum class HebrewMonth : u8
    {
        Nisan = 1,
        Iyyar,
        Sivan,
        Tammuz,
        Av,
        Elul,
        Tishri,
        Marheshvan,
        Kislev,
        Tevet,
        Shevat,
        Adar,
        AdarII,
    };

    /// @brief A date in the Hebrew calendar (civil, midnight-based day).
    struct HebrewDate
    {
        i32 year;
        HebrewMonth month;
        i32 day;

        bool leap_year;     ///< Year has 13 months
        i32 day_of_year;    ///< 1-based, counted from Tishri 1
        i32 days_in_year;   ///< 353–355 or 383–385
        i32 days_in_month;  ///< 29 or 30

        friend bool operator==(const HebrewDate&, const HebrewDate&) = default;
    };

    /// @brief Year classification by length.
    enum class YearType : u8
    {
        Deficient,  ///< Marheshvan and Kislev both 29 days (353 / 383)
        Regular,    ///< Marheshvan 29, Kislev 30 (354 / 384)
        Complete,   ///< Marheshvan and Kislev both 30 days (355 / 385)
    };

    /// @brief Result of a conversion: a date, or the reason it has none.
    using HebrewConversion = std::variant<HebrewDate, CalendarDomainError>;

    /// @brief Arithmetic Hebrew calendar on Rata Die day numbers.
    ///
    /// Day numbers are R.D. (1 January 1 CE proleptic Gregorian = 1). The
    /// calendar epoch, Tishri 1 AM 1, is R.D. −1373427 (7 October 3761 BCE,
    /// proleptic Julian). Year starts follow the mean lunation of
    /// 29d 12h 793p (1 hour = 1080 parts) with the molad-zaken, GaTaRaD,
    /// BeTU'TaKPaT and lo-ADU rosh postponements.
    class HebrewCalendarConverter
    {
    public:
        HebrewCalendarConverter() = delete;

        /// R.D. of Tishri 1, AM 1.
        static constexpr i64 kEpochRataDie = -1373427;

        /// @brief Hebrew date of the civil day containing `instant`.
        /// @param utc_offset Offset of the observer's timezone; the day is taken
        ///        from local wall-clock time. Zero gives the UTC day.
        /// @return The date, or CalendarDomainError::BeforeEpoch.
        [[nodiscard]] static HebrewConversion convert(Instant instant,
                                                      std::chrono::seconds utc_offset = std::chrono::seconds{0});

        /// @brief Hebrew date of an R.D. day number.
        [[nodiscard]] static HebrewConversion from_rata_die(i64 rata_die);

        /// @brief R.D. day number of a Hebrew date. Year must be ≥ 1.
        [[nodiscard]] static i64 to_rata_die(i32 year, HebrewMonth month, i32 day);

        /// @brief R.D. day number of the civil day containing `instant` at `utc_offset`.
        [[nodiscard]] static i64 rata_die(Instant instant, std::chrono::seconds utc_offset = std::chrono::seconds{0});

        /// @brief 7 of every 19 years (cycle positions 3, 6, 8, 11, 14, 17, 19) are leap years.
        [[nodiscard]] static bool is_leap_year(i32 year);

        /// @brief Number of days in a Hebrew year.
        [[nodiscard]] static i32 days_in_year(i32 year);

        /// @brief Number of days in a month of the given year.
        [[nodiscard]] static i32 days_in_month(i32 year, HebrewMonth month);

        /// @brief Last month of the year in Nisan-based numbering (Adar or Adar II).
        [[nodiscard]] static HebrewMonth last_month_of_year(i32 year);

        [[nodiscard]] static YearType year_type(i32 year);

        /// @brief R.D. of Tishri 1 of the given year.
        [[nodiscard]] static i64 new_year(i32 year);

        /// @brief Month name; Adar is reported as "Adar I" in leap years.
        [[nodiscard]] static std::string_view month_name(HebrewMonth month, bool leap_year);

        /// @brief Major festival falling on this date, if any.
        [[nodiscard]] static std::optional<std::string_view> holiday(const HebrewDate& date);

        /// @brief Fraction of the Hebrew year elapsed at the start of the date, [0, 1).
        [[nodiscard]] static f64 year_progress(const HebrewDate& date);

    private:
        /// @brief Days from the epoch to the molad-based Tishri 1 before the two-year delay.
        [[nodiscard]] static i64 elapsed_days(i32 year);

        /// @brief 0, 1 or 2 extra days keeping year lengths within the six legal values.
        [[nodiscard]] static i32 year_length_correction(i32 year);
    };

} // namespace chronoring::calendar
