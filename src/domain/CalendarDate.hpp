/**
 * @file CalendarDate.hpp
 * @brief Plain calendar date used for statement rows and invoice windows.
 */

#pragma once
#include <string>
#include <optional>

namespace ledgerwalker::domain {

/**
 * @struct CalendarDate
 * @brief Proleptic Gregorian date without time zone.
 */
struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    /** @brief Builds a date only when the fields form a real calendar day. */
    static std::optional<CalendarDate> Make(int year, int month, int day);

    /** @brief Parses "YYYY-MM-DD". */
    static std::optional<CalendarDate> FromIso(const std::string& iso);

    /** @brief Days since 1970-01-01 (negative before). */
    long toDays() const;
    static CalendarDate FromDays(long days);

    CalendarDate addDays(long delta) const { return FromDays(toDays() + delta); }

    std::string toIso() const;

    bool operator==(const CalendarDate& o) const { return year == o.year && month == o.month && day == o.day; }
    bool operator!=(const CalendarDate& o) const { return !(*this == o); }
    bool operator<(const CalendarDate& o) const { return toDays() < o.toDays(); }
    bool operator<=(const CalendarDate& o) const { return !(o < *this); }
    bool operator>(const CalendarDate& o) const { return o < *this; }
    bool operator>=(const CalendarDate& o) const { return !(*this < o); }
};

/** @brief Number of days in a month, 0 for an invalid month. */
int DaysInMonth(int year, int month);

} // namespace ledgerwalker::domain
