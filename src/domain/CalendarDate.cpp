/**
 * @file CalendarDate.cpp
 * @brief Implementation of CalendarDate.
 */

#include "domain/CalendarDate.hpp"
#include <cstdio>
#include <regex>

namespace ledgerwalker::domain {

namespace {
    bool IsLeap(int y) {
        return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
    }
}

int DaysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && IsLeap(year)) return 29;
    return kDays[month - 1];
}

std::optional<CalendarDate> CalendarDate::Make(int year, int month, int day) {
    if (year < 1900 || year > 2200) return std::nullopt;
    if (day < 1 || day > DaysInMonth(year, month)) return std::nullopt;
    return CalendarDate{year, month, day};
}

std::optional<CalendarDate> CalendarDate::FromIso(const std::string& iso) {
    static const std::regex kIso(R"(^\s*(\d{4})-(\d{1,2})-(\d{1,2}))");
    std::smatch m;
    if (!std::regex_search(iso, m, kIso)) return std::nullopt;
    return Make(std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str()));
}

// Howard Hinnant's days_from_civil / civil_from_days.
long CalendarDate::toDays() const {
    const int y = month <= 2 ? year - 1 : year;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned mp = static_cast<unsigned>(month > 2 ? month - 3 : month + 9);
    const unsigned doy = (153 * mp + 2) / 5 + static_cast<unsigned>(day) - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

CalendarDate CalendarDate::FromDays(long days) {
    days += 719468;
    const long era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long y = static_cast<long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    CalendarDate out;
    out.year = static_cast<int>(m <= 2 ? y + 1 : y);
    out.month = static_cast<int>(m);
    out.day = static_cast<int>(d);
    return out;
}

std::string CalendarDate::toIso() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

} // namespace ledgerwalker::domain
