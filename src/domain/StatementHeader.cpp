/**
 * @file StatementHeader.cpp
 * @brief Implementation of StatementHeader.
 */

#include "domain/StatementHeader.hpp"
#include "domain/StatementText.hpp"
#include <ctime>
#include <map>
#include <regex>

namespace ledgerwalker::domain {

namespace {

int CurrentYear() {
    std::time_t now = std::time(nullptr);
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &now);
#else
    localtime_r(&now, &tm);
#endif
    return tm.tm_year + 1900;
}

int ExpandYear(int year) {
    if (year >= 100) return year;
    return year >= 70 ? 1900 + year : 2000 + year;
}

std::optional<CalendarDate> ParseNumericDate(int a, int b, int c, bool yearFirst) {
    if (yearFirst) return CalendarDate::Make(ExpandYear(a), b, c);
    // Day first is the norm for Mexican banks, month first only when day-first is impossible.
    auto dayFirst = CalendarDate::Make(ExpandYear(c), b, a);
    if (dayFirst) return dayFirst;
    return CalendarDate::Make(ExpandYear(c), a, b);
}

std::optional<double> FindBalance(const std::string& text, const std::regex& pattern) {
    std::smatch m;
    if (std::regex_search(text, m, pattern)) {
        return text::ParseAmount(m[m.size() - 1].str());
    }
    return std::nullopt;
}

} // namespace

StatementHeader StatementHeader::Scan(const std::string& text) {
    StatementHeader header;
    const std::string upper = text::ToUpper(text);
    const std::string& months = text::MonthAlternation();

    static const std::regex kNumericPeriod(
        R"(\b(?:DEL?|FROM)\s+(\d{1,2}[/-]\d{1,2}[/-]\d{2,4})\s+(?:AL?|TO)\s+(\d{1,2}[/-]\d{1,2}[/-]\d{2,4}))");
    static const std::regex kNamedPeriod(
        "DEL?\\s+(\\d{1,2})\\s+(?:DE\\s+)?(" + months + ")\\.?\\s+(?:DE\\s+|DEL\\s+)?(\\d{4})\\s+AL?\\s+(\\d{1,2})\\s+(?:DE\\s+)?(" +
        months + ")\\.?\\s+(?:DE\\s+|DEL\\s+)?(\\d{4})");

    std::smatch m;
    if (std::regex_search(upper, m, kNumericPeriod)) {
        StatementHeader probe;
        probe.yearHint = CurrentYear();
        header.periodStart = probe.parseDate(m[1].str());
        header.periodEnd = probe.parseDate(m[2].str());
    } else if (std::regex_search(upper, m, kNamedPeriod)) {
        auto startMonth = text::MonthFromToken(m[2].str());
        auto endMonth = text::MonthFromToken(m[5].str());
        if (startMonth && endMonth) {
            header.periodStart = CalendarDate::Make(std::stoi(m[3].str()), *startMonth, std::stoi(m[1].str()));
            header.periodEnd = CalendarDate::Make(std::stoi(m[6].str()), *endMonth, std::stoi(m[4].str()));
        }
    }
    if (header.periodStart && header.periodEnd && *header.periodEnd < *header.periodStart) {
        std::swap(header.periodStart, header.periodEnd);
    }

    static const std::regex kOpening(
        R"((?:SALDO\s+(?:ANTERIOR|INICIAL)|BALANCE\s+(?:INICIAL|ANTERIOR))[:\s]+\$?\s*(-?[\d,]+\.\d{2}))");
    static const std::regex kClosing(
        R"((?:SALDO\s+(?:FINAL|ACTUAL)|BALANCE\s+FINAL)(?:\s+DEL\s+PERIODO)?[:\s]+\$?\s*(-?[\d,]+\.\d{2}))");
    header.openingBalance = FindBalance(upper, kOpening);
    header.closingBalance = FindBalance(upper, kClosing);

    if (header.periodEnd) {
        header.yearHint = header.periodEnd->year;
    } else if (header.periodStart) {
        header.yearHint = header.periodStart->year;
    } else {
        static const std::regex kYear(R"((^|[^\d])((?:19|20)\d{2})([^\d]|$))");
        std::map<int, int> counts;
        for (auto it = std::sregex_iterator(upper.begin(), upper.end(), kYear); it != std::sregex_iterator(); ++it) {
            counts[std::stoi((*it)[2].str())]++;
        }
        int best = 0;
        int bestCount = 0;
        for (const auto& [year, count] : counts) {
            if (count > bestCount || (count == bestCount && year > best)) {
                best = year;
                bestCount = count;
            }
        }
        header.yearHint = best ? best : CurrentYear();
    }
    return header;
}

std::optional<CalendarDate> StatementHeader::resolveMonthDay(int month, int day) const {
    int year = yearHint;
    if (periodStart && periodEnd && periodStart->year != periodEnd->year && month > periodEnd->month) {
        year = periodStart->year;
    }
    return CalendarDate::Make(year, month, day);
}

std::optional<CalendarDate> StatementHeader::parseDate(const std::string& token) const {
    const std::string upper = text::ToUpper(text::Trim(token));
    const std::string& months = text::MonthAlternation();

    static const std::regex kIso(R"(^(\d{4})[/-](\d{1,2})[/-](\d{1,2})$)");
    static const std::regex kNumeric(R"(^(\d{1,2})[/-](\d{1,2})[/-](\d{2}|\d{4})$)");
    static const std::regex kDayMonthYear("^(\\d{1,2})[\\s/-]*(" + months + ")\\.?[\\s/-]*(\\d{2}|\\d{4})$");
    static const std::regex kDayMonth("^(\\d{1,2})[\\s/-]*(" + months + ")\\.?$");
    static const std::regex kMonthDay("^(" + months + ")\\.?[\\s/-]*(\\d{1,2})(?:[\\s,/-]+(\\d{4}))?$");

    std::smatch m;
    if (std::regex_match(upper, m, kIso)) {
        return ParseNumericDate(std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str()), true);
    }
    if (std::regex_match(upper, m, kNumeric)) {
        return ParseNumericDate(std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str()), false);
    }
    if (std::regex_match(upper, m, kDayMonthYear)) {
        auto month = text::MonthFromToken(m[2].str());
        if (!month) return std::nullopt;
        return CalendarDate::Make(ExpandYear(std::stoi(m[3].str())), *month, std::stoi(m[1].str()));
    }
    if (std::regex_match(upper, m, kDayMonth)) {
        auto month = text::MonthFromToken(m[2].str());
        if (!month) return std::nullopt;
        return resolveMonthDay(*month, std::stoi(m[1].str()));
    }
    if (std::regex_match(upper, m, kMonthDay)) {
        auto month = text::MonthFromToken(m[1].str());
        if (!month) return std::nullopt;
        if (m[3].matched) return CalendarDate::Make(std::stoi(m[3].str()), *month, std::stoi(m[2].str()));
        return resolveMonthDay(*month, std::stoi(m[2].str()));
    }
    return std::nullopt;
}

} // namespace ledgerwalker::domain
