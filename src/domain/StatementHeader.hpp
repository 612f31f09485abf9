/**
 * @file StatementHeader.hpp
 * @brief Statement-level facts read from the document header and footer.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/CalendarDate.hpp"

namespace ledgerwalker::domain {

/**
 * @class StatementHeader
 * @brief Period, explicit balances and the year used to complete day/month dates.
 *
 * Rows in Mexican statements usually carry "MAR. 11" without a year; the year
 * comes from the statement period, and a December/January period rolls over.
 */
class StatementHeader {
public:
    std::optional<CalendarDate> periodStart;
    std::optional<CalendarDate> periodEnd;
    std::optional<double> openingBalance;   ///< "SALDO ANTERIOR", "SALDO INICIAL", "BALANCE INICIAL".
    std::optional<double> closingBalance;   ///< "SALDO FINAL", "SALDO ACTUAL".
    int yearHint = 1970;

    /** @brief Scans the whole text. Never throws; missing facts stay empty. */
    static StatementHeader Scan(const std::string& text);

    /** @brief Builds the date for a row that only carries month and day. */
    std::optional<CalendarDate> resolveMonthDay(int month, int day) const;

    /**
     * @brief Parses a date token in any supported layout:
     * "31/03/2024", "31-03-24", "2024-03-31", "31 MAR 2024", "31/MAR/2024", "MAR. 31", "31 MAR".
     */
    std::optional<CalendarDate> parseDate(const std::string& token) const;
};

} // namespace ledgerwalker::domain
