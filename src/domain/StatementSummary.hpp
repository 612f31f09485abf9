/**
 * @file StatementSummary.hpp
 * @brief Aggregates and balance check for one parsed statement.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/CalendarDate.hpp"

namespace ledgerwalker::domain {

/**
 * @enum ReconciliationStatus
 * @brief Outcome of opening + credits - debits == closing.
 */
enum class ReconciliationStatus {
    Ok,
    Mismatch,
    Unverified   ///< Opening or closing balance unknown.
};

inline std::string ToString(ReconciliationStatus s) {
    switch (s) {
        case ReconciliationStatus::Ok: return "OK";
        case ReconciliationStatus::Mismatch: return "MISMATCH";
        case ReconciliationStatus::Unverified: return "UNVERIFIED";
    }
    return "UNVERIFIED";
}

struct StatementSummary {
    std::optional<double> openingBalance;
    std::optional<double> closingBalance;
    double totalCredits = 0.0;
    double totalDebits = 0.0;
    double totalIncomes = 0.0;
    double totalExpenses = 0.0;
    double totalTransfers = 0.0;
    int transactionCount = 0;
    std::optional<CalendarDate> periodStart;
    std::optional<CalendarDate> periodEnd;
    ReconciliationStatus reconciliationStatus = ReconciliationStatus::Unverified;
    std::optional<double> reconciliationDifference;  ///< (opening + credits - debits) - closing.
    std::string detectedBank;
};

} // namespace ledgerwalker::domain
