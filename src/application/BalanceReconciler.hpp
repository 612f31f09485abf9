/**
 * @file BalanceReconciler.hpp
 * @brief Opening/closing balances, totals and the balance consistency check.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/StatementSummary.hpp"
#include "domain/Transaction.hpp"

namespace ledgerwalker::application {

/**
 * @struct BalanceHints
 * @brief Statement-level values used when the rows carry no running balance.
 */
struct BalanceHints {
    std::optional<double> openingBalance;
    std::optional<double> closingBalance;
    std::optional<domain::CalendarDate> periodStart;
    std::optional<domain::CalendarDate> periodEnd;
    std::string detectedBank;
};

/**
 * @class BalanceReconciler
 * @brief Builds the StatementSummary. A mismatch is flagged, never thrown.
 */
class BalanceReconciler {
public:
    explicit BalanceReconciler(double tolerance = 0.5) : m_tolerance(tolerance) {}

    domain::StatementSummary reconcile(const std::vector<domain::Transaction>& transactions,
                                       const BalanceHints& hints) const;

private:
    double m_tolerance;
};

} // namespace ledgerwalker::application
