/**
 * @file MsiMatcher.hpp
 * @brief Links credit-card charges to invoices paid in monthly installments.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/Invoice.hpp"
#include "domain/Transaction.hpp"

namespace ledgerwalker::application {

/**
 * @struct MsiPolicy
 * @brief Tolerances and invoice window of the matcher.
 */
struct MsiPolicy {
    double matchTolerance = 0.02;
    double monthsTolerance = 0.03;
    int lookbackDays = 30;
    int lookaheadDays = 7;
};

/**
 * @struct InvoiceWindow
 * @brief Inclusive date range of invoices considered.
 */
struct InvoiceWindow {
    domain::CalendarDate start;
    domain::CalendarDate end;
};

/**
 * @class MsiMatcher
 * @brief Matches each debit against eligible invoices and enriches the matched rows.
 *
 * Invoices are indexed by total and by every installment amount total/m, so a charge
 * matches an invoice when it is within the tolerance of the full amount or of one
 * monthly payment. A single matching invoice yields confidence 0.95; several yield
 * max(0.30, 0.60 - 0.05 n) with the most recent invoice as primary and no month count.
 * The multi-match confidence is a heuristic, not a calibrated probability.
 */
class MsiMatcher {
public:
    static constexpr const char* kModelTag = "bank_parser_v1";

    explicit MsiMatcher(MsiPolicy policy = {}) : m_policy(policy) {}

    /**
     * @brief Enriches matched rows in place. Rows are never added or removed.
     * @param periodOverride Replaces the window derived from the transaction dates.
     */
    std::vector<domain::MatchResult> match(std::vector<domain::Transaction>& transactions,
                                           const std::vector<domain::InvoiceCandidate>& invoices,
                                           const std::optional<InvoiceWindow>& periodOverride = std::nullopt) const;

    /** @brief First installment count whose monthly amount fits the charge, or nullopt. */
    std::optional<int> InferMonths(double chargeAmount, double invoiceTotal) const;

    /** @brief [earliest date - lookback, latest date + lookahead], nullopt when no row is dated. */
    std::optional<InvoiceWindow> windowFor(const std::vector<domain::Transaction>& transactions) const;

    static double AmbiguousConfidence(std::size_t candidateCount);

private:
    MsiPolicy m_policy;
};

} // namespace ledgerwalker::application
