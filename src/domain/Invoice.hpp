/**
 * @file Invoice.hpp
 * @brief Invoice candidates supplied by the caller and the installment matches produced for them.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/CalendarDate.hpp"

namespace ledgerwalker::domain {

/**
 * @struct InvoiceCandidate
 * @brief Read-only invoice the caller believes may have been paid with the card.
 */
struct InvoiceCandidate {
    std::string id;
    CalendarDate date;
    double total = 0.0;
    bool paymentMethodIsCard = false;
    std::optional<int> confirmedMonths;   ///< Installment plan already confirmed by a person.
    bool cancelled = false;
    std::string issuerName;
};

/**
 * @struct MatchResult
 * @brief Link between a card debit and an invoice, possibly ambiguous.
 */
struct MatchResult {
    std::size_t transactionIndex = 0;            ///< Position in the returned transaction list.
    std::optional<std::string> transactionRef;   ///< Statement reference of the charge, if any.
    std::string invoiceId;                       ///< Primary candidate.
    std::optional<int> months;
    double confidence = 0.0;
    bool ambiguous = false;
    std::string reasoning;
    std::vector<std::string> alternativeInvoiceIds;
};

/** @brief Installment counts sold as "meses sin intereses", tested in this order. */
inline const std::vector<int>& MsiMonthOptions() {
    static const std::vector<int> kMonths = {3, 6, 9, 12, 18, 24};
    return kMonths;
}

} // namespace ledgerwalker::domain
