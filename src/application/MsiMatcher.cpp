/**
 * @file MsiMatcher.cpp
 * @brief Implementation of MsiMatcher.
 */

#include "application/MsiMatcher.hpp"
#include "domain/StatementText.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <map>
#include <set>

namespace ledgerwalker::application {

namespace {

constexpr double kSingleMatchConfidence = 0.95;

} // namespace

double MsiMatcher::AmbiguousConfidence(std::size_t candidateCount) {
    return std::max(0.30, 0.60 - 0.05 * static_cast<double>(candidateCount));
}

std::optional<int> MsiMatcher::InferMonths(double chargeAmount, double invoiceTotal) const {
    for (int months : domain::MsiMonthOptions()) {
        const double installment = invoiceTotal / months;
        if (installment <= 0.0) continue;
        if (std::abs(chargeAmount - installment) / installment <= m_policy.monthsTolerance) {
            return months;
        }
    }
    return std::nullopt;
}

std::optional<InvoiceWindow> MsiMatcher::windowFor(const std::vector<domain::Transaction>& transactions) const {
    std::optional<domain::CalendarDate> earliest;
    std::optional<domain::CalendarDate> latest;
    for (const auto& txn : transactions) {
        if (!txn.date) continue;
        if (!earliest || *txn.date < *earliest) earliest = txn.date;
        if (!latest || *txn.date > *latest) latest = txn.date;
    }
    if (!earliest) return std::nullopt;
    return InvoiceWindow{earliest->addDays(-m_policy.lookbackDays), latest->addDays(m_policy.lookaheadDays)};
}

std::vector<domain::MatchResult> MsiMatcher::match(std::vector<domain::Transaction>& transactions,
                                                   const std::vector<domain::InvoiceCandidate>& invoices,
                                                   const std::optional<InvoiceWindow>& periodOverride) const {
    std::vector<domain::MatchResult> matches;
    const bool hasDebit = std::any_of(transactions.begin(), transactions.end(), [](const domain::Transaction& t) {
        return t.direction == domain::Direction::Debit && t.amount != 0.0;
    });
    if (!hasDebit || invoices.empty()) return matches;

    const auto window = periodOverride ? periodOverride : windowFor(transactions);

    std::vector<const domain::InvoiceCandidate*> eligible;
    for (const auto& invoice : invoices) {
        if (!invoice.paymentMethodIsCard || invoice.cancelled || invoice.confirmedMonths) continue;
        if (invoice.total <= 0.0) continue;
        if (window && (invoice.date < window->start || invoice.date > window->end)) continue;
        eligible.push_back(&invoice);
    }
    std::clog << "[MsiMatcher] " << eligible.size() << " of " << invoices.size() << " invoices eligible" << std::endl;
    if (eligible.empty()) return matches;

    // Keyed by cents of the full total and of every installment amount.
    std::multimap<std::int64_t, std::size_t> index;
    for (std::size_t i = 0; i < eligible.size(); ++i) {
        index.emplace(domain::text::ToCents(eligible[i]->total), i);
        for (int months : domain::MsiMonthOptions()) {
            index.emplace(domain::text::ToCents(eligible[i]->total / months), i);
        }
    }

    for (std::size_t row = 0; row < transactions.size(); ++row) {
        auto& txn = transactions[row];
        if (txn.direction != domain::Direction::Debit || txn.amount == 0.0) continue;
        const double charge = std::abs(txn.amount);

        const auto low = index.lower_bound(domain::text::ToCents(charge * (1.0 - m_policy.matchTolerance)));
        const auto high = index.upper_bound(domain::text::ToCents(charge * (1.0 + m_policy.matchTolerance)));
        std::set<std::size_t> candidates;
        for (auto it = low; it != high; ++it) candidates.insert(it->second);
        if (candidates.empty()) continue;

        domain::MatchResult result;
        result.transactionIndex = row;
        result.transactionRef = txn.reference;

        if (candidates.size() == 1) {
            const auto& invoice = *eligible[*candidates.begin()];
            result.invoiceId = invoice.id;
            result.confidence = kSingleMatchConfidence;
            result.months = InferMonths(charge, invoice.total);
            result.reasoning = "Charge " + domain::text::FormatAmount(charge) + " matches invoice " + invoice.id + " total " +
                               domain::text::FormatAmount(invoice.total) +
                               (result.months ? " in " + std::to_string(*result.months) + " installments"
                                              : " as a single payment");
        } else {
            std::vector<const domain::InvoiceCandidate*> ranked;
            for (std::size_t i : candidates) ranked.push_back(eligible[i]);
            std::stable_sort(ranked.begin(), ranked.end(), [](const domain::InvoiceCandidate* a, const domain::InvoiceCandidate* b) {
                return a->date > b->date;
            });
            result.invoiceId = ranked.front()->id;
            for (std::size_t i = 1; i < ranked.size(); ++i) result.alternativeInvoiceIds.push_back(ranked[i]->id);
            result.ambiguous = true;
            result.confidence = AmbiguousConfidence(ranked.size());
            result.reasoning = std::to_string(ranked.size()) + " invoices fit charge " + domain::text::FormatAmount(charge) +
                               "; months require manual confirmation";
        }

        txn.msi = domain::MsiEnrichment{result.invoiceId, result.months, result.confidence, kModelTag};
        matches.push_back(std::move(result));
    }

    std::clog << "[MsiMatcher] " << matches.size() << " charges matched" << std::endl;
    return matches;
}

} // namespace ledgerwalker::application
