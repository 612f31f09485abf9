/**
 * @file BalanceReconciler.cpp
 * @brief Implementation of BalanceReconciler.
 */

#include "application/BalanceReconciler.hpp"
#include "domain/StatementText.hpp"
#include <cmath>
#include <iostream>

namespace ledgerwalker::application {

domain::StatementSummary BalanceReconciler::reconcile(const std::vector<domain::Transaction>& transactions,
                                                      const BalanceHints& hints) const {
    using domain::text::RoundCents;

    domain::StatementSummary summary;
    summary.detectedBank = hints.detectedBank;
    summary.transactionCount = static_cast<int>(transactions.size());

    for (const auto& txn : transactions) {
        const double magnitude = std::abs(txn.amount);
        if (txn.direction == domain::Direction::Credit) {
            summary.totalCredits += magnitude;
        } else {
            summary.totalDebits += magnitude;
        }
        switch (txn.movementKind) {
            case domain::MovementKind::Income: summary.totalIncomes += magnitude; break;
            case domain::MovementKind::Expense: summary.totalExpenses += magnitude; break;
            case domain::MovementKind::Transfer: summary.totalTransfers += magnitude; break;
        }
        if (txn.date) {
            if (!summary.periodStart || *txn.date < *summary.periodStart) summary.periodStart = txn.date;
            if (!summary.periodEnd || *txn.date > *summary.periodEnd) summary.periodEnd = txn.date;
        }
    }
    summary.totalCredits = RoundCents(summary.totalCredits);
    summary.totalDebits = RoundCents(summary.totalDebits);
    summary.totalIncomes = RoundCents(summary.totalIncomes);
    summary.totalExpenses = RoundCents(summary.totalExpenses);
    summary.totalTransfers = RoundCents(summary.totalTransfers);

    if (hints.periodStart) summary.periodStart = hints.periodStart;
    if (hints.periodEnd) summary.periodEnd = hints.periodEnd;

    if (!transactions.empty() && transactions.front().balanceAfter) {
        const auto& first = transactions.front();
        summary.openingBalance = RoundCents(*first.balanceAfter - first.amount);
    } else if (hints.openingBalance) {
        summary.openingBalance = RoundCents(*hints.openingBalance);
    }
    if (!transactions.empty() && transactions.back().balanceAfter) {
        summary.closingBalance = RoundCents(*transactions.back().balanceAfter);
    } else if (hints.closingBalance) {
        summary.closingBalance = RoundCents(*hints.closingBalance);
    }

    if (summary.openingBalance && summary.closingBalance) {
        const double expected = *summary.openingBalance + summary.totalCredits - summary.totalDebits;
        const double difference = RoundCents(expected - *summary.closingBalance);
        summary.reconciliationDifference = difference;
        if (std::abs(difference) <= m_tolerance) {
            summary.reconciliationStatus = domain::ReconciliationStatus::Ok;
        } else {
            summary.reconciliationStatus = domain::ReconciliationStatus::Mismatch;
            std::cerr << "[BalanceReconciler] Balance mismatch: opening=" << *summary.openingBalance
                      << " credits=" << summary.totalCredits << " debits=" << summary.totalDebits
                      << " closing=" << *summary.closingBalance << " difference=" << difference << std::endl;
        }
    } else {
        summary.reconciliationStatus = domain::ReconciliationStatus::Unverified;
    }
    return summary;
}

} // namespace ledgerwalker::application
