/**
 * @file QualityScorer.cpp
 * @brief Implementation of QualityScorer.
 */

#include "application/QualityScorer.hpp"
#include "domain/StatementText.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace ledgerwalker::application {

namespace {

constexpr double kIdealCount = 50.0;
constexpr double kIdealDistinctPrefixes = 20.0;
constexpr std::size_t kPrefixLength = 20;

bool HasOpeningMarker(const std::string& upper) {
    return upper.find("BALANCE INICIAL") != std::string::npos || upper.find("SALDO ANTERIOR") != std::string::npos;
}

} // namespace

QualityScorer::Breakdown QualityScorer::breakdown(const std::vector<domain::Transaction>& transactions,
                                                  const std::string& rawText) const {
    Breakdown result;
    if (transactions.empty()) return result;

    const double count = static_cast<double>(transactions.size());
    result.countFactor = std::min(count / kIdealCount, 1.0);

    std::set<std::string> prefixes;
    int validAmounts = 0;
    int validDates = 0;
    for (const auto& txn : transactions) {
        const std::string upper = domain::text::ToUpper(txn.description);
        if (txn.isBalanceCarry || HasOpeningMarker(upper)) {
            result.openingMarker = true;
        }
        if (!txn.description.empty()) prefixes.insert(txn.description.substr(0, kPrefixLength));

        const double magnitude = txn.isBalanceCarry ? std::abs(txn.balanceAfter.value_or(0.0)) : std::abs(txn.amount);
        if ((magnitude > 0.0 || txn.isBalanceCarry) && magnitude <= m_amountCeiling) ++validAmounts;
        if (txn.date) ++validDates;
    }
    if (!result.openingMarker) {
        result.openingMarker = HasOpeningMarker(domain::text::ToUpper(rawText));
    }

    result.diversityFactor = std::min(static_cast<double>(prefixes.size()) / kIdealDistinctPrefixes, 1.0);
    result.validAmountRatio = validAmounts / count;
    result.validDateRatio = validDates / count;
    result.total = 0.3 * result.countFactor + (result.openingMarker ? 0.2 : 0.0) + 0.2 * result.diversityFactor +
                   0.15 * result.validAmountRatio + 0.15 * result.validDateRatio;
    result.total = std::min(result.total, 1.0);
    return result;
}

double QualityScorer::score(const std::vector<domain::Transaction>& transactions, const std::string& rawText) const {
    return breakdown(transactions, rawText).total;
}

} // namespace ledgerwalker::application
