/**
 * @file TransactionNormalizer.hpp
 * @brief Direction classification, sign fixing, noise filtering and deduplication.
 */

#pragma once
#include <optional>
#include <vector>
#include "domain/RuleSet.hpp"
#include "domain/Transaction.hpp"

namespace ledgerwalker::application {

/**
 * @struct NormalizationResult
 * @brief Ledger rows plus the balances stated by consumed carry rows.
 */
struct NormalizationResult {
    std::vector<domain::Transaction> transactions;
    std::optional<double> openingCarry;   ///< From the first opening carry row.
    std::optional<double> closingCarry;   ///< From the last closing carry row.
    int rejectedZero = 0;
    int rejectedCeiling = 0;
    int rejectedSkip = 0;
    int mergedDuplicates = 0;
    int mergedContinuationLines = 0;
};

/**
 * @class TransactionNormalizer
 * @brief Turns raw strategy rows into ledger rows.
 *
 * Order of work: continuation lines are merged (when the bank asks for it), noise
 * rows are rejected, directions are classified and signs fixed, then rows sharing
 * (date, normalized description, amount) are merged. Running it again on its own
 * output changes nothing.
 */
class TransactionNormalizer {
public:
    explicit TransactionNormalizer(double amountCeiling = 1000000.0) : m_amountCeiling(amountCeiling) {}

    NormalizationResult normalize(std::vector<domain::Transaction> rows, const domain::RuleSet& rules) const;

    /**
     * @brief Direction from explicit markers, keywords, balance column or fallback, in that order.
     * @param previousBalance Running balance before this row, if known.
     */
    static std::pair<domain::Direction, domain::DirectionBasis> Classify(const domain::Transaction& row,
                                                                         const domain::RuleSet& rules,
                                                                         std::optional<double> previousBalance);

    /** @brief Rows whose description is empty, numeric, a separator or contains a skip keyword. */
    static bool IsNoise(const std::string& description, const domain::RuleSet& rules);

private:
    double m_amountCeiling;
};

} // namespace ledgerwalker::application
