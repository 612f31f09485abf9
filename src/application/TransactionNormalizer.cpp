/**
 * @file TransactionNormalizer.cpp
 * @brief Implementation of TransactionNormalizer.
 */

#include "application/TransactionNormalizer.hpp"
#include "application/strategies/LineScanningStrategy.hpp"
#include "domain/StatementText.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <set>
#include <tuple>

namespace ledgerwalker::application {

namespace text = domain::text;

namespace {

constexpr double kBalanceEpsilon = 0.01;

using DedupKey = std::tuple<std::string, std::string, std::int64_t>;

std::optional<domain::Direction> MarkerDirection(const domain::Transaction& row) {
    if (row.explicitDirection) return row.explicitDirection;
    const std::string upper = text::ToUpper(row.description);
    const bool credit = text::ContainsWord(upper, "ABONO") || text::ContainsWord(upper, "CR") || upper.find("(+)") != std::string::npos;
    const bool debit = text::ContainsWord(upper, "CARGO") || text::ContainsWord(upper, "DR") || upper.find("(-)") != std::string::npos;
    if (credit != debit) return credit ? domain::Direction::Credit : domain::Direction::Debit;
    return std::nullopt;
}

std::size_t LongestKeyword(const std::string& lowered, const std::set<std::string>& keywords) {
    std::size_t longest = 0;
    for (const auto& keyword : keywords) {
        if (keyword.size() > longest && lowered.find(keyword) != std::string::npos) longest = keyword.size();
    }
    return longest;
}

std::string JoinFragments(const std::string& original, const std::string& addition) {
    const std::string left = text::Trim(original);
    const std::string right = text::Trim(addition);
    if (right.empty()) return left;
    if (left.empty()) return right;
    return left + " " + right;
}

} // namespace

bool TransactionNormalizer::IsNoise(const std::string& description, const domain::RuleSet& rules) {
    std::string lowered = text::ToLower(text::Trim(description));
    if (lowered.empty()) return true;
    if (std::all_of(lowered.begin(), lowered.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) return true;
    if (lowered == "|" || lowered == "-" || lowered == "--") return true;
    const auto parens = lowered.find("()");
    if (parens != std::string::npos) lowered.erase(parens, 2);
    return text::ContainsAny(lowered, rules.skipKeywords);
}

std::pair<domain::Direction, domain::DirectionBasis> TransactionNormalizer::Classify(const domain::Transaction& row,
                                                                                    const domain::RuleSet& rules,
                                                                                    std::optional<double> previousBalance) {
    if (auto marker = MarkerDirection(row)) {
        return {*marker, domain::DirectionBasis::Marker};
    }

    // The longest matching keyword wins, so "pago tarjeta de credito" beats "credito".
    const std::string lowered = text::ToLower(row.description);
    const std::size_t credit = LongestKeyword(lowered, rules.creditKeywords);
    const std::size_t debit = LongestKeyword(lowered, rules.debitKeywords);
    if (credit > 0 && credit >= debit) {
        return {domain::Direction::Credit, domain::DirectionBasis::Keyword};
    }
    if (debit > 0) {
        return {domain::Direction::Debit, domain::DirectionBasis::Keyword};
    }

    const double magnitude = std::abs(row.amount);
    if (row.balanceAfter && previousBalance) {
        if (std::abs(*previousBalance + magnitude - *row.balanceAfter) <= kBalanceEpsilon) {
            return {domain::Direction::Credit, domain::DirectionBasis::Column};
        }
        if (std::abs(*previousBalance - magnitude - *row.balanceAfter) <= kBalanceEpsilon) {
            return {domain::Direction::Debit, domain::DirectionBasis::Column};
        }
    }

    if (row.balanceAfter && magnitude > std::abs(*row.balanceAfter)) {
        return {domain::Direction::Credit, domain::DirectionBasis::Fallback};
    }
    return {domain::Direction::Debit, domain::DirectionBasis::Fallback};
}

NormalizationResult TransactionNormalizer::normalize(std::vector<domain::Transaction> rows,
                                                     const domain::RuleSet& rules) const {
    NormalizationResult result;
    std::vector<domain::Transaction> kept;
    kept.reserve(rows.size());
    std::optional<double> runningBalance;

    for (auto& row : rows) {
        if (row.isBalanceCarry) {
            if (row.balanceAfter) {
                if (strategies::IsClosingCarry(row.description)) {
                    result.closingCarry = row.balanceAfter;
                } else if (!result.openingCarry) {
                    result.openingCarry = row.balanceAfter;
                }
                runningBalance = row.balanceAfter;
            }
            continue;
        }

        if (rules.mergeMultilineConcepts && !row.continuationLines.empty()) {
            for (const auto& extra : row.continuationLines) {
                if (IsNoise(extra, rules)) continue;
                row.description = JoinFragments(row.description, extra);
                ++result.mergedContinuationLines;
            }
        }
        row.continuationLines.clear();

        if (IsNoise(row.description, rules)) {
            ++result.rejectedSkip;
            continue;
        }

        if (row.directionBasis == domain::DirectionBasis::Extracted) {
            auto [direction, basis] = Classify(row, rules, runningBalance);
            row.direction = direction;
            row.directionBasis = basis;
        }
        const double magnitude = text::RoundCents(std::abs(row.amount));
        row.amount = row.direction == domain::Direction::Credit ? magnitude : -magnitude;
        if (row.balanceAfter) {
            row.balanceAfter = text::RoundCents(*row.balanceAfter);
            runningBalance = row.balanceAfter;
        }

        if (magnitude == 0.0) {
            ++result.rejectedZero;
            continue;
        }
        if (magnitude > m_amountCeiling) {
            ++result.rejectedCeiling;
            continue;
        }
        kept.push_back(std::move(row));
    }

    std::map<DedupKey, std::size_t> index;
    for (auto& row : kept) {
        DedupKey key{row.date ? row.date->toIso() : std::string(), text::NormalizeDescription(row.description),
                     text::ToCents(row.amount)};
        auto found = index.find(key);
        if (found == index.end()) {
            index.emplace(std::move(key), result.transactions.size());
            result.transactions.push_back(std::move(row));
            continue;
        }

        auto& existing = result.transactions[found->second];
        if (existing.description.find(text::Trim(row.description)) == std::string::npos) {
            existing.description = JoinFragments(existing.description, row.description);
        }
        if (row.balanceAfter) existing.balanceAfter = row.balanceAfter;
        if (!existing.reference && row.reference) existing.reference = row.reference;
        existing.confidence = std::max(existing.confidence, row.confidence);
        ++result.mergedDuplicates;
    }

    for (auto& row : result.transactions) {
        row.movementKind = domain::InferMovementKind(row.direction, row.description);
    }
    return result;
}

} // namespace ledgerwalker::application
