/**
 * @file Transaction.hpp
 * @brief Domain entity for a single statement movement.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include "domain/CalendarDate.hpp"

namespace ledgerwalker::domain {

/**
 * @enum Direction
 * @brief Money flow relative to the account. Credit amounts are >= 0, debit amounts <= 0.
 */
enum class Direction {
    Credit,
    Debit
};

/**
 * @enum MovementKind
 * @brief Business classification of a movement.
 */
enum class MovementKind {
    Income,
    Expense,
    Transfer
};

/**
 * @enum DirectionBasis
 * @brief Which evidence decided the direction during normalization.
 */
enum class DirectionBasis {
    Extracted,  ///< Preliminary guess made by the extraction strategy.
    Marker,     ///< Explicit CARGO/ABONO, CR/DR or sign in the text.
    Keyword,    ///< Credit/debit keyword lists of the RuleSet.
    Column,     ///< Running balance delta between consecutive rows.
    Fallback    ///< Amount compared against the running balance.
};

/**
 * @struct MsiEnrichment
 * @brief Installment ("meses sin intereses") candidate attached to a card charge.
 */
struct MsiEnrichment {
    std::string candidateInvoiceId;
    std::optional<int> months;      ///< Empty when the charge needs manual confirmation.
    double matchConfidence = 0.0;
    std::string modelTag;
};

/**
 * @struct Transaction
 * @brief One movement extracted from a statement.
 */
struct Transaction {
    std::optional<CalendarDate> date;
    std::string description;
    double amount = 0.0;
    Direction direction = Direction::Debit;
    MovementKind movementKind = MovementKind::Expense;
    std::optional<std::string> reference;
    std::optional<double> balanceAfter;
    double confidence = 0.0;
    std::optional<MsiEnrichment> msi;

    // Extraction provenance, not part of the ledger output.
    std::string rawLine;                         ///< Physical line the row came from.
    std::vector<std::string> continuationLines;  ///< Unmatched lines that followed the row.
    std::optional<Direction> explicitDirection;  ///< Sign or CR/DR seen next to the amount.
    int trailingAmountCount = 0;                 ///< Numeric columns found at the end of the line.
    bool isBalanceCarry = false;                 ///< "SALDO ANTERIOR" style carry row.
    DirectionBasis directionBasis = DirectionBasis::Extracted;
};

inline std::string ToString(Direction d) {
    return d == Direction::Credit ? "CREDIT" : "DEBIT";
}

inline std::string ToString(MovementKind k) {
    switch (k) {
        case MovementKind::Income: return "INCOME";
        case MovementKind::Expense: return "EXPENSE";
        case MovementKind::Transfer: return "TRANSFER";
    }
    return "EXPENSE";
}

/** @brief Lower-case phrases marking movements between own accounts or card payments. */
const std::vector<std::string>& TransferKeywords();

/** @brief TRANSFER when a transfer phrase appears, otherwise INCOME for credits and EXPENSE for debits. */
MovementKind InferMovementKind(Direction direction, const std::string& description);

/** @brief True when the sign of amount agrees with the direction. */
inline bool IsSignConsistent(const Transaction& t) {
    return t.direction == Direction::Credit ? t.amount >= 0.0 : t.amount <= 0.0;
}

} // namespace ledgerwalker::domain
