/**
 * @file LineScanningStrategy.hpp
 * @brief Common line-by-line extraction loop shared by the regex strategies.
 */

#pragma once
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "domain/ExtractionStrategy.hpp"
#include "domain/StatementHeader.hpp"

namespace ledgerwalker::application::strategies {

/**
 * @struct LineRule
 * @brief A line regex and the meaning of its capture groups (0 = not captured).
 */
struct LineRule {
    std::string label;
    std::shared_ptr<const std::regex> regex;
    int dateGroup = 0;          ///< Complete date token, parsed by StatementHeader::parseDate.
    int monthGroup = 0;
    int dayGroup = 0;
    int yearGroup = 0;
    int referenceGroup = 0;
    int descriptionGroup = 0;
    int amountGroup = 0;        ///< 0: amounts are scanned out of the description with the RuleSet patterns.
    int balanceGroup = 0;
    bool carry = false;         ///< Balance carry line; the last captured amount is the balance.
};

/**
 * @class LineScanningStrategy
 * @brief Template method: subclasses supply the ordered rules, the base scans the text.
 *
 * For every non-empty line the first matching rule produces a row. Lines that
 * match nothing and carry no amount are kept as continuation lines of the
 * previous row; the Normalizer decides whether to merge them.
 */
class LineScanningStrategy : public domain::ExtractionStrategy {
public:
    domain::StrategyResult run(const std::string& text, const domain::RuleSet& rules) const override;

protected:
    /**
     * @struct ScanPlan
     * @brief Rules for one run. A set error aborts the run as a failure.
     */
    struct ScanPlan {
        std::vector<LineRule> rules;
        std::optional<std::string> error;
        std::size_t minLineLength = 0;
    };

    virtual ScanPlan plan(const std::vector<std::string>& lines, const domain::RuleSet& rules,
                          nlohmann::json& metadata) const = 0;

    /** @brief Confidence assigned to rows produced by this strategy. */
    virtual double rowConfidence() const = 0;

    /** @brief Case-insensitive ECMAScript regex. Throws std::regex_error on bad syntax. */
    static std::shared_ptr<const std::regex> Compile(const std::string& pattern);

    /** @brief Adapts a bank-configured line pattern. */
    static LineRule FromLinePattern(const domain::LinePattern& pattern);

    /** @brief Strict money token: optional sign/$, grouped or plain digits, two decimals. */
    static const std::string& StrictAmount();

    /** @brief Money token tolerating decimal commas and dotted grouping. */
    static const std::string& FlexibleAmount();
};

/**
 * @struct AmountToken
 * @brief A money value found inside a line.
 */
struct AmountToken {
    std::size_t position = 0;
    std::size_t length = 0;
    double value = 0.0;
};

/** @brief Non-overlapping amount tokens found by the RuleSet patterns, ordered by position. */
std::vector<AmountToken> ScanAmounts(const std::string& line, const domain::RuleSet& rules);

/** @brief True when the description opens with a balance carry phrase ("SALDO ANTERIOR", "SALDO FINAL"...). */
bool IsCarryDescription(const std::string& description);

/** @brief True for carry rows stating the closing balance. */
bool IsClosingCarry(const std::string& description);

/** @brief Moves "Ref: X" markers and 8-12 digit tokens out of a description. */
std::optional<std::string> ExtractReference(std::string& description);

} // namespace ledgerwalker::application::strategies
