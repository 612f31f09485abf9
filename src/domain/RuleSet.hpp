/**
 * @file RuleSet.hpp
 * @brief Keyword and pattern configuration governing statement extraction.
 */

#pragma once
#include <memory>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace ledgerwalker::domain {

/**
 * @struct LinePattern
 * @brief A compiled bank-specific line regex and the roles of its capture groups.
 *
 * Group index 0 means "not captured". The regex is compiled once and shared
 * read-only between RuleSet copies.
 */
struct LinePattern {
    std::string source;
    std::shared_ptr<const std::regex> regex;
    int dateGroup = 1;
    int descriptionGroup = 2;
    int amountGroup = 3;
    int balanceGroup = 0;
    int referenceGroup = 0;
};

/**
 * @struct AmountPattern
 * @brief Regex locating amount tokens inside a line; group 1 (or the whole match) is the number.
 */
struct AmountPattern {
    std::string source;
    std::shared_ptr<const std::regex> regex;
};

/**
 * @struct RuleSet
 * @brief Base rules merged with one bank override. A fresh value per parse.
 */
struct RuleSet {
    std::string bankId;                          ///< Empty for the base rules.
    std::set<std::string> creditKeywords;        ///< Lower-case.
    std::set<std::string> debitKeywords;         ///< Lower-case.
    std::set<std::string> skipKeywords;          ///< Lower-case substrings marking noise rows.
    std::vector<AmountPattern> amountPatterns;
    std::vector<LinePattern> customLinePatterns;
    bool preferFirstAmount = false;
    bool hasRunningBalanceColumn = false;
    bool mergeMultilineConcepts = false;

    /** @brief The immutable base rules every bank extends. */
    static RuleSet Base();
};

/**
 * @struct BankRuleOverride
 * @brief Additions a single bank contributes on top of the base rules.
 */
struct BankRuleOverride {
    std::string bankId;
    std::string displayName;
    std::vector<std::string> aliases;
    std::vector<std::string> creditKeywords;
    std::vector<std::string> debitKeywords;
    std::vector<std::string> skipKeywords;
    std::vector<AmountPattern> amountPatterns;
    std::vector<LinePattern> linePatterns;
    std::optional<bool> preferFirstAmount;
    std::optional<bool> hasRunningBalanceColumn;
    std::optional<bool> mergeMultilineConcepts;
};

} // namespace ledgerwalker::domain
