/**
 * @file BankRuleCatalogLoader.hpp
 * @brief Loads the versioned bank rule catalog (bank_rules.json) into a RuleProvider.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/RuleProvider.hpp"

namespace ledgerwalker::infrastructure {

/**
 * @class BankRuleCatalogLoader
 * @brief Parses {"version": ..., "banks": {id: {...}}}.
 *
 * Bank records accept display_name, aliases, credit_keywords, debit_keywords,
 * skip_patterns, amount_patterns, transaction_line_patterns, prefer_first_amount,
 * has_running_balance_column and merge_multiline_concepts. A line pattern is
 * either a regex string (groups 1-3 are date, description, amount) or an object
 * {"regex", "date", "description", "amount", "balance", "reference"} of group indices.
 * Patterns that fail to compile are reported and skipped.
 */
class BankRuleCatalogLoader {
public:
    /** @brief Builds the provider. Throws std::runtime_error when the catalog shape is wrong. */
    static application::RuleProvider FromJson(const nlohmann::json& catalog,
                                              std::vector<std::string>* warnings = nullptr);

    /** @brief Reads the catalog file. A missing file yields a provider with base rules only. */
    static application::RuleProvider Load(const std::string& path, std::vector<std::string>* warnings = nullptr);

    /** @brief One bank record. The id is the catalog key. */
    static domain::BankRuleOverride ParseBank(const std::string& bankId, const nlohmann::json& record,
                                              std::vector<std::string>* warnings = nullptr);
};

} // namespace ledgerwalker::infrastructure
