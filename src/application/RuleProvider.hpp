/**
 * @file RuleProvider.hpp
 * @brief Resolves the rule set of a bank by merging its override onto the base rules.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "domain/RuleSet.hpp"

namespace ledgerwalker::application {

/**
 * @class RuleProvider
 * @brief Immutable catalog of bank overrides. resolve() builds a fresh RuleSet per call.
 */
class RuleProvider {
public:
    RuleProvider() = default;
    RuleProvider(std::map<std::string, domain::BankRuleOverride> overrides, std::string catalogVersion);

    /**
     * @brief Base rules extended with the bank's override.
     * @param bankId Catalog key or alias, case-insensitive. Unknown ids yield the base rules.
     */
    domain::RuleSet resolve(const std::string& bankId) const;

    /** @brief Catalog key for a bank id, display name or alias. */
    std::optional<std::string> canonicalBankId(const std::string& nameOrAlias) const;

    /** @brief Display name of a catalog entry, empty when unknown. */
    std::string displayName(const std::string& bankId) const;

    /** @brief (bankId, lower-case phrase) pairs usable for bank detection. */
    std::vector<std::pair<std::string, std::string>> detectionPhrases() const;

    const std::string& catalogVersion() const { return m_catalogVersion; }
    std::size_t size() const { return m_overrides.size(); }

    /** @brief Union of keyword sets, appended patterns, flags set only where the override sets them. */
    static domain::RuleSet Merge(const domain::RuleSet& base, const domain::BankRuleOverride& override);

private:
    std::map<std::string, domain::BankRuleOverride> m_overrides;   ///< Keyed by lower-case bank id.
    std::string m_catalogVersion;
};

} // namespace ledgerwalker::application
