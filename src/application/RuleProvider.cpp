/**
 * @file RuleProvider.cpp
 * @brief Implementation of RuleProvider.
 */

#include "application/RuleProvider.hpp"
#include "domain/StatementText.hpp"
#include <algorithm>

namespace ledgerwalker::application {

namespace {

std::string Key(const std::string& raw) {
    return domain::text::ToLower(domain::text::CollapseWhitespace(raw));
}

void AppendKeywords(std::set<std::string>& target, const std::vector<std::string>& additions) {
    for (const auto& keyword : additions) {
        std::string normalized = Key(keyword);
        if (!normalized.empty()) target.insert(normalized);
    }
}

template <typename Pattern>
void AppendPatterns(std::vector<Pattern>& target, const std::vector<Pattern>& additions) {
    for (const auto& pattern : additions) {
        if (!pattern.regex) continue;
        const bool present = std::any_of(target.begin(), target.end(), [&](const Pattern& existing) {
            return existing.source == pattern.source;
        });
        if (!present) target.push_back(pattern);
    }
}

} // namespace

RuleProvider::RuleProvider(std::map<std::string, domain::BankRuleOverride> overrides, std::string catalogVersion)
    : m_catalogVersion(std::move(catalogVersion)) {
    for (auto& [id, record] : overrides) {
        std::string key = Key(id);
        record.bankId = key;
        m_overrides[key] = std::move(record);
    }
}

domain::RuleSet RuleProvider::Merge(const domain::RuleSet& base, const domain::BankRuleOverride& override) {
    domain::RuleSet merged = base;
    merged.bankId = override.bankId;
    AppendKeywords(merged.creditKeywords, override.creditKeywords);
    AppendKeywords(merged.debitKeywords, override.debitKeywords);
    AppendKeywords(merged.skipKeywords, override.skipKeywords);
    AppendPatterns(merged.amountPatterns, override.amountPatterns);
    AppendPatterns(merged.customLinePatterns, override.linePatterns);
    if (override.preferFirstAmount) merged.preferFirstAmount = *override.preferFirstAmount;
    if (override.hasRunningBalanceColumn) merged.hasRunningBalanceColumn = *override.hasRunningBalanceColumn;
    if (override.mergeMultilineConcepts) merged.mergeMultilineConcepts = *override.mergeMultilineConcepts;
    return merged;
}

domain::RuleSet RuleProvider::resolve(const std::string& bankId) const {
    auto canonical = canonicalBankId(bankId);
    if (!canonical) {
        return domain::RuleSet::Base();
    }
    return Merge(domain::RuleSet::Base(), m_overrides.at(*canonical));
}

std::optional<std::string> RuleProvider::canonicalBankId(const std::string& nameOrAlias) const {
    const std::string key = Key(nameOrAlias);
    if (key.empty()) return std::nullopt;
    if (m_overrides.count(key)) return key;
    for (const auto& [id, record] : m_overrides) {
        if (Key(record.displayName) == key) return id;
        for (const auto& alias : record.aliases) {
            if (Key(alias) == key) return id;
        }
    }
    return std::nullopt;
}

std::string RuleProvider::displayName(const std::string& bankId) const {
    auto canonical = canonicalBankId(bankId);
    if (!canonical) return {};
    const auto& record = m_overrides.at(*canonical);
    return record.displayName.empty() ? *canonical : record.displayName;
}

std::vector<std::pair<std::string, std::string>> RuleProvider::detectionPhrases() const {
    std::vector<std::pair<std::string, std::string>> phrases;
    for (const auto& [id, record] : m_overrides) {
        if (!record.displayName.empty()) phrases.emplace_back(id, Key(record.displayName));
        for (const auto& alias : record.aliases) {
            std::string normalized = Key(alias);
            if (!normalized.empty()) phrases.emplace_back(id, normalized);
        }
    }
    return phrases;
}

} // namespace ledgerwalker::application
