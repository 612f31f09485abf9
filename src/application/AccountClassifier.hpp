/**
 * @file AccountClassifier.hpp
 * @brief Resolves bank identity and account type of a statement.
 */

#pragma once
#include <optional>
#include <string>
#include "application/RuleProvider.hpp"
#include "domain/AccountProfile.hpp"

namespace ledgerwalker::application {

/**
 * @struct ClassificationInput
 * @brief What the caller knows about the statement besides its text.
 */
struct ClassificationInput {
    std::optional<std::string> bankHint;
    domain::KnownAccountProfile knownProfile;
    std::optional<domain::AdvisoryClassification> advisory;
};

/**
 * @class AccountClassifier
 * @brief Advisory classification when confident enough, then the known profile, then
 * keyword heuristics over the first pages of the text.
 */
class AccountClassifier {
public:
    static constexpr double kAccountTypeUpdateConfidence = 0.80;
    static constexpr double kBankUpdateConfidence = 0.90;

    explicit AccountClassifier(const RuleProvider& rules) : m_rules(rules) {}

    domain::AccountClassification classify(const std::string& text, const ClassificationInput& input) const;

    /** @brief Heuristic account type and confidence in [0.5, 0.8]. */
    static domain::AccountClassification ScoreAccountType(const std::string& text);

    /** @brief Bank catalog id found in the text, from the built-in table and catalog aliases. */
    std::optional<std::string> detectBank(const std::string& text) const;

    /** @brief Display name for a detected bank id. */
    std::string bankDisplayName(const std::string& bankId) const;

private:
    /** @brief Catalog id, built-in id, or the lower-cased name itself. */
    std::string canonicalBank(const std::string& name) const;

    const RuleProvider& m_rules;
};

} // namespace ledgerwalker::application
