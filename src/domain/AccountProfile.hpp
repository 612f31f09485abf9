/**
 * @file AccountProfile.hpp
 * @brief Account identity, advisory classifications and profile corrections.
 */

#pragma once
#include <optional>
#include <string>

namespace ledgerwalker::domain {

/**
 * @enum AccountType
 * @brief Kind of account the statement belongs to.
 */
enum class AccountType {
    CreditCard,
    DebitCard,
    Checking,
    Savings,
    Unknown
};

inline std::string ToString(AccountType t) {
    switch (t) {
        case AccountType::CreditCard: return "credit_card";
        case AccountType::DebitCard: return "debit_card";
        case AccountType::Checking: return "checking";
        case AccountType::Savings: return "savings";
        case AccountType::Unknown: return "unknown";
    }
    return "unknown";
}

inline AccountType AccountTypeFromString(const std::string& s) {
    if (s == "credit_card" || s == "CREDIT_CARD") return AccountType::CreditCard;
    if (s == "debit_card" || s == "DEBIT_CARD") return AccountType::DebitCard;
    if (s == "checking" || s == "CHECKING") return AccountType::Checking;
    if (s == "savings" || s == "SAVINGS") return AccountType::Savings;
    return AccountType::Unknown;
}

/**
 * @struct AccountMetadata
 * @brief Caller-side identifiers, echoed back but never interpreted.
 */
struct AccountMetadata {
    std::string id;
    std::string companyId;
    std::string tenantId;
};

/**
 * @struct KnownAccountProfile
 * @brief What the caller currently has on record for the account.
 */
struct KnownAccountProfile {
    std::optional<std::string> bankName;
    std::optional<AccountType> accountType;
};

/**
 * @struct AdvisoryClassification
 * @brief Bank/account-type guess from an external classifier (for example an LLM).
 */
struct AdvisoryClassification {
    std::string bankName;
    AccountType accountType = AccountType::Unknown;
    double confidence = 0.0;
};

/**
 * @struct AccountProfileUpdate
 * @brief Correction the caller may persist. Only changed fields are set.
 */
struct AccountProfileUpdate {
    std::optional<AccountType> accountType;
    std::optional<std::string> bankName;
    double confidence = 0.0;
    std::string reason;
};

/**
 * @enum ClassificationSource
 * @brief Where the resolved account identity came from.
 */
enum class ClassificationSource {
    Advisory,
    KnownProfile,
    Heuristic
};

inline std::string ToString(ClassificationSource s) {
    switch (s) {
        case ClassificationSource::Advisory: return "advisory";
        case ClassificationSource::KnownProfile: return "known_profile";
        case ClassificationSource::Heuristic: return "heuristic";
    }
    return "heuristic";
}

/**
 * @struct AccountClassification
 * @brief Resolved bank and account type for one statement.
 */
struct AccountClassification {
    std::string bankId;          ///< Lower-case catalog key, empty when unknown.
    std::string bankName;        ///< Display name.
    AccountType accountType = AccountType::Unknown;
    double confidence = 0.0;
    ClassificationSource source = ClassificationSource::Heuristic;
    int creditCardHits = 0;
    int debitHits = 0;
    std::optional<AccountProfileUpdate> profileUpdate;

    bool msiEligible() const { return accountType == AccountType::CreditCard; }
};

} // namespace ledgerwalker::domain
