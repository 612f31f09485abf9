/**
 * @file AccountClassifier.cpp
 * @brief Implementation of AccountClassifier.
 */

#include "application/AccountClassifier.hpp"
#include "domain/StatementText.hpp"
#include <algorithm>
#include <iostream>
#include <vector>

namespace ledgerwalker::application {

namespace text = domain::text;

namespace {

constexpr std::size_t kHeadLength = 8000;

struct KnownBank {
    const char* id;
    const char* displayName;
    std::vector<std::string> phrases;   ///< Upper-case.
};

const std::vector<KnownBank>& BankTable() {
    static const std::vector<KnownBank> kBanks = {
        {"bbva", "BBVA", {"BBVA", "BANCOMER"}},
        {"santander", "Santander", {"SANTANDER"}},
        {"banorte", "Banorte", {"BANORTE"}},
        {"banamex", "Citibanamex", {"CITIBANAMEX", "BANAMEX"}},
        {"hsbc", "HSBC", {"HSBC"}},
        {"scotiabank", "Scotiabank", {"SCOTIABANK"}},
        {"inbursa", "Inbursa", {"INBURSA"}},
        {"banregio", "Banregio", {"BANREGIO"}},
        {"bajio", "BanBajío", {"BANBAJIO", "BANBAJÍO", "BANCO DEL BAJIO"}},
        {"azteca", "Banco Azteca", {"BANCO AZTECA"}},
        {"amex", "American Express", {"AMERICAN EXPRESS", "AMEX"}},
        {"nu", "Nu", {"NU MEXICO", "NU MÉXICO", "NU BANK", "NUBANK"}},
        {"hey", "Hey Banco", {"HEY BANCO", "HEY, BANCO"}},
        {"afirme", "Afirme", {"AFIRME"}}
    };
    return kBanks;
}

const std::vector<std::string>& CreditCardPhrases() {
    static const std::vector<std::string> kPhrases = {
        "TARJETA DE CREDITO", "TARJETA DE CRÉDITO", "CREDIT CARD", "LIMITE DE CREDITO", "LÍMITE DE CRÉDITO",
        "CREDIT LIMIT", "PAGO MINIMO", "PAGO MÍNIMO", "MINIMUM PAYMENT", "FECHA DE CORTE",
        "SALDO PARA NO GENERAR INTERESES"
    };
    return kPhrases;
}

const std::vector<std::string>& DebitPhrases() {
    static const std::vector<std::string> kPhrases = {
        "TARJETA DE DEBITO", "TARJETA DE DÉBITO", "DEBIT CARD", "CUENTA DE CHEQUES", "CHECKING ACCOUNT"
    };
    return kPhrases;
}

int CountHits(const std::string& upper, const std::vector<std::string>& phrases) {
    int hits = 0;
    for (const auto& phrase : phrases) {
        if (upper.find(phrase) != std::string::npos) ++hits;
    }
    return hits;
}

} // namespace

domain::AccountClassification AccountClassifier::ScoreAccountType(const std::string& statementText) {
    const std::string upper = text::ToUpper(statementText.substr(0, kHeadLength));
    domain::AccountClassification result;
    result.source = domain::ClassificationSource::Heuristic;
    result.creditCardHits = CountHits(upper, CreditCardPhrases());
    result.debitHits = CountHits(upper, DebitPhrases());

    if (result.creditCardHits >= 2) {
        result.accountType = domain::AccountType::CreditCard;
        result.confidence = std::min(0.8, 0.5 + 0.1 * result.creditCardHits);
    } else if (result.debitHits >= 1) {
        result.accountType = domain::AccountType::DebitCard;
        result.confidence = std::min(0.7, 0.5 + 0.1 * result.debitHits);
    } else {
        result.accountType = domain::AccountType::Checking;
        result.confidence = 0.5;
    }
    return result;
}

std::optional<std::string> AccountClassifier::detectBank(const std::string& statementText) const {
    const std::string upper = text::ToUpper(statementText.substr(0, kHeadLength));
    for (const auto& bank : BankTable()) {
        for (const auto& phrase : bank.phrases) {
            if (text::ContainsWord(upper, phrase)) return std::string(bank.id);
        }
    }
    for (const auto& [bankId, phrase] : m_rules.detectionPhrases()) {
        if (text::ContainsWord(upper, text::ToUpper(phrase))) return bankId;
    }
    return std::nullopt;
}

std::string AccountClassifier::canonicalBank(const std::string& name) const {
    if (auto catalogId = m_rules.canonicalBankId(name)) return *catalogId;
    // Display names such as "Citibanamex" map through the built-in table.
    if (auto detected = detectBank(name)) return *detected;
    return text::ToLower(text::Trim(name));
}

std::string AccountClassifier::bankDisplayName(const std::string& bankId) const {
    const std::string catalogName = m_rules.displayName(bankId);
    if (!catalogName.empty()) return catalogName;
    for (const auto& bank : BankTable()) {
        if (bankId == bank.id) return bank.displayName;
    }
    return bankId;
}

domain::AccountClassification AccountClassifier::classify(const std::string& statementText,
                                                          const ClassificationInput& input) const {
    domain::AccountClassification result = ScoreAccountType(statementText);
    const auto& advisory = input.advisory;
    const auto& known = input.knownProfile;

    // Account type.
    if (advisory && advisory->accountType != domain::AccountType::Unknown &&
        advisory->confidence >= kAccountTypeUpdateConfidence) {
        result.accountType = advisory->accountType;
        result.confidence = advisory->confidence;
        result.source = domain::ClassificationSource::Advisory;
    } else if (known.accountType && *known.accountType != domain::AccountType::Unknown) {
        result.accountType = *known.accountType;
        result.confidence = 1.0;
        result.source = domain::ClassificationSource::KnownProfile;
    } else if (advisory && advisory->accountType != domain::AccountType::Unknown) {
        result.accountType = advisory->accountType;
        result.confidence = advisory->confidence;
        result.source = domain::ClassificationSource::Advisory;
    }

    // Bank.
    std::optional<std::string> bank;
    if (advisory && !advisory->bankName.empty() && advisory->confidence >= kBankUpdateConfidence) {
        bank = advisory->bankName;
    } else if (input.bankHint && !input.bankHint->empty()) {
        bank = input.bankHint;
    } else if (known.bankName && !known.bankName->empty()) {
        bank = known.bankName;
    } else if (advisory && !advisory->bankName.empty()) {
        bank = advisory->bankName;
    } else {
        bank = detectBank(statementText);
    }
    if (bank) {
        result.bankId = canonicalBank(*bank);
        result.bankName = bankDisplayName(result.bankId);
    }

    // Profile corrections proposed by a confident advisory classification.
    if (advisory) {
        domain::AccountProfileUpdate update;
        update.confidence = advisory->confidence;
        if (advisory->confidence >= kAccountTypeUpdateConfidence && advisory->accountType != domain::AccountType::Unknown &&
            (!known.accountType || *known.accountType != advisory->accountType)) {
            update.accountType = advisory->accountType;
            update.reason = "account type " + (known.accountType ? domain::ToString(*known.accountType) : std::string("unset")) +
                            " -> " + domain::ToString(advisory->accountType);
        }
        if (advisory->confidence >= kBankUpdateConfidence && !advisory->bankName.empty()) {
            const bool sameBank = known.bankName && canonicalBank(*known.bankName) == canonicalBank(advisory->bankName);
            if (!sameBank) {
                update.bankName = advisory->bankName;
                if (!update.reason.empty()) update.reason += "; ";
                update.reason += "bank " + known.bankName.value_or("unset") + " -> " + advisory->bankName;
            }
        }
        if (update.accountType || update.bankName) {
            std::clog << "[AccountClassifier] Profile update proposed: " << update.reason << std::endl;
            result.profileUpdate = update;
        }
    }

    std::clog << "[AccountClassifier] bank=" << (result.bankId.empty() ? "unknown" : result.bankId)
              << " type=" << domain::ToString(result.accountType) << " source=" << domain::ToString(result.source)
              << " confidence=" << result.confidence << std::endl;
    return result;
}

} // namespace ledgerwalker::application
