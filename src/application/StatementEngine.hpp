/**
 * @file StatementEngine.hpp
 * @brief Orchestrates classification, extraction, normalization, reconciliation and MSI matching.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/AccountClassifier.hpp"
#include "application/BalanceReconciler.hpp"
#include "application/MsiMatcher.hpp"
#include "application/RuleProvider.hpp"
#include "application/StrategySelector.hpp"
#include "application/TransactionNormalizer.hpp"
#include "domain/AccountProfile.hpp"
#include "domain/EngineSettings.hpp"
#include "domain/ExtractionStrategy.hpp"
#include "domain/Invoice.hpp"
#include "domain/StatementSummary.hpp"

namespace ledgerwalker::application {

/**
 * @struct EngineRequest
 * @brief One statement to parse plus everything the caller knows about it.
 */
struct EngineRequest {
    std::string text;
    std::optional<std::string> bankHint;
    std::optional<domain::AccountType> accountType;   ///< Type currently on record for the account.
    std::optional<std::string> knownBankName;         ///< Bank currently on record for the account.
    std::optional<domain::AccountMetadata> accountMetadata;
    std::vector<domain::InvoiceCandidate> invoiceCandidates;
    std::optional<InvoiceWindow> periodOverride;
    std::optional<domain::AdvisoryClassification> advisory;
    std::optional<nlohmann::json> candidateRows;      ///< Pre-structured rows; replaces text extraction.
};

enum class IssueSeverity {
    Warning,
    Error
};

inline std::string ToString(IssueSeverity s) {
    return s == IssueSeverity::Error ? "error" : "warning";
}

/**
 * @struct EngineIssue
 * @brief Flag for a human reviewer. Only AllStrategiesFailed stops the statement.
 */
struct EngineIssue {
    std::string code;    ///< ExtractionEmpty, AllStrategiesFailed, PartialQuality, ReconciliationMismatch, AmbiguousMSIMatch.
    IssueSeverity severity = IssueSeverity::Warning;
    std::string message;
};

/**
 * @struct EngineResponse
 * @brief Ledger rows, summary, installment matches and diagnostics of one parse.
 */
struct EngineResponse {
    std::vector<domain::Transaction> transactions;
    domain::StatementSummary summary;
    std::vector<domain::MatchResult> matches;
    nlohmann::json diagnostics = nlohmann::json::object();
    std::vector<EngineIssue> issues;
    std::optional<domain::AccountProfileUpdate> profileUpdate;
    std::optional<domain::AccountMetadata> accountMetadata;
    domain::AccountClassification classification;
    bool statementProduced = true;

    bool hasIssue(const std::string& code) const;
};

/**
 * @class StatementEngine
 * @brief Stateless pipeline; parse() may run concurrently for different statements.
 *
 * Text goes classifier -> rule resolution -> strategy selection -> normalizer ->
 * reconciler -> MSI matcher (credit cards only). Pre-structured rows skip the
 * text strategies and go through the tabular strategy instead.
 */
class StatementEngine {
public:
    /**
     * @param textStrategies Text strategies in priority order; empty selects Standard, Universal, Adaptive, BruteForce.
     * @param scorer Quality function; empty selects QualityScorer.
     */
    StatementEngine(RuleProvider rules, domain::EngineSettings settings = {},
                    std::vector<std::shared_ptr<const domain::ExtractionStrategy>> textStrategies = {},
                    StrategySelector::ScoreFunction scorer = {});

    StatementEngine(const StatementEngine&) = delete;
    StatementEngine& operator=(const StatementEngine&) = delete;

    EngineResponse parse(const EngineRequest& request) const;

    const domain::EngineSettings& settings() const { return m_settings; }
    const RuleProvider& rules() const { return m_rules; }

    /** @brief Standard, Universal, Adaptive and BruteForce in priority order. */
    static std::vector<std::shared_ptr<const domain::ExtractionStrategy>> DefaultStrategies(
        const domain::EngineSettings& settings);

private:
    static nlohmann::json SelectionDiagnostics(const SelectionResult& selection);

    RuleProvider m_rules;
    domain::EngineSettings m_settings;
    AccountClassifier m_classifier;
    StrategySelector m_textSelector;
    StrategySelector m_tabularSelector;
    TransactionNormalizer m_normalizer;
    BalanceReconciler m_reconciler;
    MsiMatcher m_matcher;
};

} // namespace ledgerwalker::application
