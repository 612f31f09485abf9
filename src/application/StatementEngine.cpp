/**
 * @file StatementEngine.cpp
 * @brief Implementation of the StatementEngine pipeline.
 */

#include "application/StatementEngine.hpp"
#include "application/QualityScorer.hpp"
#include "application/strategies/AdaptiveStrategy.hpp"
#include "application/strategies/BruteForceStrategy.hpp"
#include "application/strategies/StandardStrategy.hpp"
#include "application/strategies/TabularCandidateStrategy.hpp"
#include "application/strategies/UniversalStrategy.hpp"
#include "domain/StatementHeader.hpp"
#include "domain/StatementText.hpp"
#include <algorithm>
#include <iostream>

namespace ledgerwalker::application {

namespace {

StrategySelector::ScoreFunction DefaultScorer(double ceiling) {
    QualityScorer scorer(ceiling);
    return [scorer](const std::vector<domain::Transaction>& transactions, const std::string& rawText) {
        return scorer.score(transactions, rawText);
    };
}

SelectionPolicy PolicyFrom(const domain::EngineSettings& settings) {
    SelectionPolicy policy;
    policy.earlyExitScore = settings.earlyExitScore;
    policy.earlyExitMinCount = settings.earlyExitMinCount;
    policy.parallel = settings.parallelStrategies;
    return policy;
}

MsiPolicy MsiPolicyFrom(const domain::EngineSettings& settings) {
    MsiPolicy policy;
    policy.matchTolerance = settings.msiMatchTolerance;
    policy.monthsTolerance = settings.msiMonthsTolerance;
    policy.lookbackDays = settings.msiLookbackDays;
    policy.lookaheadDays = settings.msiLookaheadDays;
    return policy;
}

bool HasCandidateRows(const std::optional<nlohmann::json>& rows) {
    if (!rows || rows->is_null()) return false;
    if (rows->is_array()) return !rows->empty();
    if (rows->is_object() && rows->contains("rows")) return !(*rows)["rows"].empty();
    return true;
}

} // namespace

bool EngineResponse::hasIssue(const std::string& code) const {
    return std::any_of(issues.begin(), issues.end(), [&code](const EngineIssue& issue) { return issue.code == code; });
}

std::vector<std::shared_ptr<const domain::ExtractionStrategy>> StatementEngine::DefaultStrategies(
    const domain::EngineSettings& settings) {
    return {
        std::make_shared<strategies::StandardStrategy>(),
        std::make_shared<strategies::UniversalStrategy>(),
        std::make_shared<strategies::AdaptiveStrategy>(settings.adaptiveSampleSize, settings.adaptiveMinSamples),
        std::make_shared<strategies::BruteForceStrategy>()
    };
}

StatementEngine::StatementEngine(RuleProvider rules, domain::EngineSettings settings,
                                 std::vector<std::shared_ptr<const domain::ExtractionStrategy>> textStrategies,
                                 StrategySelector::ScoreFunction scorer)
    : m_rules(std::move(rules)),
      m_settings(std::move(settings)),
      m_classifier(m_rules),
      m_textSelector(textStrategies.empty() ? DefaultStrategies(m_settings) : std::move(textStrategies),
                     scorer ? scorer : DefaultScorer(m_settings.unrealisticAmountCeiling), PolicyFrom(m_settings)),
      m_tabularSelector({std::make_shared<strategies::TabularCandidateStrategy>()},
                        scorer ? scorer : DefaultScorer(m_settings.unrealisticAmountCeiling), PolicyFrom(m_settings)),
      m_normalizer(m_settings.unrealisticAmountCeiling),
      m_reconciler(m_settings.reconciliationTolerance),
      m_matcher(MsiPolicyFrom(m_settings)) {}

nlohmann::json StatementEngine::SelectionDiagnostics(const SelectionResult& selection) {
    nlohmann::json scores = nlohmann::json::array();
    for (const auto& outcome : selection.outcomes) {
        nlohmann::json entry = {
            {"name", outcome.name},
            {"ran", outcome.ran},
            {"failed", outcome.failed},
            {"score", outcome.score},
            {"transactions", outcome.transactionCount},
            {"metadata", outcome.metadata}
        };
        if (!outcome.error.empty()) entry["error"] = outcome.error;
        scores.push_back(std::move(entry));
    }
    return scores;
}

EngineResponse StatementEngine::parse(const EngineRequest& request) const {
    EngineResponse response;
    response.accountMetadata = request.accountMetadata;

    const bool tabular = HasCandidateRows(request.candidateRows);
    const auto header = domain::StatementHeader::Scan(request.text);

    ClassificationInput classificationInput;
    classificationInput.bankHint = request.bankHint;
    classificationInput.knownProfile.accountType = request.accountType;
    classificationInput.knownProfile.bankName = request.knownBankName;
    classificationInput.advisory = request.advisory;
    response.classification = m_classifier.classify(request.text, classificationInput);
    response.profileUpdate = response.classification.profileUpdate;
    const auto& classification = response.classification;

    auto& diagnostics = response.diagnostics;
    diagnostics["bank"] = classification.bankName;
    diagnostics["bank_id"] = classification.bankId;
    diagnostics["account_type"] = domain::ToString(classification.accountType);
    diagnostics["classification_source"] = domain::ToString(classification.source);
    diagnostics["classification_confidence"] = classification.confidence;
    diagnostics["year_hint"] = header.yearHint;
    diagnostics["catalog_version"] = m_rules.catalogVersion();
    diagnostics["input"] = tabular ? "rows" : "text";

    if (!tabular && domain::text::Trim(request.text).empty()) {
        response.issues.push_back({"ExtractionEmpty", IssueSeverity::Error, "Statement text is empty"});
        response.summary.detectedBank = classification.bankName;
        diagnostics["selected_strategy"] = nullptr;
        diagnostics["strategy_scores"] = nlohmann::json::array();
        diagnostics["reconciliation_status"] = domain::ToString(response.summary.reconciliationStatus);
        std::cerr << "[StatementEngine] Empty statement text" << std::endl;
        return response;
    }

    const domain::RuleSet rules = m_rules.resolve(classification.bankId);
    const std::string input = tabular ? request.candidateRows->dump() : request.text;
    const SelectionResult selection = (tabular ? m_tabularSelector : m_textSelector).select(input, rules);

    diagnostics["strategy_scores"] = SelectionDiagnostics(selection);
    diagnostics["selected_strategy"] = selection.selectedStrategy ? nlohmann::json(*selection.selectedStrategy) : nlohmann::json();
    diagnostics["best_score"] = selection.bestScore;
    diagnostics["early_exit"] = selection.earlyExit;

    if (selection.allFailed()) {
        response.statementProduced = false;
        response.issues.push_back({"AllStrategiesFailed", IssueSeverity::Error,
                                   "No extraction strategy produced a usable result; manual review required"});
        diagnostics["reconciliation_status"] = domain::ToString(response.summary.reconciliationStatus);
        std::cerr << "[StatementEngine] All strategies failed" << std::endl;
        return response;
    }
    if (selection.bestScore < m_settings.completionThreshold) {
        response.issues.push_back({"PartialQuality", IssueSeverity::Warning,
                                   "Best strategy '" + *selection.selectedStrategy + "' scored " +
                                       domain::text::FormatAmount(selection.bestScore)});
    }

    NormalizationResult normalized = m_normalizer.normalize(selection.transactions, rules);
    diagnostics["normalization"] = {
        {"rejected_zero", normalized.rejectedZero},
        {"rejected_ceiling", normalized.rejectedCeiling},
        {"rejected_skip", normalized.rejectedSkip},
        {"merged_duplicates", normalized.mergedDuplicates},
        {"merged_continuation_lines", normalized.mergedContinuationLines}
    };

    BalanceHints hints;
    hints.openingBalance = normalized.openingCarry ? normalized.openingCarry : header.openingBalance;
    hints.closingBalance = normalized.closingCarry ? normalized.closingCarry : header.closingBalance;
    if (request.periodOverride) {
        hints.periodStart = request.periodOverride->start;
        hints.periodEnd = request.periodOverride->end;
    } else {
        hints.periodStart = header.periodStart;
        hints.periodEnd = header.periodEnd;
    }
    hints.detectedBank = classification.bankName;

    response.transactions = std::move(normalized.transactions);
    response.summary = m_reconciler.reconcile(response.transactions, hints);
    diagnostics["reconciliation_status"] = domain::ToString(response.summary.reconciliationStatus);

    if (response.summary.reconciliationStatus == domain::ReconciliationStatus::Mismatch) {
        response.issues.push_back({"ReconciliationMismatch", IssueSeverity::Warning,
                                   "Opening + credits - debits differs from closing by " +
                                       domain::text::FormatAmount(response.summary.reconciliationDifference.value_or(0.0))});
    }

    if (classification.msiEligible() && !request.invoiceCandidates.empty()) {
        response.matches = m_matcher.match(response.transactions, request.invoiceCandidates, request.periodOverride);
        const auto ambiguous = std::count_if(response.matches.begin(), response.matches.end(),
                                             [](const domain::MatchResult& m) { return m.ambiguous; });
        if (ambiguous > 0) {
            response.issues.push_back({"AmbiguousMSIMatch", IssueSeverity::Warning,
                                       std::to_string(ambiguous) + " charges match several invoices"});
        }
    }
    diagnostics["msi_enabled"] = classification.msiEligible();

    std::clog << "[StatementEngine] " << response.transactions.size() << " transactions via "
              << *selection.selectedStrategy << ", reconciliation "
              << domain::ToString(response.summary.reconciliationStatus) << std::endl;
    return response;
}

} // namespace ledgerwalker::application
