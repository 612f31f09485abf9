/**
 * @file StrategySelector.hpp
 * @brief Runs extraction strategies in priority order and keeps the best scoring result.
 */

#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/ExtractionStrategy.hpp"

namespace ledgerwalker::application {

/**
 * @struct StrategyOutcome
 * @brief Diagnostics of one strategy attempt.
 */
struct StrategyOutcome {
    std::string name;
    bool ran = false;             ///< False when skipped by early exit.
    bool failed = false;          ///< Reported an error or threw.
    std::string error;
    double score = 0.0;
    std::size_t transactionCount = 0;
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @struct SelectionResult
 * @brief Winning transactions plus one outcome per configured strategy.
 */
struct SelectionResult {
    std::optional<std::string> selectedStrategy;
    std::vector<domain::Transaction> transactions;
    nlohmann::json selectedMetadata = nlohmann::json::object();
    double bestScore = 0.0;
    bool earlyExit = false;
    std::vector<StrategyOutcome> outcomes;

    /** @brief Every strategy scored 0 or failed. */
    bool allFailed() const { return !selectedStrategy.has_value(); }
};

/**
 * @struct SelectionPolicy
 * @brief Early-exit threshold and dispatch mode.
 */
struct SelectionPolicy {
    double earlyExitScore = 0.9;
    int earlyExitMinCount = 10;
    bool parallel = false;   ///< Dispatch all strategies at once; results are still folded in priority order.
};

/**
 * @class StrategySelector
 * @brief Fallback chain over ExtractionStrategy implementations.
 *
 * A result replaces the running best only when it scores strictly higher, so ties
 * go to the higher priority strategy. The chain stops once a result reaches
 * earlyExitScore with more than earlyExitMinCount rows.
 */
class StrategySelector {
public:
    using ScoreFunction = std::function<double(const std::vector<domain::Transaction>&, const std::string&)>;

    StrategySelector(std::vector<std::shared_ptr<const domain::ExtractionStrategy>> strategies, ScoreFunction scorer,
                     SelectionPolicy policy = {});

    SelectionResult select(const std::string& text, const domain::RuleSet& rules) const;

private:
    /** @brief Runs one strategy, turning exceptions into a failed outcome. */
    std::pair<StrategyOutcome, std::vector<domain::Transaction>> attempt(const domain::ExtractionStrategy& strategy,
                                                                          const std::string& text,
                                                                          const domain::RuleSet& rules) const;

    /** @brief Folds one outcome into the running best. Returns true when the chain can stop. */
    bool fold(SelectionResult& result, StrategyOutcome outcome, std::vector<domain::Transaction> transactions) const;

    std::vector<std::shared_ptr<const domain::ExtractionStrategy>> m_strategies;
    ScoreFunction m_scorer;
    SelectionPolicy m_policy;
};

} // namespace ledgerwalker::application
