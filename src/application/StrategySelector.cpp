/**
 * @file StrategySelector.cpp
 * @brief Implementation of StrategySelector.
 */

#include "application/StrategySelector.hpp"
#include <future>
#include <iostream>

namespace ledgerwalker::application {

StrategySelector::StrategySelector(std::vector<std::shared_ptr<const domain::ExtractionStrategy>> strategies,
                                   ScoreFunction scorer, SelectionPolicy policy)
    : m_strategies(std::move(strategies)), m_scorer(std::move(scorer)), m_policy(policy) {}

std::pair<StrategyOutcome, std::vector<domain::Transaction>> StrategySelector::attempt(
    const domain::ExtractionStrategy& strategy, const std::string& text, const domain::RuleSet& rules) const {
    StrategyOutcome outcome;
    outcome.name = strategy.name();
    outcome.ran = true;
    try {
        domain::StrategyResult result = strategy.run(text, rules);
        outcome.metadata = std::move(result.metadata);
        if (result.failed()) {
            outcome.failed = true;
            outcome.error = *result.error;
            return {outcome, {}};
        }
        outcome.transactionCount = result.transactions.size();
        outcome.score = m_scorer ? m_scorer(result.transactions, text) : 0.0;
        return {outcome, std::move(result.transactions)};
    } catch (const std::exception& e) {
        outcome.failed = true;
        outcome.error = e.what();
        return {outcome, {}};
    }
}

bool StrategySelector::fold(SelectionResult& result, StrategyOutcome outcome,
                            std::vector<domain::Transaction> transactions) const {
    if (outcome.failed) {
        std::cerr << "[StrategySelector] Strategy '" << outcome.name << "' failed: " << outcome.error << std::endl;
    } else {
        std::clog << "[StrategySelector] Strategy '" << outcome.name << "': " << outcome.transactionCount
                  << " transactions, score " << outcome.score << std::endl;
    }

    bool stop = false;
    if (!outcome.failed && outcome.score > result.bestScore) {
        result.bestScore = outcome.score;
        result.selectedStrategy = outcome.name;
        result.selectedMetadata = outcome.metadata;
        result.transactions = std::move(transactions);
    }
    if (!outcome.failed && outcome.score >= m_policy.earlyExitScore &&
        static_cast<int>(outcome.transactionCount) > m_policy.earlyExitMinCount) {
        stop = true;
    }
    result.outcomes.push_back(std::move(outcome));
    return stop;
}

SelectionResult StrategySelector::select(const std::string& text, const domain::RuleSet& rules) const {
    SelectionResult result;
    std::size_t next = 0;

    if (m_policy.parallel) {
        std::vector<std::future<std::pair<StrategyOutcome, std::vector<domain::Transaction>>>> futures;
        for (const auto& strategy : m_strategies) {
            futures.push_back(std::async(std::launch::async, [this, strategy, &text, &rules]() {
                return attempt(*strategy, text, rules);
            }));
        }
        // Folding in priority order keeps the winner identical to the sequential chain.
        for (; next < futures.size(); ++next) {
            auto [outcome, transactions] = futures[next].get();
            if (fold(result, std::move(outcome), std::move(transactions))) {
                result.earlyExit = true;
                ++next;
                break;
            }
        }
        for (; next < futures.size(); ++next) {
            auto [outcome, transactions] = futures[next].get();
            outcome.metadata["after_early_exit"] = true;
            result.outcomes.push_back(std::move(outcome));
        }
    } else {
        for (; next < m_strategies.size(); ++next) {
            auto [outcome, transactions] = attempt(*m_strategies[next], text, rules);
            if (fold(result, std::move(outcome), std::move(transactions))) {
                result.earlyExit = true;
                ++next;
                break;
            }
        }
    }

    for (; next < m_strategies.size(); ++next) {
        StrategyOutcome skipped;
        skipped.name = m_strategies[next]->name();
        result.outcomes.push_back(std::move(skipped));
    }

    if (result.allFailed()) {
        std::cerr << "[StrategySelector] all_strategies_failed" << std::endl;
    } else {
        std::clog << "[StrategySelector] Selected '" << *result.selectedStrategy << "' with score " << result.bestScore
                  << (result.earlyExit ? " (early exit)" : "") << std::endl;
    }
    return result;
}

} // namespace ledgerwalker::application
