/**
 * @file ExtractionStrategy.hpp
 * @brief Interface for algorithms turning statement text into candidate transactions.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/RuleSet.hpp"
#include "domain/Transaction.hpp"

namespace ledgerwalker::domain {

/**
 * @struct StrategyResult
 * @brief Candidate rows plus free-form diagnostics. An empty list with an error means failure.
 */
struct StrategyResult {
    std::vector<Transaction> transactions;
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<std::string> error;

    bool failed() const { return error.has_value(); }
};

/**
 * @class ExtractionStrategy
 * @brief Abstract extraction algorithm. Implementations are stateless and thread-safe.
 */
class ExtractionStrategy {
public:
    virtual ~ExtractionStrategy() = default;

    /** @brief Stable identifier used in diagnostics ("standard", "universal"...). */
    virtual std::string name() const = 0;

    /**
     * @brief Extracts candidate transactions.
     * @param text Statement text as produced by the extraction layer.
     * @param rules Rules resolved for the statement's bank.
     * @return Result; failures are reported in StrategyResult::error, never thrown.
     */
    virtual StrategyResult run(const std::string& text, const RuleSet& rules) const = 0;
};

} // namespace ledgerwalker::domain
