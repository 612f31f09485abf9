/**
 * @file BruteForceStrategy.hpp
 * @brief Last-resort permissive patterns.
 */

#pragma once
#include "application/strategies/LineScanningStrategy.hpp"

namespace ledgerwalker::application::strategies {

/**
 * @class BruteForceStrategy
 * @brief Three-letter month + day + free text + one or two numbers, searched anywhere in
 * lines of at least 20 characters.
 */
class BruteForceStrategy : public LineScanningStrategy {
public:
    std::string name() const override { return "brute_force"; }

protected:
    ScanPlan plan(const std::vector<std::string>& lines, const domain::RuleSet& rules,
                  nlohmann::json& metadata) const override;
    double rowConfidence() const override { return 0.6; }
};

} // namespace ledgerwalker::application::strategies
