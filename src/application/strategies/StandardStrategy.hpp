/**
 * @file StandardStrategy.hpp
 * @brief Fixed line layouts of the common Mexican statement formats.
 */

#pragma once
#include "application/strategies/LineScanningStrategy.hpp"

namespace ledgerwalker::application::strategies {

/**
 * @class StandardStrategy
 * @brief First strategy of the chain: precise layouts, first matching layout wins per line.
 *
 * Layouts, in order: balance carry, MMM DD + reference + description + amount + balance,
 * MMM DD + description + amount + balance, MMM DD + description + amount,
 * DD/MM/YYYY + description + amounts.
 */
class StandardStrategy : public LineScanningStrategy {
public:
    std::string name() const override { return "standard"; }

protected:
    ScanPlan plan(const std::vector<std::string>& lines, const domain::RuleSet& rules,
                  nlohmann::json& metadata) const override;
    double rowConfidence() const override { return 0.9; }
};

} // namespace ledgerwalker::application::strategies
