/**
 * @file UniversalStrategy.hpp
 * @brief Loose pattern family for banks without a precise standard layout.
 */

#pragma once
#include "application/strategies/LineScanningStrategy.hpp"

namespace ledgerwalker::application::strategies {

/**
 * @class UniversalStrategy
 * @brief Bank-configured line patterns first, then flexible layouts tolerating full
 * month names, day-first dates, glued day+reference and decimal commas.
 */
class UniversalStrategy : public LineScanningStrategy {
public:
    std::string name() const override { return "universal"; }

protected:
    ScanPlan plan(const std::vector<std::string>& lines, const domain::RuleSet& rules,
                  nlohmann::json& metadata) const override;
    double rowConfidence() const override { return 0.8; }
};

} // namespace ledgerwalker::application::strategies
