/**
 * @file AdaptiveStrategy.hpp
 * @brief Synthesizes one line regex from a sample of probable transaction lines.
 */

#pragma once
#include "application/strategies/LineScanningStrategy.hpp"

namespace ledgerwalker::application::strategies {

/**
 * @class AdaptiveStrategy
 * @brief Samples lines holding a month token and longer than 30 characters, infers
 * the layout (date order, reference column, amount columns) and applies the derived
 * regex to the whole document.
 */
class AdaptiveStrategy : public LineScanningStrategy {
public:
    /**
     * @param sampleSize Maximum number of sampled lines.
     * @param minSamples Fewer samples than this fails the run.
     */
    explicit AdaptiveStrategy(int sampleSize = 50, int minSamples = 3)
        : m_sampleSize(sampleSize), m_minSamples(minSamples) {}

    std::string name() const override { return "adaptive"; }

    /**
     * @brief The regex the strategy would apply to these lines.
     * @return Empty when there are not enough samples.
     */
    std::string synthesizePattern(const std::vector<std::string>& lines, nlohmann::json* layout = nullptr) const;

protected:
    ScanPlan plan(const std::vector<std::string>& lines, const domain::RuleSet& rules,
                  nlohmann::json& metadata) const override;
    double rowConfidence() const override { return 0.7; }

private:
    int m_sampleSize;
    int m_minSamples;
};

} // namespace ledgerwalker::application::strategies
