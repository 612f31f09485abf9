/**
 * @file QualityScorer.hpp
 * @brief Heuristic quality score of a candidate transaction list.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Transaction.hpp"

namespace ledgerwalker::application {

/**
 * @class QualityScorer
 * @brief score = 0.3*min(count/50,1) + 0.2*openingMarker + 0.2*min(distinctPrefixes/20,1)
 *              + 0.15*validAmountRatio + 0.15*validDateRatio
 */
class QualityScorer {
public:
    struct Breakdown {
        double countFactor = 0.0;
        bool openingMarker = false;
        double diversityFactor = 0.0;
        double validAmountRatio = 0.0;
        double validDateRatio = 0.0;
        double total = 0.0;
    };

    explicit QualityScorer(double amountCeiling = 1000000.0) : m_amountCeiling(amountCeiling) {}

    double score(const std::vector<domain::Transaction>& transactions, const std::string& rawText) const;
    Breakdown breakdown(const std::vector<domain::Transaction>& transactions, const std::string& rawText) const;

private:
    double m_amountCeiling;
};

} // namespace ledgerwalker::application
