/**
 * @file EngineSettings.hpp
 * @brief Tunable thresholds of the parsing engine (settings.json).
 */

#pragma once
#include <string>

namespace ledgerwalker::domain {

/**
 * @struct EngineSettings
 * @brief Every heuristic threshold the engine uses, with the historical defaults.
 */
struct EngineSettings {
    double unrealisticAmountCeiling = 1000000.0;  ///< Rows above this magnitude are dropped.
    double msiMatchTolerance = 0.02;              ///< Relative tolerance charge vs installment amount.
    double msiMonthsTolerance = 0.03;             ///< Relative tolerance when inferring the month count.
    double reconciliationTolerance = 0.5;         ///< Currency units.
    double earlyExitScore = 0.9;
    int earlyExitMinCount = 10;                   ///< Early exit needs strictly more rows than this.
    double completionThreshold = 0.5;             ///< Below this the best parse is flagged PartialQuality.
    int msiLookbackDays = 30;
    int msiLookaheadDays = 7;
    int adaptiveSampleSize = 50;
    int adaptiveMinSamples = 3;
    bool parallelStrategies = false;
    std::string bankRulesPath = "config/bank_rules.json";
};

} // namespace ledgerwalker::domain
