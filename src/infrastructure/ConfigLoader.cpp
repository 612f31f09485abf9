/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace ledgerwalker::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

} // namespace

domain::EngineSettings ConfigLoader::FromJson(const nlohmann::json& j) {
    domain::EngineSettings settings;
    if (!j.is_object()) return settings;
    ReadKey(j, "unrealistic_amount_ceiling", settings.unrealisticAmountCeiling);
    ReadKey(j, "msi_match_tolerance", settings.msiMatchTolerance);
    ReadKey(j, "msi_months_tolerance", settings.msiMonthsTolerance);
    ReadKey(j, "reconciliation_tolerance", settings.reconciliationTolerance);
    ReadKey(j, "early_exit_score", settings.earlyExitScore);
    ReadKey(j, "early_exit_min_count", settings.earlyExitMinCount);
    ReadKey(j, "completion_threshold", settings.completionThreshold);
    ReadKey(j, "msi_lookback_days", settings.msiLookbackDays);
    ReadKey(j, "msi_lookahead_days", settings.msiLookaheadDays);
    ReadKey(j, "adaptive_sample_size", settings.adaptiveSampleSize);
    ReadKey(j, "adaptive_min_samples", settings.adaptiveMinSamples);
    ReadKey(j, "parallel_strategies", settings.parallelStrategies);
    ReadKey(j, "bank_rules_path", settings.bankRulesPath);
    return settings;
}

nlohmann::json ConfigLoader::ToJson(const domain::EngineSettings& settings) {
    return {
        {"unrealistic_amount_ceiling", settings.unrealisticAmountCeiling},
        {"msi_match_tolerance", settings.msiMatchTolerance},
        {"msi_months_tolerance", settings.msiMonthsTolerance},
        {"reconciliation_tolerance", settings.reconciliationTolerance},
        {"early_exit_score", settings.earlyExitScore},
        {"early_exit_min_count", settings.earlyExitMinCount},
        {"completion_threshold", settings.completionThreshold},
        {"msi_lookback_days", settings.msiLookbackDays},
        {"msi_lookahead_days", settings.msiLookaheadDays},
        {"adaptive_sample_size", settings.adaptiveSampleSize},
        {"adaptive_min_samples", settings.adaptiveMinSamples},
        {"parallel_strategies", settings.parallelStrategies},
        {"bank_rules_path", settings.bankRulesPath}
    };
}

domain::EngineSettings ConfigLoader::LoadSettings(const std::string& path) {
    std::filesystem::path configPath(path);
    if (!std::filesystem::exists(configPath)) {
        return {};
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }

    return {};
}

} // namespace ledgerwalker::infrastructure
