/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading engine configuration (settings.json).
 *
 * Provides a single place for the tunable thresholds so JSON parsing logic is
 * not scattered through the engine.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/EngineSettings.hpp"

namespace ledgerwalker::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json.
     * @param path Path of the settings file.
     * @return Defaults when the file is missing or unreadable; keys absent from the file keep their default.
     */
    static domain::EngineSettings LoadSettings(const std::string& path);

    /** @brief Applies the keys present in a settings object over the defaults. */
    static domain::EngineSettings FromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::EngineSettings& settings);
};

} // namespace ledgerwalker::infrastructure
