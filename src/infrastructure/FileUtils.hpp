/**
 * @file FileUtils.hpp
 * @brief Whole-file readers used at the CLI boundary.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace ledgerwalker::infrastructure {

class FileUtils {
public:
    /** @brief Reads a file as bytes. Throws std::runtime_error when it cannot be opened. */
    static std::string ReadText(const std::string& path);

    /** @brief Reads and parses a JSON file. Throws std::runtime_error on I/O or parse errors. */
    static nlohmann::json ReadJson(const std::string& path);
};

} // namespace ledgerwalker::infrastructure
