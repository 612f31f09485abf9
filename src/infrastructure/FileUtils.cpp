/**
 * @file FileUtils.cpp
 * @brief Implementation of FileUtils.
 */

#include "infrastructure/FileUtils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace ledgerwalker::infrastructure {

std::string FileUtils::ReadText(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

nlohmann::json FileUtils::ReadJson(const std::string& path) {
    const std::string content = ReadText(path);
    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

} // namespace ledgerwalker::infrastructure
