/**
 * @file JsonCodec.hpp
 * @brief JSON mapping of engine requests and responses.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "application/StatementEngine.hpp"

namespace ledgerwalker::infrastructure {

/**
 * @class JsonCodec
 * @brief snake_case JSON for the engine boundary. Dates are ISO "YYYY-MM-DD".
 */
class JsonCodec {
public:
    /** @brief Throws std::runtime_error on missing or malformed fields. */
    static application::EngineRequest RequestFromJson(const nlohmann::json& j);

    static domain::InvoiceCandidate InvoiceFromJson(const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::Transaction& transaction);
    static nlohmann::json ToJson(const domain::StatementSummary& summary);
    static nlohmann::json ToJson(const domain::MatchResult& match);
    static nlohmann::json ToJson(const application::EngineResponse& response);
};

} // namespace ledgerwalker::infrastructure
