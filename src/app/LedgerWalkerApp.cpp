/**
 * @file LedgerWalkerApp.cpp
 * @brief Implementation of LedgerWalkerApp.
 */

#include "app/LedgerWalkerApp.hpp"
#include "application/StatementEngine.hpp"
#include "infrastructure/BankRuleCatalogLoader.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileUtils.hpp"
#include "infrastructure/JsonCodec.hpp"
#include <iostream>
#include <stdexcept>

namespace ledgerwalker::app {

std::string LedgerWalkerApp::Usage() {
    return "Usage: ledgerwalker --text <statement.txt> [--request <request.json>] [--settings <settings.json>]\n"
           "                    [--rules <bank_rules.json>] [--rows <rows.json>] [--pretty]\n";
}

CliOptions LedgerWalkerApp::ParseArgs(const std::vector<std::string>& args) {
    CliOptions options;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= args.size()) {
                throw std::runtime_error("Missing value for " + flag);
            }
            return args[++i];
        };

        if (flag == "--text") options.textPath = value();
        else if (flag == "--request") options.requestPath = value();
        else if (flag == "--settings") options.settingsPath = value();
        else if (flag == "--rules") options.rulesPath = value();
        else if (flag == "--rows") options.rowsPath = value();
        else if (flag == "--pretty") options.pretty = true;
        else if (flag == "-h" || flag == "--help") options.help = true;
        else throw std::runtime_error("Unknown argument: " + flag);
    }
    if (!options.help && !options.textPath && !options.requestPath && !options.rowsPath) {
        throw std::runtime_error("Nothing to parse: pass --text, --request or --rows");
    }
    return options;
}

int LedgerWalkerApp::Run(int argc, char** argv) {
    try {
        const CliOptions options = ParseArgs(std::vector<std::string>(argv + 1, argv + argc));
        if (options.help) {
            std::cout << Usage();
            return kExitOk;
        }

        domain::EngineSettings settings = infrastructure::ConfigLoader::LoadSettings(
            options.settingsPath.value_or("config/settings.json"));
        if (options.rulesPath) settings.bankRulesPath = *options.rulesPath;

        application::EngineRequest request;
        if (options.requestPath) {
            request = infrastructure::JsonCodec::RequestFromJson(infrastructure::FileUtils::ReadJson(*options.requestPath));
        }
        if (options.textPath) request.text = infrastructure::FileUtils::ReadText(*options.textPath);
        if (options.rowsPath) request.candidateRows = infrastructure::FileUtils::ReadJson(*options.rowsPath);

        application::StatementEngine engine(infrastructure::BankRuleCatalogLoader::Load(settings.bankRulesPath), settings);
        const application::EngineResponse response = engine.parse(request);

        std::cout << infrastructure::JsonCodec::ToJson(response).dump(options.pretty ? 2 : -1) << std::endl;
        return response.hasIssue("AllStrategiesFailed") ? kExitExtractionFailed : kExitOk;
    } catch (const std::exception& e) {
        std::cerr << "[LedgerWalker] " << e.what() << std::endl;
        std::cerr << Usage();
        return kExitInputError;
    }
}

} // namespace ledgerwalker::app
