/**
 * @file LedgerWalkerApp.hpp
 * @brief Command line front end of the statement engine.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ledgerwalker::app {

/**
 * @struct CliOptions
 * @brief Parsed command line.
 */
struct CliOptions {
    std::optional<std::string> textPath;      ///< Statement text extracted from the PDF.
    std::optional<std::string> requestPath;   ///< Request JSON (hints, invoices, advisory...).
    std::optional<std::string> settingsPath;
    std::optional<std::string> rulesPath;     ///< Overrides bank_rules_path from the settings.
    std::optional<std::string> rowsPath;      ///< Pre-structured candidate rows.
    bool pretty = false;
    bool help = false;
};

/**
 * @class LedgerWalkerApp
 * @brief Loads configuration, runs one parse and prints the response as JSON on stdout.
 */
class LedgerWalkerApp {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitInputError = 1;       ///< Unreadable file or malformed JSON.
    static constexpr int kExitExtractionFailed = 2; ///< AllStrategiesFailed.

    /**
     * @brief Runs the CLI.
     * @return Process exit code.
     */
    int Run(int argc, char** argv);

    /** @brief Parses arguments. Throws std::runtime_error on unknown flags or missing values. */
    static CliOptions ParseArgs(const std::vector<std::string>& args);

    static std::string Usage();
};

} // namespace ledgerwalker::app
