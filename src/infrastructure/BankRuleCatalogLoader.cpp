/**
 * @file BankRuleCatalogLoader.cpp
 * @brief Implementation of BankRuleCatalogLoader.
 */

#include "infrastructure/BankRuleCatalogLoader.hpp"
#include "infrastructure/FileUtils.hpp"
#include <filesystem>
#include <iostream>
#include <regex>
#include <stdexcept>

namespace ledgerwalker::infrastructure {

namespace {

void Warn(std::vector<std::string>* warnings, const std::string& message) {
    std::cerr << "[BankRuleCatalogLoader] " << message << std::endl;
    if (warnings) warnings->push_back(message);
}

std::vector<std::string> StringList(const nlohmann::json& record, const char* key) {
    std::vector<std::string> values;
    if (!record.contains(key)) return values;
    const auto& node = record[key];
    if (node.is_string()) {
        values.push_back(node.get<std::string>());
    } else if (node.is_array()) {
        for (const auto& item : node) {
            if (item.is_string()) values.push_back(item.get<std::string>());
        }
    }
    return values;
}

std::optional<bool> OptionalFlag(const nlohmann::json& record, const char* key) {
    if (!record.contains(key) || !record[key].is_boolean()) return std::nullopt;
    return record[key].get<bool>();
}

std::shared_ptr<const std::regex> TryCompile(const std::string& bankId, const std::string& source,
                                             std::vector<std::string>* warnings) {
    try {
        return std::make_shared<const std::regex>(source, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        Warn(warnings, "Skipping pattern of '" + bankId + "' (" + source + "): " + e.what());
        return nullptr;
    }
}

} // namespace

domain::BankRuleOverride BankRuleCatalogLoader::ParseBank(const std::string& bankId, const nlohmann::json& record,
                                                          std::vector<std::string>* warnings) {
    if (!record.is_object()) {
        throw std::runtime_error("Bank record '" + bankId + "' is not an object");
    }

    domain::BankRuleOverride bank;
    bank.bankId = bankId;
    bank.displayName = record.value("display_name", bankId);
    bank.aliases = StringList(record, "aliases");
    bank.creditKeywords = StringList(record, "credit_keywords");
    bank.debitKeywords = StringList(record, "debit_keywords");
    bank.skipKeywords = StringList(record, "skip_patterns");
    bank.preferFirstAmount = OptionalFlag(record, "prefer_first_amount");
    bank.hasRunningBalanceColumn = OptionalFlag(record, "has_running_balance_column");
    bank.mergeMultilineConcepts = OptionalFlag(record, "merge_multiline_concepts");

    for (const auto& source : StringList(record, "amount_patterns")) {
        if (auto regex = TryCompile(bankId, source, warnings)) {
            bank.amountPatterns.push_back(domain::AmountPattern{source, regex});
        }
    }

    if (record.contains("transaction_line_patterns") && record["transaction_line_patterns"].is_array()) {
        for (const auto& node : record["transaction_line_patterns"]) {
            domain::LinePattern pattern;
            if (node.is_string()) {
                pattern.source = node.get<std::string>();
            } else if (node.is_object() && node.contains("regex") && node["regex"].is_string()) {
                pattern.source = node["regex"].get<std::string>();
                pattern.dateGroup = node.value("date", pattern.dateGroup);
                pattern.descriptionGroup = node.value("description", pattern.descriptionGroup);
                pattern.amountGroup = node.value("amount", pattern.amountGroup);
                pattern.balanceGroup = node.value("balance", pattern.balanceGroup);
                pattern.referenceGroup = node.value("reference", pattern.referenceGroup);
            } else {
                Warn(warnings, "Ignoring malformed line pattern of '" + bankId + "'");
                continue;
            }
            pattern.regex = TryCompile(bankId, pattern.source, warnings);
            if (!pattern.regex) continue;
            if (pattern.amountGroup > 0 && pattern.amountGroup > static_cast<int>(pattern.regex->mark_count())) {
                Warn(warnings, "Skipping pattern of '" + bankId + "' (" + pattern.source + "): amount group out of range");
                continue;
            }
            bank.linePatterns.push_back(std::move(pattern));
        }
    }
    return bank;
}

application::RuleProvider BankRuleCatalogLoader::FromJson(const nlohmann::json& catalog,
                                                          std::vector<std::string>* warnings) {
    if (!catalog.is_object()) {
        throw std::runtime_error("Bank rule catalog must be a JSON object");
    }
    std::string version = "unversioned";
    if (catalog.contains("version")) {
        const auto& node = catalog["version"];
        version = node.is_string() ? node.get<std::string>() : node.dump();
    }

    std::map<std::string, domain::BankRuleOverride> overrides;
    if (catalog.contains("banks")) {
        if (!catalog["banks"].is_object()) {
            throw std::runtime_error("'banks' must map bank ids to records");
        }
        for (const auto& [bankId, record] : catalog["banks"].items()) {
            overrides[bankId] = ParseBank(bankId, record, warnings);
        }
    }
    std::clog << "[BankRuleCatalogLoader] Catalog " << version << " with " << overrides.size() << " banks" << std::endl;
    return application::RuleProvider(std::move(overrides), version);
}

application::RuleProvider BankRuleCatalogLoader::Load(const std::string& path, std::vector<std::string>* warnings) {
    if (!std::filesystem::exists(path)) {
        Warn(warnings, "Catalog " + path + " not found; using base rules only");
        return application::RuleProvider();
    }
    return FromJson(FileUtils::ReadJson(path), warnings);
}

} // namespace ledgerwalker::infrastructure
