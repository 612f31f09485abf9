/**
 * @file BruteForceStrategy.cpp
 * @brief Implementation of BruteForceStrategy.
 */

#include "application/strategies/BruteForceStrategy.hpp"

namespace ledgerwalker::application::strategies {

LineScanningStrategy::ScanPlan BruteForceStrategy::plan(const std::vector<std::string>&, const domain::RuleSet&,
                                                        nlohmann::json& metadata) const {
    static const std::vector<LineRule> kRules = [] {
        const std::string number = R"(([\d,]+\.?\d*))";
        std::vector<LineRule> rules;

        LineRule reference;
        reference.label = "month_day_reference_two_numbers";
        reference.regex = Compile(R"(\b([A-Z]{3})\.?\s+(\d{1,2})\s+(\d{8,})\s+(.+?)\s+)" + number + R"(\s+)" + number);
        reference.monthGroup = 1;
        reference.dayGroup = 2;
        reference.referenceGroup = 3;
        reference.descriptionGroup = 4;
        reference.amountGroup = 5;
        reference.balanceGroup = 6;
        rules.push_back(reference);

        LineRule twoNumbers;
        twoNumbers.label = "month_day_two_numbers";
        twoNumbers.regex = Compile(R"(\b([A-Z]{3})\s+(\d{1,2})\s+(.+?)\s+)" + number + R"(\s+)" + number);
        twoNumbers.monthGroup = 1;
        twoNumbers.dayGroup = 2;
        twoNumbers.descriptionGroup = 3;
        twoNumbers.amountGroup = 4;
        twoNumbers.balanceGroup = 5;
        rules.push_back(twoNumbers);

        LineRule dayMonth;
        dayMonth.label = "day_month_number";
        dayMonth.regex = Compile(R"(\b(\d{1,2})\s+([A-Z]{3})\s+(.+?)\s+)" + number);
        dayMonth.dayGroup = 1;
        dayMonth.monthGroup = 2;
        dayMonth.descriptionGroup = 3;
        dayMonth.amountGroup = 4;
        rules.push_back(dayMonth);

        LineRule trailing;
        trailing.label = "month_day_trailing_number";
        trailing.regex = Compile(R"(\b([A-Z]{3})\.?\s+(\d{1,2})\s+(.+?)\s+)" + number + "$");
        trailing.monthGroup = 1;
        trailing.dayGroup = 2;
        trailing.descriptionGroup = 3;
        trailing.amountGroup = 4;
        rules.push_back(trailing);
        return rules;
    }();

    metadata["patterns_used"] = kRules.size();
    ScanPlan scanPlan;
    scanPlan.rules = kRules;
    scanPlan.minLineLength = 20;
    return scanPlan;
}

} // namespace ledgerwalker::application::strategies
