/**
 * @file StandardStrategy.cpp
 * @brief Implementation of StandardStrategy.
 */

#include "application/strategies/StandardStrategy.hpp"

namespace ledgerwalker::application::strategies {

LineScanningStrategy::ScanPlan StandardStrategy::plan(const std::vector<std::string>&, const domain::RuleSet&,
                                                      nlohmann::json& metadata) const {
    static const std::vector<LineRule> kRules = [] {
        const std::string month = "(ENE|FEB|MAR|ABR|MAY|JUN|JUL|AGO|SEPT|SEP|OCT|NOV|DIC|JAN|APR|AUG|DEC)";
        const std::string amount = "(" + StrictAmount() + ")";
        std::vector<LineRule> rules;

        LineRule carry;
        carry.label = "balance_carry";
        carry.regex = Compile("^(?:" + month + "\\.?\\s+(\\d{1,2})\\s+)?(BALANCE\\s+INICIAL|SALDO\\s+(?:ANTERIOR|INICIAL))"
                              "[\\s:]*" + amount + "(?:\\s+" + amount + ")?\\s*$");
        carry.monthGroup = 1;
        carry.dayGroup = 2;
        carry.descriptionGroup = 3;
        carry.amountGroup = 4;
        carry.balanceGroup = 5;
        carry.carry = true;
        rules.push_back(carry);

        LineRule withReference;
        withReference.label = "date_reference_two_amounts";
        withReference.regex = Compile("^" + month + "\\.?\\s+(\\d{1,2})\\s+(\\d{8,12})\\s+(.+?)\\s+" + amount +
                                      "\\s+" + amount + "\\s*$");
        withReference.monthGroup = 1;
        withReference.dayGroup = 2;
        withReference.referenceGroup = 3;
        withReference.descriptionGroup = 4;
        withReference.amountGroup = 5;
        withReference.balanceGroup = 6;
        rules.push_back(withReference);

        LineRule twoAmounts;
        twoAmounts.label = "date_two_amounts";
        twoAmounts.regex = Compile("^" + month + "\\.?\\s+(\\d{1,2})\\s+([A-Z].*?)\\s+" + amount + "\\s+" + amount + "\\s*$");
        twoAmounts.monthGroup = 1;
        twoAmounts.dayGroup = 2;
        twoAmounts.descriptionGroup = 3;
        twoAmounts.amountGroup = 4;
        twoAmounts.balanceGroup = 5;
        rules.push_back(twoAmounts);

        LineRule oneAmount;
        oneAmount.label = "date_one_amount";
        oneAmount.regex = Compile("^" + month + "\\.?\\s+(\\d{1,2})\\s+(.+?)\\s+" + amount + "\\s*$");
        oneAmount.monthGroup = 1;
        oneAmount.dayGroup = 2;
        oneAmount.descriptionGroup = 3;
        oneAmount.amountGroup = 4;
        rules.push_back(oneAmount);

        LineRule numericDate;
        numericDate.label = "numeric_date";
        numericDate.regex = Compile(R"(^(\d{1,2}[/-]\d{1,2}[/-]\d{2,4})\s+(.+)$)");
        numericDate.dateGroup = 1;
        numericDate.descriptionGroup = 2;
        rules.push_back(numericDate);
        return rules;
    }();

    metadata["layouts"] = kRules.size();
    ScanPlan scanPlan;
    scanPlan.rules = kRules;
    return scanPlan;
}

} // namespace ledgerwalker::application::strategies
