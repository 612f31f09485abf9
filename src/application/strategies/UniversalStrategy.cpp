/**
 * @file UniversalStrategy.cpp
 * @brief Implementation of UniversalStrategy.
 */

#include "application/strategies/UniversalStrategy.hpp"
#include "domain/StatementText.hpp"

namespace ledgerwalker::application::strategies {

LineScanningStrategy::ScanPlan UniversalStrategy::plan(const std::vector<std::string>&, const domain::RuleSet& rules,
                                                       nlohmann::json& metadata) const {
    static const std::vector<LineRule> kFlexible = [] {
        const std::string month = "(" + domain::text::MonthAlternation() + ")";
        const std::string amount = "(" + FlexibleAmount() + ")";
        std::vector<LineRule> flexible;

        LineRule reference;
        reference.label = "month_day_reference";
        reference.regex = Compile("^" + month + "\\.?\\s+(\\d{1,2})\\s+(\\d{8,12})\\s+(.+?)\\s+" + amount + "\\s+" + amount + "\\s*$");
        reference.monthGroup = 1;
        reference.dayGroup = 2;
        reference.referenceGroup = 3;
        reference.descriptionGroup = 4;
        reference.amountGroup = 5;
        reference.balanceGroup = 6;
        flexible.push_back(reference);

        LineRule glued;
        glued.label = "month_day_glued_reference";
        glued.regex = Compile("^" + month + "\\.?\\s+(\\d{1,2})(\\d{10})\\s+(.+?)\\s+" + amount + "\\s+" + amount + "\\s*$");
        glued.monthGroup = 1;
        glued.dayGroup = 2;
        glued.referenceGroup = 3;
        glued.descriptionGroup = 4;
        glued.amountGroup = 5;
        glued.balanceGroup = 6;
        flexible.push_back(glued);

        LineRule carry;
        carry.label = "balance_carry";
        carry.regex = Compile("^(?:" + month + "\\.?\\s+(\\d{1,2})\\s+)?(BALANCE\\s+(?:INICIAL|ANTERIOR)|SALDO\\s+(?:ANTERIOR|INICIAL))"
                              "[\\s:]*" + amount + "(?:\\s+" + amount + ")?\\s*$");
        carry.monthGroup = 1;
        carry.dayGroup = 2;
        carry.descriptionGroup = 3;
        carry.amountGroup = 4;
        carry.balanceGroup = 5;
        carry.carry = true;
        flexible.push_back(carry);

        LineRule twoAmounts;
        twoAmounts.label = "month_day_two_amounts";
        twoAmounts.regex = Compile("^" + month + "\\.?\\s+(\\d{1,2})\\s+(.+?)\\s+" + amount + "\\s+" + amount + "\\s*$");
        twoAmounts.monthGroup = 1;
        twoAmounts.dayGroup = 2;
        twoAmounts.descriptionGroup = 3;
        twoAmounts.amountGroup = 4;
        twoAmounts.balanceGroup = 5;
        flexible.push_back(twoAmounts);

        LineRule dayFirst;
        dayFirst.label = "day_month";
        dayFirst.regex = Compile("^(\\d{1,2})[\\s/-]+" + month + "\\.?(?:[\\s/-]+(\\d{4}|\\d{2}))?\\s+(.+?)\\s+" + amount +
                                 "(?:\\s+" + amount + ")?\\s*$");
        dayFirst.dayGroup = 1;
        dayFirst.monthGroup = 2;
        dayFirst.yearGroup = 3;
        dayFirst.descriptionGroup = 4;
        dayFirst.amountGroup = 5;
        dayFirst.balanceGroup = 6;
        flexible.push_back(dayFirst);

        LineRule monthDay;
        monthDay.label = "month_day_one_amount";
        monthDay.regex = Compile("^" + month + "\\.?\\s+(\\d{1,2})(?:,?\\s+(\\d{4}))?\\s+(.+?)\\s+" + amount + "\\s*$");
        monthDay.monthGroup = 1;
        monthDay.dayGroup = 2;
        monthDay.yearGroup = 3;
        monthDay.descriptionGroup = 4;
        monthDay.amountGroup = 5;
        flexible.push_back(monthDay);

        LineRule numeric;
        numeric.label = "numeric_date";
        numeric.regex = Compile(R"(^(\d{4}-\d{1,2}-\d{1,2}|\d{1,2}[/-]\d{1,2}[/-]\d{2,4})\s+(.+)$)");
        numeric.dateGroup = 1;
        numeric.descriptionGroup = 2;
        flexible.push_back(numeric);
        return flexible;
    }();

    ScanPlan scanPlan;
    for (const auto& pattern : rules.customLinePatterns) {
        if (pattern.regex) scanPlan.rules.push_back(FromLinePattern(pattern));
    }
    metadata["custom_patterns"] = scanPlan.rules.size();
    scanPlan.rules.insert(scanPlan.rules.end(), kFlexible.begin(), kFlexible.end());
    return scanPlan;
}

} // namespace ledgerwalker::application::strategies
