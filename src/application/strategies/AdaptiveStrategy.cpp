/**
 * @file AdaptiveStrategy.cpp
 * @brief Implementation of AdaptiveStrategy.
 */

#include "application/strategies/AdaptiveStrategy.hpp"
#include "domain/StatementText.hpp"

namespace ledgerwalker::application::strategies {

namespace text = domain::text;

namespace {

constexpr std::size_t kMinSampleLength = 30;

struct LayoutVotes {
    int monthFirst = 0;
    int dayFirst = 0;
    int dotted = 0;
    int withReference = 0;
    int twoAmounts = 0;
    int oneAmount = 0;
};

} // namespace

std::string AdaptiveStrategy::synthesizePattern(const std::vector<std::string>& lines, nlohmann::json* layout) const {
    std::vector<std::string> samples;
    for (const auto& physical : lines) {
        if (static_cast<int>(samples.size()) >= m_sampleSize) break;
        const std::string line = text::Trim(physical);
        if (line.size() > kMinSampleLength && text::ContainsMonthToken(line)) {
            samples.push_back(line);
        }
    }
    if (layout) (*layout)["samples"] = samples.size();
    if (static_cast<int>(samples.size()) < m_minSamples) return {};

    const std::string& months = text::MonthAlternation();
    static const std::regex kMonthFirst("^(" + text::MonthAlternation() + ")(\\.?)\\s+\\d{1,2}\\b", std::regex::icase);
    static const std::regex kDayFirst("^\\d{1,2}[\\s/-]+(" + text::MonthAlternation() + ")\\b", std::regex::icase);
    static const std::regex kReference(R"(^\S+\.?\s+\S+\s+\d{8,12}\s)");
    static const std::regex kTrailingAmounts(R"(([\d,]+\.\d{2})\s+([\d,]+\.\d{2})\s*$)");
    static const std::regex kTrailingAmount(R"([\d,]+\.\d{2}\s*$)");

    LayoutVotes votes;
    for (const auto& sample : samples) {
        std::smatch m;
        if (std::regex_search(sample, m, kMonthFirst)) {
            ++votes.monthFirst;
            if (!m[2].str().empty()) ++votes.dotted;
        } else if (std::regex_search(sample, kDayFirst)) {
            ++votes.dayFirst;
        }
        if (std::regex_search(sample, kReference)) ++votes.withReference;
        if (std::regex_search(sample, kTrailingAmounts)) {
            ++votes.twoAmounts;
        } else if (std::regex_search(sample, kTrailingAmount)) {
            ++votes.oneAmount;
        }
    }

    const bool monthFirst = votes.monthFirst >= votes.dayFirst;
    const bool reference = votes.withReference * 2 >= static_cast<int>(samples.size());
    const bool twoAmounts = votes.twoAmounts >= votes.oneAmount;
    const std::string amount = "([\\d,]+\\.?\\d*)";

    std::string pattern = "^";
    pattern += monthFirst ? "(" + months + ")\\.?\\s+(\\d{1,2})" : "(\\d{1,2})[\\s/-]+(" + months + ")\\.?";
    pattern += reference ? "\\s+(\\d{8,12})?" : "()";
    pattern += "\\s*(.+?)\\s+" + amount;
    pattern += twoAmounts ? "\\s+" + amount : "()";
    pattern += "\\s*$";

    if (layout) {
        (*layout)["month_first"] = monthFirst;
        (*layout)["dotted_month"] = votes.dotted;
        (*layout)["reference_column"] = reference;
        (*layout)["amount_columns"] = twoAmounts ? 2 : 1;
    }
    return pattern;
}

LineScanningStrategy::ScanPlan AdaptiveStrategy::plan(const std::vector<std::string>& lines, const domain::RuleSet&,
                                                      nlohmann::json& metadata) const {
    ScanPlan scanPlan;
    nlohmann::json layout = nlohmann::json::object();
    const std::string pattern = synthesizePattern(lines, &layout);
    metadata["layout"] = layout;
    if (pattern.empty()) {
        scanPlan.error = "insufficient_samples";
        return scanPlan;
    }
    metadata["adaptive_pattern"] = pattern;

    LineRule rule;
    rule.label = "adaptive";
    rule.regex = Compile(pattern);
    const bool monthFirst = layout.value("month_first", true);
    rule.monthGroup = monthFirst ? 1 : 2;
    rule.dayGroup = monthFirst ? 2 : 1;
    rule.referenceGroup = 3;
    rule.descriptionGroup = 4;
    rule.amountGroup = 5;
    rule.balanceGroup = 6;
    scanPlan.rules.push_back(rule);
    return scanPlan;
}

} // namespace ledgerwalker::application::strategies
