/**
 * @file LineScanningStrategy.cpp
 * @brief Implementation of the shared line scanning loop.
 */

#include "application/strategies/LineScanningStrategy.hpp"
#include "domain/StatementText.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>

namespace ledgerwalker::application::strategies {

namespace text = domain::text;

namespace {

constexpr std::size_t kMaxContinuationLines = 4;

std::optional<int> ToInt(const std::string& token) {
    if (token.empty() || token.size() > 4) return std::nullopt;
    if (!std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return std::stoi(token);
}

std::string CleanDescription(const std::string& raw) {
    std::string description = text::CollapseWhitespace(raw);
    auto isEdge = [](char c) { return c == '$' || c == '|' || c == '-' || c == ' ' || c == ':'; };
    while (!description.empty() && isEdge(description.back())) description.pop_back();
    while (!description.empty() && isEdge(description.front())) description.erase(description.begin());
    return description;
}

std::optional<domain::Transaction> BuildRow(const std::smatch& m, const LineRule& rule, const domain::RuleSet& rules,
                                            const domain::StatementHeader& header, const std::string& line,
                                            double confidence) {
    auto group = [&m](int index) -> std::string {
        if (index <= 0 || index >= static_cast<int>(m.size()) || !m[index].matched) return {};
        return text::Trim(m[index].str());
    };

    domain::Transaction row;
    row.rawLine = line;
    row.confidence = confidence;

    if (rule.dateGroup) {
        const std::string token = group(rule.dateGroup);
        if (!token.empty()) {
            row.date = header.parseDate(token);
            if (!row.date) return std::nullopt;
        }
    } else if (rule.monthGroup && rule.dayGroup &&
               (!group(rule.monthGroup).empty() || !group(rule.dayGroup).empty())) {
        auto month = text::MonthFromToken(group(rule.monthGroup));
        auto day = ToInt(group(rule.dayGroup));
        if (!month || !day) return std::nullopt;
        auto year = ToInt(group(rule.yearGroup));
        if (year) {
            int fullYear = *year < 100 ? 2000 + *year : *year;
            row.date = domain::CalendarDate::Make(fullYear, *month, *day);
        } else {
            row.date = header.resolveMonthDay(*month, *day);
        }
        if (!row.date) return std::nullopt;
    }

    std::string description = group(rule.descriptionGroup);
    std::optional<double> amount;
    std::optional<double> balance;
    bool explicitPlus = false;

    if (rule.amountGroup) {
        const std::string token = group(rule.amountGroup);
        amount = text::ParseAmount(token);
        if (!amount) return std::nullopt;
        explicitPlus = token.find('+') != std::string::npos;
        const std::string balanceToken = group(rule.balanceGroup);
        if (!balanceToken.empty()) {
            balance = text::ParseAmount(balanceToken);
            if (!balance) return std::nullopt;
        }
        row.trailingAmountCount = balance ? 2 : 1;
    } else {
        const auto tokens = ScanAmounts(description, rules);
        if (tokens.empty()) return std::nullopt;
        std::vector<double> values;
        for (const auto& token : tokens) values.push_back(token.value);
        if (rules.hasRunningBalanceColumn && values.size() >= 2) {
            balance = values.back();
            values.pop_back();
        }
        if (rules.preferFirstAmount) {
            amount = values.front();
        } else {
            amount = *std::max_element(values.begin(), values.end(), [](double a, double b) {
                return std::abs(a) < std::abs(b);
            });
        }
        for (auto it = tokens.rbegin(); it != tokens.rend(); ++it) {
            description.erase(it->position, it->length);
        }
        row.trailingAmountCount = static_cast<int>(tokens.size());
    }

    if (rule.carry || IsCarryDescription(description)) {
        row.isBalanceCarry = true;
        row.balanceAfter = text::RoundCents(balance ? *balance : *amount);
        row.amount = 0.0;
        row.description = CleanDescription(description);
        if (row.description.empty()) row.description = "SALDO ANTERIOR";
        return row;
    }

    const std::string reference = group(rule.referenceGroup);
    if (!reference.empty()) {
        row.reference = reference;
    } else {
        row.reference = ExtractReference(description);
    }
    row.description = CleanDescription(description);
    if (row.description.empty()) return std::nullopt;

    if (*amount < 0.0) {
        row.explicitDirection = domain::Direction::Debit;
    } else if (explicitPlus) {
        row.explicitDirection = domain::Direction::Credit;
    }
    const double magnitude = text::RoundCents(std::abs(*amount));
    row.direction = row.explicitDirection.value_or(domain::Direction::Debit);
    row.amount = row.direction == domain::Direction::Credit ? magnitude : -magnitude;
    if (balance) row.balanceAfter = text::RoundCents(*balance);
    return row;
}

bool HasLetter(const std::string& line) {
    return std::any_of(line.begin(), line.end(), [](unsigned char c) { return std::isalpha(c) != 0; });
}

} // namespace

bool IsCarryDescription(const std::string& description) {
    static const std::vector<std::string> kPhrases = {
        "balance inicial", "saldo inicial", "saldo anterior", "saldo final", "saldo actual", "saldo al corte"
    };
    // Only a leading phrase marks a carry row; "PAGO SALDO ANTERIOR" stays a movement.
    const std::string lowered = text::ToLower(CleanDescription(description));
    return std::any_of(kPhrases.begin(), kPhrases.end(), [&lowered](const std::string& phrase) {
        return lowered.compare(0, phrase.size(), phrase) == 0;
    });
}

bool IsClosingCarry(const std::string& description) {
    static const std::vector<std::string> kPhrases = {"saldo final", "saldo actual", "saldo al corte", "balance final"};
    return text::ContainsAny(text::ToLower(description), kPhrases);
}

std::vector<AmountToken> ScanAmounts(const std::string& line, const domain::RuleSet& rules) {
    std::vector<AmountToken> tokens;
    for (const auto& pattern : rules.amountPatterns) {
        if (!pattern.regex) continue;
        for (auto it = std::sregex_iterator(line.begin(), line.end(), *pattern.regex); it != std::sregex_iterator(); ++it) {
            const auto& m = *it;
            if (m.length(0) == 0) continue;
            const std::size_t start = static_cast<std::size_t>(m.position(0));
            const std::size_t end = start + static_cast<std::size_t>(m.length(0));
            const bool overlaps = std::any_of(tokens.begin(), tokens.end(), [&](const AmountToken& t) {
                return start < t.position + t.length && t.position < end;
            });
            if (overlaps) continue;
            const int valueGroup = (m.size() > 1 && m[1].matched) ? 1 : 0;
            auto value = text::ParseAmount(m[valueGroup].str());
            if (!value) continue;
            tokens.push_back(AmountToken{start, end - start, *value});
        }
    }
    std::sort(tokens.begin(), tokens.end(), [](const AmountToken& a, const AmountToken& b) {
        return a.position < b.position;
    });
    return tokens;
}

std::optional<std::string> ExtractReference(std::string& description) {
    static const std::regex kMarker(R"(\bREF(?:ERENCIA)?\.?(?:\s*[:#]\s*|\s+)([A-Z0-9-]*\d[A-Z0-9-]*))", std::regex::icase);
    static const std::regex kDigits(R"((^|\s)(\d{8,12})(?=\s|$))");

    std::smatch m;
    if (std::regex_search(description, m, kMarker)) {
        std::string reference = m[1].str();
        description.erase(static_cast<std::size_t>(m.position(0)), static_cast<std::size_t>(m.length(0)));
        return reference;
    }
    if (std::regex_search(description, m, kDigits)) {
        std::string reference = m[2].str();
        description.erase(static_cast<std::size_t>(m.position(2)), static_cast<std::size_t>(m.length(2)));
        return reference;
    }
    return std::nullopt;
}

std::shared_ptr<const std::regex> LineScanningStrategy::Compile(const std::string& pattern) {
    return std::make_shared<const std::regex>(pattern, std::regex::ECMAScript | std::regex::icase);
}

LineRule LineScanningStrategy::FromLinePattern(const domain::LinePattern& pattern) {
    LineRule rule;
    rule.label = "custom:" + pattern.source;
    rule.regex = pattern.regex;
    rule.dateGroup = pattern.dateGroup;
    rule.descriptionGroup = pattern.descriptionGroup;
    rule.amountGroup = pattern.amountGroup;
    rule.balanceGroup = pattern.balanceGroup;
    rule.referenceGroup = pattern.referenceGroup;
    return rule;
}

const std::string& LineScanningStrategy::StrictAmount() {
    static const std::string kAmount = R"([-+]?\$?\s?(?:\d{1,3}(?:,\d{3})+|\d+)\.\d{2}-?)";
    return kAmount;
}

const std::string& LineScanningStrategy::FlexibleAmount() {
    static const std::string kAmount = R"([-+]?\$?\s?(?:\d{1,3}(?:[.,]\d{3})+|\d+)[.,]\d{2}-?)";
    return kAmount;
}

domain::StrategyResult LineScanningStrategy::run(const std::string& text, const domain::RuleSet& rules) const {
    domain::StrategyResult result;
    result.metadata["strategy"] = name();
    if (text::Trim(text).empty()) {
        result.error = "empty_text";
        return result;
    }

    const auto lines = text::SplitLines(text);
    const auto header = domain::StatementHeader::Scan(text);
    result.metadata["lines"] = lines.size();
    result.metadata["year_hint"] = header.yearHint;

    ScanPlan scanPlan;
    try {
        scanPlan = plan(lines, rules, result.metadata);
    } catch (const std::regex_error& e) {
        result.error = std::string("pattern_error: ") + e.what();
        return result;
    }
    if (scanPlan.error) {
        result.error = scanPlan.error;
        return result;
    }
    if (scanPlan.rules.empty()) {
        result.error = "no_patterns";
        return result;
    }

    std::map<std::string, int> hits;
    int continuationCount = 0;
    std::optional<std::size_t> lastRow;

    for (const auto& physical : lines) {
        const std::string line = text::Trim(physical);
        if (line.empty()) continue;

        bool matched = false;
        if (line.size() >= scanPlan.minLineLength) {
            for (const auto& rule : scanPlan.rules) {
                std::smatch m;
                if (!rule.regex || !std::regex_search(line, m, *rule.regex)) continue;
                auto row = BuildRow(m, rule, rules, header, line, rowConfidence());
                if (!row) continue;
                hits[rule.label]++;
                result.transactions.push_back(std::move(*row));
                lastRow = result.transactions.size() - 1;
                matched = true;
                break;
            }
        }
        if (matched || !lastRow) continue;

        // Totals and page furniture end the wrapped concept of the previous row.
        const bool noise = text::ContainsAny(text::ToLower(line), rules.skipKeywords) ||
                           !ScanAmounts(line, rules).empty() || !HasLetter(line);
        auto& previous = result.transactions[*lastRow];
        if (noise || previous.isBalanceCarry || previous.continuationLines.size() >= kMaxContinuationLines) {
            lastRow.reset();
            continue;
        }
        previous.continuationLines.push_back(line);
        ++continuationCount;
    }

    result.metadata["matched"] = result.transactions.size();
    result.metadata["continuation_lines"] = continuationCount;
    result.metadata["rule_hits"] = hits;
    return result;
}

} // namespace ledgerwalker::application::strategies
