/**
 * @file StatementText.cpp
 * @brief Implementation of the statement text helpers.
 */

#include "domain/StatementText.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <sstream>
#include <unordered_map>

namespace ledgerwalker::domain::text {

namespace {

const std::vector<std::pair<std::string, int>>& MonthTable() {
    static const std::vector<std::pair<std::string, int>> kMonths = {
        {"ENERO", 1}, {"FEBRERO", 2}, {"MARZO", 3}, {"ABRIL", 4}, {"MAYO", 5}, {"JUNIO", 6},
        {"JULIO", 7}, {"AGOSTO", 8}, {"SEPTIEMBRE", 9}, {"SETIEMBRE", 9}, {"OCTUBRE", 10},
        {"NOVIEMBRE", 11}, {"DICIEMBRE", 12},
        {"JANUARY", 1}, {"FEBRUARY", 2}, {"MARCH", 3}, {"APRIL", 4}, {"JUNE", 6}, {"JULY", 7},
        {"AUGUST", 8}, {"SEPTEMBER", 9}, {"OCTOBER", 10}, {"NOVEMBER", 11}, {"DECEMBER", 12},
        {"ENE", 1}, {"FEB", 2}, {"MAR", 3}, {"ABR", 4}, {"MAY", 5}, {"JUN", 6}, {"JUL", 7},
        {"AGO", 8}, {"SEP", 9}, {"SEPT", 9}, {"OCT", 10}, {"NOV", 11}, {"DIC", 12},
        {"JAN", 1}, {"APR", 4}, {"AUG", 8}, {"DEC", 12}
    };
    return kMonths;
}

bool IsNoisePunctuation(unsigned char c) {
    return c == '|' || c == '*' || c == '#' || c == '_' || c == ';' || c == ':' || c == '"' || c == '\'';
}

} // namespace

std::string ToLower(const std::string& input) {
    std::string out = input;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string ToUpper(const std::string& input) {
    std::string out = input;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string Trim(const std::string& input) {
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = input.find_last_not_of(" \t\r\n");
    return input.substr(first, last - first + 1);
}

std::string CollapseWhitespace(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    bool lastWasSpace = true;
    for (unsigned char c : input) {
        if (std::isspace(c)) {
            if (!lastWasSpace) {
                out.push_back(' ');
                lastWasSpace = true;
            }
            continue;
        }
        out.push_back(static_cast<char>(c));
        lastWasSpace = false;
    }
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
        lines.push_back(line);
    }
    return lines;
}

std::string NormalizeDescription(const std::string& description) {
    std::string desc = ToLower(description);

    static const std::regex kEmptyParens(R"(\(\s*\))");
    desc = std::regex_replace(desc, kEmptyParens, " ");

    std::string cleaned;
    cleaned.reserve(desc.size());
    for (unsigned char c : desc) {
        cleaned.push_back(IsNoisePunctuation(c) ? ' ' : static_cast<char>(c));
    }
    cleaned = CollapseWhitespace(cleaned);

    while (!cleaned.empty() && (cleaned.back() == '.' || cleaned.back() == ',' || cleaned.back() == '-')) {
        cleaned.pop_back();
    }
    while (!cleaned.empty() && (cleaned.front() == '.' || cleaned.front() == ',' || cleaned.front() == '-')) {
        cleaned.erase(cleaned.begin());
    }
    return Trim(cleaned);
}

bool ContainsAny(const std::string& lowerHaystack, const std::set<std::string>& needles) {
    for (const auto& needle : needles) {
        if (!needle.empty() && lowerHaystack.find(needle) != std::string::npos) return true;
    }
    return false;
}

bool ContainsAny(const std::string& lowerHaystack, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (!needle.empty() && lowerHaystack.find(needle) != std::string::npos) return true;
    }
    return false;
}

bool ContainsWord(const std::string& upperText, const std::string& upperWord) {
    if (upperWord.empty()) return false;
    size_t pos = upperText.find(upperWord);
    while (pos != std::string::npos) {
        const bool leftOk = pos == 0 || !std::isalnum(static_cast<unsigned char>(upperText[pos - 1]));
        const size_t end = pos + upperWord.size();
        const bool rightOk = end >= upperText.size() || !std::isalnum(static_cast<unsigned char>(upperText[end]));
        if (leftOk && rightOk) return true;
        pos = upperText.find(upperWord, pos + 1);
    }
    return false;
}

std::optional<double> ParseAmount(const std::string& token) {
    std::string s;
    s.reserve(token.size());
    for (unsigned char c : token) {
        if (c == ' ' || c == '\t' || c == '$' || c == '\'' || c == 0xA0) continue;
        s.push_back(static_cast<char>(c));
    }
    if (s.empty()) return std::nullopt;

    bool negative = false;
    if (s.size() >= 2 && s.front() == '(' && s.back() == ')') {
        negative = true;
        s = s.substr(1, s.size() - 2);
    }
    if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
        negative = negative != (s.front() == '-');
        s.erase(s.begin());
    }
    if (!s.empty() && (s.back() == '-' || s.back() == '+')) {
        negative = negative != (s.back() == '-');
        s.pop_back();
    }
    if (s.empty()) return std::nullopt;

    const size_t lastDot = s.find_last_of('.');
    const size_t lastComma = s.find_last_of(',');
    char decimal = 0;
    if (lastDot != std::string::npos && lastComma != std::string::npos) {
        decimal = lastDot > lastComma ? '.' : ',';
    } else if (lastDot != std::string::npos) {
        decimal = '.';
    } else if (lastComma != std::string::npos) {
        // "1,234" is grouping, "12,50" is a decimal comma.
        decimal = (s.size() - lastComma - 1 == 3) ? 0 : ',';
    }

    std::string intPart = s;
    std::string fracPart;
    if (decimal) {
        const size_t pos = s.find_last_of(decimal);
        intPart = s.substr(0, pos);
        fracPart = s.substr(pos + 1);
    }
    intPart.erase(std::remove_if(intPart.begin(), intPart.end(), [](char c) { return c == ',' || c == '.'; }), intPart.end());

    auto onlyDigits = [](const std::string& t) {
        return std::all_of(t.begin(), t.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    };
    if (intPart.empty() && fracPart.empty()) return std::nullopt;
    if (!onlyDigits(intPart) || !onlyDigits(fracPart)) return std::nullopt;
    if (intPart.empty()) intPart = "0";
    if (intPart.size() > 15) return std::nullopt;

    double value = std::stod(intPart + (fracPart.empty() ? "" : "." + fracPart));
    return negative ? -value : value;
}

double RoundCents(double value) {
    return std::round(value * 100.0) / 100.0;
}

std::int64_t ToCents(double value) {
    return static_cast<std::int64_t>(std::llround(value * 100.0));
}

std::string FormatAmount(double value) {
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out.precision(2);
    out << value;
    return out.str();
}

std::optional<int> MonthFromToken(const std::string& token) {
    std::string upper = ToUpper(Trim(token));
    while (!upper.empty() && upper.back() == '.') upper.pop_back();
    for (const auto& [name, number] : MonthTable()) {
        if (upper == name) return number;
    }
    return std::nullopt;
}

const std::string& MonthAlternation() {
    static const std::string kAlternation = [] {
        std::vector<std::string> names;
        for (const auto& entry : MonthTable()) names.push_back(entry.first);
        std::sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) {
            return a.size() > b.size();
        });
        std::string joined;
        for (const auto& name : names) {
            if (!joined.empty()) joined += "|";
            joined += name;
        }
        return joined;
    }();
    return kAlternation;
}

bool ContainsMonthToken(const std::string& line) {
    static const std::regex kMonth("(^|[^A-Z])(" + MonthAlternation() + ")([^A-Z]|$)");
    return std::regex_search(ToUpper(line), kMonth);
}

} // namespace ledgerwalker::domain::text
