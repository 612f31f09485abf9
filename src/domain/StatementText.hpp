/**
 * @file StatementText.hpp
 * @brief Stateless text helpers shared by strategies, normalizer and classifier.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ledgerwalker::domain::text {

std::string ToLower(const std::string& input);
std::string ToUpper(const std::string& input);
std::string Trim(const std::string& input);

/** @brief Collapses runs of whitespace into single spaces and trims. */
std::string CollapseWhitespace(const std::string& input);

/** @brief Splits on '\n', dropping '\r'. Empty lines are kept. */
std::vector<std::string> SplitLines(const std::string& text);

/**
 * @brief Dedup signature of a description: lower-case, whitespace collapsed,
 * punctuation noise ("()", "|", "*", trailing dots...) removed.
 */
std::string NormalizeDescription(const std::string& description);

/** @brief True if the lower-cased haystack contains any of the (lower-case) needles. */
bool ContainsAny(const std::string& lowerHaystack, const std::set<std::string>& needles);
bool ContainsAny(const std::string& lowerHaystack, const std::vector<std::string>& needles);

/** @brief True if the word appears in the text delimited by non-alphanumerics. */
bool ContainsWord(const std::string& upperText, const std::string& upperWord);

/**
 * @brief Parses a money token such as "1,234.56", "$ 1 234,56", "-12.00", "12.00-" or "(12.00)".
 * @return Signed value, or nullopt when the token is not a number.
 */
std::optional<double> ParseAmount(const std::string& token);

/** @brief Rounds to cents. */
double RoundCents(double value);
std::int64_t ToCents(double value);
/** @brief Fixed two-decimal rendering used in reasoning and issue messages. */
std::string FormatAmount(double value);

/**
 * @brief Month number for Spanish or English month names and abbreviations
 * ("ENE", "ENERO", "JAN", "Ago.", "December"...).
 */
std::optional<int> MonthFromToken(const std::string& token);

/** @brief Regex alternation matching any month token, longest first. */
const std::string& MonthAlternation();

/** @brief True if the line holds a standalone month token. */
bool ContainsMonthToken(const std::string& line);

} // namespace ledgerwalker::domain::text
