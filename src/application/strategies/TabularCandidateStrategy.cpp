/**
 * @file TabularCandidateStrategy.cpp
 * @brief Implementation of TabularCandidateStrategy.
 */

#include "application/strategies/TabularCandidateStrategy.hpp"
#include "application/strategies/LineScanningStrategy.hpp"
#include "domain/StatementHeader.hpp"
#include "domain/StatementText.hpp"
#include <cmath>
#include <cstdio>

namespace ledgerwalker::application::strategies {

namespace text = domain::text;

namespace {

std::string CellText(const nlohmann::json& cell) {
    if (cell.is_string()) return text::Trim(cell.get<std::string>());
    if (cell.is_number_integer()) return std::to_string(cell.get<long long>());
    if (cell.is_number()) {
        char buffer[64];
        std::snprintf(buffer, sizeof(buffer), "%.2f", cell.get<double>());
        return buffer;
    }
    return {};
}

std::optional<double> CellAmount(const nlohmann::json& cell) {
    if (cell.is_number()) return cell.get<double>();
    if (cell.is_string()) return text::ParseAmount(cell.get<std::string>());
    return std::nullopt;
}

} // namespace

ColumnRole TabularCandidateStrategy::DetectRole(const std::string& header) {
    const std::string key = text::ToLower(text::Trim(header));
    static const std::vector<std::pair<ColumnRole, std::vector<std::string>>> kRoles = {
        {ColumnRole::Date, {"fecha", "date"}},
        {ColumnRole::Reference, {"referencia", "reference", "folio", "ref"}},
        {ColumnRole::Balance, {"saldo", "balance"}},
        {ColumnRole::Debit, {"cargo", "retiro", "debit", "debe", "withdrawal"}},
        {ColumnRole::Credit, {"abono", "deposito", "depósito", "credit", "haber"}},
        {ColumnRole::Amount, {"monto", "importe", "amount", "cantidad"}},
        {ColumnRole::Description, {"descrip", "concepto", "description", "detalle", "movimiento", "concept"}}
    };
    for (const auto& [role, keywords] : kRoles) {
        if (text::ContainsAny(key, keywords)) return role;
    }
    return ColumnRole::Ignored;
}

domain::StrategyResult TabularCandidateStrategy::run(const std::string& input, const domain::RuleSet&) const {
    domain::StrategyResult result;
    result.metadata["strategy"] = name();

    nlohmann::json document = nlohmann::json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        result.error = "not_tabular_input";
        return result;
    }
    const nlohmann::json* rows = &document;
    if (document.is_object() && document.contains("rows")) rows = &document["rows"];
    if (!rows->is_array()) {
        result.error = "rows_not_an_array";
        return result;
    }

    std::map<std::string, ColumnRole> columns;
    for (const auto& row : *rows) {
        if (!row.is_object()) continue;
        for (const auto& item : row.items()) {
            if (!columns.count(item.key())) columns[item.key()] = DetectRole(item.key());
        }
    }
    nlohmann::json columnReport = nlohmann::json::object();
    for (const auto& [column, role] : columns) columnReport[column] = static_cast<int>(role);
    result.metadata["columns"] = columnReport;

    const auto header = domain::StatementHeader::Scan(input);
    int skipped = 0;
    for (const auto& row : *rows) {
        if (!row.is_object()) {
            ++skipped;
            continue;
        }
        domain::Transaction txn;
        txn.confidence = 0.85;
        std::optional<double> amount;
        std::optional<double> debit;
        std::optional<double> credit;
        std::vector<std::string> descriptionParts;

        for (const auto& item : row.items()) {
            const auto role = columns[item.key()];
            const auto& cell = item.value();
            switch (role) {
                case ColumnRole::Date: {
                    const std::string token = CellText(cell);
                    if (!token.empty()) txn.date = header.parseDate(token);
                    break;
                }
                case ColumnRole::Reference: {
                    const std::string token = CellText(cell);
                    if (!token.empty()) txn.reference = token;
                    break;
                }
                case ColumnRole::Balance:
                    txn.balanceAfter = CellAmount(cell);
                    break;
                case ColumnRole::Debit:
                    debit = CellAmount(cell);
                    break;
                case ColumnRole::Credit:
                    credit = CellAmount(cell);
                    break;
                case ColumnRole::Amount:
                    amount = CellAmount(cell);
                    break;
                case ColumnRole::Description: {
                    const std::string token = CellText(cell);
                    if (!token.empty()) descriptionParts.push_back(token);
                    break;
                }
                case ColumnRole::Ignored:
                    break;
            }
        }

        if (debit && std::abs(*debit) > 0.0) {
            amount = std::abs(*debit);
            txn.explicitDirection = domain::Direction::Debit;
        } else if (credit && std::abs(*credit) > 0.0) {
            amount = std::abs(*credit);
            txn.explicitDirection = domain::Direction::Credit;
        } else if (amount && *amount < 0.0) {
            txn.explicitDirection = domain::Direction::Debit;
        }

        for (const auto& part : descriptionParts) {
            if (!txn.description.empty()) txn.description += " ";
            txn.description += part;
        }
        txn.description = text::CollapseWhitespace(txn.description);
        txn.rawLine = row.dump();
        txn.trailingAmountCount = txn.balanceAfter ? 2 : 1;

        // Carry rows often fill only the balance column.
        if (IsCarryDescription(txn.description) && (amount || txn.balanceAfter)) {
            txn.isBalanceCarry = true;
            txn.balanceAfter = text::RoundCents(txn.balanceAfter ? *txn.balanceAfter : *amount);
            txn.amount = 0.0;
            result.transactions.push_back(std::move(txn));
            continue;
        }
        if (!amount) {
            ++skipped;
            continue;
        }
        if (!txn.reference) txn.reference = ExtractReference(txn.description);

        const double magnitude = text::RoundCents(std::abs(*amount));
        txn.direction = txn.explicitDirection.value_or(domain::Direction::Debit);
        txn.amount = txn.direction == domain::Direction::Credit ? magnitude : -magnitude;
        if (txn.balanceAfter) txn.balanceAfter = text::RoundCents(*txn.balanceAfter);
        result.transactions.push_back(std::move(txn));
    }

    result.metadata["rows"] = rows->size();
    result.metadata["skipped_rows"] = skipped;
    result.metadata["matched"] = result.transactions.size();
    return result;
}

} // namespace ledgerwalker::application::strategies
