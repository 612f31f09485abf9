/**
 * @file TabularCandidateStrategy.hpp
 * @brief Extraction from pre-structured rows (CSV/Excel extraction as JSON).
 */

#pragma once
#include <map>
#include "domain/ExtractionStrategy.hpp"

namespace ledgerwalker::application::strategies {

/**
 * @enum ColumnRole
 * @brief Meaning of a tabular column, detected from its header.
 */
enum class ColumnRole {
    Date,
    Reference,
    Balance,
    Debit,
    Credit,
    Amount,
    Description,
    Ignored
};

/**
 * @class TabularCandidateStrategy
 * @brief Reads a JSON array of row objects (or {"rows": [...]}) and maps columns by
 * header keywords: fecha/date, referencia/folio, saldo/balance, cargo/retiro/debit,
 * abono/deposito/credit, monto/importe/amount, descripcion/concepto/description.
 */
class TabularCandidateStrategy : public domain::ExtractionStrategy {
public:
    std::string name() const override { return "tabular"; }
    domain::StrategyResult run(const std::string& text, const domain::RuleSet& rules) const override;

    /** @brief Role of a column header. */
    static ColumnRole DetectRole(const std::string& header);
};

} // namespace ledgerwalker::application::strategies
