/**
 * @file RuleSet.cpp
 * @brief Base keyword and amount rules shared by every bank.
 */

#include "domain/RuleSet.hpp"

namespace ledgerwalker::domain {

namespace {

AmountPattern MakeAmountPattern(const std::string& source) {
    return AmountPattern{source, std::make_shared<const std::regex>(source)};
}

} // namespace

RuleSet RuleSet::Base() {
    // Compiled once; every copy shares the same read-only regex objects.
    static const RuleSet kBase = [] {
        RuleSet base;
        base.creditKeywords = {
            "deposito", "abono", "transferencia recibida", "interes", "intereses", "devolucion",
            "ingreso", "credito", "deposito electronico", "spei recibido", "ganado", "ganados"
        };
        base.debitKeywords = {
            "cargo", "retiro", "pago", "compra", "comision", "domiciliacion",
            "transferencia enviada", "spei enviado", "debito", "iva"
        };
        base.skipKeywords = {
            "balance inicial", "saldo anterior", "saldo final", "saldo actual", "saldo promedio",
            "total de cargos", "total de abonos", "total cargos", "total abonos", "total de movimientos"
        };
        base.amountPatterns = {
            MakeAmountPattern(R"([\$]?\s*([+-]?\d{1,3}(?:,\d{3})+\.\d{2})(?![\d.,]))"),
            MakeAmountPattern(R"([\$]?\s*([+-]?\d+\.\d{2})(?![\d.,]))")
        };
        // Two trailing amounts read as movement then running balance unless a bank says otherwise.
        base.hasRunningBalanceColumn = true;
        return base;
    }();
    return kBase;
}

} // namespace ledgerwalker::domain
