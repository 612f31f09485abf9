/**
 * @file Transaction.cpp
 * @brief Movement kind inference for transactions.
 */

#include "domain/Transaction.hpp"
#include "domain/StatementText.hpp"

namespace ledgerwalker::domain {

const std::vector<std::string>& TransferKeywords() {
    static const std::vector<std::string> kKeywords = {
        "traspaso", "transferencia", "mov.banc", "transfer", "pago tarjeta", "pago tarjeta de credito",
        "card payment", "interbank", "spei propio", "cta propia", "propia", "pagotarjeta",
        "balance inicial", "saldo inicial", "saldo anterior", "payment thank you", "pago total",
        "pago mensual", "payment received"
    };
    return kKeywords;
}

MovementKind InferMovementKind(Direction direction, const std::string& description) {
    if (text::ContainsAny(text::ToLower(description), TransferKeywords())) {
        return MovementKind::Transfer;
    }
    return direction == Direction::Credit ? MovementKind::Income : MovementKind::Expense;
}

} // namespace ledgerwalker::domain
