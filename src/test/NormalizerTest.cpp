#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>

#include "application/TransactionNormalizer.hpp"
#include "infrastructure/BankRuleCatalogLoader.hpp"

using namespace ledgerwalker;
using application::TransactionNormalizer;

static bool Near(double a, double b) {
    return std::abs(a - b) < 0.001;
}

static domain::Transaction Row(const std::string& description, double amount, int day,
                               std::optional<double> balance = std::nullopt) {
    domain::Transaction txn;
    txn.date = domain::CalendarDate::Make(2024, 3, day);
    txn.description = description;
    txn.amount = amount;
    txn.balanceAfter = balance;
    txn.confidence = 0.9;
    return txn;
}

static domain::Transaction Carry(const std::string& description, double balance) {
    domain::Transaction txn;
    txn.description = description;
    txn.isBalanceCarry = true;
    txn.balanceAfter = balance;
    return txn;
}

static bool SameLedger(const std::vector<domain::Transaction>& a, const std::vector<domain::Transaction>& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i].description != b[i].description || a[i].amount != b[i].amount || a[i].direction != b[i].direction ||
            a[i].movementKind != b[i].movementKind || a[i].balanceAfter != b[i].balanceAfter || a[i].date != b[i].date ||
            a[i].reference != b[i].reference) {
            return false;
        }
    }
    return true;
}

static void TestDeduplication() {
    std::cout << "[Test] Deduplication..." << std::endl;
    TransactionNormalizer normalizer;
    auto first = Row("COMPRA OXXO", -250.50, 5, 1000.0);
    first.reference = std::string("REF1");
    auto second = Row("Compra   OXXO.", -250.50, 5, 749.50);
    second.confidence = 0.95;
    auto exactCopy = Row("COMPRA OXXO", -250.50, 5);
    auto otherDay = Row("COMPRA OXXO", -250.50, 6);

    auto result = normalizer.normalize({first, second, exactCopy, otherDay}, domain::RuleSet::Base());
    assert(result.transactions.size() == 2);
    assert(result.mergedDuplicates == 2);

    const auto& merged = result.transactions[0];
    assert(merged.description == "COMPRA OXXO Compra   OXXO.");
    assert(Near(*merged.balanceAfter, 749.50));
    assert(merged.reference == std::optional<std::string>("REF1"));
    assert(Near(merged.confidence, 0.95));
    assert(result.transactions[1].date->day == 6);
    std::cout << "[PASS] Identical keys merged into one row." << std::endl;
}

static void TestClassification() {
    std::cout << "[Test] Classification priority..." << std::endl;
    const auto rules = domain::RuleSet::Base();

    // Marker beats the debit keyword "pago".
    auto marked = Row("PAGO RECIBIDO ABONO", -100.0, 1);
    auto [markerDirection, markerBasis] = TransactionNormalizer::Classify(marked, rules, std::nullopt);
    assert(markerDirection == domain::Direction::Credit && markerBasis == domain::DirectionBasis::Marker);

    auto explicitSign = Row("DEPOSITO", -100.0, 1);
    explicitSign.explicitDirection = domain::Direction::Debit;
    assert(TransactionNormalizer::Classify(explicitSign, rules, std::nullopt).first == domain::Direction::Debit);

    auto keyword = Row("DEPOSITO EN EFECTIVO", -100.0, 1);
    auto [keywordDirection, keywordBasis] = TransactionNormalizer::Classify(keyword, rules, std::nullopt);
    assert(keywordDirection == domain::Direction::Credit && keywordBasis == domain::DirectionBasis::Keyword);

    auto columnUp = Row("MOVIMIENTO XYZ", -200.0, 1, 1200.0);
    auto [upDirection, upBasis] = TransactionNormalizer::Classify(columnUp, rules, 1000.0);
    assert(upDirection == domain::Direction::Credit && upBasis == domain::DirectionBasis::Column);

    auto columnDown = Row("MOVIMIENTO XYZ", 50.0, 1, 1150.0);
    auto [downDirection, downBasis] = TransactionNormalizer::Classify(columnDown, rules, 1200.0);
    assert(downDirection == domain::Direction::Debit && downBasis == domain::DirectionBasis::Column);

    auto large = Row("OPERACION", 500.0, 1, 100.0);
    auto [largeDirection, largeBasis] = TransactionNormalizer::Classify(large, rules, std::nullopt);
    assert(largeDirection == domain::Direction::Credit && largeBasis == domain::DirectionBasis::Fallback);

    auto small = Row("OPERACION", 50.0, 1);
    auto [smallDirection, smallBasis] = TransactionNormalizer::Classify(small, rules, std::nullopt);
    assert(smallDirection == domain::Direction::Debit && smallBasis == domain::DirectionBasis::Fallback);
    std::cout << "[PASS] Marker, keyword, column and fallback applied in order." << std::endl;
}

static void TestBankSpecificKeywords() {
    std::cout << "[Test] Bank debit keywords over base credit keywords..." << std::endl;
    const auto catalog = infrastructure::BankRuleCatalogLoader::Load("config/bank_rules.json");

    auto cardPayment = Row("PAGO TARJETA DE CREDITO", -1500.0, 4);
    auto [bbvaDirection, bbvaBasis] = TransactionNormalizer::Classify(cardPayment, catalog.resolve("bbva"), std::nullopt);
    assert(bbvaDirection == domain::Direction::Debit && bbvaBasis == domain::DirectionBasis::Keyword);

    auto interest = Row("INTERES FINANCIERO", -1500.0, 4);
    auto [amexDirection, amexBasis] = TransactionNormalizer::Classify(interest, catalog.resolve("amex"), std::nullopt);
    assert(amexDirection == domain::Direction::Debit && amexBasis == domain::DirectionBasis::Keyword);

    // Base rules alone still read the shorter credit keyword.
    assert(TransactionNormalizer::Classify(interest, domain::RuleSet::Base(), std::nullopt).first == domain::Direction::Credit);

    TransactionNormalizer normalizer;
    auto result = normalizer.normalize({interest}, catalog.resolve("amex"));
    assert(result.transactions.size() == 1);
    assert(Near(result.transactions[0].amount, -1500.0));
    std::cout << "[PASS] Longest keyword decides the direction." << std::endl;
}

static void TestCarryAndRunningBalance() {
    std::cout << "[Test] Carry rows and running balance..." << std::endl;
    TransactionNormalizer normalizer;
    auto result = normalizer.normalize({Carry("SALDO ANTERIOR", 1000.0), Row("MOVIMIENTO XYZ", -200.0, 2, 1200.0),
                                        Row("MOVIMIENTO ABC", 50.0, 3, 1150.0), Carry("SALDO FINAL", 1150.0)},
                                       domain::RuleSet::Base());
    assert(result.transactions.size() == 2);
    assert(Near(*result.openingCarry, 1000.0));
    assert(Near(*result.closingCarry, 1150.0));
    assert(result.transactions[0].direction == domain::Direction::Credit);
    assert(Near(result.transactions[0].amount, 200.0));
    assert(result.transactions[0].movementKind == domain::MovementKind::Income);
    assert(result.transactions[1].direction == domain::Direction::Debit);
    assert(Near(result.transactions[1].amount, -50.0));
    assert(result.transactions[1].movementKind == domain::MovementKind::Expense);
    std::cout << "[PASS] Carry rows consumed and balances followed." << std::endl;
}

static void TestContinuationLines() {
    std::cout << "[Test] Continuation lines..." << std::endl;
    auto row = Row("PAGO SERVICIO LUZ", -749.50, 6);
    row.continuationLines = {"CFE SUMINISTRADOR", "TOTAL DE CARGOS"};

    domain::RuleSet merging = domain::RuleSet::Base();
    merging.mergeMultilineConcepts = true;
    TransactionNormalizer normalizer;
    auto merged = normalizer.normalize({row}, merging);
    assert(merged.transactions[0].description == "PAGO SERVICIO LUZ CFE SUMINISTRADOR");
    assert(merged.mergedContinuationLines == 1);
    assert(merged.transactions[0].continuationLines.empty());

    auto plain = normalizer.normalize({row}, domain::RuleSet::Base());
    assert(plain.transactions[0].description == "PAGO SERVICIO LUZ");
    std::cout << "[PASS] Wrapped concepts merged only when the bank asks." << std::endl;
}

static void TestRejections() {
    std::cout << "[Test] Rejection rules..." << std::endl;
    TransactionNormalizer normalizer(1000000.0);
    auto result = normalizer.normalize({Row("COMISION", 0.0, 1), Row("DEPOSITO ERRONEO", 2500000.0, 1),
                                        Row("TOTAL DE CARGOS", -1100.0, 1), Row("123456", -10.0, 1),
                                        Row("--", -10.0, 1), Row("RETIRO CAJERO", -300.0, 1)},
                                       domain::RuleSet::Base());
    assert(result.transactions.size() == 1);
    assert(result.transactions[0].description == "RETIRO CAJERO");
    assert(result.rejectedZero == 1);
    assert(result.rejectedCeiling == 1);
    assert(result.rejectedSkip == 3);
    assert(TransactionNormalizer::IsNoise("SALDO PROMEDIO", domain::RuleSet::Base()));
    std::cout << "[PASS] Noise, zero and unrealistic rows dropped." << std::endl;
}

static void TestIdempotenceAndSigns() {
    std::cout << "[Test] Idempotence and sign invariant..." << std::endl;
    domain::RuleSet rules = domain::RuleSet::Base();
    rules.creditKeywords.insert("traspaso");
    TransactionNormalizer normalizer;
    std::vector<domain::Transaction> rows = {
        Carry("SALDO ANTERIOR", 500.0),
        Row("TRASPASO DE CUENTA PROPIA", -300.0, 1, 800.0),
        Row("COMPRA FARMACIA", 120.0, 2, 680.0),
        Row("COMPRA FARMACIA", 120.0, 2, 680.0),
        Row("INTERESES GANADOS", -1.25, 3, 681.25),
        Row("PAGO CR", -40.0, 4)
    };
    auto once = normalizer.normalize(rows, rules);
    auto twice = normalizer.normalize(once.transactions, rules);
    assert(SameLedger(once.transactions, twice.transactions));
    assert(twice.mergedDuplicates == 0);

    assert(once.transactions.size() == 4);
    assert(once.transactions[0].movementKind == domain::MovementKind::Transfer);
    assert(once.transactions[0].direction == domain::Direction::Credit);
    assert(once.transactions[2].direction == domain::Direction::Credit);
    assert(once.transactions[3].direction == domain::Direction::Credit);   // CR marker
    for (const auto& txn : twice.transactions) assert(domain::IsSignConsistent(txn));
    std::cout << "[PASS] Second pass is a no-op and signs follow direction." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Normalizer Test..." << std::endl;
    TestDeduplication();
    TestClassification();
    TestBankSpecificKeywords();
    TestCarryAndRunningBalance();
    TestContinuationLines();
    TestRejections();
    TestIdempotenceAndSigns();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
