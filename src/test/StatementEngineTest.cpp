#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "application/StatementEngine.hpp"

using namespace ledgerwalker;
using application::EngineRequest;
using application::StatementEngine;

static bool Near(double a, double b) {
    return std::abs(a - b) < 0.001;
}

static std::string Statement(const std::string& closing) {
    return "BANCO EJEMPLO\n"
           "PERIODO DEL 01/03/2024 AL 31/03/2024\n"
           "SALDO ANTERIOR 10,000.00\n"
           "MAR. 02 1234567890 DEPOSITO NOMINA 5,000.00 15,000.00\n"
           "MAR 05 COMPRA OXXO 250.50 14,749.50\n"
           "MAR 06 PAGO SERVICIO LUZ 749.50\n"
           "   CFE SUMINISTRADOR\n"
           "01/03/2024 COMISION MANEJO 100.00\n"
           "TOTAL DE CARGOS 1,100.00\n"
           "SALDO FINAL " + closing + "\n";
}

class FailingStrategy : public domain::ExtractionStrategy {
public:
    explicit FailingStrategy(bool throws) : m_throws(throws) {}

    std::string name() const override { return m_throws ? "throwing" : "empty_handed"; }

    domain::StrategyResult run(const std::string&, const domain::RuleSet&) const override {
        if (m_throws) throw std::runtime_error("layout not understood");
        domain::StrategyResult result;
        result.error = "no_patterns";
        return result;
    }

private:
    bool m_throws;
};

static void TestTextStatement() {
    std::cout << "[Test] Parse text statement..." << std::endl;
    StatementEngine engine{application::RuleProvider()};
    EngineRequest request;
    request.text = Statement("13,900.00");
    request.accountMetadata = domain::AccountMetadata{"acc-9", "co-1", "t-1"};

    auto response = engine.parse(request);
    assert(response.statementProduced);
    assert(response.issues.empty());
    assert(response.transactions.size() == 4);

    const auto& deposit = response.transactions[0];
    assert(deposit.direction == domain::Direction::Credit);
    assert(Near(deposit.amount, 5000.0));
    assert(deposit.movementKind == domain::MovementKind::Income);
    assert(deposit.reference == std::optional<std::string>("1234567890"));

    const auto& bill = response.transactions[2];
    assert(bill.description == "PAGO SERVICIO LUZ");
    assert(bill.direction == domain::Direction::Debit && Near(bill.amount, -749.50));

    const auto& fee = response.transactions[3];
    assert(fee.date->toIso() == "2024-03-01");
    for (const auto& txn : response.transactions) assert(domain::IsSignConsistent(txn));

    const auto& summary = response.summary;
    assert(Near(*summary.openingBalance, 10000.0));
    assert(Near(*summary.closingBalance, 13900.0));
    assert(Near(summary.totalCredits, 5000.0));
    assert(Near(summary.totalDebits, 1100.0));
    assert(summary.reconciliationStatus == domain::ReconciliationStatus::Ok);
    assert(summary.periodStart->toIso() == "2024-03-01" && summary.periodEnd->toIso() == "2024-03-31");

    const auto& diagnostics = response.diagnostics;
    assert(diagnostics["selected_strategy"] == "standard");
    assert(diagnostics["strategy_scores"].size() == 4);
    assert(diagnostics["early_exit"] == false);
    assert(diagnostics["input"] == "text");
    assert(diagnostics["msi_enabled"] == false);
    assert(diagnostics["reconciliation_status"] == "OK");
    assert(response.accountMetadata && response.accountMetadata->id == "acc-9");
    assert(response.matches.empty());
    std::cout << "[PASS] Statement parsed and reconciled." << std::endl;
}

static void TestMismatchAndQuality() {
    std::cout << "[Test] Mismatch and partial quality..." << std::endl;
    StatementEngine engine{application::RuleProvider()};
    EngineRequest request;
    request.text = Statement("14,000.00");
    auto mismatch = engine.parse(request);
    assert(mismatch.statementProduced);
    assert(mismatch.hasIssue("ReconciliationMismatch"));
    assert(Near(*mismatch.summary.reconciliationDifference, -100.0));

    StatementEngine lowScoring(application::RuleProvider(), domain::EngineSettings{}, {},
                               [](const std::vector<domain::Transaction>&, const std::string&) { return 0.3; });
    request.text = Statement("13,900.00");
    auto partial = lowScoring.parse(request);
    assert(partial.statementProduced);
    assert(partial.hasIssue("PartialQuality"));
    assert(partial.transactions.size() == 4);
    std::cout << "[PASS] Reviewer flags raised without dropping the statement." << std::endl;
}

static void TestCarryPhraseInsideMovement() {
    std::cout << "[Test] Carry phrase inside a movement..." << std::endl;
    StatementEngine engine{application::RuleProvider()};
    EngineRequest request;
    request.text = "PERIODO DEL 01/03/2024 AL 31/03/2024\n"
                   "MAR 02 COMPRA AMAZON MX 1,200.00\n"
                   "MAR 05 PAGO SALDO ANTERIOR GRACIAS 3,000.00\n"
                   "MAR 09 COMPRA LIVERPOOL 800.00\n";
    auto response = engine.parse(request);
    assert(response.statementProduced);
    assert(response.transactions.size() == 2);
    assert(!response.summary.openingBalance);
    assert(Near(response.summary.totalCredits, 0.0));
    assert(Near(response.summary.totalDebits, 2000.0));
    assert(response.summary.reconciliationStatus == domain::ReconciliationStatus::Unverified);
    assert(response.diagnostics["normalization"]["rejected_skip"] == 1);
    std::cout << "[PASS] Opening balance left untouched." << std::endl;
}

static void TestEmptyAndFailed() {
    std::cout << "[Test] Empty text and failed extraction..." << std::endl;
    StatementEngine engine{application::RuleProvider()};
    EngineRequest empty;
    empty.text = "   \n";
    auto emptyResponse = engine.parse(empty);
    assert(emptyResponse.hasIssue("ExtractionEmpty"));
    assert(emptyResponse.statementProduced);
    assert(emptyResponse.transactions.empty());
    assert(emptyResponse.summary.reconciliationStatus == domain::ReconciliationStatus::Unverified);

    StatementEngine failing(application::RuleProvider(), domain::EngineSettings{},
                            {std::make_shared<FailingStrategy>(true), std::make_shared<FailingStrategy>(false)});
    EngineRequest request;
    request.text = Statement("13,900.00");
    auto failed = failing.parse(request);
    assert(!failed.statementProduced);
    assert(failed.hasIssue("AllStrategiesFailed"));
    assert(failed.transactions.empty());
    assert(failed.diagnostics["selected_strategy"].is_null());
    assert(failed.diagnostics["strategy_scores"][0]["error"] == "layout not understood");
    assert(failed.diagnostics["strategy_scores"][1]["failed"] == true);
    std::cout << "[PASS] Failures surfaced as issues." << std::endl;
}

static void TestCreditCardMsi() {
    std::cout << "[Test] Credit card installments..." << std::endl;
    StatementEngine engine{application::RuleProvider()};
    EngineRequest request;
    request.text = Statement("13,900.00");
    request.knownBankName = std::string("Banorte");
    request.advisory = domain::AdvisoryClassification{"Inbursa", domain::AccountType::CreditCard, 0.95};

    domain::InvoiceCandidate tv;
    tv.id = "F-TV";
    tv.date = *domain::CalendarDate::Make(2024, 3, 1);
    tv.total = 9000.0;
    tv.paymentMethodIsCard = true;
    domain::InvoiceCandidate cash = tv;
    cash.id = "F-CASH";
    cash.paymentMethodIsCard = false;
    request.invoiceCandidates = {tv, cash};

    auto response = engine.parse(request);
    assert(response.classification.accountType == domain::AccountType::CreditCard);
    assert(response.classification.bankId == "inbursa");
    assert(response.profileUpdate && response.profileUpdate->bankName == std::optional<std::string>("Inbursa"));
    assert(response.diagnostics["msi_enabled"] == true);
    assert(response.matches.size() == 1);
    assert(response.matches[0].transactionIndex == 2);
    assert(response.matches[0].invoiceId == "F-TV");
    assert(response.matches[0].months == std::optional<int>(12));
    assert(response.transactions[2].msi && response.transactions[2].msi->modelTag == "bank_parser_v1");
    assert(!response.hasIssue("AmbiguousMSIMatch"));

    request.advisory.reset();
    request.accountType = domain::AccountType::Checking;
    auto checking = engine.parse(request);
    assert(checking.matches.empty());
    assert(!checking.transactions[2].msi);
    std::cout << "[PASS] Installments matched only for credit cards." << std::endl;
}

static void TestCandidateRows() {
    std::cout << "[Test] Pre-structured rows..." << std::endl;
    StatementEngine engine{application::RuleProvider()};
    nlohmann::json rows = nlohmann::json::array();
    rows.push_back({{"Fecha", "01/03/2024"}, {"Concepto", "SALDO ANTERIOR"}, {"Saldo", "8,000.00"}});
    rows.push_back({{"Fecha", "02/03/2024"}, {"Concepto", "SPEI RECIBIDO CLIENTE"}, {"Abonos", 1200.5}, {"Saldo", 9200.5}});
    rows.push_back({{"Fecha", "03/03/2024"}, {"Concepto", "COMPRA GASOLINA"}, {"Cargos", "$500.00"}, {"Saldo", 8700.5}});

    EngineRequest request;
    request.candidateRows = rows;
    auto response = engine.parse(request);
    assert(response.statementProduced);
    assert(!response.hasIssue("ExtractionEmpty"));
    assert(response.diagnostics["input"] == "rows");
    assert(response.diagnostics["selected_strategy"] == "tabular");
    assert(response.transactions.size() == 2);
    assert(response.transactions[0].direction == domain::Direction::Credit);
    assert(Near(*response.summary.openingBalance, 8000.0));
    assert(Near(*response.summary.closingBalance, 8700.5));
    assert(response.summary.reconciliationStatus == domain::ReconciliationStatus::Ok);
    std::cout << "[PASS] Rows bypass text extraction." << std::endl;
}

int main() {
    std::cout << "[Test] Starting StatementEngine Test..." << std::endl;
    TestTextStatement();
    TestMismatchAndQuality();
    TestCarryPhraseInsideMovement();
    TestEmptyAndFailed();
    TestCreditCardMsi();
    TestCandidateRows();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
