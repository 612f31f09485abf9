#undef NDEBUG
#include <cassert>
#include <iostream>

#include "application/AccountClassifier.hpp"

using namespace ledgerwalker;
using application::AccountClassifier;
using application::ClassificationInput;

static application::RuleProvider Catalog() {
    domain::BankRuleOverride local;
    local.displayName = "Caja Popular Sur";
    local.aliases = {"CPS Digital"};
    std::map<std::string, domain::BankRuleOverride> overrides;
    overrides["cajasur"] = local;
    return application::RuleProvider(overrides, "test-1");
}

static void TestHeuristics() {
    std::cout << "[Test] Account type heuristics..." << std::endl;
    auto card = AccountClassifier::ScoreAccountType(
        "ESTADO DE CUENTA TARJETA DE CREDITO\nFECHA DE CORTE 15/03/2024\nPAGO MINIMO 1,200.00");
    assert(card.accountType == domain::AccountType::CreditCard);
    assert(card.creditCardHits == 3);
    assert(card.confidence > 0.79 && card.confidence <= 0.8);
    assert(card.msiEligible());

    auto single = AccountClassifier::ScoreAccountType("PAGO MINIMO 100.00");
    assert(single.accountType == domain::AccountType::Checking);
    assert(single.confidence == 0.5);

    auto debit = AccountClassifier::ScoreAccountType("Cuenta de cheques / tarjeta de débito");
    assert(debit.accountType == domain::AccountType::DebitCard);
    assert(!debit.msiEligible());
    std::cout << "[PASS] Credit card needs two phrases." << std::endl;
}

static void TestBankDetection() {
    std::cout << "[Test] Bank detection..." << std::endl;
    const auto rules = Catalog();
    AccountClassifier classifier(rules);
    assert(classifier.detectBank("BBVA BANCOMER S.A.") == std::optional<std::string>("bbva"));
    assert(classifier.detectBank("Estado de cuenta Citibanamex") == std::optional<std::string>("banamex"));
    assert(classifier.detectBank("Bienvenido a CPS DIGITAL") == std::optional<std::string>("cajasur"));
    assert(!classifier.detectBank("BANCO EJEMPLO"));
    assert(classifier.bankDisplayName("cajasur") == "Caja Popular Sur");
    assert(classifier.bankDisplayName("banamex") == "Citibanamex");

    auto hinted = classifier.classify("BBVA", ClassificationInput{std::string("CPS Digital"), {}, std::nullopt});
    assert(hinted.bankId == "cajasur");
    assert(hinted.source == domain::ClassificationSource::Heuristic);
    assert(!hinted.profileUpdate);
    std::cout << "[PASS] Built-in table and catalog aliases used." << std::endl;
}

static void TestAdvisory() {
    std::cout << "[Test] Advisory classification..." << std::endl;
    const auto rules = Catalog();
    AccountClassifier classifier(rules);
    const std::string statement = "BANORTE\nCUENTA DE CHEQUES";

    ClassificationInput input;
    input.knownProfile.bankName = std::string("Banorte");
    input.knownProfile.accountType = domain::AccountType::Checking;

    input.advisory = domain::AdvisoryClassification{"Citibanamex", domain::AccountType::CreditCard, 0.92};
    auto confident = classifier.classify(statement, input);
    assert(confident.accountType == domain::AccountType::CreditCard);
    assert(confident.source == domain::ClassificationSource::Advisory);
    assert(confident.bankId == "banamex");
    assert(confident.profileUpdate);
    assert(confident.profileUpdate->accountType == domain::AccountType::CreditCard);
    assert(confident.profileUpdate->bankName == std::optional<std::string>("Citibanamex"));

    input.advisory->confidence = 0.85;
    auto typeOnly = classifier.classify(statement, input);
    assert(typeOnly.accountType == domain::AccountType::CreditCard);
    assert(typeOnly.bankId == "banorte");
    assert(typeOnly.profileUpdate && typeOnly.profileUpdate->accountType);
    assert(!typeOnly.profileUpdate->bankName);

    input.advisory->confidence = 0.60;
    auto weak = classifier.classify(statement, input);
    assert(weak.accountType == domain::AccountType::Checking);
    assert(weak.source == domain::ClassificationSource::KnownProfile);
    assert(weak.confidence == 1.0);
    assert(!weak.profileUpdate);

    input.advisory = domain::AdvisoryClassification{"BANORTE", domain::AccountType::Checking, 0.95};
    auto agreeing = classifier.classify(statement, input);
    assert(!agreeing.profileUpdate);

    ClassificationInput unknownProfile;
    unknownProfile.advisory = domain::AdvisoryClassification{"", domain::AccountType::Savings, 0.40};
    auto fallback = classifier.classify("SIN DATOS", unknownProfile);
    assert(fallback.accountType == domain::AccountType::Savings);
    assert(fallback.bankId.empty());
    assert(!fallback.profileUpdate);
    std::cout << "[PASS] Thresholds 0.80 and 0.90 respected." << std::endl;
}

int main() {
    std::cout << "[Test] Starting AccountClassifier Test..." << std::endl;
    TestHeuristics();
    TestBankDetection();
    TestAdvisory();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
