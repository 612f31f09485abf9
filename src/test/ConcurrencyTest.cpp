#undef NDEBUG
#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <cassert>
#include "application/StatementEngine.hpp"
#include "infrastructure/JsonCodec.hpp"

using namespace ledgerwalker;

static std::string Statement(int variant) {
    const std::string day = std::to_string(10 + variant % 15);
    return "BANCO EJEMPLO TARJETA DE CREDITO\n"
           "FECHA DE CORTE 31/03/2024 PAGO MINIMO 500.00\n"
           "PERIODO DEL 01/03/2024 AL 31/03/2024\n"
           "SALDO ANTERIOR 2,000.00\n"
           "MAR 02 COMPRA TIENDA 500.00 1,500.00\n"
           "MAR " + day + " COMPRA VARIANTE " + std::to_string(variant) + " 1" + std::to_string(variant % 10) + ".00\n"
           "MAR 20 PAGO RECIBIDO ABONO 300.00\n";
}

static application::EngineRequest Request(int variant) {
    application::EngineRequest request;
    request.text = Statement(variant);
    domain::InvoiceCandidate invoice;
    invoice.id = "F-" + std::to_string(variant);
    invoice.date = *domain::CalendarDate::Make(2024, 3, 1);
    invoice.total = 6000.0;
    invoice.paymentMethodIsCard = true;
    request.invoiceCandidates.push_back(invoice);
    return request;
}

// Diagnostics carry timing-independent content only, so whole responses compare equal.
static std::string Fingerprint(const application::EngineResponse& response) {
    return infrastructure::JsonCodec::ToJson(response).dump();
}

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    const application::StatementEngine engine{application::RuleProvider()};
    domain::EngineSettings parallelSettings;
    parallelSettings.parallelStrategies = true;
    const application::StatementEngine parallelEngine{application::RuleProvider(), parallelSettings};

    const int NUM_STATEMENTS = 40;
    std::vector<std::string> expected;
    for (int i = 0; i < NUM_STATEMENTS; ++i) {
        expected.push_back(Fingerprint(engine.parse(Request(i))));
    }

    auto sample = engine.parse(Request(0));
    assert(sample.classification.accountType == domain::AccountType::CreditCard);
    assert(sample.matches.size() == 1 && sample.matches[0].months == std::optional<int>(12));

    std::vector<std::string> actual(NUM_STATEMENTS);
    std::vector<std::string> actualParallel(NUM_STATEMENTS);
    std::vector<std::thread> threads;
    std::atomic<int> completed{0};

    std::cout << "[Test] Spawning " << NUM_STATEMENTS << " threads parsing statements..." << std::endl;
    auto startTime = std::chrono::steady_clock::now();

    for (int i = 0; i < NUM_STATEMENTS; ++i) {
        threads.emplace_back([&, i]() {
            actual[i] = Fingerprint(engine.parse(Request(i)));
            actualParallel[i] = Fingerprint(parallelEngine.parse(Request(i)));
            completed++;
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
    std::cout << "[Test] " << completed.load() << " statements parsed in " << elapsed.count() << " ms" << std::endl;

    assert(completed.load() == NUM_STATEMENTS);
    for (int i = 0; i < NUM_STATEMENTS; ++i) {
        if (actual[i] != expected[i] || actualParallel[i] != expected[i]) {
            std::cerr << "[FAIL] Statement " << i << " differs under concurrency" << std::endl;
            return 1;
        }
    }

    std::cout << "[PASS] Concurrent parses match sequential results." << std::endl;
    return 0;
}
