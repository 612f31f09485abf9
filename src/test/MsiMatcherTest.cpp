#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>

#include "application/MsiMatcher.hpp"

using namespace ledgerwalker;
using application::MsiMatcher;

static bool Near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

static domain::CalendarDate Date(int year, int month, int day) {
    return *domain::CalendarDate::Make(year, month, day);
}

static domain::Transaction Charge(double amount, int day, domain::Direction direction = domain::Direction::Debit) {
    domain::Transaction txn;
    txn.date = Date(2024, 3, day);
    txn.description = "COMPRA TIENDA";
    txn.direction = direction;
    txn.amount = direction == domain::Direction::Credit ? amount : -amount;
    return txn;
}

static domain::InvoiceCandidate Invoice(const std::string& id, double total, domain::CalendarDate date) {
    domain::InvoiceCandidate invoice;
    invoice.id = id;
    invoice.total = total;
    invoice.date = date;
    invoice.paymentMethodIsCard = true;
    return invoice;
}

static std::vector<domain::InvoiceCandidate> Invoices() {
    std::vector<domain::InvoiceCandidate> invoices = {
        Invoice("INV-TV", 6000.0, Date(2024, 3, 1)),
        Invoice("INV-B", 1800.0, Date(2024, 3, 5)),
        Invoice("INV-C", 1800.0, Date(2024, 3, 8))
    };
    auto confirmed = Invoice("INV-CONFIRMED", 6000.0, Date(2024, 3, 1));
    confirmed.confirmedMonths = 6;
    auto cancelled = Invoice("INV-CANCELLED", 6000.0, Date(2024, 3, 2));
    cancelled.cancelled = true;
    auto cash = Invoice("INV-CASH", 6000.0, Date(2024, 3, 3));
    cash.paymentMethodIsCard = false;
    auto old = Invoice("INV-OLD", 6000.0, Date(2023, 12, 1));
    auto empty = Invoice("INV-ZERO", 0.0, Date(2024, 3, 1));
    invoices.insert(invoices.end(), {confirmed, cancelled, cash, old, empty});
    return invoices;
}

static void TestInferMonths() {
    std::cout << "[Test] Installment inference..." << std::endl;
    MsiMatcher matcher;
    assert(matcher.InferMonths(500.0, 6000.0) == std::optional<int>(12));
    assert(matcher.InferMonths(2000.0, 6000.0) == std::optional<int>(3));
    assert(matcher.InferMonths(1010.0, 6000.0) == std::optional<int>(6));
    assert(!matcher.InferMonths(6000.0, 6000.0));
    assert(!matcher.InferMonths(700.0, 6000.0));
    assert(Near(MsiMatcher::AmbiguousConfidence(2), 0.50));
    assert(Near(MsiMatcher::AmbiguousConfidence(10), 0.30));
    std::cout << "[PASS] Months inferred within tolerance." << std::endl;
}

static void TestMatching() {
    std::cout << "[Test] Matching charges to invoices..." << std::endl;
    MsiMatcher matcher;
    std::vector<domain::Transaction> txns = {
        Charge(500.0, 10),
        Charge(500.0, 11, domain::Direction::Credit),
        Charge(2000.0, 12),
        Charge(300.0, 15),
        Charge(123.45, 16)
    };
    txns[0].reference = std::string("0001234567");

    auto matches = matcher.match(txns, Invoices());
    assert(matches.size() == 3);
    assert(txns.size() == 5);

    const auto& monthly = matches[0];
    assert(monthly.transactionIndex == 0);
    assert(monthly.transactionRef == std::optional<std::string>("0001234567"));
    assert(monthly.invoiceId == "INV-TV");
    assert(monthly.months == std::optional<int>(12));
    assert(Near(monthly.confidence, 0.95));
    assert(!monthly.ambiguous);
    assert(txns[0].msi && txns[0].msi->candidateInvoiceId == "INV-TV");
    assert(txns[0].msi->modelTag == "bank_parser_v1");

    assert(!txns[1].msi);

    assert(matches[1].transactionIndex == 2);
    assert(matches[1].months == std::optional<int>(3));

    const auto& ambiguous = matches[2];
    assert(ambiguous.transactionIndex == 3);
    assert(ambiguous.ambiguous);
    assert(Near(ambiguous.confidence, 0.50));
    assert(!ambiguous.months);
    assert(ambiguous.invoiceId == "INV-C");
    assert(ambiguous.alternativeInvoiceIds == std::vector<std::string>{"INV-B"});
    assert(txns[3].msi && !txns[3].msi->months);

    assert(!txns[4].msi);
    std::cout << "[PASS] Single and ambiguous matches reported." << std::endl;
}

static void TestWindow() {
    std::cout << "[Test] Invoice window..." << std::endl;
    MsiMatcher matcher;
    std::vector<domain::Transaction> txns = {Charge(500.0, 10), Charge(80.0, 20)};
    auto window = matcher.windowFor(txns);
    assert(window);
    assert(window->start == Date(2024, 2, 9));
    assert(window->end == Date(2024, 3, 27));

    auto overridden = matcher.match(txns, Invoices(),
                                    application::InvoiceWindow{Date(2023, 11, 1), Date(2023, 12, 31)});
    assert(overridden.size() == 1);
    assert(overridden[0].invoiceId == "INV-OLD");

    std::vector<domain::Transaction> undated = {Charge(500.0, 10)};
    undated[0].date.reset();
    assert(!matcher.windowFor(undated));
    auto all = matcher.match(undated, {Invoice("A", 6000.0, Date(2024, 3, 1)), Invoice("B", 6000.0, Date(2020, 1, 1))});
    assert(all.size() == 1 && all[0].ambiguous);
    assert(all[0].invoiceId == "A");

    std::vector<domain::Transaction> untouched = {Charge(500.0, 10)};
    assert(matcher.match(untouched, {}).empty());
    assert(!untouched[0].msi);
    std::cout << "[PASS] Window derived from dates or overridden." << std::endl;
}

int main() {
    std::cout << "[Test] Starting MsiMatcher Test..." << std::endl;
    TestInferMonths();
    TestMatching();
    TestWindow();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
