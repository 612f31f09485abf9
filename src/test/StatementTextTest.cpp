#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>

#include "domain/CalendarDate.hpp"
#include "domain/StatementHeader.hpp"
#include "domain/StatementText.hpp"

using namespace ledgerwalker::domain;

static bool Near(double a, double b) {
    return std::abs(a - b) < 0.001;
}

static void TestParseAmount() {
    std::cout << "[Test] ParseAmount..." << std::endl;
    assert(Near(*text::ParseAmount("1,234.56"), 1234.56));
    assert(Near(*text::ParseAmount("$ 500.00"), 500.0));
    assert(Near(*text::ParseAmount("-75.10"), -75.10));
    assert(Near(*text::ParseAmount("75.10-"), -75.10));
    assert(Near(*text::ParseAmount("(1,000.00)"), -1000.0));
    assert(Near(*text::ParseAmount("1.234,56"), 1234.56));
    assert(Near(*text::ParseAmount("12,50"), 12.5));
    assert(Near(*text::ParseAmount("1,234"), 1234.0));
    assert(!text::ParseAmount("ABC"));
    assert(!text::ParseAmount(""));
    std::cout << "[PASS] Amount tokens parsed." << std::endl;
}

static void TestTextHelpers() {
    std::cout << "[Test] Text helpers..." << std::endl;
    assert(text::NormalizeDescription("  PAGO | TARJETA ** 1234.  ") == "pago tarjeta 1234");
    assert(text::NormalizeDescription("Compra ( ) OXXO") == "compra oxxo");
    assert(text::ContainsWord("PAGO CR 100", "CR"));
    assert(!text::ContainsWord("CREDITO", "CR"));
    assert(*text::MonthFromToken("mar.") == 3);
    assert(*text::MonthFromToken("Septiembre") == 9);
    assert(*text::MonthFromToken("DEC") == 12);
    assert(!text::MonthFromToken("XYZ"));
    assert(text::ContainsMonthToken("ENE 12 DEPOSITO"));
    assert(!text::ContainsMonthToken("MARCADOR 12"));
    assert(text::ToCents(19.999) == 2000);
    assert(text::FormatAmount(1100.0) == "1100.00");
    assert(text::FormatAmount(-3.456) == "-3.46");
    assert(text::SplitLines("a\r\nb\nc").size() == 3);
    std::cout << "[PASS] Text helpers behave." << std::endl;
}

static void TestCalendarDate() {
    std::cout << "[Test] CalendarDate..." << std::endl;
    assert(!CalendarDate::Make(2023, 2, 29));
    assert(CalendarDate::Make(2024, 2, 29));
    auto d = *CalendarDate::FromIso("2024-03-01");
    assert(d.addDays(-1).toIso() == "2024-02-29");
    assert(d.addDays(31).toIso() == "2024-04-01");
    assert(CalendarDate::FromDays(d.toDays()) == d);
    assert(*CalendarDate::FromIso("2024-01-31") < d);
    std::cout << "[PASS] Calendar arithmetic is correct." << std::endl;
}

static void TestHeaderScan() {
    std::cout << "[Test] StatementHeader::Scan..." << std::endl;
    const std::string text =
        "BANCO INBURSA\n"
        "PERIODO DEL 01/12/2023 AL 31/01/2024\n"
        "SALDO ANTERIOR 10,000.00\n"
        "DIC. 15 COMPRA 100.00 9,900.00\n"
        "SALDO FINAL 9,900.00\n";
    auto header = StatementHeader::Scan(text);
    assert(header.periodStart && header.periodStart->toIso() == "2023-12-01");
    assert(header.periodEnd && header.periodEnd->toIso() == "2024-01-31");
    assert(header.yearHint == 2024);
    assert(header.openingBalance && Near(*header.openingBalance, 10000.0));
    assert(header.closingBalance && Near(*header.closingBalance, 9900.0));

    // December rows belong to the year the period started in.
    assert(header.resolveMonthDay(12, 15)->toIso() == "2023-12-15");
    assert(header.resolveMonthDay(1, 5)->toIso() == "2024-01-05");
    assert(header.parseDate("DIC. 15")->toIso() == "2023-12-15");
    assert(header.parseDate("15/ENE/2024")->toIso() == "2024-01-15");
    assert(header.parseDate("2024-01-20")->toIso() == "2024-01-20");
    assert(header.parseDate("20/01/24")->toIso() == "2024-01-20");
    assert(!header.parseDate("31/02/2024"));

    auto named = StatementHeader::Scan("Del 1 MAR 2024 al 31 MAR 2024\n");
    assert(named.periodStart->toIso() == "2024-03-01");
    assert(named.periodEnd->toIso() == "2024-03-31");
    assert(!named.openingBalance);
    std::cout << "[PASS] Header facts extracted." << std::endl;
}

int main() {
    std::cout << "[Test] Starting StatementText Test..." << std::endl;
    TestParseAmount();
    TestTextHelpers();
    TestCalendarDate();
    TestHeaderScan();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
