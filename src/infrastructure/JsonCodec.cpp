/**
 * @file JsonCodec.cpp
 * @brief Implementation of JsonCodec.
 */

#include "infrastructure/JsonCodec.hpp"
#include <stdexcept>

namespace ledgerwalker::infrastructure {

using nlohmann::json;

namespace {

domain::CalendarDate DateField(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) {
        throw std::runtime_error(std::string("Missing date field '") + key + "'");
    }
    const std::string raw = j[key].get<std::string>();
    // Accept full timestamps by keeping the date part.
    auto date = domain::CalendarDate::FromIso(raw.substr(0, 10));
    if (!date) {
        throw std::runtime_error(std::string("Invalid date in '") + key + "': " + raw);
    }
    return *date;
}

std::optional<std::string> OptionalString(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_string()) {
        throw std::runtime_error(std::string("Field '") + key + "' must be a string");
    }
    return j[key].get<std::string>();
}

template <typename T>
json Nullable(const std::optional<T>& value) {
    return value ? json(*value) : json();
}

json Nullable(const std::optional<domain::CalendarDate>& date) {
    return date ? json(date->toIso()) : json();
}

} // namespace

domain::InvoiceCandidate JsonCodec::InvoiceFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Invoice candidate must be an object");
    }
    domain::InvoiceCandidate invoice;
    if (!j.contains("id")) {
        throw std::runtime_error("Invoice candidate without id");
    }
    invoice.id = j["id"].is_string() ? j["id"].get<std::string>() : j["id"].dump();
    invoice.date = DateField(j, "date");
    if (!j.contains("total") || !j["total"].is_number()) {
        throw std::runtime_error("Invoice " + invoice.id + " has no numeric total");
    }
    invoice.total = j["total"].get<double>();
    if (j.contains("payment_method_is_card")) {
        invoice.paymentMethodIsCard = j["payment_method_is_card"].get<bool>();
    } else if (auto method = OptionalString(j, "payment_method")) {
        // SAT payment form 04 is "tarjeta de credito".
        invoice.paymentMethodIsCard = *method == "04" || *method == "card" || *method == "credit_card";
    }
    if (j.contains("confirmed_months") && j["confirmed_months"].is_number_integer()) {
        invoice.confirmedMonths = j["confirmed_months"].get<int>();
    }
    invoice.cancelled = j.value("cancelled", false) || j.value("status", std::string()) == "cancelled";
    invoice.issuerName = j.value("issuer_name", std::string());
    return invoice;
}

application::EngineRequest JsonCodec::RequestFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Request must be a JSON object");
    }
    application::EngineRequest request;
    request.text = OptionalString(j, "text").value_or("");
    request.bankHint = OptionalString(j, "bank_hint");
    request.knownBankName = OptionalString(j, "known_bank_name");
    if (auto type = OptionalString(j, "account_type")) {
        request.accountType = domain::AccountTypeFromString(*type);
    }

    if (j.contains("account_metadata") && j["account_metadata"].is_object()) {
        const auto& m = j["account_metadata"];
        domain::AccountMetadata metadata;
        metadata.id = m.value("id", std::string());
        metadata.companyId = m.value("company_id", std::string());
        metadata.tenantId = m.value("tenant_id", std::string());
        request.accountMetadata = metadata;
    }

    if (j.contains("invoice_candidates")) {
        if (!j["invoice_candidates"].is_array()) {
            throw std::runtime_error("'invoice_candidates' must be an array");
        }
        for (const auto& item : j["invoice_candidates"]) {
            request.invoiceCandidates.push_back(InvoiceFromJson(item));
        }
    }

    if (j.contains("period_override") && j["period_override"].is_object()) {
        const auto& p = j["period_override"];
        application::InvoiceWindow window{DateField(p, "start"), DateField(p, "end")};
        if (window.end < window.start) {
            throw std::runtime_error("period_override ends before it starts");
        }
        request.periodOverride = window;
    }

    if (j.contains("advisory") && j["advisory"].is_object()) {
        const auto& a = j["advisory"];
        domain::AdvisoryClassification advisory;
        advisory.bankName = a.value("bank_name", std::string());
        advisory.accountType = domain::AccountTypeFromString(a.value("account_type", std::string()));
        advisory.confidence = a.value("confidence", 0.0);
        request.advisory = advisory;
    }

    if (j.contains("candidate_rows") && !j["candidate_rows"].is_null()) {
        request.candidateRows = j["candidate_rows"];
    }
    return request;
}

json JsonCodec::ToJson(const domain::Transaction& t) {
    json j = {
        {"date", Nullable(t.date)},
        {"description", t.description},
        {"amount", t.amount},
        {"direction", domain::ToString(t.direction)},
        {"movement_kind", domain::ToString(t.movementKind)},
        {"reference", Nullable(t.reference)},
        {"balance_after", Nullable(t.balanceAfter)},
        {"confidence", t.confidence}
    };
    if (t.msi) {
        j["msi"] = {
            {"candidate_invoice_id", t.msi->candidateInvoiceId},
            {"months", Nullable(t.msi->months)},
            {"match_confidence", t.msi->matchConfidence},
            {"model_tag", t.msi->modelTag}
        };
    }
    return j;
}

json JsonCodec::ToJson(const domain::StatementSummary& s) {
    return {
        {"opening_balance", Nullable(s.openingBalance)},
        {"closing_balance", Nullable(s.closingBalance)},
        {"total_credits", s.totalCredits},
        {"total_debits", s.totalDebits},
        {"total_incomes", s.totalIncomes},
        {"total_expenses", s.totalExpenses},
        {"total_transfers", s.totalTransfers},
        {"transaction_count", s.transactionCount},
        {"period_start", Nullable(s.periodStart)},
        {"period_end", Nullable(s.periodEnd)},
        {"reconciliation_status", domain::ToString(s.reconciliationStatus)},
        {"reconciliation_difference", Nullable(s.reconciliationDifference)},
        {"detected_bank", s.detectedBank}
    };
}

json JsonCodec::ToJson(const domain::MatchResult& m) {
    return {
        {"transaction_index", m.transactionIndex},
        {"transaction_ref", Nullable(m.transactionRef)},
        {"invoice_id", m.invoiceId},
        {"months", Nullable(m.months)},
        {"confidence", m.confidence},
        {"ambiguous", m.ambiguous},
        {"reasoning", m.reasoning},
        {"alternative_invoice_ids", m.alternativeInvoiceIds}
    };
}

json JsonCodec::ToJson(const application::EngineResponse& response) {
    json transactions = json::array();
    for (const auto& t : response.transactions) transactions.push_back(ToJson(t));
    json matches = json::array();
    for (const auto& m : response.matches) matches.push_back(ToJson(m));
    json issues = json::array();
    for (const auto& issue : response.issues) {
        issues.push_back({{"code", issue.code}, {"severity", application::ToString(issue.severity)}, {"message", issue.message}});
    }

    json j = {
        {"statement_produced", response.statementProduced},
        {"transactions", transactions},
        {"summary", ToJson(response.summary)},
        {"matches", matches},
        {"issues", issues},
        {"diagnostics", response.diagnostics}
    };

    const auto& c = response.classification;
    j["classification"] = {
        {"bank_id", c.bankId},
        {"bank_name", c.bankName},
        {"account_type", domain::ToString(c.accountType)},
        {"confidence", c.confidence},
        {"source", domain::ToString(c.source)}
    };

    if (response.profileUpdate) {
        const auto& u = *response.profileUpdate;
        j["account_profile_update"] = {
            {"account_type", u.accountType ? json(domain::ToString(*u.accountType)) : json()},
            {"bank_name", Nullable(u.bankName)},
            {"confidence", u.confidence},
            {"reason", u.reason}
        };
    } else {
        j["account_profile_update"] = nullptr;
    }

    if (response.accountMetadata) {
        const auto& m = *response.accountMetadata;
        j["account_metadata"] = {{"id", m.id}, {"company_id", m.companyId}, {"tenant_id", m.tenantId}};
    }
    return j;
}

} // namespace ledgerwalker::infrastructure
