#include "record.hpp"
#include "node_error.hpp"
#include <array>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

using json = nlohmann::json;

namespace ledgerflow {

namespace {

// Alias tables: the first key present in the source object wins.
const std::array<const char*, 5> kCounterpartyKeys = {
    "counterparty", "vendor_name", "customer_name", "vendor_id", "customer_id"};
const std::array<const char*, 3> kInvoiceNumberKeys = {
    "invoice_number", "document_number", "invoice_no"};
const std::array<const char*, 3> kInvoiceDateKeys = {
    "invoice_date", "document_date", "date"};
const std::array<const char*, 5> kTotalKeys = {
    "inr_amount", "total_amount", "grand_total", "total", "amount"};
const std::array<const char*, 3> kPaidKeys = {
    "paid_amount", "received_amount", "paid"};
const std::array<const char*, 3> kTaxKeys = {
    "tax_amount", "tax_total", "tax"};
const std::array<const char*, 2> kOutstandingKeys = {
    "outstanding", "outstanding_amount"};

bool is_present(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && !it->is_null();
}

template <size_t N>
bool in_table(const std::string& key, const std::array<const char*, N>& keys) {
    for (const char* candidate : keys) {
        if (key == candidate) {
            return true;
        }
    }
    return false;
}

// Keys that name a typed member; an unused one must not shadow it
bool is_alias_key(const std::string& key) {
    return in_table(key, kCounterpartyKeys) || in_table(key, kInvoiceNumberKeys) ||
           in_table(key, kInvoiceDateKeys) || in_table(key, kTotalKeys) ||
           in_table(key, kPaidKeys) || in_table(key, kTaxKeys);
}

template <size_t N>
const char* first_present(const json& j, const std::array<const char*, N>& keys) {
    for (const char* key : keys) {
        if (is_present(j, key)) {
            return key;
        }
    }
    return nullptr;
}

std::string as_text(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

double as_number(const json& value, const std::string& key) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        if (text.empty()) {
            return 0.0;
        }
        char* end = nullptr;
        double parsed = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size()) {
            throw std::invalid_argument("field '" + key + "' is not numeric: " + text);
        }
        return parsed;
    }
    if (value.is_null()) {
        return 0.0;
    }
    throw std::invalid_argument("field '" + key + "' is not numeric");
}

template <typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template <typename T>
void get_optional(const json& j, const char* key, std::optional<T>& value) {
    if (is_present(j, key)) {
        value = j.at(key).get<T>();
    } else {
        value.reset();
    }
}

json text_or_null(const std::string& value) {
    return value.empty() ? json() : json(value);
}

template <typename T>
json optional_or_null(const std::optional<T>& value) {
    return value ? json(*value) : json();
}

} // anonymous namespace

json Record::field(const std::string& name) const {
    // Well-known names and their aliases always read the typed members
    if (name == "id") return text_or_null(id);
    for (const char* key : kCounterpartyKeys) {
        if (name == key) return text_or_null(counterparty);
    }
    for (const char* key : kInvoiceNumberKeys) {
        if (name == key) return text_or_null(invoice_number);
    }
    for (const char* key : kInvoiceDateKeys) {
        if (name == key) return text_or_null(invoice_date);
    }
    if (name == "due_date") return text_or_null(due_date);
    for (const char* key : kTotalKeys) {
        if (name == key) return total_amount;
    }
    for (const char* key : kPaidKeys) {
        if (name == key) return paid_amount;
    }
    for (const char* key : kTaxKeys) {
        if (name == key) return tax_amount;
    }
    for (const char* key : kOutstandingKeys) {
        if (name == key) return optional_or_null(outstanding);
    }
    if (name == "gross_amount") return optional_or_null(gross_amount);
    if (name == "status") return text_or_null(status);
    if (name == "aging_days") return optional_or_null(aging_days);
    if (name == "overdue_days") return optional_or_null(overdue_days);
    if (name == "aging_bucket") return text_or_null(aging_bucket);
    if (name == "sla_breach") return optional_or_null(sla_breach);
    if (name == "breach_days") return optional_or_null(breach_days);
    if (name == "sla_severity") return text_or_null(sla_severity);

    auto ext = extensions.find(name);
    if (ext != extensions.end()) {
        return *ext;
    }
    return json();
}

double Record::outstanding_or_derived() const {
    return outstanding ? *outstanding : total_amount - paid_amount;
}

bool Record::operator==(const Record& other) const {
    return id == other.id &&
           counterparty == other.counterparty &&
           invoice_number == other.invoice_number &&
           invoice_date == other.invoice_date &&
           due_date == other.due_date &&
           total_amount == other.total_amount &&
           paid_amount == other.paid_amount &&
           tax_amount == other.tax_amount &&
           outstanding == other.outstanding &&
           gross_amount == other.gross_amount &&
           status == other.status &&
           aging_days == other.aging_days &&
           overdue_days == other.overdue_days &&
           aging_bucket == other.aging_bucket &&
           sla_breach == other.sla_breach &&
           breach_days == other.breach_days &&
           sla_severity == other.sla_severity &&
           extensions == other.extensions;
}

bool Group::operator==(const Group& other) const {
    return group_name == other.group_name &&
           records == other.records &&
           count == other.count &&
           total_amount == other.total_amount &&
           total_outstanding == other.total_outstanding;
}

bool Summary::operator==(const Summary& other) const {
    return total_records == other.total_records &&
           total_amount == other.total_amount &&
           total_outstanding == other.total_outstanding &&
           average_amount == other.average_amount &&
           min_amount == other.min_amount &&
           max_amount == other.max_amount &&
           average_outstanding == other.average_outstanding &&
           total_groups == other.total_groups;
}

bool DuplicateCandidate::operator==(const DuplicateCandidate& other) const {
    return group == other.group &&
           confidence == other.confidence &&
           type == other.type &&
           reason == other.reason;
}

bool DuplicateReport::operator==(const DuplicateReport& other) const {
    return exact == other.exact && fuzzy == other.fuzzy;
}

bool Totals::operator==(const Totals& other) const {
    return gross_total == other.gross_total &&
           tax_total == other.tax_total &&
           net_total == other.net_total &&
           paid_total == other.paid_total &&
           outstanding_total == other.outstanding_total;
}

bool Envelope::operator==(const Envelope& other) const {
    return records == other.records &&
           groups == other.groups &&
           summary == other.summary &&
           duplicates == other.duplicates &&
           totals == other.totals;
}

// ============================================================================
// Payload
// ============================================================================

Payload::Payload(Envelope envelope)
    : fan_in_(false), envelope_(std::move(envelope)) {}

Payload Payload::fan_in(std::map<std::string, Envelope> upstream) {
    Payload payload;
    payload.fan_in_ = true;
    payload.upstream_ = std::move(upstream);
    return payload;
}

const Envelope& Payload::envelope() const {
    if (fan_in_) {
        throw NodeError("Node received a fan-in input from " + std::to_string(upstream_.size()) +
                        " predecessors; route it through RecordUnionNode first");
    }
    return envelope_;
}

Envelope& Payload::envelope() {
    if (fan_in_) {
        throw NodeError("Node received a fan-in input from " + std::to_string(upstream_.size()) +
                        " predecessors; route it through RecordUnionNode first");
    }
    return envelope_;
}

size_t Payload::record_count() const {
    if (!fan_in_) {
        return envelope_.records.size();
    }
    size_t total = 0;
    for (const auto& pair : upstream_) {
        total += pair.second.records.size();
    }
    return total;
}

bool Payload::operator==(const Payload& other) const {
    return fan_in_ == other.fan_in_ &&
           envelope_ == other.envelope_ &&
           upstream_ == other.upstream_;
}

// ============================================================================
// Helpers
// ============================================================================

std::string duplicate_type_to_string(DuplicateType type) {
    switch (type) {
        case DuplicateType::Exact: return "exact";
        case DuplicateType::Fuzzy: return "fuzzy";
        default: return "unknown";
    }
}

DuplicateType string_to_duplicate_type(const std::string& value) {
    if (value == "exact") return DuplicateType::Exact;
    if (value == "fuzzy") return DuplicateType::Fuzzy;
    throw std::invalid_argument("Unknown duplicate type: " + value);
}

double round_currency(double value) {
    // The epsilon absorbs binary representation error (1.005 is stored as 1.00499...)
    double scaled = std::fabs(value) * 100.0;
    double rounded = std::floor(scaled + 0.5 + 1e-9) / 100.0;
    return value < 0 ? -rounded : rounded;
}

// ============================================================================
// JSON conversions
// ============================================================================

void to_json(json& j, const Record& record) {
    j = json::object();

    // Extensions first so the canonical members overwrite any clash
    for (auto it = record.extensions.begin(); it != record.extensions.end(); ++it) {
        j[it.key()] = it.value();
    }

    if (!record.id.empty()) j["id"] = record.id;
    j["counterparty"] = record.counterparty;
    j["invoice_number"] = record.invoice_number;
    j["invoice_date"] = text_or_null(record.invoice_date);
    j["due_date"] = text_or_null(record.due_date);
    j["total_amount"] = record.total_amount;
    j["paid_amount"] = record.paid_amount;
    j["tax_amount"] = record.tax_amount;

    if (record.outstanding) {
        j["outstanding"] = *record.outstanding;
        j["outstanding_amount"] = *record.outstanding;
    }
    put_optional(j, "gross_amount", record.gross_amount);
    if (!record.status.empty()) j["status"] = record.status;
    put_optional(j, "aging_days", record.aging_days);
    put_optional(j, "overdue_days", record.overdue_days);
    if (!record.aging_bucket.empty()) j["aging_bucket"] = record.aging_bucket;
    put_optional(j, "sla_breach", record.sla_breach);
    put_optional(j, "breach_days", record.breach_days);
    if (!record.sla_severity.empty()) j["sla_severity"] = record.sla_severity;
}

void from_json(const json& j, Record& record) {
    if (!j.is_object()) {
        throw std::invalid_argument("record must be an object, got " + std::string(j.type_name()));
    }

    record = Record();
    json consumed = json::object();
    auto take_text = [&](const char* key, std::string& target) {
        if (key) {
            target = as_text(j.at(key));
            consumed[key] = true;
        }
    };
    auto take_number = [&](const char* key, double& target) {
        if (key) {
            target = as_number(j.at(key), key);
            consumed[key] = true;
        }
    };

    if (is_present(j, "id")) {
        record.id = as_text(j.at("id"));
    }
    consumed["id"] = true;

    take_text(first_present(j, kCounterpartyKeys), record.counterparty);
    take_text(first_present(j, kInvoiceNumberKeys), record.invoice_number);
    take_text(first_present(j, kInvoiceDateKeys), record.invoice_date);
    take_text(is_present(j, "due_date") ? "due_date" : nullptr, record.due_date);
    consumed["due_date"] = true;
    take_number(first_present(j, kTotalKeys), record.total_amount);
    take_number(first_present(j, kPaidKeys), record.paid_amount);
    take_number(first_present(j, kTaxKeys), record.tax_amount);

    if (const char* key = first_present(j, kOutstandingKeys)) {
        record.outstanding = as_number(j.at(key), key);
    }
    for (const char* key : kOutstandingKeys) {
        consumed[key] = true;
    }

    get_optional(j, "gross_amount", record.gross_amount);
    get_optional(j, "aging_days", record.aging_days);
    get_optional(j, "overdue_days", record.overdue_days);
    get_optional(j, "sla_breach", record.sla_breach);
    get_optional(j, "breach_days", record.breach_days);
    if (is_present(j, "status")) record.status = j.at("status").get<std::string>();
    if (is_present(j, "aging_bucket")) record.aging_bucket = j.at("aging_bucket").get<std::string>();
    if (is_present(j, "sla_severity")) record.sla_severity = j.at("sla_severity").get<std::string>();
    for (const char* key : {"gross_amount", "aging_days", "overdue_days", "sla_breach",
                            "breach_days", "status", "aging_bucket", "sla_severity"}) {
        consumed[key] = true;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!consumed.contains(it.key())) {
            // A second alias of a typed member is kept as raw_<key>
            const std::string& key = it.key();
            record.extensions[is_alias_key(key) ? "raw_" + key : key] = it.value();
        }
    }
}

void to_json(json& j, const Group& group) {
    j = json{
        {"group_name", group.group_name},
        {"records", group.records},
        {"count", group.count},
        {"total_amount", group.total_amount},
        {"total_outstanding", group.total_outstanding}
    };
}

void from_json(const json& j, Group& group) {
    group.group_name = j.at("group_name").get<std::string>();
    group.records = j.value("records", json::array()).get<std::vector<Record>>();
    group.count = j.value("count", group.records.size());
    group.total_amount = j.value("total_amount", 0.0);
    group.total_outstanding = j.value("total_outstanding", 0.0);
}

void to_json(json& j, const Summary& summary) {
    j = json{
        {"total_records", summary.total_records},
        {"total_amount", summary.total_amount},
        {"total_outstanding", summary.total_outstanding},
        {"average_amount", summary.average_amount}
    };
    put_optional(j, "min_amount", summary.min_amount);
    put_optional(j, "max_amount", summary.max_amount);
    put_optional(j, "average_outstanding", summary.average_outstanding);
    put_optional(j, "total_groups", summary.total_groups);
}

void from_json(const json& j, Summary& summary) {
    summary.total_records = j.value("total_records", size_t(0));
    summary.total_amount = j.value("total_amount", 0.0);
    summary.total_outstanding = j.value("total_outstanding", 0.0);
    summary.average_amount = j.value("average_amount", 0.0);
    get_optional(j, "min_amount", summary.min_amount);
    get_optional(j, "max_amount", summary.max_amount);
    get_optional(j, "average_outstanding", summary.average_outstanding);
    get_optional(j, "total_groups", summary.total_groups);
}

void to_json(json& j, const DuplicateCandidate& candidate) {
    j = json{
        {"group", candidate.group},
        {"confidence", candidate.confidence},
        {"type", duplicate_type_to_string(candidate.type)},
        {"reason", candidate.reason}
    };
}

void from_json(const json& j, DuplicateCandidate& candidate) {
    candidate.group = j.at("group").get<std::vector<Record>>();
    candidate.confidence = j.at("confidence").get<int>();
    candidate.type = string_to_duplicate_type(j.at("type").get<std::string>());
    candidate.reason = j.value("reason", std::string());
}

void to_json(json& j, const DuplicateReport& report) {
    j = json{{"exact", report.exact}, {"fuzzy", report.fuzzy}};
}

void from_json(const json& j, DuplicateReport& report) {
    report.exact = j.value("exact", json::array()).get<std::vector<DuplicateCandidate>>();
    report.fuzzy = j.value("fuzzy", json::array()).get<std::vector<DuplicateCandidate>>();
}

void to_json(json& j, const Totals& totals) {
    j = json{
        {"gross_total", totals.gross_total},
        {"tax_total", totals.tax_total},
        {"net_total", totals.net_total},
        {"paid_total", totals.paid_total},
        {"outstanding_total", totals.outstanding_total}
    };
}

void from_json(const json& j, Totals& totals) {
    totals.gross_total = j.value("gross_total", 0.0);
    totals.tax_total = j.value("tax_total", 0.0);
    totals.net_total = j.value("net_total", 0.0);
    totals.paid_total = j.value("paid_total", 0.0);
    totals.outstanding_total = j.value("outstanding_total", 0.0);
}

void to_json(json& j, const Envelope& envelope) {
    j = json{{"records", envelope.records}};
    if (envelope.groups) j["groups"] = *envelope.groups;
    if (envelope.summary) j["summary"] = *envelope.summary;
    if (envelope.duplicates) j["duplicates"] = *envelope.duplicates;
    if (envelope.totals) j["totals"] = *envelope.totals;
}

void from_json(const json& j, Envelope& envelope) {
    envelope = Envelope();

    // A bare array is a plain record set
    if (j.is_array()) {
        envelope.records = j.get<std::vector<Record>>();
        return;
    }
    if (!j.is_object()) {
        throw std::invalid_argument("envelope must be an object or an array of records");
    }

    if (j.contains("records")) {
        envelope.records = j.at("records").get<std::vector<Record>>();
    } else if (j.contains("invoices")) {
        envelope.records = j.at("invoices").get<std::vector<Record>>();
    }
    if (j.contains("groups")) envelope.groups = j.at("groups").get<std::vector<Group>>();
    if (j.contains("summary")) envelope.summary = j.at("summary").get<Summary>();
    if (j.contains("duplicates")) envelope.duplicates = j.at("duplicates").get<DuplicateReport>();
    if (j.contains("totals")) envelope.totals = j.at("totals").get<Totals>();
}

void to_json(json& j, const Payload& payload) {
    if (!payload.is_fan_in()) {
        j = payload.envelope();
        return;
    }
    json upstream = json::object();
    for (const auto& pair : payload.upstream()) {
        upstream[pair.first] = pair.second;
    }
    j = json{{"fan_in", upstream}};
}

} // namespace ledgerflow
