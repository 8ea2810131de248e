#ifndef LEDGERFLOW_RECORD_HPP
#define LEDGERFLOW_RECORD_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ledgerflow {

// One invoice-like entity flowing between nodes.
// Input fields are decoded once (with alias resolution) when the record enters
// the system; derived fields are filled in by calculation nodes.
struct Record {
    std::string id;
    std::string counterparty;    // vendor or customer identity
    std::string invoice_number;
    std::string invoice_date;    // raw date text, empty when absent
    std::string due_date;
    double total_amount = 0.0;   // base currency
    double paid_amount = 0.0;
    double tax_amount = 0.0;

    // Derived by OutstandingCalculatorNode
    std::optional<double> outstanding;
    std::optional<double> gross_amount;
    std::string status;

    // Derived by AgingCalculatorNode
    std::optional<int> aging_days;
    std::optional<int> overdue_days;
    std::string aging_bucket;

    // Derived by SLACheckerNode
    std::optional<bool> sla_breach;
    std::optional<int> breach_days;
    std::string sla_severity;

    nlohmann::json extensions = nlohmann::json::object();  // source-specific fields

    // Field lookup by name for the generic nodes (filter, sort, grouping, summary).
    // Well-known names and their aliases map to the typed members, anything else
    // to extensions. Absent values come back as null.
    nlohmann::json field(const std::string& name) const;

    // Outstanding if calculated, otherwise total - paid.
    double outstanding_or_derived() const;

    bool operator==(const Record& other) const;
    bool operator!=(const Record& other) const { return !(*this == other); }
};

struct Group {
    std::string group_name;
    std::vector<Record> records;
    size_t count = 0;
    double total_amount = 0.0;
    double total_outstanding = 0.0;

    bool operator==(const Group& other) const;
};

struct Summary {
    size_t total_records = 0;
    double total_amount = 0.0;
    double total_outstanding = 0.0;
    double average_amount = 0.0;
    std::optional<double> min_amount;   // record-level summaries only
    std::optional<double> max_amount;
    std::optional<double> average_outstanding;
    std::optional<size_t> total_groups; // group-level summaries only

    bool operator==(const Summary& other) const;
};

enum class DuplicateType {
    Exact,
    Fuzzy
};

struct DuplicateCandidate {
    std::vector<Record> group;  // always the earlier record first
    int confidence = 0;         // 100 exact, 75 fuzzy
    DuplicateType type = DuplicateType::Exact;
    std::string reason;

    bool operator==(const DuplicateCandidate& other) const;
};

struct DuplicateReport {
    std::vector<DuplicateCandidate> exact;
    std::vector<DuplicateCandidate> fuzzy;

    bool operator==(const DuplicateReport& other) const;
};

struct Totals {
    double gross_total = 0.0;
    double tax_total = 0.0;
    double net_total = 0.0;
    double paid_total = 0.0;
    double outstanding_total = 0.0;

    bool operator==(const Totals& other) const;
};

// Canonical intermediate shape every node accepts and emits.
struct Envelope {
    std::vector<Record> records;
    std::optional<std::vector<Group>> groups;
    std::optional<Summary> summary;
    std::optional<DuplicateReport> duplicates;
    std::optional<Totals> totals;

    Envelope() = default;
    explicit Envelope(std::vector<Record> records_) : records(std::move(records_)) {}

    bool operator==(const Envelope& other) const;
};

// What a node receives and returns: a single envelope, or for fan-in nodes a
// map from predecessor id to that predecessor's output.
class Payload {
public:
    Payload() = default;
    Payload(Envelope envelope);  // NOLINT(google-explicit-constructor)

    static Payload fan_in(std::map<std::string, Envelope> upstream);

    bool is_fan_in() const { return fan_in_; }

    // Throws NodeError when the payload is a fan-in map.
    const Envelope& envelope() const;
    Envelope& envelope();

    const std::map<std::string, Envelope>& upstream() const { return upstream_; }

    // Number of records carried (summed across a fan-in map); used for traces.
    size_t record_count() const;

    bool operator==(const Payload& other) const;

private:
    bool fan_in_ = false;
    Envelope envelope_;
    std::map<std::string, Envelope> upstream_;
};

std::string duplicate_type_to_string(DuplicateType type);
DuplicateType string_to_duplicate_type(const std::string& value);

// Round half away from zero to two decimal places.
double round_currency(double value);

// JSON conversions (found by nlohmann::json through ADL)
void to_json(nlohmann::json& j, const Record& record);
void from_json(const nlohmann::json& j, Record& record);
void to_json(nlohmann::json& j, const Group& group);
void from_json(const nlohmann::json& j, Group& group);
void to_json(nlohmann::json& j, const Summary& summary);
void from_json(const nlohmann::json& j, Summary& summary);
void to_json(nlohmann::json& j, const DuplicateCandidate& candidate);
void from_json(const nlohmann::json& j, DuplicateCandidate& candidate);
void to_json(nlohmann::json& j, const DuplicateReport& report);
void from_json(const nlohmann::json& j, DuplicateReport& report);
void to_json(nlohmann::json& j, const Totals& totals);
void from_json(const nlohmann::json& j, Totals& totals);
void to_json(nlohmann::json& j, const Envelope& envelope);
void from_json(const nlohmann::json& j, Envelope& envelope);
void to_json(nlohmann::json& j, const Payload& payload);

} // namespace ledgerflow

#endif // LEDGERFLOW_RECORD_HPP
