#include "calculation_nodes.hpp"
#include "logger.hpp"
#include "node_parameters.hpp"
#include <cmath>
#include <map>
#include <utility>

using json = nlohmann::json;

namespace ledgerflow {

namespace {

std::string record_label(const Record& record) {
    if (!record.id.empty()) return record.id;
    if (!record.invoice_number.empty()) return record.invoice_number;
    return "unknown";
}

} // anonymous namespace

std::string aging_bucket_for(int aging_days) {
    if (aging_days <= 30) return AgingBucket::DAYS_0_30;
    if (aging_days <= 60) return AgingBucket::DAYS_31_60;
    if (aging_days <= 90) return AgingBucket::DAYS_61_90;
    return AgingBucket::DAYS_90_PLUS;
}

std::string sla_severity_for(int breach_days) {
    if (breach_days <= 7) return "Low";
    if (breach_days <= 14) return "Medium";
    if (breach_days <= 30) return "High";
    return "Critical";
}

// ============================================================================
// AgingCalculatorNode
// ============================================================================

NodeInfo AgingCalculatorNode::get_info() const {
    return NodeInfo(
        CalculationNodeType::AGING,
        "Calculate Aging Days",
        NodeCategory::CALCULATION,
        "Calculates aging days and assigns buckets (0-30, 31-60, 61-90, 90+)",
        json{{"records", "array"}, {"as_of_date", "date"}},
        json{{"aging_days", "integer"}, {"overdue_days", "integer"}, {"aging_bucket", "string"}}
    );
}

Payload AgingCalculatorNode::run(const Payload& input, const json& parameters) {
    const dates::DayNumber as_of = as_of_date_param(parameters);

    Envelope output = input.envelope();
    Logger& logger = Logger::get_instance();
    ExecutionContext ctx("", CalculationNodeType::AGING);

    for (Record& record : output.records) {
        auto invoice_day = dates::parse_iso_date(record.invoice_date);
        if (!invoice_day) {
            logger.log_warning(ctx, record.invoice_date.empty()
                ? "Record " + record_label(record) + " has no invoice date, setting Unknown bucket"
                : "Record " + record_label(record) + " has unparseable invoice date '" +
                      record.invoice_date + "', setting Unknown bucket");
            record.aging_days = 0;
            record.overdue_days = 0;
            record.aging_bucket = AgingBucket::UNKNOWN;
            continue;
        }

        int aging_days = static_cast<int>(as_of - *invoice_day);
        record.aging_days = aging_days;

        auto due_day = dates::parse_iso_date(record.due_date);
        record.overdue_days = due_day ? static_cast<int>(as_of - *due_day) : 0;

        record.aging_bucket = aging_bucket_for(aging_days);
    }

    return output;
}

// ============================================================================
// OutstandingCalculatorNode
// ============================================================================

NodeInfo OutstandingCalculatorNode::get_info() const {
    return NodeInfo(
        CalculationNodeType::OUTSTANDING,
        "Calculate Outstanding",
        NodeCategory::CALCULATION,
        "Calculates outstanding amount and invoice status",
        json{{"records", "array"}},
        json{{"outstanding", "number"}, {"gross_amount", "number"}, {"status", "string"}}
    );
}

Payload OutstandingCalculatorNode::run(const Payload& input, const json& /*parameters*/) {
    Envelope output = input.envelope();

    for (Record& record : output.records) {
        const double total = record.total_amount;
        const double paid = record.paid_amount;

        record.outstanding = round_currency(total - paid);
        record.gross_amount = round_currency(total - record.tax_amount);

        if (paid >= total) {
            record.status = "Paid";
        } else if (paid <= 0.0) {
            record.status = "Unpaid";
        } else {
            record.status = "Partially Paid";
        }
    }

    return output;
}

// ============================================================================
// SLACheckerNode
// ============================================================================

NodeInfo SLACheckerNode::get_info() const {
    return NodeInfo(
        CalculationNodeType::SLA,
        "Check SLA Breaches",
        NodeCategory::CALCULATION,
        "Checks SLA breaches and calculates severity",
        json{{"records", "array"}, {"sla_days", "integer"}, {"as_of_date", "date"}},
        json{{"sla_breach", "boolean"}, {"breach_days", "integer"}, {"sla_severity", "string"}}
    );
}

Payload SLACheckerNode::run(const Payload& input, const json& parameters) {
    const int sla_days = int_param(parameters, "sla_days", 30);
    if (sla_days < 0) {
        throw InvalidParameterError("sla_days", "must be non-negative, got " + std::to_string(sla_days));
    }
    const dates::DayNumber as_of = as_of_date_param(parameters);

    Envelope output = input.envelope();
    Logger& logger = Logger::get_instance();
    ExecutionContext ctx("", CalculationNodeType::SLA);

    for (Record& record : output.records) {
        auto due_day = dates::parse_iso_date(record.due_date);
        if (!due_day) {
            if (!record.due_date.empty()) {
                logger.log_warning(ctx, "Record " + record_label(record) +
                    " has unparseable due date '" + record.due_date + "', skipping SLA check");
            }
            record.sla_breach = false;
            record.breach_days = 0;
            record.sla_severity = "None";
            continue;
        }

        const dates::DayNumber deadline = *due_day + sla_days;
        if (as_of > deadline) {
            int breach_days = static_cast<int>(as_of - deadline);
            record.sla_breach = true;
            record.breach_days = breach_days;
            record.sla_severity = sla_severity_for(breach_days);
        } else {
            record.sla_breach = false;
            record.breach_days = 0;
            record.sla_severity = "None";
        }
    }

    return output;
}

// ============================================================================
// DuplicateDetectorNode
// ============================================================================

NodeInfo DuplicateDetectorNode::get_info() const {
    return NodeInfo(
        CalculationNodeType::DUPLICATES,
        "Detect Duplicates",
        NodeCategory::CALCULATION,
        "Detects exact and fuzzy duplicate invoices",
        json{{"records", "array"}, {"tolerance", "number"}},
        json{{"duplicates", "object"}}
    );
}

Payload DuplicateDetectorNode::run(const Payload& input, const json& parameters) {
    const double tolerance = number_param(parameters, "tolerance", DEFAULT_TOLERANCE);
    if (tolerance < 0.0) {
        throw InvalidParameterError("tolerance", "must be non-negative");
    }
    // Absorbs binary error in cent differences; zero tolerance means equal amounts
    const double slack = tolerance > 0.0 ? 1e-9 : 0.0;

    Envelope output = input.envelope();
    DuplicateReport report;

    // Indices hold positions into output.records
    std::map<std::pair<std::string, std::string>, size_t> exact_index;
    std::map<std::pair<std::string, std::string>, std::vector<size_t>> fuzzy_index;

    for (size_t i = 0; i < output.records.size(); ++i) {
        const Record& record = output.records[i];

        // Records without an invoice number carry no identity to match on
        if (!record.invoice_number.empty()) {
            auto exact_key = std::make_pair(record.counterparty, record.invoice_number);
            auto found = exact_index.find(exact_key);
            if (found != exact_index.end()) {
                DuplicateCandidate candidate;
                candidate.group = {output.records[found->second], record};
                candidate.confidence = 100;
                candidate.type = DuplicateType::Exact;
                candidate.reason = "Same counterparty and invoice number";
                report.exact.push_back(std::move(candidate));
            } else {
                exact_index.emplace(exact_key, i);
            }
        }

        auto& earlier = fuzzy_index[std::make_pair(record.counterparty, record.invoice_date)];
        for (size_t j : earlier) {
            const Record& existing = output.records[j];
            double diff = std::fabs(record.total_amount - existing.total_amount);
            if (diff <= tolerance + slack && record.invoice_number != existing.invoice_number) {
                DuplicateCandidate candidate;
                candidate.group = {existing, record};
                candidate.confidence = 75;
                candidate.type = DuplicateType::Fuzzy;
                candidate.reason = "Same counterparty, amount and date but different invoice number";
                report.fuzzy.push_back(std::move(candidate));
            }
        }
        earlier.push_back(i);
    }

    output.duplicates = std::move(report);
    return output;
}

// ============================================================================
// TotalsCalculationNode
// ============================================================================

NodeInfo TotalsCalculationNode::get_info() const {
    return NodeInfo(
        CalculationNodeType::TOTALS,
        "Calculate Totals",
        NodeCategory::CALCULATION,
        "Calculates gross, tax, net, paid and outstanding totals",
        json{{"records", "array"}},
        json{{"totals", "object"}}
    );
}

Payload TotalsCalculationNode::run(const Payload& input, const json& /*parameters*/) {
    Envelope output = input.envelope();

    double gross = 0.0;
    double tax = 0.0;
    double paid = 0.0;
    double outstanding = 0.0;
    for (const Record& record : output.records) {
        gross += record.total_amount;
        tax += record.tax_amount;
        paid += record.paid_amount;
        outstanding += record.outstanding_or_derived();
    }

    Totals totals;
    totals.gross_total = round_currency(gross);
    totals.tax_total = round_currency(tax);
    totals.net_total = round_currency(gross - tax);
    totals.paid_total = round_currency(paid);
    totals.outstanding_total = round_currency(outstanding);

    output.totals = totals;
    return output;
}

} // namespace ledgerflow
