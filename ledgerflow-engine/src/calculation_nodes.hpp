#ifndef LEDGERFLOW_CALCULATION_NODES_HPP
#define LEDGERFLOW_CALCULATION_NODES_HPP

#include "node_interface.hpp"
#include <string>

namespace ledgerflow {

/**
 * @brief Calculation node type identifiers
 */
namespace CalculationNodeType {
    constexpr const char* AGING = "AgingCalculatorNode";
    constexpr const char* OUTSTANDING = "OutstandingCalculatorNode";
    constexpr const char* SLA = "SLACheckerNode";
    constexpr const char* DUPLICATES = "DuplicateDetectorNode";
    constexpr const char* TOTALS = "TotalsCalculationNode";
}

// Aging bucket labels, in display order
namespace AgingBucket {
    constexpr const char* DAYS_0_30 = "0-30";
    constexpr const char* DAYS_31_60 = "31-60";
    constexpr const char* DAYS_61_90 = "61-90";
    constexpr const char* DAYS_90_PLUS = "90+";
    constexpr const char* UNKNOWN = "Unknown";
}

// Closed intervals, first match wins: <=30, <=60, <=90, otherwise 90+.
std::string aging_bucket_for(int aging_days);

// Breach severity by ascending thresholds: <=7 Low, <=14 Medium, <=30 High, else Critical.
std::string sla_severity_for(int breach_days);

/**
 * @brief Invoice age in days and aging bucket
 *
 * Parameters: as_of_date (ISO date, default today).
 * Adds aging_days, overdue_days and aging_bucket. A record without a parseable
 * invoice date gets aging_days = 0 and bucket "Unknown" instead of failing the
 * batch.
 */
class AgingCalculatorNode : public INode {
public:
    NodeInfo get_info() const override;
    Payload run(const Payload& input, const nlohmann::json& parameters) override;
};

/**
 * @brief Outstanding balance, gross amount and payment status
 *
 * outstanding = total - paid, gross = total - tax, both rounded half-up to
 * cents. Status is Paid (paid >= total), Unpaid (paid <= 0) or Partially Paid.
 */
class OutstandingCalculatorNode : public INode {
public:
    NodeInfo get_info() const override;
    Payload run(const Payload& input, const nlohmann::json& parameters) override;
};

/**
 * @brief SLA breach detection
 *
 * Parameters: sla_days (default 30), as_of_date (default today).
 * deadline = due_date + sla_days; breached when as_of_date is past it.
 */
class SLACheckerNode : public INode {
public:
    NodeInfo get_info() const override;
    Payload run(const Payload& input, const nlohmann::json& parameters) override;
};

/**
 * @brief Exact and fuzzy duplicate invoice detection
 *
 * Parameters: tolerance (absolute amount difference for fuzzy matches,
 * default 0.01).
 * Exact: same counterparty and invoice number (confidence 100).
 * Fuzzy: same counterparty and invoice date, amounts within tolerance and
 * different invoice numbers (confidence 75).
 */
class DuplicateDetectorNode : public INode {
public:
    static constexpr double DEFAULT_TOLERANCE = 0.01;

    NodeInfo get_info() const override;
    Payload run(const Payload& input, const nlohmann::json& parameters) override;
};

/**
 * @brief Report totals (gross, tax, net, paid, outstanding)
 */
class TotalsCalculationNode : public INode {
public:
    NodeInfo get_info() const override;
    Payload run(const Payload& input, const nlohmann::json& parameters) override;
};

} // namespace ledgerflow

#endif // LEDGERFLOW_CALCULATION_NODES_HPP
