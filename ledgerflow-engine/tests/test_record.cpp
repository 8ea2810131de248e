#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "record.hpp"
#include "node_error.hpp"

using namespace ledgerflow;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

TEST_CASE("Record decodes canonical fields", "[record]") {
    json j = {
        {"id", "INV-1"},
        {"counterparty", "Acme"},
        {"invoice_number", "A-100"},
        {"invoice_date", "2025-01-15"},
        {"due_date", "2025-01-30"},
        {"total_amount", 1000.0},
        {"paid_amount", 250.0},
        {"tax_amount", 180.0}
    };

    Record r = j.get<Record>();

    REQUIRE(r.id == "INV-1");
    REQUIRE(r.counterparty == "Acme");
    REQUIRE(r.invoice_number == "A-100");
    REQUIRE(r.invoice_date == "2025-01-15");
    REQUIRE(r.due_date == "2025-01-30");
    REQUIRE(r.total_amount == 1000.0);
    REQUIRE(r.paid_amount == 250.0);
    REQUIRE(r.tax_amount == 180.0);
    REQUIRE_FALSE(r.outstanding.has_value());
    REQUIRE(r.extensions.empty());
}

TEST_CASE("Record resolves field aliases", "[record]") {
    SECTION("Vendor and document aliases") {
        json j = {
            {"vendor_name", "Northwind"},
            {"document_number", "NW-1"},
            {"document_date", "2025-01-02"},
            {"grand_total", 590.0},
            {"received_amount", 90.0},
            {"tax_total", 90.0}
        };

        Record r = j.get<Record>();

        REQUIRE(r.counterparty == "Northwind");
        REQUIRE(r.invoice_number == "NW-1");
        REQUIRE(r.invoice_date == "2025-01-02");
        REQUIRE(r.total_amount == 590.0);
        REQUIRE(r.paid_amount == 90.0);
        REQUIRE(r.tax_amount == 90.0);
    }

    SECTION("Base currency amount wins over the document amount") {
        json j = {{"customer_name", "Acme"}, {"inr_amount", 83000.0}, {"total_amount", 1000.0}};

        Record r = j.get<Record>();

        REQUIRE(r.total_amount == 83000.0);
        // The unused alias is kept under a raw_ key
        REQUIRE(r.extensions.at("raw_total_amount") == 1000.0);
        REQUIRE_FALSE(r.extensions.contains("total_amount"));
        REQUIRE(r.field("total_amount") == 83000.0);
        REQUIRE(r.field("amount") == 83000.0);
        REQUIRE(r.field("raw_total_amount") == 1000.0);
    }

    SECTION("Base currency amount survives a JSON round trip") {
        json j = {{"customer_name", "Acme"}, {"inr_amount", 900.0}, {"total_amount", 1000.0}};

        Record decoded = json(j.get<Record>()).get<Record>();

        REQUIRE(decoded.total_amount == 900.0);
        REQUIRE(decoded.field("total_amount") == 900.0);
        REQUIRE(decoded.extensions.at("raw_total_amount") == 1000.0);
    }

    SECTION("Typed member wins over an extension of the same name") {
        Record r;
        r.total_amount = 50.0;
        r.extensions["total_amount"] = 70.0;

        REQUIRE(r.field("total_amount") == 50.0);
    }

    SECTION("Null alias falls through to the next one") {
        json j = {{"vendor_name", nullptr}, {"customer_name", "Globex"}};

        REQUIRE(j.get<Record>().counterparty == "Globex");
    }

    SECTION("Outstanding alias") {
        json j = {{"total_amount", 100.0}, {"outstanding_amount", 40.0}};

        Record r = j.get<Record>();

        REQUIRE(r.outstanding.has_value());
        REQUIRE(*r.outstanding == 40.0);
        REQUIRE_FALSE(r.extensions.contains("outstanding_amount"));
    }
}

TEST_CASE("Record numeric decoding", "[record]") {
    SECTION("Numeric strings are accepted") {
        json j = {{"total_amount", "1180.50"}, {"paid_amount", ""}};

        Record r = j.get<Record>();

        REQUIRE(r.total_amount == 1180.50);
        REQUIRE(r.paid_amount == 0.0);
    }

    SECTION("Non-numeric amount is rejected") {
        json j = {{"total_amount", "twelve"}};
        REQUIRE_THROWS_AS(j.get<Record>(), std::invalid_argument);
    }

    SECTION("Non-object record is rejected") {
        json j = json::array({1, 2});
        REQUIRE_THROWS_AS(j.get<Record>(), std::invalid_argument);
    }
}

TEST_CASE("Record field lookup", "[record]") {
    json j = {
        {"vendor_name", "Northwind"},
        {"invoice_number", "NW-1"},
        {"total_amount", 590.0},
        {"cost_center", "OPS"}
    };
    Record r = j.get<Record>();

    REQUIRE(r.field("counterparty") == "Northwind");
    REQUIRE(r.field("vendor_name") == "Northwind");
    REQUIRE(r.field("amount") == 590.0);
    REQUIRE(r.field("cost_center") == "OPS");
    REQUIRE(r.field("due_date").is_null());
    REQUIRE(r.field("aging_bucket").is_null());
    REQUIRE(r.field("no_such_field").is_null());

    r.aging_days = 12;
    REQUIRE(r.field("aging_days") == 12);
}

TEST_CASE("Record outstanding fallback", "[record]") {
    Record r;
    r.total_amount = 1000.0;
    r.paid_amount = 400.0;

    REQUIRE(r.outstanding_or_derived() == 600.0);

    r.outstanding = 0.0;
    REQUIRE(r.outstanding_or_derived() == 0.0);
}

TEST_CASE("Record encodes derived fields", "[record][serialization]") {
    Record r;
    r.counterparty = "Acme";
    r.invoice_number = "A-100";
    r.total_amount = 1000.0;
    r.outstanding = 1000.0;
    r.status = "Unpaid";
    r.aging_days = 15;
    r.aging_bucket = "0-30";
    r.extensions["cost_center"] = "OPS";

    json j = r;

    REQUIRE(j["outstanding"] == 1000.0);
    REQUIRE(j["outstanding_amount"] == 1000.0);
    REQUIRE(j["status"] == "Unpaid");
    REQUIRE(j["aging_bucket"] == "0-30");
    REQUIRE(j["cost_center"] == "OPS");
    REQUIRE(j["invoice_date"].is_null());
    REQUIRE_FALSE(j.contains("sla_breach"));

    REQUIRE(j.get<Record>() == r);
}

TEST_CASE("Currency rounding", "[record]") {
    REQUIRE(round_currency(1.005) == 1.01);
    REQUIRE(round_currency(2.344) == 2.34);
    REQUIRE(round_currency(-2.345) == -2.35);
    REQUIRE(round_currency(0.0) == 0.0);
    REQUIRE_THAT(round_currency(333.333333), WithinAbs(333.33, 1e-9));
}

TEST_CASE("Envelope decoding", "[record]") {
    SECTION("Bare array") {
        json j = json::array({{{"id", "1"}}, {{"id", "2"}}});
        Envelope e = j.get<Envelope>();

        REQUIRE(e.records.size() == 2);
        REQUIRE_FALSE(e.groups.has_value());
    }

    SECTION("Invoices key") {
        json j = {{"invoices", json::array({{{"id", "1"}}})}};
        REQUIRE(j.get<Envelope>().records.size() == 1);
    }

    SECTION("Aggregates are carried") {
        json j = {
            {"records", json::array()},
            {"summary", {{"total_records", 3}, {"total_amount", 30.0}, {"total_outstanding", 10.0},
                         {"average_amount", 10.0}}},
            {"totals", {{"gross_total", 30.0}}}
        };
        Envelope e = j.get<Envelope>();

        REQUIRE(e.summary.has_value());
        REQUIRE(e.summary->total_records == 3);
        REQUIRE_FALSE(e.summary->min_amount.has_value());
        REQUIRE(e.totals->gross_total == 30.0);
    }

    SECTION("Scalar is rejected") {
        json j = 42;
        REQUIRE_THROWS_AS(j.get<Envelope>(), std::invalid_argument);
    }
}

TEST_CASE("Payload fan-in", "[record]") {
    Envelope a;
    a.records.resize(2);
    Envelope b;
    b.records.resize(3);

    SECTION("Single envelope") {
        Payload p(a);

        REQUIRE_FALSE(p.is_fan_in());
        REQUIRE(p.record_count() == 2);
        REQUIRE(p.envelope().records.size() == 2);
    }

    SECTION("Fan-in map") {
        Payload p = Payload::fan_in({{"left", a}, {"right", b}});

        REQUIRE(p.is_fan_in());
        REQUIRE(p.record_count() == 5);
        REQUIRE(p.upstream().size() == 2);
        REQUIRE_THROWS_AS(p.envelope(), NodeError);

        json j = p;
        REQUIRE(j["fan_in"]["left"]["records"].size() == 2);
        REQUIRE(j["fan_in"]["right"]["records"].size() == 3);
    }
}

TEST_CASE("Duplicate type conversion", "[record]") {
    REQUIRE(duplicate_type_to_string(DuplicateType::Exact) == "exact");
    REQUIRE(duplicate_type_to_string(DuplicateType::Fuzzy) == "fuzzy");
    REQUIRE(string_to_duplicate_type("fuzzy") == DuplicateType::Fuzzy);
    REQUIRE_THROWS_AS(string_to_duplicate_type("partial"), std::invalid_argument);
}
