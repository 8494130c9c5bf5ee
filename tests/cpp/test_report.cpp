/**
 * @file test_report.cpp
 * @brief C++ tests for rounding, number formatting and report rows
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "metraj/formula_table.hpp"
#include "metraj/material_calculator.hpp"
#include "metraj/material_summary.hpp"
#include "metraj/report.hpp"

#include <algorithm>

using namespace metraj;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Round half up at two decimals", "[report][rounding]") {
    REQUIRE_THAT(round_half_up(2.345, 2), WithinAbs(2.35, 1e-12));
    REQUIRE_THAT(round_half_up(2.344, 2), WithinAbs(2.34, 1e-12));
    REQUIRE_THAT(round_half_up(1.005, 2), WithinAbs(1.01, 1e-12));
    REQUIRE_THAT(round_half_up(-2.345, 2), WithinAbs(-2.35, 1e-12));
    REQUIRE_THAT(round_half_up(3090.0000000000005, 2), WithinAbs(3090.0, 1e-12));
    REQUIRE_THAT(round_half_up(12.5, 0), WithinAbs(13.0, 1e-12));
}

TEST_CASE("Turkish number formatting", "[report][format]") {
    CHECK(format_number(1234567.891) == "1.234.567,89");
    CHECK(format_number(3090.0) == "3.090,00");
    CHECK(format_number(0.5) == "0,50");
    CHECK(format_number(999.999) == "1.000,00");
    CHECK(format_number(-1234.5) == "-1.234,50");
    CHECK(format_number(42.0, 0) == "42");
    CHECK(format_number(1234.5, 1, ',', '.') == "1,234.5");
}

TEST_CASE("Waste factor as percent", "[report][format]") {
    CHECK(format_percent(0.05) == "%5");
    CHECK(format_percent(0.025) == "%2,5");
    CHECK(format_percent(0.0) == "%0");
    CHECK(format_percent(0.1) == "%10");
}

TEST_CASE("Requirement report keeps calculator order", "[report][rows]") {
    FormulaTable table;
    table.add_entry(MaterialFormulaEntry("concrete", "cement", 300.0, "kg", 0.03));
    table.add_entry(MaterialFormulaEntry("concrete", "water", 180.0, "lt", 0.0));

    WorkItem slab("15.150.1005", "concrete", 10.0, "m³");
    auto rows = build_requirement_report(compute_material_requirements(slab, table));

    REQUIRE(rows.size() == 2);
    CHECK(rows[0].material == "cement");
    CHECK(rows[0].base_quantity == "3.000,00");
    CHECK(rows[0].adjusted_quantity == "3.090,00");
    CHECK(rows[0].waste_factor == "%3");
    CHECK(rows[0].source == "15.150.1005");
    CHECK(rows[1].material == "water");
    CHECK(rows[1].waste_factor == "%0");

    SECTION("Hidden waste column") {
        ReportConfig config;
        config.show_waste_factor = false;
        config.decimals = 1;
        auto hidden = build_requirement_report(compute_material_requirements(slab, table), config);
        CHECK(hidden[0].waste_factor.empty());
        CHECK(hidden[0].adjusted_quantity == "3.090,0");
    }

    SECTION("Plain text table") {
        std::string text = render_text_table(rows);
        CHECK_THAT(text, ContainsSubstring("Material"));
        CHECK_THAT(text, ContainsSubstring("3.090,00"));
        CHECK_THAT(text, ContainsSubstring("cement"));
        CHECK(std::count(text.begin(), text.end(), '\n') == 4);
    }
}

TEST_CASE("Summary report has one row per material", "[report][rows]") {
    MaterialRequirement a;
    a.material = "cement";
    a.unit = "kg";
    a.base_quantity = 1000.0;
    a.adjusted_quantity = 1030.0;

    MaterialRequirement b = a;
    b.base_quantity = 500.0;
    b.adjusted_quantity = 525.0;

    MaterialSummary summary({"C-1", "P-1"}, {{a}, {b}});
    auto rows = build_summary_report(summary);

    REQUIRE(rows.size() == 1);
    CHECK(rows[0].adjusted_quantity == "1.555,00");
    CHECK(rows[0].base_quantity == "1.500,00");
    CHECK(rows[0].waste_factor.empty());
    CHECK(rows[0].source == "2");
}
