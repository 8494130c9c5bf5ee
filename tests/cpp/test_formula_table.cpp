/**
 * @file test_formula_table.cpp
 * @brief C++ tests for FormulaTable construction, lookup and validation
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "metraj/errors.hpp"
#include "metraj/formula_table.hpp"
#include "metraj/warnings.hpp"

#include <limits>

using namespace metraj;
using Catch::Matchers::WithinAbs;

TEST_CASE("Entries keep insertion order per category", "[FormulaTable][order]") {
    FormulaTable table;
    table.add_entry(MaterialFormulaEntry("roofing", "tile", 16.0, "adet"));
    table.add_entry(MaterialFormulaEntry("concrete", "cement", 300.0, "kg", 0.03));
    table.add_entry(MaterialFormulaEntry("roofing", "batten", 3.2, "m", 0.10));
    table.add_entry(MaterialFormulaEntry("roofing", "nail", 0.05, "kg", 0.15));

    const auto& roofing = table.entries_for("roofing");
    REQUIRE(roofing.size() == 3);
    CHECK(roofing[0].material == "tile");
    CHECK(roofing[1].material == "batten");
    CHECK(roofing[2].material == "nail");

    CHECK(table.size() == 4);
    CHECK_FALSE(table.empty());
}

TEST_CASE("Default waste factor is five percent", "[FormulaTable][defaults]") {
    MaterialFormulaEntry entry("electrical", "cable", 1.05, "m");
    REQUIRE_THAT(entry.default_waste_factor, WithinAbs(0.05, 1e-15));
    REQUIRE_THAT(DEFAULT_WASTE_FACTOR, WithinAbs(0.05, 1e-15));
}

TEST_CASE("Unknown category lookup returns empty entries", "[FormulaTable][lookup]") {
    FormulaTable table;
    table.add_entry(MaterialFormulaEntry("concrete", "cement", 300.0, "kg"));

    CHECK(table.entries_for("masonry").empty());
    CHECK_FALSE(table.has_category("masonry"));
    CHECK(table.has_category("concrete"));
}

TEST_CASE("Registered empty category", "[FormulaTable][lookup]") {
    FormulaTable table;
    table.register_category("labor-only");
    table.add_entry(MaterialFormulaEntry("concrete", "cement", 300.0, "kg"));
    table.register_category("concrete");

    CHECK(table.has_category("labor-only"));
    CHECK(table.entries_for("labor-only").empty());
    // Registering an existing category keeps its entries
    CHECK(table.entries_for("concrete").size() == 1);

    auto cats = table.categories();
    REQUIRE(cats.size() == 2);
    CHECK(cats[0] == "concrete");
    CHECK(cats[1] == "labor-only");
}

TEST_CASE("Invalid formula entries are rejected", "[FormulaTable][validation]") {
    FormulaTable table;

    SECTION("Empty category") {
        REQUIRE_THROWS_AS(table.add_entry(MaterialFormulaEntry("", "cement", 300.0, "kg")),
                          InvalidInputError);
    }

    SECTION("Empty material") {
        REQUIRE_THROWS_AS(table.add_entry(MaterialFormulaEntry("concrete", "", 300.0, "kg")),
                          InvalidInputError);
    }

    SECTION("Negative coefficient") {
        try {
            table.add_entry(MaterialFormulaEntry("concrete", "cement", -1.0, "kg"));
            FAIL("expected InvalidInputError");
        } catch (const InvalidInputError& e) {
            CHECK(e.code() == ErrorCode::INVALID_FORMULA_ENTRY);
            CHECK(e.error().details.at("category") == "concrete");
        }
    }

    SECTION("Non-finite coefficient") {
        REQUIRE_THROWS_AS(table.add_entry(MaterialFormulaEntry(
                              "concrete", "cement", std::numeric_limits<double>::infinity(), "kg")),
                          InvalidInputError);
    }

    SECTION("Negative default waste factor") {
        REQUIRE_THROWS_AS(table.add_entry(MaterialFormulaEntry("concrete", "cement", 300.0, "kg", -0.01)),
                          InvalidInputError);
    }

    // Nothing was added by the failed calls
    CHECK(table.empty());
}

TEST_CASE("Validation reports suspicious data", "[FormulaTable][warnings]") {
    FormulaTable table;
    table.add_entry(MaterialFormulaEntry("concrete", "cement", 300.0, "kg", 0.03));
    table.add_entry(MaterialFormulaEntry("concrete", "admixture", 0.0, "lt", 0.0));
    table.add_entry(MaterialFormulaEntry("concrete", "cement", 10.0, "kg", 0.03));
    table.add_entry(MaterialFormulaEntry("masonry", "brick", 50.0, "adet", 5.0));
    table.register_category("labor-only");

    WarningList warnings = table.validate();

    CHECK(warnings.count() == 4);
    CHECK(warnings.count_by_code(WarningCode::ZERO_COEFFICIENT) == 1);
    CHECK(warnings.count_by_code(WarningCode::DUPLICATE_MATERIAL) == 1);
    CHECK(warnings.count_by_code(WarningCode::HIGH_WASTE_FACTOR) == 1);
    CHECK(warnings.count_by_code(WarningCode::EMPTY_CATEGORY) == 1);
    CHECK(warnings.count_by_severity(WarningSeverity::High) == 1);

    SECTION("Higher plausibility limit drops the waste warning") {
        WarningList relaxed = table.validate(10.0);
        CHECK(relaxed.count_by_code(WarningCode::HIGH_WASTE_FACTOR) == 0);
    }
}

TEST_CASE("Clean table validates without warnings", "[FormulaTable][warnings]") {
    FormulaTable table;
    table.add_entry(MaterialFormulaEntry("concrete", "cement", 300.0, "kg", 0.03));
    table.add_entry(MaterialFormulaEntry("concrete", "cement", 6.0, "torba", 0.03));

    // Same material in another unit is not a duplicate
    WarningList warnings = table.validate();
    CHECK_FALSE(warnings.has_warnings());
    CHECK(warnings.summary() == "No warnings");
}
