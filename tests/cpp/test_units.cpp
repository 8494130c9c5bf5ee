/**
 * @file test_units.cpp
 * @brief C++ tests for unit classification and UnitConverter
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "metraj/errors.hpp"
#include "metraj/material_calculator.hpp"
#include "metraj/units.hpp"
#include "metraj/warnings.hpp"

using namespace metraj;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Unit symbols are classified", "[units][kind]") {
    CHECK(unit_kind("m") == UnitKind::Length);
    CHECK(unit_kind("m²") == UnitKind::Area);
    CHECK(unit_kind("m2") == UnitKind::Area);
    CHECK(unit_kind("m³") == UnitKind::Volume);
    CHECK(unit_kind("kg") == UnitKind::Mass);
    CHECK(unit_kind("ton") == UnitKind::Mass);
    CHECK(unit_kind("adet") == UnitKind::Count);
    CHECK(unit_kind("lt") == UnitKind::LiquidVolume);
    CHECK(unit_kind("furlong") == UnitKind::Unknown);
    CHECK(unit_kind_to_string(UnitKind::LiquidVolume) == "LiquidVolume");
}

TEST_CASE("Standard conversions", "[units][UnitConverter]") {
    UnitConverter conv;

    REQUIRE_THAT(*conv.convert(3090.0, "kg", "ton"), WithinRel(3.09, 1e-12));
    REQUIRE_THAT(*conv.convert(2.5, "ton", "kg"), WithinRel(2500.0, 1e-12));
    REQUIRE_THAT(*conv.convert(0.18, "m³", "lt"), WithinRel(180.0, 1e-12));
    REQUIRE_THAT(*conv.convert(450.0, "lt", "m³"), WithinRel(0.45, 1e-12));
    REQUIRE_THAT(*conv.convert(1.5, "m²", "cm²"), WithinRel(15000.0, 1e-12));
    REQUIRE_THAT(*conv.convert(12.0, "m", "mm"), WithinRel(12000.0, 1e-12));
    REQUIRE_THAT(*conv.convert(35.0, "cm", "m"), WithinRel(0.35, 1e-12));

    SECTION("Identical units pass through") {
        REQUIRE_THAT(*conv.convert(7.0, "adet", "adet"), WithinAbs(7.0, 1e-15));
    }

    SECTION("Unknown pair gives no value") {
        CHECK_FALSE(conv.convert(1.0, "kg", "m³").has_value());
        REQUIRE_THROWS_AS(conv.convert_or_throw(1.0, "kg", "m³"), InvalidInputError);
    }
}

TEST_CASE("Material-specific conversion takes precedence", "[units][UnitConverter]") {
    UnitConverter conv;
    conv.add_conversion("torba", "kg", 50.0, "cement");
    conv.add_conversion("torba", "kg", 25.0);

    REQUIRE_THAT(*conv.convert(12.0, "torba", "kg", "cement"), WithinRel(600.0, 1e-12));
    REQUIRE_THAT(*conv.convert(12.0, "torba", "kg", "lime"), WithinRel(300.0, 1e-12));
    REQUIRE_THAT(*conv.convert(12.0, "torba", "kg"), WithinRel(300.0, 1e-12));

    try {
        conv.add_conversion("kg", "torba", 0.0, "cement");
        FAIL("expected InvalidInputError");
    } catch (const InvalidInputError& e) {
        CHECK(e.code() == ErrorCode::INVALID_FORMULA_ENTRY);
    }

    try {
        conv.add_conversion("", "kg", 50.0);
        FAIL("expected InvalidInputError");
    } catch (const InvalidInputError& e) {
        CHECK(e.code() == ErrorCode::UNKNOWN_UNIT);
    }
}

TEST_CASE("Requirement lists are converted without mutation", "[units][convert_requirements]") {
    MaterialRequirement cement;
    cement.material = "cement";
    cement.unit = "kg";
    cement.base_quantity = 3000.0;
    cement.waste_factor = 0.03;
    cement.adjusted_quantity = 3090.0;

    MaterialRequirement brick;
    brick.material = "brick";
    brick.unit = "adet";
    brick.base_quantity = 500.0;
    brick.adjusted_quantity = 540.0;

    std::vector<MaterialRequirement> reqs = {cement, brick};
    UnitConverter conv;
    WarningList warnings;

    auto converted = convert_requirements(reqs, "ton", conv, &warnings);

    REQUIRE(converted.size() == 2);
    CHECK(converted[0].unit == "ton");
    REQUIRE_THAT(converted[0].base_quantity, WithinRel(3.0, 1e-12));
    REQUIRE_THAT(converted[0].adjusted_quantity, WithinRel(3.09, 1e-12));
    REQUIRE_THAT(converted[0].waste_factor, WithinAbs(0.03, 1e-15));

    CHECK(converted[1].unit == "adet");
    REQUIRE_THAT(converted[1].adjusted_quantity, WithinAbs(540.0, 1e-12));

    CHECK(warnings.count_by_code(WarningCode::UNCONVERTIBLE_UNIT) == 1);
    CHECK(reqs[0].unit == "kg");
}
