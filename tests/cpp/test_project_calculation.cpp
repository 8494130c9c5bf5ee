/**
 * @file test_project_calculation.cpp
 * @brief C++ tests for whole-project material computation
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "metraj/logging.hpp"
#include "metraj/project_calculation.hpp"

#include <limits>
#include <sstream>

using namespace metraj;
using Catch::Matchers::WithinRel;

/**
 * @brief Takeoff with one invalid line, a labor-only line and a mortar mix
 */
class TakeoffFixture {
public:
    FormulaTable table;
    MixLibrary mixes;
    std::vector<WorkItem> items;
    std::ostringstream log_sink;

    TakeoffFixture() {
        table.add_entry(MaterialFormulaEntry("concrete", "cement", 300.0, "kg", 0.03));
        table.add_entry(MaterialFormulaEntry("masonry", "brick", 50.0, "adet", 0.08));
        table.add_entry(MaterialFormulaEntry("masonry", "mortar", 0.25, "m³", 0.10));
        table.register_category("labor-only");

        mixes.add_mix(MixDesign("mortar", {
            MixComponent("cement", "kg", 250.0),
            MixComponent("sand", "m³", 1.1),
        }));

        items.emplace_back("C-1", "concrete", 10.0, "m³");
        items.emplace_back("M-1", "masonry", 4.0, "m³");
        items.emplace_back("BAD", "concrete", 0.0, "m³");
        items.emplace_back("L-1", "labor-only", 8.0, "adet");

        set_log_stream(&log_sink);
    }

    ~TakeoffFixture() {
        set_log_stream(nullptr);
    }
};

TEST_CASE_METHOD(TakeoffFixture, "Skip policy records invalid items and continues",
                 "[ProjectCalculator][skip]") {
    ProjectCalculator calc(table, mixes);
    auto result = calc.compute(items);

    REQUIRE(result.items.size() == 4);
    CHECK(result.succeeded() == 3);
    CHECK(result.failed() == 1);

    CHECK(result.items[2].work_item_code == "BAD");
    CHECK_FALSE(result.items[2].success);
    CHECK(result.items[2].error.code == ErrorCode::NON_POSITIVE_QUANTITY);
    CHECK(result.items[2].requirements.empty());

    CHECK(result.items[3].success);
    CHECK(result.items[3].requirements.empty());

    CHECK(result.warnings.count_by_code(WarningCode::SKIPPED_WORK_ITEM) == 1);
    CHECK(log_sink.str().find("Skipping work item 'BAD'") != std::string::npos);

    // Mortar expanded into cement and sand, cement merged with concrete cement
    double cement = 10.0 * 300.0 * 1.03 + 4.0 * 0.25 * 1.10 * 250.0;
    REQUIRE(result.summary.total_for("cement", "kg").has_value());
    REQUIRE_THAT(*result.summary.total_for("cement", "kg"), WithinRel(cement, 1e-12));
    CHECK_FALSE(result.summary.total_for("mortar", "m³").has_value());
    REQUIRE(result.summary.num_items() == 3);
}

TEST_CASE_METHOD(TakeoffFixture, "Abort policy rethrows the first invalid item",
                 "[ProjectCalculator][abort]") {
    ProjectCalculationConfig config;
    config.on_invalid_item = BatchErrorPolicy::Abort;
    ProjectCalculator calc(table, mixes, config);

    try {
        calc.compute(items);
        FAIL("expected InvalidInputError");
    } catch (const InvalidInputError& e) {
        CHECK(e.code() == ErrorCode::NON_POSITIVE_QUANTITY);
        REQUIRE(e.error().involved_items.size() == 1);
        CHECK(e.error().involved_items[0] == "BAD");
    }
}

TEST_CASE_METHOD(TakeoffFixture, "Mix expansion can be disabled", "[ProjectCalculator][mixes]") {
    ProjectCalculationConfig config;
    config.expand_mixes = false;
    ProjectCalculator calc(table, mixes, config);

    auto result = calc.compute(items);
    REQUIRE(result.summary.total_for("mortar", "m³").has_value());
    REQUIRE_THAT(*result.summary.total_for("mortar", "m³"), WithinRel(4.0 * 0.25 * 1.10, 1e-12));
    CHECK_FALSE(result.summary.total_for("sand", "m³").has_value());
}

TEST_CASE_METHOD(TakeoffFixture, "Manual policy applies to every item", "[ProjectCalculator][manual]") {
    ProjectCalculationConfig config;
    config.policy = WasteFactorPolicy::manual(0.0);
    ProjectCalculator calc(table, config);

    auto result = calc.compute(items);
    for (const auto& req : result.all_requirements()) {
        CHECK(req.waste_factor == 0.0);
        CHECK(req.adjusted_quantity == req.base_quantity);
    }
    // No mix library given, mortar stays a single material
    CHECK(result.summary.total_for("mortar", "m³").has_value());
}

TEST_CASE_METHOD(TakeoffFixture, "Invalid policy is rejected before any item",
                 "[ProjectCalculator][validation]") {
    ProjectCalculationConfig config;
    config.policy = WasteFactorPolicy::manual(-0.05);
    ProjectCalculator calc(table, mixes, config);

    REQUIRE_THROWS_AS(calc.compute(items), InvalidInputError);

    config.policy.mode = WasteFactorMode::Manual;
    config.policy.override_factor.reset();
    ProjectCalculator missing(table, mixes, config);
    REQUIRE_THROWS_AS(missing.compute(items), InvalidInputError);
}

TEST_CASE_METHOD(TakeoffFixture, "Implausible override is flagged", "[ProjectCalculator][warnings]") {
    ProjectCalculationConfig config;
    config.policy = WasteFactorPolicy::manual(5.0);
    ProjectCalculator calc(table, mixes, config);

    auto result = calc.compute(items);
    CHECK(result.warnings.count_by_code(WarningCode::HIGH_WASTE_FACTOR) == 1);
    CHECK(result.succeeded() == 3);
}

TEST_CASE_METHOD(TakeoffFixture, "Empty takeoff yields empty summary", "[ProjectCalculator]") {
    ProjectCalculator calc(table);
    auto result = calc.compute({});
    CHECK(result.items.empty());
    CHECK(result.summary.empty());
    CHECK_FALSE(result.warnings.has_warnings());
}
