#pragma once

#include "metraj/errors.hpp"
#include "metraj/formula_table.hpp"
#include "metraj/material_calculator.hpp"
#include "metraj/material_summary.hpp"
#include "metraj/mix_design.hpp"
#include "metraj/waste_factor.hpp"
#include "metraj/warnings.hpp"
#include "metraj/work_item.hpp"

#include <string>
#include <vector>

namespace metraj {

/**
 * @brief What a project computation does with an invalid work item
 */
enum class BatchErrorPolicy {
    Abort,  ///< Rethrow the first InvalidInputError
    Skip    ///< Record the error, add a warning and continue
};

/**
 * @brief Configuration of a whole-project material computation
 */
struct ProjectCalculationConfig {
    WasteFactorPolicy policy = WasteFactorPolicy::automatic();  ///< Waste factor mode
    BatchErrorPolicy on_invalid_item = BatchErrorPolicy::Skip;  ///< Invalid item handling
    bool expand_mixes = true;                                   ///< Replace mixes by raw materials
    double max_plausible_waste_factor = DEFAULT_MAX_PLAUSIBLE_WASTE_FACTOR;  ///< Warning limit
};

/**
 * @brief Outcome for one work item of a project computation
 */
struct WorkItemResult {
    std::string work_item_code;                     ///< Code of the work item
    bool success = false;                           ///< Requirements computed
    MetrajError error;                              ///< Error if skipped
    std::vector<MaterialRequirement> requirements;  ///< Empty if skipped

    WorkItemResult() = default;
    explicit WorkItemResult(const std::string& code) : work_item_code(code) {}
};

/**
 * @brief Result of a whole-project material computation
 */
struct ProjectMaterialResult {
    std::vector<WorkItemResult> items;  ///< Per work item, input order
    MaterialSummary summary;            ///< Aggregated material list of successful items
    WarningList warnings;               ///< Skipped items, suspicious factors

    size_t succeeded() const;
    size_t failed() const;

    /**
     * @brief All requirements of successful items, in input order
     */
    std::vector<MaterialRequirement> all_requirements() const;
};

/**
 * @brief Computes the material list of a set of work items
 *
 * Keeps references to the formula table and mix library, which must
 * outlive the calculator and must not change while it is used.
 *
 * Usage:
 * @code
 *   ProjectCalculationConfig config;
 *   config.policy = WasteFactorPolicy::manual(0.08);
 *   ProjectCalculator calc(table, mixes, config);
 *   auto result = calc.compute(takeoff_items);
 *   auto totals = result.summary.to_totals();
 * @endcode
 */
class ProjectCalculator {
public:
    ProjectCalculator(const FormulaTable& table,
                      const MixLibrary& mixes,
                      ProjectCalculationConfig config = ProjectCalculationConfig());

    /**
     * @brief Construct without mix designs
     */
    explicit ProjectCalculator(const FormulaTable& table,
                               ProjectCalculationConfig config = ProjectCalculationConfig());

    const ProjectCalculationConfig& config() const { return config_; }

    /**
     * @brief Compute requirements of all items and aggregate them
     *
     * @throws InvalidInputError if the waste factor policy is invalid, or
     *         if an item is invalid and on_invalid_item is Abort
     */
    ProjectMaterialResult compute(const std::vector<WorkItem>& items) const;

private:
    const FormulaTable& table_;
    const MixLibrary& mixes_;
    ProjectCalculationConfig config_;

    static const MixLibrary& no_mixes();
};

} // namespace metraj
