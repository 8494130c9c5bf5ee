#pragma once

#include "metraj/formula_table.hpp"
#include "metraj/waste_factor.hpp"
#include "metraj/work_item.hpp"

#include <optional>
#include <string>
#include <vector>

namespace metraj {

/**
 * @brief Raw material needed for one work item x formula entry pairing
 *
 * Values are unrounded; rounding for display belongs to the report layer.
 */
struct MaterialRequirement {
    std::string material;           ///< Material name
    std::string unit;               ///< Material unit
    double base_quantity;           ///< quantity x coefficient
    double waste_factor;            ///< Effective waste factor used
    double adjusted_quantity;       ///< base_quantity x (1 + waste_factor)
    std::string category;           ///< Category of the source work item
    std::string work_item_code;     ///< Code (poz no) of the source work item
    std::string description;        ///< Formula note, or parent mix after expansion

    MaterialRequirement()
        : base_quantity(0.0), waste_factor(0.0), adjusted_quantity(0.0) {}
};

/**
 * @brief Compute the material requirements of one work item
 *
 * For each formula entry of the work item's category, in table order:
 *   base     = quantity * coefficient
 *   factor   = override (Manual) or entry default (Automatic)
 *   adjusted = base * (1 + factor)
 *
 * An unknown or empty category yields an empty result.
 *
 * @param item Work item (quantity > 0, non-empty category)
 * @param table Formula table
 * @param policy Waste factor mode and override
 * @return One requirement per formula entry
 *
 * @throws InvalidInputError if the item or the policy is invalid; nothing
 *         is computed in that case
 */
std::vector<MaterialRequirement> compute_material_requirements(
    const WorkItem& item,
    const FormulaTable& table,
    const WasteFactorPolicy& policy = WasteFactorPolicy::automatic());

/**
 * @brief Stateless material requirement calculator
 *
 * Holds no data; one instance can be shared between threads as long as
 * the formula table is not modified concurrently.
 *
 * Usage:
 * @code
 *   MaterialCalculator calc;
 *   WorkItem slab("15.150.1005", "concrete", 10.0, "m³");
 *   auto reqs = calc.compute(slab, table, WasteFactorMode::Manual, 0.10);
 * @endcode
 */
class MaterialCalculator {
public:
    std::vector<MaterialRequirement> compute(
        const WorkItem& item,
        const FormulaTable& table,
        const WasteFactorPolicy& policy = WasteFactorPolicy::automatic()) const;

    /**
     * @brief Compute with mode and optional override factor
     *
     * The override is required in Manual mode and ignored in Automatic mode.
     */
    std::vector<MaterialRequirement> compute(
        const WorkItem& item,
        const FormulaTable& table,
        WasteFactorMode mode,
        std::optional<double> override_factor = std::nullopt) const;
};

} // namespace metraj
