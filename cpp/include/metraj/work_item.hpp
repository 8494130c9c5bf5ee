#pragma once

#include "metraj/errors.hpp"
#include "metraj/units.hpp"

#include <string>

namespace metraj {

/**
 * @brief One line of a quantity takeoff (bill of quantities)
 *
 * A work item is identified by its unit-price code ("poz no", e.g.
 * "15.150.1005") and belongs to a construction category that selects the
 * material formulas used for it. Quantities are in the work item's unit:
 * - Length [m], Area [m²], Volume [m³], Mass [kg/ton], Count [adet],
 *   LiquidVolume [lt]
 *
 * Only the quantity can be edited after construction; code, category and
 * unit identify the line for downstream exports.
 */
class WorkItem {
public:
    /**
     * @brief Construct a work item
     *
     * No validation is done here; validate() reports problems and the
     * calculator rejects invalid items.
     *
     * @param code Unit-price code (poz no)
     * @param category Construction category (e.g. "concrete", "masonry")
     * @param quantity Quantity in the given unit (must be > 0 to compute)
     * @param unit Unit symbol (e.g. "m³")
     * @param description Free-text description of the work
     */
    WorkItem(std::string code, std::string category, double quantity,
             std::string unit, std::string description = "");

    // Getters
    const std::string& code() const { return code_; }
    const std::string& category() const { return category_; }
    double quantity() const { return quantity_; }
    const std::string& unit() const { return unit_; }
    const std::string& description() const { return description_; }

    /**
     * @brief Edit the quantity
     *
     * The new value is not validated; compute() rejects non-positive values.
     */
    void set_quantity(double quantity) { quantity_ = quantity; }

    /**
     * @brief Dimension of the work item's unit
     */
    UnitKind unit_kind() const;

    /**
     * @brief Check the item for computation
     * @return OK, or NON_FINITE_QUANTITY / NON_POSITIVE_QUANTITY / MISSING_CATEGORY
     */
    MetrajError validate() const;

private:
    std::string code_;
    std::string category_;
    double quantity_;
    std::string unit_;
    std::string description_;
};

} // namespace metraj
