#pragma once

#include "metraj/warnings.hpp"

#include <map>
#include <string>
#include <vector>

namespace metraj {

/// Default waste factor for formula entries (5%)
constexpr double DEFAULT_WASTE_FACTOR = 0.05;

/// Waste factors above this are reported as suspicious by validation
constexpr double DEFAULT_MAX_PLAUSIBLE_WASTE_FACTOR = 0.5;

/**
 * @brief Material consumption of one unit of work in a category
 *
 * Example: concrete category, 300 kg cement per m³ with 3% waste:
 * @code
 *   MaterialFormulaEntry e("concrete", "cement", 300.0, "kg", 0.03);
 * @endcode
 */
struct MaterialFormulaEntry {
    std::string category;           ///< Construction category this entry belongs to
    std::string material;           ///< Material name
    double coefficient;             ///< Material quantity per unit of work item quantity
    double default_waste_factor;    ///< Literature waste factor as fraction (0.05 = 5%)
    std::string unit;               ///< Unit of the material quantity
    std::string description;        ///< Optional note (source of the formula)

    MaterialFormulaEntry(std::string category, std::string material, double coefficient,
                         std::string unit, double default_waste_factor = DEFAULT_WASTE_FACTOR,
                         std::string description = "");
};

/**
 * @brief Static reference data: category -> ordered material formulas
 *
 * Entries keep their insertion order within a category; the calculator
 * emits requirements in that order. The table is built once by the
 * formula provider and then passed by const reference to every
 * computation. Concurrent reads are safe.
 */
class FormulaTable {
public:
    FormulaTable() = default;

    /**
     * @brief Append an entry to its category
     *
     * @throws InvalidInputError (INVALID_FORMULA_ENTRY) if the category or
     *         material is empty, or the coefficient or default waste factor
     *         is negative or not finite
     */
    void add_entry(const MaterialFormulaEntry& entry);

    /**
     * @brief Register a category without materials (e.g. labor-only work)
     */
    void register_category(const std::string& category);

    /**
     * @brief Get the ordered entries of a category
     * @return Entries, or an empty vector if the category is unknown
     */
    const std::vector<MaterialFormulaEntry>& entries_for(const std::string& category) const;

    bool has_category(const std::string& category) const;

    /**
     * @brief All registered categories in sorted order
     */
    std::vector<std::string> categories() const;

    /**
     * @brief Total number of entries over all categories
     */
    size_t size() const;

    bool empty() const { return size() == 0; }

    /**
     * @brief Check the table for suspicious data
     * @param max_plausible_waste_factor Limit above which default factors are flagged
     * @return Zero-coefficient, high-waste, duplicate and empty-category warnings
     */
    WarningList validate(double max_plausible_waste_factor = DEFAULT_MAX_PLAUSIBLE_WASTE_FACTOR) const;

private:
    std::map<std::string, std::vector<MaterialFormulaEntry>> entries_;
};

} // namespace metraj
