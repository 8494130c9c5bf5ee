#pragma once

#include "metraj/material_calculator.hpp"

#include <Eigen/Dense>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace metraj {

/**
 * @brief Aggregation key: material name + unit
 *
 * The same material in different units is kept apart (cement in kg and
 * in bags are two rows).
 */
struct MaterialKey {
    std::string material;
    std::string unit;

    bool operator<(const MaterialKey& other) const {
        if (material != other.material) return material < other.material;
        return unit < other.unit;
    }

    bool operator==(const MaterialKey& other) const {
        return material == other.material && unit == other.unit;
    }
};

/**
 * @brief Grouped total of one material over many requirements
 */
struct MaterialTotal {
    MaterialKey key;
    double base_quantity = 0.0;         ///< Sum of base quantities
    double adjusted_quantity = 0.0;     ///< Sum of adjusted quantities
    int contributions = 0;              ///< Number of summed requirements
};

/**
 * @brief Sum requirements per (material, unit)
 *
 * Plain grouped summation; the result does not depend on the order of the
 * lists (up to floating-point rounding). Sorted by material, then unit.
 */
std::vector<MaterialTotal> aggregate_requirements(
    const std::vector<std::vector<MaterialRequirement>>& lists);

/**
 * @brief Totals grouped by work item category
 */
std::map<std::string, std::vector<MaterialTotal>> group_by_category(
    const std::vector<MaterialRequirement>& requirements);

/**
 * @brief Project material list with per-item breakdown
 *
 * Stores the adjusted quantities as a dense matrix with one row per
 * material key (sorted) and one column per work item (input order):
 *
 *   C(i, j) = adjusted quantity of material i required by work item j
 *
 * Row sums give the project material list, column sums the material
 * volume attributable to each work item.
 */
class MaterialSummary {
public:
    MaterialSummary() = default;

    /**
     * @brief Build from per-item requirement lists
     * @param item_codes Column labels, one per list
     * @param lists Requirements per work item
     *
     * @throws std::invalid_argument if the sizes differ
     */
    MaterialSummary(const std::vector<std::string>& item_codes,
                    const std::vector<std::vector<MaterialRequirement>>& lists);

    const std::vector<MaterialKey>& materials() const { return keys_; }
    const std::vector<std::string>& item_codes() const { return item_codes_; }

    /**
     * @brief Adjusted quantity matrix (materials x work items)
     */
    const Eigen::MatrixXd& contributions() const { return adjusted_; }

    /**
     * @brief Adjusted total per material (row sums)
     */
    Eigen::VectorXd totals() const;

    /**
     * @brief Base total per material (row sums of the base matrix)
     */
    Eigen::VectorXd base_totals() const;

    /**
     * @brief Adjusted total per work item (column sums)
     *
     * Only meaningful between rows of compatible units.
     */
    Eigen::VectorXd item_totals() const;

    /**
     * @brief Adjusted total of one material
     * @return Total, or std::nullopt if the material is not in the summary
     */
    std::optional<double> total_for(const std::string& material, const std::string& unit) const;

    /**
     * @brief Adjusted quantity of one material required by one work item
     * @return 0.0 if the material or the item is not in the summary
     */
    double contribution(const std::string& material, const std::string& unit,
                        const std::string& item_code) const;

    /**
     * @brief Convert to a flat list of totals (same order as materials())
     */
    std::vector<MaterialTotal> to_totals() const;

    size_t num_materials() const { return keys_.size(); }
    size_t num_items() const { return item_codes_.size(); }
    bool empty() const { return keys_.empty(); }

private:
    int row_of(const std::string& material, const std::string& unit) const;

    std::vector<MaterialKey> keys_;
    std::vector<std::string> item_codes_;
    Eigen::MatrixXd base_;
    Eigen::MatrixXd adjusted_;
    Eigen::MatrixXi counts_;
};

} // namespace metraj
