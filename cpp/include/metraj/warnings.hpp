/**
 * @file warnings.hpp
 * @brief Warning system for questionable reference data and batch outcomes.
 *
 * Warnings indicate potential issues that don't prevent a computation
 * but may indicate data entry errors or produce incomplete material lists.
 */

#ifndef METRAJ_WARNINGS_HPP
#define METRAJ_WARNINGS_HPP

#include <string>
#include <vector>
#include <map>

namespace metraj {

/**
 * @brief Warning codes for questionable reference data.
 */
enum class WarningCode {
    // === Formula Table Warnings (100-199) ===

    /// Formula entry has a zero coefficient (contributes nothing)
    ZERO_COEFFICIENT = 100,

    /// Waste factor above the plausibility limit (likely entered as percent)
    HIGH_WASTE_FACTOR = 101,

    /// Same material and unit listed twice in one category
    DUPLICATE_MATERIAL = 102,

    /// Category registered without any material
    EMPTY_CATEGORY = 103,

    // === Batch Warnings (200-299) ===

    /// Invalid work item was skipped by a project computation
    SKIPPED_WORK_ITEM = 200,

    /// Unit conversion was not possible, original unit kept
    UNCONVERTIBLE_UNIT = 201
};

/**
 * @brief Warning severity levels.
 */
enum class WarningSeverity {
    /// Minor issue, likely acceptable
    Low = 0,

    /// Potentially problematic, review recommended
    Medium = 1,

    /// Likely indicates a data entry error
    High = 2
};

/**
 * @brief Convert warning code to string representation.
 */
inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::ZERO_COEFFICIENT: return "ZERO_COEFFICIENT";
        case WarningCode::HIGH_WASTE_FACTOR: return "HIGH_WASTE_FACTOR";
        case WarningCode::DUPLICATE_MATERIAL: return "DUPLICATE_MATERIAL";
        case WarningCode::EMPTY_CATEGORY: return "EMPTY_CATEGORY";
        case WarningCode::SKIPPED_WORK_ITEM: return "SKIPPED_WORK_ITEM";
        case WarningCode::UNCONVERTIBLE_UNIT: return "UNCONVERTIBLE_UNIT";
        default: return "UNKNOWN_WARNING";
    }
}

/**
 * @brief Convert severity to string representation.
 */
inline std::string severity_to_string(WarningSeverity severity) {
    switch (severity) {
        case WarningSeverity::Low: return "LOW";
        case WarningSeverity::Medium: return "MEDIUM";
        case WarningSeverity::High: return "HIGH";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured warning information for Metraj.
 */
struct MetrajWarning {
    /// Machine-readable warning code
    WarningCode code;

    /// Warning severity level
    WarningSeverity severity;

    /// Human-readable warning message
    std::string message;

    /// Work item codes involved in the warning
    std::vector<std::string> involved_items;

    /// Material names involved in the warning
    std::vector<std::string> involved_materials;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the warning
    std::string suggestion;

    MetrajWarning(WarningCode code, WarningSeverity severity, const std::string& message)
        : code(code), severity(severity), message(message) {}

    std::string code_string() const { return warning_code_to_string(code); }

    std::string severity_string() const { return severity_to_string(severity); }

    /**
     * @brief Get formatted warning string for display.
     */
    std::string to_string() const {
        std::string result = "[" + severity_string() + "] [" + code_string() + "] " + message;

        if (!involved_items.empty()) {
            result += "\n  Items: ";
            for (size_t i = 0; i < involved_items.size(); ++i) {
                if (i > 0) result += ", ";
                result += involved_items[i];
            }
        }

        if (!involved_materials.empty()) {
            result += "\n  Materials: ";
            for (size_t i = 0; i < involved_materials.size(); ++i) {
                if (i > 0) result += ", ";
                result += involved_materials[i];
            }
        }

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common warnings ===

    static MetrajWarning zero_coefficient(const std::string& category, const std::string& material) {
        MetrajWarning warn(WarningCode::ZERO_COEFFICIENT, WarningSeverity::Low,
            "Formula entry has zero coefficient");
        warn.involved_materials.push_back(material);
        warn.details["category"] = category;
        warn.suggestion = "Remove the entry or enter the consumption per unit of work";
        return warn;
    }

    /**
     * @brief Create warning for a waste factor above the plausibility limit.
     *
     * Typical cause is a percentage (5) entered where a fraction (0.05) is expected.
     */
    static MetrajWarning high_waste_factor(const std::string& category, const std::string& material,
                                           double factor, double limit) {
        MetrajWarning warn(WarningCode::HIGH_WASTE_FACTOR, WarningSeverity::High,
            "Waste factor is unusually high");
        if (!material.empty()) warn.involved_materials.push_back(material);
        if (!category.empty()) warn.details["category"] = category;
        warn.details["waste_factor"] = std::to_string(factor);
        warn.details["limit"] = std::to_string(limit);
        warn.suggestion = "Waste factors are fractions: enter 0.05 for 5%";
        return warn;
    }

    static MetrajWarning duplicate_material(const std::string& category, const std::string& material,
                                            const std::string& unit) {
        MetrajWarning warn(WarningCode::DUPLICATE_MATERIAL, WarningSeverity::Medium,
            "Material listed more than once in category");
        warn.involved_materials.push_back(material);
        warn.details["category"] = category;
        warn.details["unit"] = unit;
        warn.suggestion = "Merge the coefficients into a single entry";
        return warn;
    }

    static MetrajWarning empty_category(const std::string& category) {
        MetrajWarning warn(WarningCode::EMPTY_CATEGORY, WarningSeverity::Low,
            "Category has no material formulas");
        warn.details["category"] = category;
        warn.suggestion = "Expected for labor-only categories";
        return warn;
    }

    static MetrajWarning skipped_work_item(const std::string& item_code, const std::string& reason) {
        MetrajWarning warn(WarningCode::SKIPPED_WORK_ITEM, WarningSeverity::High,
            "Work item skipped: " + reason);
        if (!item_code.empty()) warn.involved_items.push_back(item_code);
        warn.suggestion = "Fix the work item and recompute the project material list";
        return warn;
    }

    static MetrajWarning unconvertible_unit(const std::string& material, const std::string& from,
                                            const std::string& to) {
        MetrajWarning warn(WarningCode::UNCONVERTIBLE_UNIT, WarningSeverity::Low,
            "Unit conversion not available, original unit kept");
        warn.involved_materials.push_back(material);
        warn.details["from"] = from;
        warn.details["to"] = to;
        return warn;
    }
};

/**
 * @brief Collection of warnings from table validation or a project computation.
 */
class WarningList {
public:
    /// List of warnings
    std::vector<MetrajWarning> warnings;

    /**
     * @brief Add a warning to the list.
     */
    void add(const MetrajWarning& warning) {
        warnings.push_back(warning);
    }

    /**
     * @brief Add a warning to the list (move semantics).
     */
    void add(MetrajWarning&& warning) {
        warnings.push_back(std::move(warning));
    }

    /**
     * @brief Append all warnings of another list.
     */
    void merge(const WarningList& other) {
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    }

    bool has_warnings() const { return !warnings.empty(); }

    size_t count() const { return warnings.size(); }

    /**
     * @brief Get count of warnings by severity.
     */
    size_t count_by_severity(WarningSeverity severity) const {
        size_t count = 0;
        for (const auto& w : warnings) {
            if (w.severity == severity) ++count;
        }
        return count;
    }

    /**
     * @brief Get count of warnings with the given code.
     */
    size_t count_by_code(WarningCode code) const {
        size_t count = 0;
        for (const auto& w : warnings) {
            if (w.code == code) ++count;
        }
        return count;
    }

    /**
     * @brief Get all warnings with given severity or higher.
     */
    std::vector<MetrajWarning> get_by_min_severity(WarningSeverity min_severity) const {
        std::vector<MetrajWarning> result;
        for (const auto& w : warnings) {
            if (static_cast<int>(w.severity) >= static_cast<int>(min_severity)) {
                result.push_back(w);
            }
        }
        return result;
    }

    void clear() { warnings.clear(); }

    /**
     * @brief Get formatted summary string.
     */
    std::string summary() const {
        if (warnings.empty()) return "No warnings";

        std::string result = std::to_string(warnings.size()) + " warning(s): ";
        result += std::to_string(count_by_severity(WarningSeverity::High)) + " high, ";
        result += std::to_string(count_by_severity(WarningSeverity::Medium)) + " medium, ";
        result += std::to_string(count_by_severity(WarningSeverity::Low)) + " low";
        return result;
    }
};

}  // namespace metraj

#endif  // METRAJ_WARNINGS_HPP
