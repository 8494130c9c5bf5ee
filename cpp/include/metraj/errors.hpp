/**
 * @file errors.hpp
 * @brief Structured error handling for Metraj.
 *
 * This file defines error codes and error structures for reporting
 * invalid takeoff input in a machine-readable format, plus the exception
 * type thrown by every validating operation of the library.
 */

#ifndef METRAJ_ERRORS_HPP
#define METRAJ_ERRORS_HPP

#include <string>
#include <vector>
#include <map>
#include <stdexcept>

namespace metraj {

/**
 * @brief Error codes for Metraj failures.
 *
 * These codes provide machine-readable error identification.
 * Each code corresponds to a specific type of failure.
 */
enum class ErrorCode {
    /// No error - input is valid
    OK = 0,

    // === Work Item / Policy Errors (100-199) ===

    /// Work item quantity is zero or negative
    NON_POSITIVE_QUANTITY = 100,

    /// Work item quantity is NaN or infinite
    NON_FINITE_QUANTITY = 101,

    /// Work item has no category
    MISSING_CATEGORY = 102,

    /// Manual waste mode requested without an override factor
    MISSING_OVERRIDE_FACTOR = 103,

    /// Manual override factor is negative (or NaN)
    NEGATIVE_OVERRIDE_FACTOR = 104,

    // === Reference Data Errors (200-299) ===

    /// Formula entry rejected (empty names, negative coefficient, ...)
    INVALID_FORMULA_ENTRY = 200,

    /// Mix design component rejected
    INVALID_MIX_COMPONENT = 201,

    /// Mix design references another mix
    RECURSIVE_MIX = 202,

    // === Unit Errors (300-399) ===

    /// Unit symbol is not recognised
    UNKNOWN_UNIT = 300,

    /// No conversion exists between the two units
    INCOMPATIBLE_UNITS = 301,

    // === Costing Errors (400-499) ===

    /// Unit price is negative or not finite
    INVALID_PRICE = 400,

    /// Tax rate is negative or not finite
    INVALID_RATE = 401,

    // === Generic Errors (900-999) ===

    /// Unknown or unspecified error
    UNKNOWN_ERROR = 999
};

/**
 * @brief Convert error code to string representation.
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::NON_POSITIVE_QUANTITY: return "NON_POSITIVE_QUANTITY";
        case ErrorCode::NON_FINITE_QUANTITY: return "NON_FINITE_QUANTITY";
        case ErrorCode::MISSING_CATEGORY: return "MISSING_CATEGORY";
        case ErrorCode::MISSING_OVERRIDE_FACTOR: return "MISSING_OVERRIDE_FACTOR";
        case ErrorCode::NEGATIVE_OVERRIDE_FACTOR: return "NEGATIVE_OVERRIDE_FACTOR";
        case ErrorCode::INVALID_FORMULA_ENTRY: return "INVALID_FORMULA_ENTRY";
        case ErrorCode::INVALID_MIX_COMPONENT: return "INVALID_MIX_COMPONENT";
        case ErrorCode::RECURSIVE_MIX: return "RECURSIVE_MIX";
        case ErrorCode::UNKNOWN_UNIT: return "UNKNOWN_UNIT";
        case ErrorCode::INCOMPATIBLE_UNITS: return "INCOMPATIBLE_UNITS";
        case ErrorCode::INVALID_PRICE: return "INVALID_PRICE";
        case ErrorCode::INVALID_RATE: return "INVALID_RATE";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Structured error information for Metraj.
 *
 * Contains machine-readable error code, human-readable message,
 * and diagnostic information about the involved work items and materials.
 */
struct MetrajError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Work item codes (poz numbers) involved in the error
    std::vector<std::string> involved_items;

    /// Material names involved in the error
    std::vector<std::string> involved_materials;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix, shown to the user by the UI layer
    std::string suggestion;

    /**
     * @brief Default constructor creates OK status.
     */
    MetrajError()
        : code(ErrorCode::OK), message("OK") {}

    /**
     * @brief Construct error with code and message.
     */
    MetrajError(ErrorCode code, const std::string& message)
        : code(code), message(message) {}

    /**
     * @brief Check if this represents a successful state.
     */
    bool is_ok() const { return code == ErrorCode::OK; }

    /**
     * @brief Check if this represents an error state.
     */
    bool is_error() const { return code != ErrorCode::OK; }

    /**
     * @brief Get string representation of the error code.
     */
    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get formatted error string for display.
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] " + message;

        if (!involved_items.empty()) {
            result += "\n  Involved items: ";
            for (size_t i = 0; i < involved_items.size(); ++i) {
                if (i > 0) result += ", ";
                result += involved_items[i];
            }
        }

        if (!involved_materials.empty()) {
            result += "\n  Involved materials: ";
            for (size_t i = 0; i < involved_materials.size(); ++i) {
                if (i > 0) result += ", ";
                result += involved_materials[i];
            }
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common errors ===

    /**
     * @brief Create error for a zero or negative work item quantity.
     */
    static MetrajError non_positive_quantity(const std::string& item_code, double quantity) {
        MetrajError err(ErrorCode::NON_POSITIVE_QUANTITY, "quantity must be positive");
        if (!item_code.empty()) err.involved_items.push_back(item_code);
        err.details["quantity"] = std::to_string(quantity);
        err.suggestion = "Enter a quantity greater than zero for this work item.";
        return err;
    }

    /**
     * @brief Create error for a NaN or infinite work item quantity.
     */
    static MetrajError non_finite_quantity(const std::string& item_code) {
        MetrajError err(ErrorCode::NON_FINITE_QUANTITY, "quantity must be a finite number");
        if (!item_code.empty()) err.involved_items.push_back(item_code);
        err.suggestion = "Check the takeoff source; the quantity could not be read as a number.";
        return err;
    }

    /**
     * @brief Create error for a work item without category.
     */
    static MetrajError missing_category(const std::string& item_code) {
        MetrajError err(ErrorCode::MISSING_CATEGORY, "work item has no category");
        if (!item_code.empty()) err.involved_items.push_back(item_code);
        err.suggestion = "Assign a construction category (e.g. concrete, masonry) to the work item.";
        return err;
    }

    /**
     * @brief Create error for manual mode without override factor.
     */
    static MetrajError missing_override_factor() {
        MetrajError err(ErrorCode::MISSING_OVERRIDE_FACTOR,
            "override waste factor required and must be non-negative");
        err.suggestion = "Enter a waste factor (e.g. 0.05 for 5%) or switch to automatic mode.";
        return err;
    }

    /**
     * @brief Create error for a negative override factor.
     */
    static MetrajError negative_override_factor(double factor) {
        MetrajError err(ErrorCode::NEGATIVE_OVERRIDE_FACTOR,
            "override waste factor required and must be non-negative");
        err.details["override_factor"] = std::to_string(factor);
        err.suggestion = "Use a waste factor of 0 or more (0.05 means 5%).";
        return err;
    }

    /**
     * @brief Create error for a rejected formula table entry.
     */
    static MetrajError invalid_formula_entry(const std::string& category,
                                             const std::string& material,
                                             const std::string& reason) {
        MetrajError err(ErrorCode::INVALID_FORMULA_ENTRY, "Invalid formula entry: " + reason);
        if (!material.empty()) err.involved_materials.push_back(material);
        err.details["category"] = category;
        return err;
    }

    /**
     * @brief Create error for a rejected mix design component.
     */
    static MetrajError invalid_mix_component(const std::string& mix,
                                             const std::string& material,
                                             const std::string& reason) {
        MetrajError err(ErrorCode::INVALID_MIX_COMPONENT, "Invalid mix component: " + reason);
        if (!material.empty()) err.involved_materials.push_back(material);
        err.details["mix"] = mix;
        return err;
    }

    /**
     * @brief Create error for a mix that contains another mix.
     */
    static MetrajError recursive_mix(const std::string& mix, const std::string& component) {
        MetrajError err(ErrorCode::RECURSIVE_MIX,
            "Mix '" + mix + "' references mix '" + component + "'");
        err.involved_materials.push_back(component);
        err.details["mix"] = mix;
        err.suggestion = "List the raw materials of the inner mix directly.";
        return err;
    }

    /**
     * @brief Create error for an empty or unrecognised unit symbol.
     */
    static MetrajError unknown_unit(const std::string& symbol) {
        MetrajError err(ErrorCode::UNKNOWN_UNIT, "Unknown unit '" + symbol + "'");
        err.suggestion = "Use a unit symbol such as m, m², m³, kg, ton, adet or lt.";
        return err;
    }

    /**
     * @brief Create error for units without a known conversion.
     */
    static MetrajError incompatible_units(const std::string& from, const std::string& to,
                                          const std::string& material = "") {
        MetrajError err(ErrorCode::INCOMPATIBLE_UNITS,
            "No conversion from '" + from + "' to '" + to + "'");
        if (!material.empty()) err.involved_materials.push_back(material);
        err.suggestion = "Register a material-specific conversion factor.";
        return err;
    }
};

/**
 * @brief Exception thrown for invalid input.
 *
 * Raised synchronously by every validating operation before any output
 * is produced. The attached MetrajError carries the actionable message.
 */
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const MetrajError& error)
        : std::invalid_argument(error.to_string()), error_(error) {}

    const MetrajError& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    MetrajError error_;
};

}  // namespace metraj

#endif  // METRAJ_ERRORS_HPP
