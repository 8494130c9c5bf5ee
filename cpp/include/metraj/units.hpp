#pragma once

#include "metraj/warnings.hpp"

#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace metraj {

struct MaterialRequirement;

/**
 * @brief Physical dimension of a takeoff or material unit
 */
enum class UnitKind {
    Length,         ///< m, cm, mm
    Area,           ///< m², cm²
    Volume,         ///< m³, dm³
    Mass,           ///< kg, g, ton
    Count,          ///< adet, pcs
    LiquidVolume,   ///< lt
    Unknown         ///< Unrecognised symbol
};

/**
 * @brief Classify a unit symbol
 *
 * Accepts the superscript forms used in unit-price books (m², m³) as well
 * as the ASCII spellings (m2, m3). Returns UnitKind::Unknown otherwise.
 */
UnitKind unit_kind(const std::string& symbol);

std::string unit_kind_to_string(UnitKind kind);

/**
 * @brief Converts quantities between unit symbols
 *
 * Holds the material-independent standard factors (kg/ton, m³/lt, ...)
 * and optional material-specific factors (e.g. cement bag -> kg).
 * Material-specific factors take precedence over standard ones.
 *
 * Usage:
 * @code
 *   UnitConverter conv;
 *   conv.add_conversion("torba", "kg", 50.0, "Çimento");
 *   auto kg = conv.convert(12.0, "torba", "kg", "Çimento");  // 600
 *   auto t  = conv.convert(600.0, "kg", "ton");              // 0.6
 * @endcode
 */
class UnitConverter {
public:
    /**
     * @brief Construct a converter preloaded with the standard factors
     */
    UnitConverter();

    /**
     * @brief Register a conversion factor
     * @param from Source unit symbol
     * @param to Target unit symbol
     * @param factor Multiplier from source to target (must be > 0)
     * @param material Material name, or empty for a material-independent factor
     *
     * @throws InvalidInputError UNKNOWN_UNIT for an empty symbol,
     *         INVALID_FORMULA_ENTRY if factor is not positive and finite
     */
    void add_conversion(const std::string& from, const std::string& to,
                        double factor, const std::string& material = "");

    /**
     * @brief Look up the conversion factor between two units
     * @return Factor, 1.0 for identical units, std::nullopt if unknown
     */
    std::optional<double> factor(const std::string& from, const std::string& to,
                                 const std::string& material = "") const;

    /**
     * @brief Convert a value between two units
     * @return Converted value, or std::nullopt if no conversion is known
     */
    std::optional<double> convert(double value, const std::string& from,
                                  const std::string& to,
                                  const std::string& material = "") const;

    /**
     * @brief Convert a value, failing when no conversion is known
     * @throws InvalidInputError with ErrorCode::INCOMPATIBLE_UNITS
     */
    double convert_or_throw(double value, const std::string& from,
                            const std::string& to,
                            const std::string& material = "") const;

private:
    using Key = std::tuple<std::string, std::string, std::string>;  // material, from, to

    std::map<Key, double> factors_;
};

/**
 * @brief Convert a requirement list to a target unit
 * @param requirements Source requirements (not modified)
 * @param target_unit Unit to convert to
 * @param converter Converter providing the factors
 * @param warnings Optional list receiving UNCONVERTIBLE_UNIT warnings
 * @return Copy of the requirements with base and adjusted quantities scaled
 *
 * Rows whose unit cannot be converted keep their original unit.
 */
std::vector<MaterialRequirement> convert_requirements(
    const std::vector<MaterialRequirement>& requirements,
    const std::string& target_unit,
    const UnitConverter& converter,
    WarningList* warnings = nullptr);

} // namespace metraj
