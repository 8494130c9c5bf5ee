#include "metraj/units.hpp"
#include "metraj/errors.hpp"
#include "metraj/material_calculator.hpp"

#include <cmath>

namespace metraj {

UnitKind unit_kind(const std::string& symbol) {
    static const std::map<std::string, UnitKind> kinds = {
        {"m", UnitKind::Length},
        {"cm", UnitKind::Length},
        {"mm", UnitKind::Length},
        {"mt", UnitKind::Length},
        {"m²", UnitKind::Area},
        {"m2", UnitKind::Area},
        {"cm²", UnitKind::Area},
        {"cm2", UnitKind::Area},
        {"m³", UnitKind::Volume},
        {"m3", UnitKind::Volume},
        {"dm³", UnitKind::Volume},
        {"dm3", UnitKind::Volume},
        {"kg", UnitKind::Mass},
        {"g", UnitKind::Mass},
        {"ton", UnitKind::Mass},
        {"t", UnitKind::Mass},
        {"adet", UnitKind::Count},
        {"pcs", UnitKind::Count},
        {"lt", UnitKind::LiquidVolume},
        {"L", UnitKind::LiquidVolume},
    };

    auto it = kinds.find(symbol);
    return it != kinds.end() ? it->second : UnitKind::Unknown;
}

std::string unit_kind_to_string(UnitKind kind) {
    switch (kind) {
        case UnitKind::Length: return "Length";
        case UnitKind::Area: return "Area";
        case UnitKind::Volume: return "Volume";
        case UnitKind::Mass: return "Mass";
        case UnitKind::Count: return "Count";
        case UnitKind::LiquidVolume: return "LiquidVolume";
        case UnitKind::Unknown: return "Unknown";
        default: return "Unknown";
    }
}

UnitConverter::UnitConverter() {
    // Mass
    add_conversion("kg", "ton", 0.001);
    add_conversion("ton", "kg", 1000.0);
    add_conversion("kg", "g", 1000.0);
    add_conversion("g", "kg", 0.001);

    // Volume
    add_conversion("m³", "lt", 1000.0);
    add_conversion("lt", "m³", 0.001);
    add_conversion("m³", "dm³", 1000.0);
    add_conversion("dm³", "m³", 0.001);

    // Area
    add_conversion("m²", "cm²", 10000.0);
    add_conversion("cm²", "m²", 0.0001);

    // Length
    add_conversion("m", "cm", 100.0);
    add_conversion("cm", "m", 0.01);
    add_conversion("m", "mm", 1000.0);
    add_conversion("mm", "m", 0.001);
}

void UnitConverter::add_conversion(const std::string& from, const std::string& to,
                                   double factor, const std::string& material) {
    if (from.empty()) {
        throw InvalidInputError(MetrajError::unknown_unit(from));
    }
    if (to.empty()) {
        throw InvalidInputError(MetrajError::unknown_unit(to));
    }
    if (!std::isfinite(factor) || factor <= 0.0) {
        throw InvalidInputError(MetrajError::invalid_formula_entry(
            "", material, "conversion factor from '" + from + "' to '" + to +
            "' must be positive"));
    }
    factors_[Key(material, from, to)] = factor;
}

std::optional<double> UnitConverter::factor(const std::string& from, const std::string& to,
                                            const std::string& material) const {
    if (from == to) {
        return 1.0;
    }

    if (!material.empty()) {
        auto it = factors_.find(Key(material, from, to));
        if (it != factors_.end()) {
            return it->second;
        }
    }

    auto it = factors_.find(Key(std::string(), from, to));
    if (it != factors_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> UnitConverter::convert(double value, const std::string& from,
                                             const std::string& to,
                                             const std::string& material) const {
    auto f = factor(from, to, material);
    if (!f) {
        return std::nullopt;
    }
    return value * *f;
}

double UnitConverter::convert_or_throw(double value, const std::string& from,
                                       const std::string& to,
                                       const std::string& material) const {
    auto result = convert(value, from, to, material);
    if (!result) {
        throw InvalidInputError(MetrajError::incompatible_units(from, to, material));
    }
    return *result;
}

std::vector<MaterialRequirement> convert_requirements(
    const std::vector<MaterialRequirement>& requirements,
    const std::string& target_unit,
    const UnitConverter& converter,
    WarningList* warnings)
{
    std::vector<MaterialRequirement> converted;
    converted.reserve(requirements.size());

    for (const auto& req : requirements) {
        auto f = converter.factor(req.unit, target_unit, req.material);
        if (!f) {
            if (warnings) {
                warnings->add(MetrajWarning::unconvertible_unit(req.material, req.unit, target_unit));
            }
            converted.push_back(req);
            continue;
        }

        MaterialRequirement copy = req;
        copy.unit = target_unit;
        copy.base_quantity = req.base_quantity * *f;
        copy.adjusted_quantity = req.adjusted_quantity * *f;
        converted.push_back(copy);
    }

    return converted;
}

} // namespace metraj
