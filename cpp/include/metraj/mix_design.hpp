#pragma once

#include "metraj/material_calculator.hpp"

#include <map>
#include <string>
#include <vector>

namespace metraj {

/**
 * @brief Raw material content of one unit of a mix
 */
struct MixComponent {
    std::string material;   ///< Raw material name
    std::string unit;       ///< Unit of the raw material
    double coefficient;     ///< Raw material per unit of mix

    MixComponent(std::string material, std::string unit, double coefficient);
};

/**
 * @brief Composite material prepared on site (mortar, concrete mix)
 *
 * A formula entry may name a mix instead of a raw material, e.g. masonry
 * needs 0.25 m³ of "mortar" per m³ of wall. expand_mixes() replaces such
 * requirements by the mix's raw materials.
 */
struct MixDesign {
    std::string name;                       ///< Mix name, matched against requirement material
    std::vector<MixComponent> components;   ///< Raw materials in output order

    MixDesign() = default;
    MixDesign(std::string name, std::vector<MixComponent> components);
};

/**
 * @brief Registry of mix designs, keyed by name
 */
class MixLibrary {
public:
    /**
     * @brief Register (or replace) a mix design
     *
     * @throws InvalidInputError INVALID_MIX_COMPONENT for an empty name,
     *         empty component material or negative/non-finite coefficient;
     *         RECURSIVE_MIX if a component names a registered mix or the
     *         mix itself
     */
    void add_mix(const MixDesign& mix);

    /**
     * @brief Find a mix by name
     * @return Pointer to the mix, or nullptr if not registered
     */
    const MixDesign* find(const std::string& name) const;

    size_t size() const { return mixes_.size(); }
    bool empty() const { return mixes_.empty(); }

private:
    std::map<std::string, MixDesign> mixes_;
};

/**
 * @brief Replace mix requirements by their raw material components
 *
 * For a requirement whose material is a registered mix, one requirement per
 * component is emitted at the same position:
 *   base     = mix.base * c
 *   adjusted = mix.adjusted * c
 * The waste factor is inherited from the mix and not applied again.
 * Other requirements pass through unchanged.
 *
 * @param requirements Calculator output (not modified)
 * @param library Registered mixes
 * @return Expanded requirement list
 */
std::vector<MaterialRequirement> expand_mixes(
    const std::vector<MaterialRequirement>& requirements,
    const MixLibrary& library);

} // namespace metraj
