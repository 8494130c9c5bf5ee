#include "metraj/mix_design.hpp"
#include "metraj/errors.hpp"

#include <cmath>
#include <utility>

namespace metraj {

MixComponent::MixComponent(std::string material, std::string unit, double coefficient)
    : material(std::move(material)), unit(std::move(unit)), coefficient(coefficient) {
}

MixDesign::MixDesign(std::string name, std::vector<MixComponent> components)
    : name(std::move(name)), components(std::move(components)) {
}

void MixLibrary::add_mix(const MixDesign& mix) {
    if (mix.name.empty()) {
        throw InvalidInputError(MetrajError::invalid_mix_component(
            mix.name, "", "mix name must not be empty"));
    }

    for (const auto& c : mix.components) {
        if (c.material.empty()) {
            throw InvalidInputError(MetrajError::invalid_mix_component(
                mix.name, c.material, "component material must not be empty"));
        }
        if (!std::isfinite(c.coefficient) || c.coefficient < 0.0) {
            throw InvalidInputError(MetrajError::invalid_mix_component(
                mix.name, c.material, "coefficient must be a non-negative number"));
        }
        if (c.material == mix.name || mixes_.count(c.material) > 0) {
            throw InvalidInputError(MetrajError::recursive_mix(mix.name, c.material));
        }
    }

    // A registered mix must not appear as component of an existing mix
    for (const auto& kv : mixes_) {
        if (kv.first == mix.name) continue;
        for (const auto& c : kv.second.components) {
            if (c.material == mix.name) {
                throw InvalidInputError(MetrajError::recursive_mix(kv.first, mix.name));
            }
        }
    }

    mixes_[mix.name] = mix;
}

const MixDesign* MixLibrary::find(const std::string& name) const {
    auto it = mixes_.find(name);
    return it != mixes_.end() ? &it->second : nullptr;
}

std::vector<MaterialRequirement> expand_mixes(
    const std::vector<MaterialRequirement>& requirements,
    const MixLibrary& library)
{
    std::vector<MaterialRequirement> expanded;
    expanded.reserve(requirements.size());

    for (const auto& req : requirements) {
        const MixDesign* mix = library.find(req.material);
        if (mix == nullptr) {
            expanded.push_back(req);
            continue;
        }

        for (const auto& component : mix->components) {
            MaterialRequirement part;
            part.material = component.material;
            part.unit = component.unit;
            part.base_quantity = req.base_quantity * component.coefficient;
            part.waste_factor = req.waste_factor;
            part.adjusted_quantity = req.adjusted_quantity * component.coefficient;
            part.category = req.category;
            part.work_item_code = req.work_item_code;
            part.description = mix->name + " (" + req.unit + ")";
            expanded.push_back(std::move(part));
        }
    }

    return expanded;
}

} // namespace metraj
