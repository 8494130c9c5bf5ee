#include "metraj/material_calculator.hpp"

namespace metraj {

std::vector<MaterialRequirement> compute_material_requirements(
    const WorkItem& item,
    const FormulaTable& table,
    const WasteFactorPolicy& policy)
{
    MetrajError err = item.validate();
    if (err.is_error()) {
        throw InvalidInputError(err);
    }

    err = policy.validate();
    if (err.is_error()) {
        if (!item.code().empty()) err.involved_items.push_back(item.code());
        throw InvalidInputError(err);
    }

    const auto& entries = table.entries_for(item.category());

    std::vector<MaterialRequirement> requirements;
    requirements.reserve(entries.size());

    for (const auto& entry : entries) {
        MaterialRequirement req;
        req.material = entry.material;
        req.unit = entry.unit;
        req.base_quantity = item.quantity() * entry.coefficient;
        req.waste_factor = policy.effective_factor(entry);
        req.adjusted_quantity = req.base_quantity * (1.0 + req.waste_factor);
        req.category = item.category();
        req.work_item_code = item.code();
        req.description = entry.description;
        requirements.push_back(std::move(req));
    }

    return requirements;
}

std::vector<MaterialRequirement> MaterialCalculator::compute(
    const WorkItem& item,
    const FormulaTable& table,
    const WasteFactorPolicy& policy) const
{
    return compute_material_requirements(item, table, policy);
}

std::vector<MaterialRequirement> MaterialCalculator::compute(
    const WorkItem& item,
    const FormulaTable& table,
    WasteFactorMode mode,
    std::optional<double> override_factor) const
{
    WasteFactorPolicy policy;
    policy.mode = mode;
    policy.override_factor = override_factor;
    return compute_material_requirements(item, table, policy);
}

} // namespace metraj
