#include "metraj/formula_table.hpp"
#include "metraj/errors.hpp"
#include "metraj/logging.hpp"

#include <cmath>
#include <set>
#include <utility>

namespace metraj {

MaterialFormulaEntry::MaterialFormulaEntry(std::string category, std::string material,
                                           double coefficient, std::string unit,
                                           double default_waste_factor,
                                           std::string description)
    : category(std::move(category)),
      material(std::move(material)),
      coefficient(coefficient),
      default_waste_factor(default_waste_factor),
      unit(std::move(unit)),
      description(std::move(description)) {
}

static void reject_entry(const MaterialFormulaEntry& entry, const std::string& reason) {
    log_debug("Rejected formula entry '" + entry.material + "' in category '" +
              entry.category + "': " + reason);
    throw InvalidInputError(
        MetrajError::invalid_formula_entry(entry.category, entry.material, reason));
}

void FormulaTable::add_entry(const MaterialFormulaEntry& entry) {
    if (entry.category.empty()) {
        reject_entry(entry, "category must not be empty");
    }
    if (entry.material.empty()) {
        reject_entry(entry, "material must not be empty");
    }
    if (!std::isfinite(entry.coefficient) || entry.coefficient < 0.0) {
        reject_entry(entry, "coefficient must be a non-negative number");
    }
    if (!std::isfinite(entry.default_waste_factor) || entry.default_waste_factor < 0.0) {
        reject_entry(entry, "default waste factor must be a non-negative number");
    }

    entries_[entry.category].push_back(entry);
}

void FormulaTable::register_category(const std::string& category) {
    // operator[] creates an empty list without touching existing entries
    entries_[category];
}

const std::vector<MaterialFormulaEntry>& FormulaTable::entries_for(const std::string& category) const {
    static const std::vector<MaterialFormulaEntry> no_entries;

    auto it = entries_.find(category);
    if (it == entries_.end()) {
        return no_entries;
    }
    return it->second;
}

bool FormulaTable::has_category(const std::string& category) const {
    return entries_.find(category) != entries_.end();
}

std::vector<std::string> FormulaTable::categories() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& kv : entries_) {
        result.push_back(kv.first);
    }
    return result;
}

size_t FormulaTable::size() const {
    size_t total = 0;
    for (const auto& kv : entries_) {
        total += kv.second.size();
    }
    return total;
}

WarningList FormulaTable::validate(double max_plausible_waste_factor) const {
    WarningList warnings;

    for (const auto& kv : entries_) {
        const std::string& category = kv.first;
        const auto& entries = kv.second;

        if (entries.empty()) {
            warnings.add(MetrajWarning::empty_category(category));
            continue;
        }

        std::set<std::pair<std::string, std::string>> seen;
        for (const auto& entry : entries) {
            if (entry.coefficient == 0.0) {
                warnings.add(MetrajWarning::zero_coefficient(category, entry.material));
            }
            if (entry.default_waste_factor > max_plausible_waste_factor) {
                warnings.add(MetrajWarning::high_waste_factor(
                    category, entry.material, entry.default_waste_factor,
                    max_plausible_waste_factor));
            }
            if (!seen.insert({entry.material, entry.unit}).second) {
                warnings.add(MetrajWarning::duplicate_material(category, entry.material, entry.unit));
            }
        }
    }

    return warnings;
}

} // namespace metraj
