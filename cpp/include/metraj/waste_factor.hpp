#pragma once

#include "metraj/errors.hpp"
#include "metraj/formula_table.hpp"

#include <optional>
#include <string>

namespace metraj {

/**
 * @brief How waste ("fire") factors are chosen for a computation
 */
enum class WasteFactorMode {
    Automatic,  ///< Each material uses its default factor from the formula table
    Manual      ///< One user-supplied override factor applies to all materials
};

std::string waste_mode_to_string(WasteFactorMode mode);

/**
 * @brief Per-computation waste factor setting
 *
 * Mirrors the explicit-vs-default factor rule of a load combination:
 * in Manual mode the override replaces every entry's default, in
 * Automatic mode an override (if any) is ignored.
 */
struct WasteFactorPolicy {
    WasteFactorMode mode = WasteFactorMode::Automatic;
    std::optional<double> override_factor;   ///< Required (>= 0) in Manual mode

    static WasteFactorPolicy automatic() {
        return WasteFactorPolicy{};
    }

    static WasteFactorPolicy manual(double factor) {
        WasteFactorPolicy policy;
        policy.mode = WasteFactorMode::Manual;
        policy.override_factor = factor;
        return policy;
    }

    /**
     * @brief Check the policy
     * @return OK, MISSING_OVERRIDE_FACTOR or NEGATIVE_OVERRIDE_FACTOR
     */
    MetrajError validate() const;

    /**
     * @brief Waste factor used for the given entry
     *
     * Assumes validate() passed.
     */
    double effective_factor(const MaterialFormulaEntry& entry) const {
        return mode == WasteFactorMode::Manual ? *override_factor : entry.default_waste_factor;
    }
};

} // namespace metraj
