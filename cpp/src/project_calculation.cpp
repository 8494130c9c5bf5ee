#include "metraj/project_calculation.hpp"
#include "metraj/logging.hpp"

#include <utility>

namespace metraj {

size_t ProjectMaterialResult::succeeded() const {
    size_t count = 0;
    for (const auto& item : items) {
        if (item.success) ++count;
    }
    return count;
}

size_t ProjectMaterialResult::failed() const {
    return items.size() - succeeded();
}

std::vector<MaterialRequirement> ProjectMaterialResult::all_requirements() const {
    std::vector<MaterialRequirement> result;
    for (const auto& item : items) {
        result.insert(result.end(), item.requirements.begin(), item.requirements.end());
    }
    return result;
}

const MixLibrary& ProjectCalculator::no_mixes() {
    static const MixLibrary empty;
    return empty;
}

ProjectCalculator::ProjectCalculator(const FormulaTable& table,
                                     const MixLibrary& mixes,
                                     ProjectCalculationConfig config)
    : table_(table), mixes_(mixes), config_(std::move(config)) {
}

ProjectCalculator::ProjectCalculator(const FormulaTable& table,
                                     ProjectCalculationConfig config)
    : table_(table), mixes_(no_mixes()), config_(std::move(config)) {
}

ProjectMaterialResult ProjectCalculator::compute(const std::vector<WorkItem>& items) const {
    // A bad policy fails every item the same way; reject it up front
    MetrajError policy_error = config_.policy.validate();
    if (policy_error.is_error()) {
        throw InvalidInputError(policy_error);
    }

    ProjectMaterialResult result;

    if (config_.policy.mode == WasteFactorMode::Manual &&
        *config_.policy.override_factor > config_.max_plausible_waste_factor) {
        result.warnings.add(MetrajWarning::high_waste_factor(
            "", "", *config_.policy.override_factor, config_.max_plausible_waste_factor));
    }

    std::vector<std::string> codes;
    std::vector<std::vector<MaterialRequirement>> lists;
    result.items.reserve(items.size());

    for (const auto& item : items) {
        WorkItemResult item_result(item.code());

        try {
            auto requirements = compute_material_requirements(item, table_, config_.policy);
            if (config_.expand_mixes && !mixes_.empty()) {
                requirements = expand_mixes(requirements, mixes_);
            }
            item_result.requirements = std::move(requirements);
            item_result.success = true;
        } catch (const InvalidInputError& e) {
            if (config_.on_invalid_item == BatchErrorPolicy::Abort) {
                log_error("Project computation aborted at work item '" + item.code() +
                          "': " + e.error().message);
                throw;
            }
            log_warn("Skipping work item '" + item.code() + "': " + e.error().message);
            item_result.error = e.error();
            result.warnings.add(MetrajWarning::skipped_work_item(item.code(), e.error().message));
        }

        if (item_result.success) {
            codes.push_back(item_result.work_item_code);
            lists.push_back(item_result.requirements);
        }
        result.items.push_back(std::move(item_result));
    }

    result.summary = MaterialSummary(codes, lists);

    log_info("Computed " + std::to_string(result.summary.num_materials()) +
             " materials from " + std::to_string(result.succeeded()) + " of " +
             std::to_string(items.size()) + " work items");

    return result;
}

} // namespace metraj
