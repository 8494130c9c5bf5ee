#include "metraj/material_summary.hpp"

#include <algorithm>
#include <stdexcept>

namespace metraj {

std::vector<MaterialTotal> aggregate_requirements(
    const std::vector<std::vector<MaterialRequirement>>& lists)
{
    std::map<MaterialKey, MaterialTotal> grouped;

    for (const auto& list : lists) {
        for (const auto& req : list) {
            MaterialKey key{req.material, req.unit};
            MaterialTotal& total = grouped[key];
            total.key = key;
            total.base_quantity += req.base_quantity;
            total.adjusted_quantity += req.adjusted_quantity;
            total.contributions += 1;
        }
    }

    std::vector<MaterialTotal> result;
    result.reserve(grouped.size());
    for (const auto& kv : grouped) {
        result.push_back(kv.second);
    }
    return result;
}

std::map<std::string, std::vector<MaterialTotal>> group_by_category(
    const std::vector<MaterialRequirement>& requirements)
{
    std::map<std::string, std::vector<MaterialRequirement>> by_category;
    for (const auto& req : requirements) {
        by_category[req.category].push_back(req);
    }

    std::map<std::string, std::vector<MaterialTotal>> result;
    for (const auto& kv : by_category) {
        result[kv.first] = aggregate_requirements({kv.second});
    }
    return result;
}

MaterialSummary::MaterialSummary(const std::vector<std::string>& item_codes,
                                 const std::vector<std::vector<MaterialRequirement>>& lists)
    : item_codes_(item_codes)
{
    if (item_codes.size() != lists.size()) {
        throw std::invalid_argument("MaterialSummary: item code count (" +
                                    std::to_string(item_codes.size()) +
                                    ") does not match requirement list count (" +
                                    std::to_string(lists.size()) + ")");
    }

    // Collect sorted unique keys
    for (const auto& list : lists) {
        for (const auto& req : list) {
            keys_.push_back(MaterialKey{req.material, req.unit});
        }
    }
    std::sort(keys_.begin(), keys_.end());
    keys_.erase(std::unique(keys_.begin(), keys_.end()), keys_.end());

    const Eigen::Index rows = static_cast<Eigen::Index>(keys_.size());
    const Eigen::Index cols = static_cast<Eigen::Index>(lists.size());
    base_ = Eigen::MatrixXd::Zero(rows, cols);
    adjusted_ = Eigen::MatrixXd::Zero(rows, cols);
    counts_ = Eigen::MatrixXi::Zero(rows, cols);

    for (Eigen::Index j = 0; j < cols; ++j) {
        for (const auto& req : lists[static_cast<size_t>(j)]) {
            int i = row_of(req.material, req.unit);
            base_(i, j) += req.base_quantity;
            adjusted_(i, j) += req.adjusted_quantity;
            counts_(i, j) += 1;
        }
    }
}

int MaterialSummary::row_of(const std::string& material, const std::string& unit) const {
    MaterialKey key{material, unit};
    auto it = std::lower_bound(keys_.begin(), keys_.end(), key);
    if (it == keys_.end() || !(*it == key)) {
        return -1;
    }
    return static_cast<int>(it - keys_.begin());
}

Eigen::VectorXd MaterialSummary::totals() const {
    return adjusted_.rowwise().sum();
}

Eigen::VectorXd MaterialSummary::base_totals() const {
    return base_.rowwise().sum();
}

Eigen::VectorXd MaterialSummary::item_totals() const {
    return adjusted_.colwise().sum().transpose();
}

std::optional<double> MaterialSummary::total_for(const std::string& material,
                                                 const std::string& unit) const {
    int row = row_of(material, unit);
    if (row < 0) {
        return std::nullopt;
    }
    return adjusted_.row(row).sum();
}

double MaterialSummary::contribution(const std::string& material, const std::string& unit,
                                     const std::string& item_code) const {
    int row = row_of(material, unit);
    if (row < 0) {
        return 0.0;
    }

    // Codes may repeat (same poz on several takeoff lines); sum all columns
    double sum = 0.0;
    for (size_t j = 0; j < item_codes_.size(); ++j) {
        if (item_codes_[j] == item_code) {
            sum += adjusted_(row, static_cast<Eigen::Index>(j));
        }
    }
    return sum;
}

std::vector<MaterialTotal> MaterialSummary::to_totals() const {
    std::vector<MaterialTotal> result;
    result.reserve(keys_.size());

    Eigen::VectorXd base = base_totals();
    Eigen::VectorXd adjusted = totals();
    Eigen::VectorXi counts = counts_.rowwise().sum();

    for (size_t i = 0; i < keys_.size(); ++i) {
        MaterialTotal total;
        total.key = keys_[i];
        total.base_quantity = base(static_cast<Eigen::Index>(i));
        total.adjusted_quantity = adjusted(static_cast<Eigen::Index>(i));
        total.contributions = counts(static_cast<Eigen::Index>(i));
        result.push_back(total);
    }
    return result;
}

} // namespace metraj
