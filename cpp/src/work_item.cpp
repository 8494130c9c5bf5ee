#include "metraj/work_item.hpp"

#include <cmath>
#include <utility>

namespace metraj {

WorkItem::WorkItem(std::string code, std::string category, double quantity,
                   std::string unit, std::string description)
    : code_(std::move(code)),
      category_(std::move(category)),
      quantity_(quantity),
      unit_(std::move(unit)),
      description_(std::move(description)) {
}

UnitKind WorkItem::unit_kind() const {
    return metraj::unit_kind(unit_);
}

MetrajError WorkItem::validate() const {
    if (!std::isfinite(quantity_)) {
        return MetrajError::non_finite_quantity(code_);
    }
    if (quantity_ <= 0.0) {
        return MetrajError::non_positive_quantity(code_, quantity_);
    }
    if (category_.empty()) {
        return MetrajError::missing_category(code_);
    }
    return MetrajError();
}

} // namespace metraj
