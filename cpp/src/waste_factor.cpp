#include "metraj/waste_factor.hpp"

#include <cmath>

namespace metraj {

std::string waste_mode_to_string(WasteFactorMode mode) {
    switch (mode) {
        case WasteFactorMode::Automatic: return "Automatic";
        case WasteFactorMode::Manual: return "Manual";
        default: return "Unknown";
    }
}

MetrajError WasteFactorPolicy::validate() const {
    if (mode != WasteFactorMode::Manual) {
        return MetrajError();
    }
    if (!override_factor) {
        return MetrajError::missing_override_factor();
    }
    if (!std::isfinite(*override_factor) || *override_factor < 0.0) {
        return MetrajError::negative_override_factor(*override_factor);
    }
    return MetrajError();
}

} // namespace metraj
