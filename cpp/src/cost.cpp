#include "metraj/cost.hpp"
#include "metraj/errors.hpp"
#include "metraj/report.hpp"

#include <cmath>
#include <utility>

namespace metraj {

PricedLine::PricedLine(std::string code, double quantity, double unit_price)
    : code(std::move(code)), quantity(quantity), unit_price(unit_price) {
}

SubcontractorOffer::SubcontractorOffer(std::string company, double total)
    : company(std::move(company)), total(total) {
}

static void check_price(double unit_price, const std::string& code) {
    if (!std::isfinite(unit_price) || unit_price < 0.0) {
        MetrajError err(ErrorCode::INVALID_PRICE, "unit price must be a non-negative number");
        if (!code.empty()) err.involved_items.push_back(code);
        err.details["unit_price"] = std::to_string(unit_price);
        err.suggestion = "Check the unit price of the work item.";
        throw InvalidInputError(err);
    }
}

double line_total(double quantity, double unit_price) {
    check_price(unit_price, "");
    return round_half_up(quantity * unit_price, 2);
}

double project_total(const std::vector<PricedLine>& lines) {
    double total = 0.0;
    for (const auto& line : lines) {
        check_price(line.unit_price, line.code);
        total += line.quantity * line.unit_price;
    }
    return round_half_up(total, 2);
}

double vat_amount(double amount, double rate_percent) {
    if (!std::isfinite(rate_percent) || rate_percent < 0.0) {
        MetrajError err(ErrorCode::INVALID_RATE, "VAT rate must be a non-negative number");
        err.details["rate_percent"] = std::to_string(rate_percent);
        err.suggestion = "Enter the rate in percent, e.g. 20 for 20%.";
        throw InvalidInputError(err);
    }
    return round_half_up(amount * rate_percent / 100.0, 2);
}

VatBreakdown with_vat(double amount, double rate_percent) {
    VatBreakdown result;
    result.net = amount;
    result.vat = vat_amount(amount, rate_percent);
    result.gross = round_half_up(amount + result.vat, 2);
    return result;
}

OfferComparison compare_offers(const std::vector<SubcontractorOffer>& offers) {
    OfferComparison result;
    result.offer_count = offers.size();

    double sum = 0.0;
    size_t counted = 0;

    for (const auto& offer : offers) {
        if (!(offer.total > 0.0)) {
            continue;
        }

        if (!result.lowest || offer.total < result.lowest->amount) {
            result.lowest = RankedOffer{offer.company, offer.total};
        }
        if (!result.highest || offer.total > result.highest->amount) {
            result.highest = RankedOffer{offer.company, offer.total};
        }
        sum += offer.total;
        ++counted;
    }

    if (counted > 0) {
        result.average = round_half_up(sum / static_cast<double>(counted), 2);
    }
    return result;
}

} // namespace metraj
