#pragma once

#include <optional>
#include <string>
#include <vector>

namespace metraj {

/// Default VAT (KDV) rate [%]
constexpr double DEFAULT_VAT_RATE = 20.0;

/**
 * @brief Priced takeoff line
 */
struct PricedLine {
    std::string code;       ///< Work item code (poz no)
    double quantity;        ///< Quantity in the work item's unit
    double unit_price;      ///< Price per unit [currency]

    PricedLine(std::string code, double quantity, double unit_price);
};

/**
 * @brief Amount split into net, tax and gross (rounded to 0.01)
 */
struct VatBreakdown {
    double net = 0.0;
    double vat = 0.0;
    double gross = 0.0;
};

/**
 * @brief Subcontractor offer for a work package
 */
struct SubcontractorOffer {
    std::string company;
    double total;

    SubcontractorOffer(std::string company, double total);
};

struct RankedOffer {
    std::string company;
    double amount;
};

/**
 * @brief Comparison of subcontractor offers
 *
 * Only offers with a positive total take part in ranking and average;
 * offer_count includes all offers.
 */
struct OfferComparison {
    std::optional<RankedOffer> lowest;
    std::optional<RankedOffer> highest;
    double average = 0.0;
    size_t offer_count = 0;
};

/**
 * @brief quantity x unit price, rounded half up to 0.01
 * @throws InvalidInputError (INVALID_PRICE) for a negative or non-finite price
 */
double line_total(double quantity, double unit_price);

/**
 * @brief Sum of quantity x unit price over all lines, rounded once at the end
 * @throws InvalidInputError (INVALID_PRICE) for a negative or non-finite price
 */
double project_total(const std::vector<PricedLine>& lines);

/**
 * @brief VAT on an amount, rounded half up to 0.01
 * @param amount Net amount
 * @param rate_percent VAT rate in percent (20.0 = 20%)
 * @throws InvalidInputError (INVALID_RATE) for a negative or non-finite rate
 */
double vat_amount(double amount, double rate_percent = DEFAULT_VAT_RATE);

/**
 * @brief Net, VAT and gross of a net amount
 */
VatBreakdown with_vat(double amount, double rate_percent = DEFAULT_VAT_RATE);

/**
 * @brief Rank subcontractor offers
 *
 * Ties are resolved in favour of the earlier offer.
 */
OfferComparison compare_offers(const std::vector<SubcontractorOffer>& offers);

} // namespace metraj
