#pragma once

#include "metraj/material_calculator.hpp"
#include "metraj/material_summary.hpp"

#include <string>
#include <vector>

namespace metraj {

/**
 * @brief Round half away from zero at the given number of decimals
 *
 * round_half_up(2.345, 2) == 2.35, round_half_up(-2.345, 2) == -2.35
 */
double round_half_up(double value, int decimals = 2);

/**
 * @brief Format a number for display
 *
 * Default separators give Turkish style: 1234567.891 -> "1.234.567,89".
 */
std::string format_number(double value, int decimals = 2,
                          char thousands_separator = '.',
                          char decimal_separator = ',');

/**
 * @brief Format a waste factor as percentage ("%5", "%2,5")
 */
std::string format_percent(double fraction, char decimal_separator = ',');

/**
 * @brief Display settings of material reports
 */
struct ReportConfig {
    int decimals = 2;                   ///< Decimals of quantities
    char thousands_separator = '.';     ///< Group separator
    char decimal_separator = ',';       ///< Decimal mark
    bool show_waste_factor = true;      ///< Fill the waste factor column
};

/**
 * @brief One formatted row of a material report
 */
struct MaterialReportRow {
    std::string material;
    std::string unit;
    std::string base_quantity;
    std::string adjusted_quantity;
    std::string waste_factor;     ///< Empty if hidden or not applicable
    std::string source;           ///< Work item code, or contribution count for summaries
};

/**
 * @brief Format a requirement list, preserving its order
 */
std::vector<MaterialReportRow> build_requirement_report(
    const std::vector<MaterialRequirement>& requirements,
    const ReportConfig& config = ReportConfig());

/**
 * @brief Format a project summary, one row per material
 *
 * The waste factor column is empty: a total may mix several factors.
 */
std::vector<MaterialReportRow> build_summary_report(
    const MaterialSummary& summary,
    const ReportConfig& config = ReportConfig());

/**
 * @brief Render rows as a fixed-width plain text table
 */
std::string render_text_table(const std::vector<MaterialReportRow>& rows);

} // namespace metraj
