#include "metraj/report.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace metraj {

double round_half_up(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    const double scaled = value * scale;

    // Nudge by a relative epsilon so 2.345 (stored as 2.34499...) rounds up
    const double nudge = std::abs(scaled) * 1e-12;
    double rounded = value >= 0.0 ? std::floor(scaled + 0.5 + nudge)
                                  : -std::floor(-scaled + 0.5 + nudge);
    return rounded / scale;
}

std::string format_number(double value, int decimals,
                          char thousands_separator, char decimal_separator) {
    decimals = std::max(decimals, 0);
    double rounded = round_half_up(value, decimals);
    bool negative = rounded < 0.0;

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, std::abs(rounded));
    std::string digits(buf);

    std::string int_part = digits;
    std::string frac_part;
    auto dot = digits.find('.');
    if (dot != std::string::npos) {
        int_part = digits.substr(0, dot);
        frac_part = digits.substr(dot + 1);
    }

    std::string grouped;
    int count = 0;
    for (auto it = int_part.rbegin(); it != int_part.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            grouped.push_back(thousands_separator);
        }
        grouped.push_back(*it);
        ++count;
    }
    std::reverse(grouped.begin(), grouped.end());

    std::string result = negative ? "-" + grouped : grouped;
    if (!frac_part.empty()) {
        result += decimal_separator + frac_part;
    }
    return result;
}

std::string format_percent(double fraction, char decimal_separator) {
    double percent = round_half_up(fraction * 100.0, 2);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", percent);
    std::string text(buf);

    // Drop trailing zeros: 5.00 -> 5, 2.50 -> 2.5
    while (!text.empty() && text.back() == '0') text.pop_back();
    if (!text.empty() && text.back() == '.') text.pop_back();

    std::replace(text.begin(), text.end(), '.', decimal_separator);
    return "%" + text;
}

std::vector<MaterialReportRow> build_requirement_report(
    const std::vector<MaterialRequirement>& requirements,
    const ReportConfig& config)
{
    std::vector<MaterialReportRow> rows;
    rows.reserve(requirements.size());

    for (const auto& req : requirements) {
        MaterialReportRow row;
        row.material = req.material;
        row.unit = req.unit;
        row.base_quantity = format_number(req.base_quantity, config.decimals,
                                          config.thousands_separator, config.decimal_separator);
        row.adjusted_quantity = format_number(req.adjusted_quantity, config.decimals,
                                              config.thousands_separator, config.decimal_separator);
        if (config.show_waste_factor) {
            row.waste_factor = format_percent(req.waste_factor, config.decimal_separator);
        }
        row.source = req.work_item_code;
        rows.push_back(std::move(row));
    }

    return rows;
}

std::vector<MaterialReportRow> build_summary_report(
    const MaterialSummary& summary,
    const ReportConfig& config)
{
    std::vector<MaterialReportRow> rows;

    for (const auto& total : summary.to_totals()) {
        MaterialReportRow row;
        row.material = total.key.material;
        row.unit = total.key.unit;
        row.base_quantity = format_number(total.base_quantity, config.decimals,
                                          config.thousands_separator, config.decimal_separator);
        row.adjusted_quantity = format_number(total.adjusted_quantity, config.decimals,
                                              config.thousands_separator, config.decimal_separator);
        row.source = std::to_string(total.contributions);
        rows.push_back(std::move(row));
    }

    return rows;
}

std::string render_text_table(const std::vector<MaterialReportRow>& rows) {
    const std::array<std::string, 6> headers = {
        "Material", "Unit", "Base", "Waste", "Required", "Source"};

    auto cells_of = [](const MaterialReportRow& r) {
        return std::array<std::string, 6>{
            r.material, r.unit, r.base_quantity, r.waste_factor, r.adjusted_quantity, r.source};
    };

    // Width in bytes; multi-byte names (Çimento) may misalign slightly
    std::array<size_t, 6> widths;
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        auto cells = cells_of(row);
        for (size_t c = 0; c < cells.size(); ++c) {
            widths[c] = std::max(widths[c], cells[c].size());
        }
    }

    std::ostringstream out;
    auto write_line = [&](const std::array<std::string, 6>& cells) {
        for (size_t c = 0; c < cells.size(); ++c) {
            if (c > 0) out << "  ";
            const bool numeric = (c == 2 || c == 3 || c == 4);
            const std::string pad(widths[c] - cells[c].size(), ' ');
            out << (numeric ? pad + cells[c] : cells[c] + pad);
        }
        out << "\n";
    };

    write_line(headers);
    size_t total_width = 0;
    for (size_t w : widths) total_width += w;
    total_width += 2 * (widths.size() - 1);
    out << std::string(total_width, '-') << "\n";

    for (const auto& row : rows) {
        write_line(cells_of(row));
    }

    return out.str();
}

} // namespace metraj
