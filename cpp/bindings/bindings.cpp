#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "metraj/errors.hpp"
#include "metraj/warnings.hpp"
#include "metraj/logging.hpp"
#include "metraj/units.hpp"
#include "metraj/work_item.hpp"
#include "metraj/formula_table.hpp"
#include "metraj/waste_factor.hpp"
#include "metraj/material_calculator.hpp"
#include "metraj/mix_design.hpp"
#include "metraj/material_summary.hpp"
#include "metraj/project_calculation.hpp"
#include "metraj/report.hpp"
#include "metraj/cost.hpp"

namespace py = pybind11;

/**
 * Metraj C++ Python bindings module.
 * This module exposes the material computation core to the desktop application.
 */
PYBIND11_MODULE(_metraj_cpp, m) {
    m.doc() = "Metraj C++ core module - material quantities for construction takeoffs";

    m.attr("__version__") = "1.0.0";
    m.attr("DEFAULT_WASTE_FACTOR") = metraj::DEFAULT_WASTE_FACTOR;
    m.attr("DEFAULT_VAT_RATE") = metraj::DEFAULT_VAT_RATE;

    // ========================================================================
    // Errors and warnings
    // ========================================================================

    py::enum_<metraj::ErrorCode>(m, "ErrorCode", "Error codes for invalid input")
        .value("OK", metraj::ErrorCode::OK)
        .value("NON_POSITIVE_QUANTITY", metraj::ErrorCode::NON_POSITIVE_QUANTITY)
        .value("NON_FINITE_QUANTITY", metraj::ErrorCode::NON_FINITE_QUANTITY)
        .value("MISSING_CATEGORY", metraj::ErrorCode::MISSING_CATEGORY)
        .value("MISSING_OVERRIDE_FACTOR", metraj::ErrorCode::MISSING_OVERRIDE_FACTOR)
        .value("NEGATIVE_OVERRIDE_FACTOR", metraj::ErrorCode::NEGATIVE_OVERRIDE_FACTOR)
        .value("INVALID_FORMULA_ENTRY", metraj::ErrorCode::INVALID_FORMULA_ENTRY)
        .value("INVALID_MIX_COMPONENT", metraj::ErrorCode::INVALID_MIX_COMPONENT)
        .value("RECURSIVE_MIX", metraj::ErrorCode::RECURSIVE_MIX)
        .value("UNKNOWN_UNIT", metraj::ErrorCode::UNKNOWN_UNIT)
        .value("INCOMPATIBLE_UNITS", metraj::ErrorCode::INCOMPATIBLE_UNITS)
        .value("INVALID_PRICE", metraj::ErrorCode::INVALID_PRICE)
        .value("INVALID_RATE", metraj::ErrorCode::INVALID_RATE)
        .value("UNKNOWN_ERROR", metraj::ErrorCode::UNKNOWN_ERROR);

    py::class_<metraj::MetrajError>(m, "MetrajError",
        "Structured error with code, message and suggestion")
        .def(py::init<>())
        .def(py::init<metraj::ErrorCode, const std::string&>(),
             py::arg("code"), py::arg("message"))
        .def_readwrite("code", &metraj::MetrajError::code)
        .def_readwrite("message", &metraj::MetrajError::message)
        .def_readwrite("involved_items", &metraj::MetrajError::involved_items)
        .def_readwrite("involved_materials", &metraj::MetrajError::involved_materials)
        .def_readwrite("details", &metraj::MetrajError::details)
        .def_readwrite("suggestion", &metraj::MetrajError::suggestion)
        .def("is_ok", &metraj::MetrajError::is_ok)
        .def("is_error", &metraj::MetrajError::is_error)
        .def("code_string", &metraj::MetrajError::code_string)
        .def("to_string", &metraj::MetrajError::to_string)
        .def("__repr__", [](const metraj::MetrajError& e) {
            return "<MetrajError " + e.code_string() + ": " + e.message + ">";
        });

    // Raised for every validation failure; subclass of ValueError on the Python side
    py::register_exception<metraj::InvalidInputError>(m, "InvalidInputError", PyExc_ValueError);

    py::enum_<metraj::WarningCode>(m, "WarningCode")
        .value("ZERO_COEFFICIENT", metraj::WarningCode::ZERO_COEFFICIENT)
        .value("HIGH_WASTE_FACTOR", metraj::WarningCode::HIGH_WASTE_FACTOR)
        .value("DUPLICATE_MATERIAL", metraj::WarningCode::DUPLICATE_MATERIAL)
        .value("EMPTY_CATEGORY", metraj::WarningCode::EMPTY_CATEGORY)
        .value("SKIPPED_WORK_ITEM", metraj::WarningCode::SKIPPED_WORK_ITEM)
        .value("UNCONVERTIBLE_UNIT", metraj::WarningCode::UNCONVERTIBLE_UNIT);

    py::enum_<metraj::WarningSeverity>(m, "WarningSeverity")
        .value("Low", metraj::WarningSeverity::Low)
        .value("Medium", metraj::WarningSeverity::Medium)
        .value("High", metraj::WarningSeverity::High);

    py::class_<metraj::MetrajWarning>(m, "MetrajWarning")
        .def_readonly("code", &metraj::MetrajWarning::code)
        .def_readonly("severity", &metraj::MetrajWarning::severity)
        .def_readonly("message", &metraj::MetrajWarning::message)
        .def_readonly("involved_items", &metraj::MetrajWarning::involved_items)
        .def_readonly("involved_materials", &metraj::MetrajWarning::involved_materials)
        .def_readonly("details", &metraj::MetrajWarning::details)
        .def_readonly("suggestion", &metraj::MetrajWarning::suggestion)
        .def("to_string", &metraj::MetrajWarning::to_string);

    py::class_<metraj::WarningList>(m, "WarningList")
        .def(py::init<>())
        .def_readonly("warnings", &metraj::WarningList::warnings)
        .def("has_warnings", &metraj::WarningList::has_warnings)
        .def("count", &metraj::WarningList::count)
        .def("count_by_severity", &metraj::WarningList::count_by_severity)
        .def("count_by_code", &metraj::WarningList::count_by_code)
        .def("get_by_min_severity", &metraj::WarningList::get_by_min_severity)
        .def("summary", &metraj::WarningList::summary)
        .def("__len__", &metraj::WarningList::count);

    // ========================================================================
    // Logging
    // ========================================================================

    py::enum_<metraj::LogLevel>(m, "LogLevel")
        .value("Debug", metraj::LogLevel::Debug)
        .value("Info", metraj::LogLevel::Info)
        .value("Warn", metraj::LogLevel::Warn)
        .value("Error", metraj::LogLevel::Error)
        .value("Off", metraj::LogLevel::Off);

    m.def("set_log_level", &metraj::set_log_level, py::arg("level"),
          "Set the minimum level of core log messages");
    m.def("get_log_level", &metraj::get_log_level);

    // ========================================================================
    // Units
    // ========================================================================

    py::enum_<metraj::UnitKind>(m, "UnitKind")
        .value("Length", metraj::UnitKind::Length)
        .value("Area", metraj::UnitKind::Area)
        .value("Volume", metraj::UnitKind::Volume)
        .value("Mass", metraj::UnitKind::Mass)
        .value("Count", metraj::UnitKind::Count)
        .value("LiquidVolume", metraj::UnitKind::LiquidVolume)
        .value("Unknown", metraj::UnitKind::Unknown);

    m.def("unit_kind", &metraj::unit_kind, py::arg("symbol"),
          "Classify a unit symbol (m, m², m³, kg, adet, lt, ...)");

    py::class_<metraj::UnitConverter>(m, "UnitConverter",
        "Converts quantities between units, with material-specific factors")
        .def(py::init<>())
        .def("add_conversion", &metraj::UnitConverter::add_conversion,
             py::arg("from_unit"), py::arg("to_unit"), py::arg("factor"),
             py::arg("material") = "")
        .def("factor", &metraj::UnitConverter::factor,
             py::arg("from_unit"), py::arg("to_unit"), py::arg("material") = "")
        .def("convert", &metraj::UnitConverter::convert,
             py::arg("value"), py::arg("from_unit"), py::arg("to_unit"),
             py::arg("material") = "",
             "Convert a value; returns None if no conversion is known")
        .def("convert_or_throw", &metraj::UnitConverter::convert_or_throw,
             py::arg("value"), py::arg("from_unit"), py::arg("to_unit"),
             py::arg("material") = "");

    m.def("convert_requirements",
          [](const std::vector<metraj::MaterialRequirement>& reqs,
             const std::string& target_unit,
             const metraj::UnitConverter& converter) {
              metraj::WarningList warnings;
              auto converted = metraj::convert_requirements(reqs, target_unit, converter, &warnings);
              return py::make_tuple(converted, warnings);
          },
          py::arg("requirements"), py::arg("target_unit"), py::arg("converter"),
          "Convert requirements to a unit; returns (requirements, warnings)");

    // ========================================================================
    // Work items and formula table
    // ========================================================================

    py::class_<metraj::WorkItem>(m, "WorkItem", "One line of a quantity takeoff")
        .def(py::init<std::string, std::string, double, std::string, std::string>(),
             py::arg("code"), py::arg("category"), py::arg("quantity"),
             py::arg("unit"), py::arg("description") = "")
        .def_property_readonly("code", &metraj::WorkItem::code)
        .def_property_readonly("category", &metraj::WorkItem::category)
        .def_property("quantity", &metraj::WorkItem::quantity, &metraj::WorkItem::set_quantity)
        .def_property_readonly("unit", &metraj::WorkItem::unit)
        .def_property_readonly("description", &metraj::WorkItem::description)
        .def("unit_kind", &metraj::WorkItem::unit_kind)
        .def("validate", &metraj::WorkItem::validate)
        .def("__repr__", [](const metraj::WorkItem& w) {
            return "<WorkItem " + w.code() + " " + w.category() + " " +
                   std::to_string(w.quantity()) + " " + w.unit() + ">";
        });

    py::class_<metraj::MaterialFormulaEntry>(m, "MaterialFormulaEntry")
        .def(py::init<std::string, std::string, double, std::string, double, std::string>(),
             py::arg("category"), py::arg("material"), py::arg("coefficient"),
             py::arg("unit"), py::arg("default_waste_factor") = metraj::DEFAULT_WASTE_FACTOR,
             py::arg("description") = "")
        .def_readwrite("category", &metraj::MaterialFormulaEntry::category)
        .def_readwrite("material", &metraj::MaterialFormulaEntry::material)
        .def_readwrite("coefficient", &metraj::MaterialFormulaEntry::coefficient)
        .def_readwrite("default_waste_factor", &metraj::MaterialFormulaEntry::default_waste_factor)
        .def_readwrite("unit", &metraj::MaterialFormulaEntry::unit)
        .def_readwrite("description", &metraj::MaterialFormulaEntry::description);

    py::class_<metraj::FormulaTable>(m, "FormulaTable",
        "Category -> ordered material formulas (static reference data)")
        .def(py::init<>())
        .def("add_entry", &metraj::FormulaTable::add_entry, py::arg("entry"))
        .def("register_category", &metraj::FormulaTable::register_category, py::arg("category"))
        .def("entries_for", &metraj::FormulaTable::entries_for, py::arg("category"))
        .def("has_category", &metraj::FormulaTable::has_category, py::arg("category"))
        .def("categories", &metraj::FormulaTable::categories)
        .def("validate", &metraj::FormulaTable::validate,
             py::arg("max_plausible_waste_factor") = metraj::DEFAULT_MAX_PLAUSIBLE_WASTE_FACTOR)
        .def("__len__", &metraj::FormulaTable::size);

    // ========================================================================
    // Calculator
    // ========================================================================

    py::enum_<metraj::WasteFactorMode>(m, "WasteFactorMode")
        .value("Automatic", metraj::WasteFactorMode::Automatic)
        .value("Manual", metraj::WasteFactorMode::Manual);

    py::class_<metraj::WasteFactorPolicy>(m, "WasteFactorPolicy")
        .def(py::init<>())
        .def_static("automatic", &metraj::WasteFactorPolicy::automatic)
        .def_static("manual", &metraj::WasteFactorPolicy::manual, py::arg("factor"))
        .def_readwrite("mode", &metraj::WasteFactorPolicy::mode)
        .def_readwrite("override_factor", &metraj::WasteFactorPolicy::override_factor)
        .def("validate", &metraj::WasteFactorPolicy::validate);

    py::class_<metraj::MaterialRequirement>(m, "MaterialRequirement")
        .def(py::init<>())
        .def_readwrite("material", &metraj::MaterialRequirement::material)
        .def_readwrite("unit", &metraj::MaterialRequirement::unit)
        .def_readwrite("base_quantity", &metraj::MaterialRequirement::base_quantity)
        .def_readwrite("waste_factor", &metraj::MaterialRequirement::waste_factor)
        .def_readwrite("adjusted_quantity", &metraj::MaterialRequirement::adjusted_quantity)
        .def_readwrite("category", &metraj::MaterialRequirement::category)
        .def_readwrite("work_item_code", &metraj::MaterialRequirement::work_item_code)
        .def_readwrite("description", &metraj::MaterialRequirement::description)
        .def("__repr__", [](const metraj::MaterialRequirement& r) {
            return "<MaterialRequirement " + r.material + " " +
                   std::to_string(r.adjusted_quantity) + " " + r.unit + ">";
        });

    m.def("compute_material_requirements", &metraj::compute_material_requirements,
          py::arg("item"), py::arg("table"),
          py::arg("policy") = metraj::WasteFactorPolicy::automatic(),
          "Compute the raw materials of one work item");

    py::class_<metraj::MaterialCalculator>(m, "MaterialCalculator")
        .def(py::init<>())
        .def("compute",
             py::overload_cast<const metraj::WorkItem&, const metraj::FormulaTable&,
                               metraj::WasteFactorMode, std::optional<double>>(
                 &metraj::MaterialCalculator::compute, py::const_),
             py::arg("item"), py::arg("table"),
             py::arg("mode") = metraj::WasteFactorMode::Automatic,
             py::arg("override_factor") = py::none());

    // ========================================================================
    // Mixes, aggregation and project computation
    // ========================================================================

    py::class_<metraj::MixComponent>(m, "MixComponent")
        .def(py::init<std::string, std::string, double>(),
             py::arg("material"), py::arg("unit"), py::arg("coefficient"))
        .def_readwrite("material", &metraj::MixComponent::material)
        .def_readwrite("unit", &metraj::MixComponent::unit)
        .def_readwrite("coefficient", &metraj::MixComponent::coefficient);

    py::class_<metraj::MixDesign>(m, "MixDesign")
        .def(py::init<std::string, std::vector<metraj::MixComponent>>(),
             py::arg("name"), py::arg("components"))
        .def_readwrite("name", &metraj::MixDesign::name)
        .def_readwrite("components", &metraj::MixDesign::components);

    py::class_<metraj::MixLibrary>(m, "MixLibrary")
        .def(py::init<>())
        .def("add_mix", &metraj::MixLibrary::add_mix, py::arg("mix"))
        .def("find", &metraj::MixLibrary::find, py::arg("name"),
             py::return_value_policy::reference_internal)
        .def("__len__", &metraj::MixLibrary::size);

    m.def("expand_mixes", &metraj::expand_mixes, py::arg("requirements"), py::arg("library"));

    py::class_<metraj::MaterialKey>(m, "MaterialKey")
        .def_readonly("material", &metraj::MaterialKey::material)
        .def_readonly("unit", &metraj::MaterialKey::unit);

    py::class_<metraj::MaterialTotal>(m, "MaterialTotal")
        .def_readonly("key", &metraj::MaterialTotal::key)
        .def_readonly("base_quantity", &metraj::MaterialTotal::base_quantity)
        .def_readonly("adjusted_quantity", &metraj::MaterialTotal::adjusted_quantity)
        .def_readonly("contributions", &metraj::MaterialTotal::contributions);

    m.def("aggregate_requirements", &metraj::aggregate_requirements, py::arg("lists"));
    m.def("group_by_category", &metraj::group_by_category, py::arg("requirements"));

    py::class_<metraj::MaterialSummary>(m, "MaterialSummary",
        "Project material list with per work item breakdown")
        .def(py::init<const std::vector<std::string>&,
                      const std::vector<std::vector<metraj::MaterialRequirement>>&>(),
             py::arg("item_codes"), py::arg("lists"))
        .def("materials", &metraj::MaterialSummary::materials)
        .def("item_codes", &metraj::MaterialSummary::item_codes)
        .def("contributions", &metraj::MaterialSummary::contributions,
             "Adjusted quantity matrix (materials x work items)")
        .def("totals", &metraj::MaterialSummary::totals)
        .def("base_totals", &metraj::MaterialSummary::base_totals)
        .def("item_totals", &metraj::MaterialSummary::item_totals)
        .def("total_for", &metraj::MaterialSummary::total_for,
             py::arg("material"), py::arg("unit"))
        .def("contribution", &metraj::MaterialSummary::contribution,
             py::arg("material"), py::arg("unit"), py::arg("item_code"))
        .def("to_totals", &metraj::MaterialSummary::to_totals);

    py::enum_<metraj::BatchErrorPolicy>(m, "BatchErrorPolicy")
        .value("Abort", metraj::BatchErrorPolicy::Abort)
        .value("Skip", metraj::BatchErrorPolicy::Skip);

    py::class_<metraj::ProjectCalculationConfig>(m, "ProjectCalculationConfig")
        .def(py::init<>())
        .def_readwrite("policy", &metraj::ProjectCalculationConfig::policy)
        .def_readwrite("on_invalid_item", &metraj::ProjectCalculationConfig::on_invalid_item)
        .def_readwrite("expand_mixes", &metraj::ProjectCalculationConfig::expand_mixes)
        .def_readwrite("max_plausible_waste_factor",
                       &metraj::ProjectCalculationConfig::max_plausible_waste_factor);

    py::class_<metraj::WorkItemResult>(m, "WorkItemResult")
        .def_readonly("work_item_code", &metraj::WorkItemResult::work_item_code)
        .def_readonly("success", &metraj::WorkItemResult::success)
        .def_readonly("error", &metraj::WorkItemResult::error)
        .def_readonly("requirements", &metraj::WorkItemResult::requirements);

    py::class_<metraj::ProjectMaterialResult>(m, "ProjectMaterialResult")
        .def_readonly("items", &metraj::ProjectMaterialResult::items)
        .def_readonly("summary", &metraj::ProjectMaterialResult::summary)
        .def_readonly("warnings", &metraj::ProjectMaterialResult::warnings)
        .def("succeeded", &metraj::ProjectMaterialResult::succeeded)
        .def("failed", &metraj::ProjectMaterialResult::failed)
        .def("all_requirements", &metraj::ProjectMaterialResult::all_requirements);

    py::class_<metraj::ProjectCalculator>(m, "ProjectCalculator")
        .def(py::init<const metraj::FormulaTable&, const metraj::MixLibrary&,
                      metraj::ProjectCalculationConfig>(),
             py::arg("table"), py::arg("mixes"),
             py::arg("config") = metraj::ProjectCalculationConfig(),
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
        .def("config", &metraj::ProjectCalculator::config)
        .def("compute", &metraj::ProjectCalculator::compute, py::arg("items"));

    // ========================================================================
    // Report and cost helpers
    // ========================================================================

    m.def("round_half_up", &metraj::round_half_up, py::arg("value"), py::arg("decimals") = 2);
    m.def("format_number", &metraj::format_number, py::arg("value"), py::arg("decimals") = 2,
          py::arg("thousands_separator") = '.', py::arg("decimal_separator") = ',');
    m.def("format_percent", &metraj::format_percent, py::arg("fraction"),
          py::arg("decimal_separator") = ',');

    py::class_<metraj::ReportConfig>(m, "ReportConfig")
        .def(py::init<>())
        .def_readwrite("decimals", &metraj::ReportConfig::decimals)
        .def_readwrite("thousands_separator", &metraj::ReportConfig::thousands_separator)
        .def_readwrite("decimal_separator", &metraj::ReportConfig::decimal_separator)
        .def_readwrite("show_waste_factor", &metraj::ReportConfig::show_waste_factor);

    py::class_<metraj::MaterialReportRow>(m, "MaterialReportRow")
        .def_readonly("material", &metraj::MaterialReportRow::material)
        .def_readonly("unit", &metraj::MaterialReportRow::unit)
        .def_readonly("base_quantity", &metraj::MaterialReportRow::base_quantity)
        .def_readonly("adjusted_quantity", &metraj::MaterialReportRow::adjusted_quantity)
        .def_readonly("waste_factor", &metraj::MaterialReportRow::waste_factor)
        .def_readonly("source", &metraj::MaterialReportRow::source);

    m.def("build_requirement_report", &metraj::build_requirement_report,
          py::arg("requirements"), py::arg("config") = metraj::ReportConfig());
    m.def("build_summary_report", &metraj::build_summary_report,
          py::arg("summary"), py::arg("config") = metraj::ReportConfig());
    m.def("render_text_table", &metraj::render_text_table, py::arg("rows"));

    py::class_<metraj::PricedLine>(m, "PricedLine")
        .def(py::init<std::string, double, double>(),
             py::arg("code"), py::arg("quantity"), py::arg("unit_price"))
        .def_readwrite("code", &metraj::PricedLine::code)
        .def_readwrite("quantity", &metraj::PricedLine::quantity)
        .def_readwrite("unit_price", &metraj::PricedLine::unit_price);

    py::class_<metraj::VatBreakdown>(m, "VatBreakdown")
        .def_readonly("net", &metraj::VatBreakdown::net)
        .def_readonly("vat", &metraj::VatBreakdown::vat)
        .def_readonly("gross", &metraj::VatBreakdown::gross);

    py::class_<metraj::SubcontractorOffer>(m, "SubcontractorOffer")
        .def(py::init<std::string, double>(), py::arg("company"), py::arg("total"))
        .def_readwrite("company", &metraj::SubcontractorOffer::company)
        .def_readwrite("total", &metraj::SubcontractorOffer::total);

    py::class_<metraj::RankedOffer>(m, "RankedOffer")
        .def_readonly("company", &metraj::RankedOffer::company)
        .def_readonly("amount", &metraj::RankedOffer::amount);

    py::class_<metraj::OfferComparison>(m, "OfferComparison")
        .def_readonly("lowest", &metraj::OfferComparison::lowest)
        .def_readonly("highest", &metraj::OfferComparison::highest)
        .def_readonly("average", &metraj::OfferComparison::average)
        .def_readonly("offer_count", &metraj::OfferComparison::offer_count);

    m.def("line_total", &metraj::line_total, py::arg("quantity"), py::arg("unit_price"));
    m.def("project_total", &metraj::project_total, py::arg("lines"));
    m.def("vat_amount", &metraj::vat_amount, py::arg("amount"),
          py::arg("rate_percent") = metraj::DEFAULT_VAT_RATE);
    m.def("with_vat", &metraj::with_vat, py::arg("amount"),
          py::arg("rate_percent") = metraj::DEFAULT_VAT_RATE);
    m.def("compare_offers", &metraj::compare_offers, py::arg("offers"));
}
