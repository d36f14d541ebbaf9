/**
 * @file report_json.cpp
 * @brief Реализация сериализации результатов анализа
 */

#include "report_json.hpp"
#include "file_utils.hpp"
#include <nlohmann/json.hpp>

namespace petrolog::io {

using json = nlohmann::json;

namespace {

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    return value.has_value() ? json(*value) : json(nullptr);
}

json porosityToJson(const core::PorosityAnalysis& porosity, bool include_curves) {
    json j;
    j["valid"] = porosity.valid;
    j["shale_corrected"] = porosity.shale_corrected;
    j["statistics"] = {
        {"density_porosity", summaryToJson(porosity.density_stats)},
        {"neutron_porosity", summaryToJson(porosity.neutron_stats)},
        {"effective_porosity", summaryToJson(porosity.effective_stats)}
    };
    j["reservoir_intervals"] = intervalsToJson(porosity.reservoirs);
    j["high_porosity_zones"] = intervalsToJson(porosity.high_porosity_zones);
    j["well_quality"] = toString(porosity.well_quality);
    j["lithology"] = {
        {"indicator", core::toString(porosity.lithology.indicator)},
        {"matrix_density", porosity.lithology.matrix_density}
    };
    if (include_curves && porosity.valid) {
        j["curves"] = json::array({
            curveToJson(porosity.density_porosity),
            curveToJson(porosity.neutron_porosity),
            curveToJson(porosity.effective_porosity)
        });
    }
    return j;
}

json shaleToJson(const core::ShaleAnalysis& shale, bool include_curves) {
    json j;
    j["valid"] = shale.valid;
    j["baselines"] = {
        {"gr_clean", shale.baselines.gr_clean},
        {"gr_shale", shale.baselines.gr_shale},
        {"estimated", shale.baselines.estimated}
    };
    j["statistics"] = summaryToJson(shale.stats);
    j["net_to_gross"] = shale.net_to_gross;
    j["clean_sand_intervals"] = intervalsToJson(shale.clean_sands);
    j["well_quality"] = toString(shale.well_quality);
    if (include_curves && shale.valid) {
        j["curves"] = json::array({curveToJson(shale.shale_volume)});
    }
    return j;
}

json saturationToJson(const core::SaturationAnalysis& saturation, bool include_curves) {
    json j;
    j["valid"] = saturation.valid;
    j["statistics"] = summaryToJson(saturation.stats);
    if (include_curves && saturation.valid) {
        j["curves"] = json::array({
            curveToJson(saturation.water_saturation),
            curveToJson(saturation.hydrocarbon_saturation),
            curveToJson(saturation.bulk_volume_water)
        });
    }
    return j;
}

json permeabilityToJson(const core::PermeabilityAnalysis& permeability, bool include_curves) {
    json j;
    j["valid"] = permeability.valid;
    j["method"] = toString(permeability.method);
    j["valid_count"] = permeability.valid_count;
    j["geometric_mean_md"] = permeability.geometric_mean_md;
    if (include_curves && permeability.valid) {
        j["curves"] = json::array({curveToJson(permeability.permeability)});
    }
    return j;
}

json netPayToJson(const core::NetPayAnalysis& net_pay) {
    const auto& summary = net_pay.summary;
    return json{
        {"valid", net_pay.valid},
        {"cutoffs", {
            {"vsh_max", net_pay.cutoffs.vsh_max},
            {"porosity_min", net_pay.cutoffs.porosity_min},
            {"sw_max", net_pay.cutoffs.sw_max}
        }},
        {"gross_thickness", summary.gross_thickness},
        {"net_reservoir_thickness", summary.net_reservoir_thickness},
        {"net_to_gross", summary.net_to_gross},
        {"weighted_porosity", summary.weighted_porosity},
        {"average_shale_volume", summary.average_shale_volume},
        {"net_pay_thickness", optionalToJson(summary.net_pay_thickness)},
        {"net_pay_ratio", optionalToJson(summary.net_pay_ratio)},
        {"weighted_saturation", optionalToJson(summary.weighted_saturation)}
    };
}

json dataQualityToJson(const core::DataQualityReport& quality) {
    json outliers = json::array();
    for (const auto& report : quality.outliers) {
        outliers.push_back(json{
            {"mnemonic", report.mnemonic},
            {"method", toString(report.method)},
            {"threshold", report.threshold},
            {"count", report.indices.size()},
            {"indices", report.indices},
            {"values", report.values},
            {"major", report.major}
        });
    }

    json checks = json::array();
    for (const auto& check : quality.checks) {
        checks.push_back(json{
            {"kind", core::toString(check.kind)},
            {"consistent", check.consistent},
            {"confidence", toString(check.confidence)},
            {"message", check.message}
        });
    }

    return json{
        {"overall", toString(quality.overall)},
        {"completeness", quality.completeness},
        {"confidence", toString(quality.confidence)},
        {"outliers", outliers},
        {"consistency_checks", checks}
    };
}

} // anonymous namespace

json curveToJson(const LogCurve& curve) {
    return json{
        {"mnemonic", curve.mnemonic},
        {"unit", curve.unit},
        {"description", curve.description},
        {"null_value", kNullValue},
        {"valid_count", curve.validCount()},
        {"samples", curve.samples}
    };
}

json intervalToJson(const Interval& interval) {
    return json{
        {"top", interval.top.value},
        {"bottom", interval.bottom.value},
        {"thickness", interval.thickness.value},
        {"mean_value", interval.mean_value},
        {"peak_value", interval.peak_value},
        {"point_count", interval.point_count},
        {"permeability_md", optionalToJson(interval.permeability_md)},
        {"net_to_gross", optionalToJson(interval.net_to_gross)},
        {"mean_shale_volume", optionalToJson(interval.mean_shale_volume)},
        {"net_pay_potential", optionalToJson(interval.net_pay_potential)},
        {"quality", toString(interval.quality)},
        {"rank", interval.rank},
        {"primary_target", interval.isPrimaryTarget()}
    };
}

json intervalsToJson(const IntervalList& intervals) {
    json arr = json::array();
    for (const auto& interval : intervals) {
        arr.push_back(intervalToJson(interval));
    }
    return arr;
}

json summaryToJson(const StatisticsSummary& summary) {
    return json{
        {"mean", summary.mean},
        {"std_dev", summary.std_dev},
        {"min", summary.min},
        {"max", summary.max},
        {"median", summary.median},
        {"p10", summary.p10},
        {"p50", summary.p50},
        {"p90", summary.p90},
        {"valid_count", summary.valid_count},
        {"total_count", summary.total_count},
        {"confidence_95", {
            {"lower", summary.confidence_95.lower},
            {"upper", summary.confidence_95.upper}
        }},
        {"standard_error", summary.standard_error},
        {"method_uncertainty", summary.method_uncertainty},
        {"combined_uncertainty", summary.combined_uncertainty},
        {"completeness", summary.completeness},
        {"confidence", toString(summary.confidence)},
        {"low_confidence", summary.low_confidence}
    };
}

json wellReportToJson(const core::WellReport& report, const ReportWriteOptions& options) {
    json j;
    j["well"] = report.well_name;
    j["depth_range"] = {
        {"top", report.top.value},
        {"bottom", report.bottom.value}
    };
    j["sample_count"] = report.sample_count;
    if (options.include_curves) {
        j["depth"] = report.depth;
    }
    j["porosity"] = porosityToJson(report.porosity, options.include_curves);
    j["shale"] = shaleToJson(report.shale, options.include_curves);
    j["saturation"] = saturationToJson(report.saturation, options.include_curves);
    j["permeability"] = permeabilityToJson(report.permeability, options.include_curves);
    j["net_pay"] = netPayToJson(report.net_pay);
    j["data_quality"] = dataQualityToJson(report.data_quality);
    j["diagnostics"] = report.diagnostics;
    return j;
}

std::string reportToString(const core::WellReport& report, const ReportWriteOptions& options) {
    // Строки из файлов уже в UTF-8; оставшиеся некорректные байты заменяются U+FFFD
    return wellReportToJson(report, options).dump(
        options.indent, ' ', false, json::error_handler_t::replace);
}

void writeReport(
    const core::WellReport& report,
    const std::filesystem::path& path,
    const ReportWriteOptions& options
) {
    atomicWrite(path, reportToString(report, options) + "\n");
}

} // namespace petrolog::io
