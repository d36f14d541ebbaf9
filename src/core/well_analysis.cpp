/**
 * @file well_analysis.cpp
 * @brief Реализация полного анализа скважины
 */

#include "well_analysis.hpp"
#include "curve_store.hpp"
#include "permeability.hpp"
#include "porosity.hpp"
#include "saturation.hpp"
#include "segmentation.hpp"
#include "statistics.hpp"
#include "model/errors.hpp"
#include "model/validation.hpp"

namespace petrolog::core {

namespace {

double fractionAtMost(const LogCurve& curve, double cutoff) noexcept {
    size_t valid = 0;
    size_t passing = 0;
    for (double v : curve.samples) {
        if (isNull(v)) continue;
        ++valid;
        if (v <= cutoff) ++passing;
    }
    return valid == 0 ? 0.0 : static_cast<double>(passing) / static_cast<double>(valid);
}

GammaRayBaselines resolveBaselines(const LogCurve& gr, const AnalysisConfig& config) {
    GammaRayBaselines configured{config.parameters.gr_clean, config.parameters.gr_shale, false};
    if (!config.shale.auto_baselines) {
        return configured;
    }

    GammaRayBaselines estimated = estimateGammaRayBaselines(gr, config.parameters);
    if (!estimated.estimated) {
        return configured;
    }

    ParameterSet candidate = config.parameters;
    candidate.gr_clean = estimated.gr_clean;
    candidate.gr_shale = estimated.gr_shale;
    if (validateParameters(candidate).hasErrors()) {
        return configured;
    }
    return estimated;
}

void report(const ProgressCallback& on_progress, double progress, std::string_view message) {
    if (on_progress) {
        on_progress(progress, message);
    }
}

} // anonymous namespace

PorosityAnalysis analyzePorosity(
    const WellLog& log,
    const AnalysisConfig& config,
    const LogCurve* shale_volume
) {
    requireValidParameters(config.parameters);
    const auto& options = config.porosity;

    const LogCurve& rhob = requireCurve(log, curve_aliases::kBulkDensity);
    const LogCurve& nphi = requireCurve(log, curve_aliases::kNeutron);

    PorosityAnalysis result;
    result.density_porosity = calculateDensityPorosity(rhob, config.parameters);
    result.neutron_porosity = calculateNeutronPorosity(nphi, options.lithology);

    const LogCurve* correction = options.shale_correction ? shale_volume : nullptr;
    result.effective_porosity = calculateEffectivePorosity(
        result.density_porosity, result.neutron_porosity, options.blend, correction);
    result.shale_corrected = correction != nullptr;

    requireValidCount(result.effective_porosity, options.min_valid_samples,
                      "Статистика пористости " + log.displayName());

    result.density_stats = summarize(result.density_porosity, PropertyKind::DensityPorosity);
    result.neutron_stats = summarize(result.neutron_porosity, PropertyKind::NeutronPorosity);
    result.effective_stats = summarize(result.effective_porosity, PropertyKind::EffectivePorosity);

    CompanionCurves companions;
    companions.shale_volume = shale_volume;

    result.reservoirs = segmentIntervals(
        log.depth, result.effective_porosity, options.reservoir, CurveRole::Porosity, companions);
    classifyIntervals(result.reservoirs, PropertyKind::EffectivePorosity);
    rankIntervals(result.reservoirs, RankingScore::ValueTimesThickness);

    result.high_porosity_zones = segmentIntervals(
        log.depth, result.effective_porosity, options.high_porosity, CurveRole::Porosity, companions);
    classifyHighPorosityZones(result.high_porosity_zones);
    rankIntervals(result.high_porosity_zones, RankingScore::MeanValue);

    result.well_quality = assessPorosityWellQuality(
        result.effective_stats.mean,
        result.reservoirs.size(),
        result.high_porosity_zones.size());
    result.lithology = assessLithology(result.density_stats.mean, result.neutron_stats.mean);

    result.valid = true;
    return result;
}

IntervalList findCleanSands(
    const DepthAxis& depth,
    const LogCurve& shale_volume,
    const SegmentationRule& rule,
    const LogCurve* porosity
) {
    CompanionCurves companions;
    companions.porosity = porosity;

    IntervalList sands = segmentIntervals(depth, shale_volume, rule, CurveRole::ShaleVolume, companions);
    classifyIntervals(sands, PropertyKind::ShaleVolume);
    rankIntervals(sands, RankingScore::NetPayPotential);
    return sands;
}

ShaleAnalysis analyzeShale(
    const WellLog& log,
    const AnalysisConfig& config,
    const LogCurve* porosity
) {
    requireValidParameters(config.parameters);
    const auto& options = config.shale;

    const LogCurve& gr = requireCurve(log, curve_aliases::kGammaRay);

    ShaleAnalysis result;
    result.baselines = resolveBaselines(gr, config);

    ParameterSet params = config.parameters;
    params.gr_clean = result.baselines.gr_clean;
    params.gr_shale = result.baselines.gr_shale;

    result.shale_volume = calculateShaleVolume(gr, params, options.method);
    requireValidCount(result.shale_volume, options.min_valid_samples,
                      "Статистика глинистости " + log.displayName());

    result.stats = summarize(result.shale_volume, PropertyKind::ShaleVolume);
    result.net_to_gross = fractionAtMost(result.shale_volume, options.clean_sand.cutoff);
    result.clean_sands = findCleanSands(log.depth, result.shale_volume, options.clean_sand, porosity);
    result.well_quality = assessShaleWellQuality(
        result.stats.mean, result.net_to_gross, result.clean_sands.size());

    result.valid = true;
    return result;
}

SaturationAnalysis analyzeSaturation(
    const WellLog& log,
    const LogCurve& porosity,
    const AnalysisConfig& config,
    const LogCurve* shale_volume
) {
    const LogCurve& rt = requireCurve(log, curve_aliases::kResistivity);

    SaturationAnalysis result;
    result.water_saturation = calculateWaterSaturation(
        rt, porosity, config.parameters, config.saturation.method, shale_volume);
    result.hydrocarbon_saturation = calculateHydrocarbonSaturation(result.water_saturation);
    result.bulk_volume_water = calculateBulkVolumeWater(porosity, result.water_saturation);
    result.stats = summarize(result.water_saturation, PropertyKind::WaterSaturation);

    result.valid = true;
    return result;
}

PermeabilityAnalysis analyzePermeability(
    const LogCurve& porosity,
    const AnalysisConfig& config,
    const LogCurve* swi
) {
    PermeabilityAnalysis result;
    result.method = config.permeability.method;
    result.permeability = calculatePermeability(porosity, config.permeability, swi);
    result.valid_count = result.permeability.validCount();
    result.geometric_mean_md = geometricMean(result.permeability);
    result.valid = true;
    return result;
}

WellReport buildWellReport(
    const WellLog& log,
    const AnalysisConfig& config,
    ProgressCallback on_progress
) {
    validateWellLog(log);
    requireValidParameters(config.parameters);
    throwIfInvalid(validatePermeabilityOptions(config.permeability));
    throwIfInvalid(validateNetPayCutoffs(config.net_pay));
    throwIfInvalid(validateQualityControlOptions(config.quality_control));

    WellLog selected = config.depth_range
        ? filterByDepthRange(log, config.depth_range->top, config.depth_range->bottom)
        : log;

    WellReport report_data;
    report_data.well_name = selected.displayName();
    report_data.sample_count = selected.size();
    report_data.depth = selected.depth;
    if (!selected.empty()) {
        report_data.top = Depth{selected.depth.front()};
        report_data.bottom = Depth{selected.depth.back()};
    }

    auto& diagnostics = report_data.diagnostics;

    // Глинистость
    report(on_progress, 0.0, "Расчёт глинистости");
    try {
        report_data.shale = analyzeShale(selected, config);
        if (config.shale.auto_baselines && !report_data.shale.baselines.estimated) {
            diagnostics.push_back("Глинистость: линии ГК не удалось оценить по данным, "
                                  "использованы заданные значения");
        }
    } catch (const CurveNotFoundError& e) {
        diagnostics.push_back(std::string("Глинистость: ") + e.what());
    } catch (const InsufficientDataError& e) {
        diagnostics.push_back(std::string("Глинистость: ") + e.what());
    }
    if (!report_data.shale.valid) {
        report_data.shale.stats = summarize(std::vector<double>{}, PropertyKind::ShaleVolume);
    }

    const LogCurve* vsh = report_data.shale.valid ? &report_data.shale.shale_volume : nullptr;

    // Пористость
    report(on_progress, 0.35, "Расчёт пористости");
    try {
        report_data.porosity = analyzePorosity(selected, config, vsh);
        if (config.porosity.shale_correction && !report_data.porosity.shale_corrected) {
            diagnostics.push_back("Пористость: поправка за глинистость не применена "
                                  "(нет кривой глинистости)");
        }
    } catch (const CurveNotFoundError& e) {
        diagnostics.push_back(std::string("Пористость: ") + e.what());
    } catch (const InsufficientDataError& e) {
        diagnostics.push_back(std::string("Пористость: ") + e.what());
    }
    if (!report_data.porosity.valid) {
        report_data.porosity.density_stats = summarize(std::vector<double>{}, PropertyKind::DensityPorosity);
        report_data.porosity.neutron_stats = summarize(std::vector<double>{}, PropertyKind::NeutronPorosity);
        report_data.porosity.effective_stats = summarize(std::vector<double>{}, PropertyKind::EffectivePorosity);
    }

    const LogCurve* phie = report_data.porosity.valid
        ? &report_data.porosity.effective_porosity : nullptr;

    // Характеристики чистых песчаников уточняются по пористости
    if (report_data.shale.valid && phie != nullptr) {
        report_data.shale.clean_sands = findCleanSands(
            selected.depth, report_data.shale.shale_volume, config.shale.clean_sand, phie);
    }

    // Насыщенность
    report(on_progress, 0.7, "Расчёт водонасыщенности");
    if (phie == nullptr) {
        diagnostics.push_back("Насыщенность: не рассчитана (нет эффективной пористости)");
    } else if (config.saturation.method != SaturationMethod::Archie && vsh == nullptr) {
        diagnostics.push_back("Насыщенность: модель " + toString(config.saturation.method) +
                              " требует кривую глинистости");
    } else {
        try {
            report_data.saturation = analyzeSaturation(selected, *phie, config, vsh);
        } catch (const CurveNotFoundError& e) {
            diagnostics.push_back(std::string("Насыщенность: ") + e.what());
        }
    }
    if (!report_data.saturation.valid) {
        report_data.saturation.stats = summarize(std::vector<double>{}, PropertyKind::WaterSaturation);
    }

    // Проницаемость
    report(on_progress, 0.8, "Оценка проницаемости");
    if (phie == nullptr) {
        diagnostics.push_back("Проницаемость: не рассчитана (нет эффективной пористости)");
    } else {
        report_data.permeability = analyzePermeability(*phie, config);
        if (report_data.permeability.valid_count == 0) {
            diagnostics.push_back("Проницаемость: нет достоверных значений");
        }
    }

    // Эффективные толщины
    report_data.net_pay.cutoffs = config.net_pay;
    if (vsh != nullptr && phie != nullptr) {
        const LogCurve* sw = report_data.saturation.valid
            ? &report_data.saturation.water_saturation : nullptr;
        try {
            report_data.net_pay.summary = calculateNetPay(
                selected.depth, *vsh, *phie, config.net_pay, sw);
            report_data.net_pay.valid = true;
        } catch (const InsufficientDataError& e) {
            diagnostics.push_back(std::string("Эффективные толщины: ") + e.what());
        }
    } else {
        diagnostics.push_back("Эффективные толщины: не рассчитаны "
                              "(нужны глинистость и пористость)");
    }

    // Контроль качества данных
    report(on_progress, 0.9, "Контроль качества данных");
    report_data.data_quality = assessDataQuality(selected, config.quality_control, phie);

    report(on_progress, 1.0, "Готово");
    return report_data;
}

} // namespace petrolog::core
