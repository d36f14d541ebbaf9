/**
 * @file classification.cpp
 * @brief Реализация оценки качества и ранжирования
 */

#include "classification.hpp"
#include <algorithm>

namespace petrolog::core {

using namespace quality_thresholds;

QualityLabel classifyPorosity(double porosity) noexcept {
    if (porosity >= kPorosityExcellent) return QualityLabel::Excellent;
    if (porosity >= kPorosityGood) return QualityLabel::Good;
    if (porosity >= kPorosityFair) return QualityLabel::Fair;
    return QualityLabel::Poor;
}

QualityLabel classifyShaleVolume(double shale_volume) noexcept {
    if (shale_volume <= kShaleExcellent) return QualityLabel::Excellent;
    if (shale_volume <= kShaleGood) return QualityLabel::Good;
    if (shale_volume <= kShaleFair) return QualityLabel::Fair;
    return QualityLabel::Poor;
}

QualityLabel classifyHighPorosityZone(double porosity) noexcept {
    if (porosity >= kZoneExceptional) return QualityLabel::Exceptional;
    if (porosity >= kZoneExcellent) return QualityLabel::Excellent;
    if (porosity >= kZoneVeryGood) return QualityLabel::VeryGood;
    return QualityLabel::Good;
}

QualityLabel classifyWaterSaturation(double saturation) noexcept {
    if (saturation <= kSaturationExcellent) return QualityLabel::Excellent;
    if (saturation <= kSaturationGood) return QualityLabel::Good;
    if (saturation <= kSaturationFair) return QualityLabel::Fair;
    return QualityLabel::Poor;
}

QualityLabel classify(PropertyKind kind, double value) noexcept {
    switch (kind) {
        case PropertyKind::DensityPorosity:
        case PropertyKind::NeutronPorosity:
        case PropertyKind::EffectivePorosity:
            return classifyPorosity(value);
        case PropertyKind::ShaleVolume:
            return classifyShaleVolume(value);
        case PropertyKind::WaterSaturation:
            return classifyWaterSaturation(value);
    }
    return QualityLabel::Poor;
}

void classifyIntervals(IntervalList& intervals, PropertyKind kind) {
    for (auto& interval : intervals) {
        interval.quality = classify(kind, interval.mean_value);
    }
}

void classifyHighPorosityZones(IntervalList& zones) {
    for (auto& zone : zones) {
        zone.quality = classifyHighPorosityZone(zone.mean_value);
    }
}

double rankingScore(const Interval& interval, RankingScore score) noexcept {
    switch (score) {
        case RankingScore::ValueTimesThickness:
            return interval.mean_value * interval.thickness.value;
        case RankingScore::NetPayPotential:
            return interval.net_pay_potential.value_or(0.0);
        case RankingScore::MeanValue:
            return interval.mean_value;
    }
    return 0.0;
}

void rankIntervals(IntervalList& intervals, RankingScore score) {
    std::stable_sort(intervals.begin(), intervals.end(),
        [score](const Interval& a, const Interval& b) {
            return rankingScore(a, score) > rankingScore(b, score);
        });

    int rank = 1;
    for (auto& interval : intervals) {
        interval.rank = rank++;
    }
}

QualityLabel assessPorosityWellQuality(
    double mean_porosity,
    size_t reservoir_count,
    size_t high_porosity_zone_count
) noexcept {
    if (mean_porosity >= 0.15 && reservoir_count >= 3 && high_porosity_zone_count >= 2) {
        return QualityLabel::Excellent;
    }
    if (mean_porosity >= 0.12 && reservoir_count >= 2 && high_porosity_zone_count >= 1) {
        return QualityLabel::Good;
    }
    if (mean_porosity >= 0.08 && reservoir_count >= 1) {
        return QualityLabel::Fair;
    }
    return QualityLabel::Poor;
}

QualityLabel assessShaleWellQuality(
    double mean_shale_volume,
    double net_to_gross,
    size_t clean_sand_count
) noexcept {
    if (mean_shale_volume <= 0.2 && net_to_gross >= 0.7 && clean_sand_count >= 3) {
        return QualityLabel::Excellent;
    }
    if (mean_shale_volume <= 0.3 && net_to_gross >= 0.5 && clean_sand_count >= 2) {
        return QualityLabel::Good;
    }
    if (mean_shale_volume <= 0.5 && net_to_gross >= 0.3) {
        return QualityLabel::Fair;
    }
    return QualityLabel::Poor;
}

LithologyAssessment assessLithology(
    double mean_density_porosity,
    double mean_neutron_porosity
) noexcept {
    if (mean_density_porosity > 0.12 && mean_neutron_porosity > 0.15) {
        return {LithologyIndicator::ShalySandstone, 2.65};
    }
    if (mean_density_porosity > 0.15) {
        return {LithologyIndicator::Carbonate, 2.71};
    }
    return {LithologyIndicator::Sandstone, 2.65};
}

std::string toString(LithologyIndicator indicator) {
    switch (indicator) {
        case LithologyIndicator::Sandstone: return "sandstone";
        case LithologyIndicator::ShalySandstone: return "shaly_sandstone";
        case LithologyIndicator::Carbonate: return "carbonate";
    }
    return "sandstone";
}

} // namespace petrolog::core
