/**
 * @file segmentation.cpp
 * @brief Реализация выделения интервалов
 */

#include "segmentation.hpp"
#include "model/errors.hpp"
#include <algorithm>
#include <cmath>
#include <optional>

namespace petrolog::core {

namespace {

enum class ScanState {
    Idle,
    InRun
};

/// Накопитель открытого интервала
struct OpenRun {
    size_t first = 0;
    size_t last = 0;
    double sum = 0.0;
    double peak = 0.0;
    size_t count = 0;
};

void requireLength(const DepthAxis& depth, const LogCurve& curve) {
    if (curve.size() != depth.size()) {
        throw MalformedInputError(
            "Длина кривой " + curve.mnemonic + " (" + std::to_string(curve.size()) +
            ") не совпадает с длиной оси глубин (" + std::to_string(depth.size()) + ")");
    }
}

std::optional<double> meanOverRange(const LogCurve* curve, size_t first, size_t last) {
    if (curve == nullptr) {
        return std::nullopt;
    }
    double sum = 0.0;
    size_t count = 0;
    for (size_t i = first; i <= last; ++i) {
        double v = curve->samples[i];
        if (!isNull(v)) {
            sum += v;
            ++count;
        }
    }
    if (count == 0) {
        return std::nullopt;
    }
    return sum / static_cast<double>(count);
}

Interval buildInterval(
    const DepthAxis& depth,
    const OpenRun& run,
    CurveRole role,
    const CompanionCurves& companions
) {
    Interval interval;
    interval.top = Depth{depth[run.first]};
    interval.bottom = Depth{depth[run.last]};
    interval.thickness = interval.bottom - interval.top;
    interval.point_count = run.count;
    interval.mean_value = run.sum / static_cast<double>(run.count);
    interval.peak_value = run.peak;

    std::optional<double> porosity = role == CurveRole::Porosity
        ? std::optional<double>(interval.mean_value)
        : meanOverRange(companions.porosity, run.first, run.last);
    if (porosity.has_value()) {
        double permeability = estimatePermeability(*porosity);
        if (!isNull(permeability)) {
            interval.permeability_md = permeability;
        }
        interval.net_to_gross = netToGrossFromPorosity(*porosity);
    }

    interval.mean_shale_volume = role == CurveRole::ShaleVolume
        ? std::optional<double>(interval.mean_value)
        : meanOverRange(companions.shale_volume, run.first, run.last);
    if (interval.mean_shale_volume.has_value()) {
        interval.net_pay_potential = interval.thickness.value * (1.0 - *interval.mean_shale_volume);
    }

    return interval;
}

} // anonymous namespace

double estimatePermeability(double porosity) noexcept {
    if (porosity >= 1.0) {
        return kNullValue;
    }
    return std::pow(porosity, 3.0) / std::pow(1.0 - porosity, 2.0) * 1000.0;
}

double netToGrossFromPorosity(double porosity) noexcept {
    if (porosity >= 0.15) return 0.9;
    if (porosity >= 0.10) return 0.75;
    if (porosity >= 0.06) return 0.6;
    return 0.4;
}

IntervalList segmentIntervals(
    const DepthAxis& depth,
    const LogCurve& curve,
    const SegmentationRule& rule,
    CurveRole role,
    const CompanionCurves& companions
) {
    requireLength(depth, curve);
    if (companions.porosity != nullptr) {
        requireLength(depth, *companions.porosity);
    }
    if (companions.shale_volume != nullptr) {
        requireLength(depth, *companions.shale_volume);
    }

    IntervalList intervals;
    ScanState state = ScanState::Idle;
    OpenRun run;

    auto closeRun = [&]() {
        double thickness = depth[run.last] - depth[run.first];
        if (run.count > rule.min_points && thickness > rule.min_thickness.value) {
            intervals.push_back(buildInterval(depth, run, role, companions));
        }
        state = ScanState::Idle;
    };

    for (size_t i = 0; i < curve.size(); ++i) {
        double value = curve.samples[i];
        bool qualifies = !isNull(value) && rule.qualifies(value);

        switch (state) {
            case ScanState::Idle:
                if (qualifies) {
                    run = OpenRun{i, i, value, value, 1};
                    state = ScanState::InRun;
                }
                break;

            case ScanState::InRun:
                if (qualifies) {
                    run.last = i;
                    run.sum += value;
                    run.peak = std::max(run.peak, value);
                    ++run.count;
                } else {
                    // Непрошедший отсчёт и пропуск одинаково закрывают интервал
                    closeRun();
                }
                break;
        }
    }

    if (state == ScanState::InRun) {
        closeRun();
    }

    return intervals;
}

} // namespace petrolog::core
