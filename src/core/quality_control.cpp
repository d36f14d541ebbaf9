/**
 * @file quality_control.cpp
 * @brief Реализация контроля качества данных
 */

#include "quality_control.hpp"
#include "curve_store.hpp"
#include "statistics.hpp"
#include "model/validation.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace petrolog::core {

namespace {

struct IndexedValue {
    size_t index;
    double value;
};

std::vector<IndexedValue> validSamples(const LogCurve& curve) {
    std::vector<IndexedValue> valid;
    valid.reserve(curve.size());
    for (size_t i = 0; i < curve.size(); ++i) {
        if (!isNull(curve.samples[i])) {
            valid.push_back({i, curve.samples[i]});
        }
    }
    return valid;
}

double median(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    return interpolatedQuantile(values, 0.5);
}

double thresholdFor(const QualityControlOptions& options) noexcept {
    switch (options.outlier_method) {
        case OutlierMethod::Iqr: return options.iqr_multiplier;
        case OutlierMethod::ModifiedZScore: return options.modified_z_score_threshold;
        case OutlierMethod::ZScore:
        default: return options.z_score_threshold;
    }
}

// Признак выброса для каждого валидного отсчёта
std::vector<bool> outlierFlags(const std::vector<double>& values, OutlierMethod method, double threshold) {
    std::vector<bool> flags(values.size(), false);
    const auto n = static_cast<double>(values.size());

    switch (method) {
        case OutlierMethod::Iqr: {
            std::vector<double> sorted = values;
            std::sort(sorted.begin(), sorted.end());
            double q1 = sorted[static_cast<size_t>(std::floor(n * 0.25))];
            double q3 = sorted[static_cast<size_t>(std::floor(n * 0.75))];
            double iqr = q3 - q1;
            for (size_t i = 0; i < values.size(); ++i) {
                flags[i] = values[i] < q1 - threshold * iqr || values[i] > q3 + threshold * iqr;
            }
            break;
        }
        case OutlierMethod::ModifiedZScore: {
            double med = median(values);
            std::vector<double> deviations;
            deviations.reserve(values.size());
            for (double v : values) {
                deviations.push_back(std::abs(v - med));
            }
            double mad = median(std::move(deviations));
            if (mad > 0.0) {
                for (size_t i = 0; i < values.size(); ++i) {
                    flags[i] = 0.6745 * std::abs(values[i] - med) / mad > threshold;
                }
            }
            break;
        }
        case OutlierMethod::ZScore:
        default: {
            double mean = 0.0;
            for (double v : values) mean += v;
            mean /= n;
            double sq = 0.0;
            for (double v : values) sq += (v - mean) * (v - mean);
            double sd = std::sqrt(sq / (n - 1.0));
            if (sd > 0.0) {
                for (size_t i = 0; i < values.size(); ++i) {
                    flags[i] = std::abs(values[i] - mean) / sd > threshold;
                }
            }
            break;
        }
    }
    return flags;
}

ConsistencyCheck noData(ConsistencyCheckKind kind, const std::string& message) {
    return ConsistencyCheck{kind, false, ConfidenceLevel::Low, message};
}

} // anonymous namespace

std::string toString(ConsistencyCheckKind kind) {
    switch (kind) {
        case ConsistencyCheckKind::GammaRayRange: return "gamma_ray_range";
        case ConsistencyCheckKind::DensityRange: return "density_range";
        case ConsistencyCheckKind::ResistivityPorosity: return "resistivity_porosity";
    }
    return "gamma_ray_range";
}

OutlierReport detectOutliers(const LogCurve& curve, const QualityControlOptions& options) {
    OutlierReport report;
    report.mnemonic = curve.mnemonic;
    report.method = options.outlier_method;
    report.threshold = thresholdFor(options);

    auto valid = validSamples(curve);
    if (valid.size() < kMinOutlierSamples) {
        return report;
    }

    std::vector<double> values;
    values.reserve(valid.size());
    for (const auto& sample : valid) {
        values.push_back(sample.value);
    }

    auto flags = outlierFlags(values, report.method, report.threshold);
    for (size_t i = 0; i < valid.size(); ++i) {
        if (flags[i]) {
            report.indices.push_back(valid[i].index);
            report.values.push_back(valid[i].value);
        }
    }
    report.major = static_cast<double>(report.indices.size()) >
                   static_cast<double>(curve.size()) * kMajorOutlierFraction;
    return report;
}

ConsistencyCheck checkGammaRayRange(const LogCurve& gr) {
    auto valid = validSamples(gr);
    if (valid.empty()) {
        return noData(ConsistencyCheckKind::GammaRayRange, "Нет валидных отсчётов ГК");
    }

    double mean = 0.0;
    double min = valid.front().value;
    double max = valid.front().value;
    for (const auto& s : valid) {
        mean += s.value;
        min = std::min(min, s.value);
        max = std::max(max, s.value);
    }
    mean /= static_cast<double>(valid.size());
    double sq = 0.0;
    for (const auto& s : valid) {
        sq += (s.value - mean) * (s.value - mean);
    }
    double sd = std::sqrt(sq / static_cast<double>(valid.size()));
    double range = max - min;

    ConsistencyCheck check;
    check.kind = ConsistencyCheckKind::GammaRayRange;
    check.consistent = min >= 0.0 && max <= 300.0 && range > 20.0 && sd > 5.0;
    if (range > 50.0 && sd > 15.0) {
        check.confidence = ConfidenceLevel::High;
    } else if (range > 30.0 && sd > 10.0) {
        check.confidence = ConfidenceLevel::Medium;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << "ГК: " << min << "-" << max << " API, СКО " << sd;
    check.message = oss.str();
    return check;
}

ConsistencyCheck checkDensityRange(const LogCurve& rhob, const QualityControlOptions& options) {
    auto valid = validSamples(rhob);
    if (valid.empty()) {
        return noData(ConsistencyCheckKind::DensityRange, "Нет валидных отсчётов плотности");
    }

    size_t out_of_range = 0;
    for (const auto& s : valid) {
        if (s.value < options.density_min || s.value > options.density_max) {
            ++out_of_range;
        }
    }
    double percent = 100.0 * static_cast<double>(out_of_range) / static_cast<double>(valid.size());

    ConsistencyCheck check;
    check.kind = ConsistencyCheckKind::DensityRange;
    check.consistent = percent < 5.0;
    if (percent < 1.0) {
        check.confidence = ConfidenceLevel::High;
    } else if (percent < 3.0) {
        check.confidence = ConfidenceLevel::Medium;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << "Плотность: " << percent << "% отсчётов вне [" << options.density_min
        << ", " << options.density_max << "] г/см3";
    check.message = oss.str();
    return check;
}

ConsistencyCheck checkResistivityPorosity(
    const LogCurve& rt,
    const LogCurve& porosity,
    const QualityControlOptions& options
) {
    requireSameLength(rt, porosity);

    size_t pairs = 0;
    size_t high_porosity = 0;
    size_t high_porosity_high_rt = 0;
    for (size_t i = 0; i < rt.size(); ++i) {
        double r = rt.samples[i];
        double phi = porosity.samples[i];
        if (isNull(r) || isNull(phi) || r <= 0.0 || phi <= 0.0) continue;
        ++pairs;
        if (phi > kHighPorosityForResistivity) {
            ++high_porosity;
            if (r > options.resistivity_cutoff) ++high_porosity_high_rt;
        }
    }
    if (pairs == 0) {
        return noData(ConsistencyCheckKind::ResistivityPorosity,
                      "Нет валидных пар сопротивление-пористость");
    }

    double share = high_porosity > 0
        ? static_cast<double>(high_porosity_high_rt) / static_cast<double>(high_porosity)
        : 0.0;

    ConsistencyCheck check;
    check.kind = ConsistencyCheckKind::ResistivityPorosity;
    check.consistent = true;
    if (pairs > 50) {
        check.confidence = ConfidenceLevel::High;
    } else if (pairs > 20) {
        check.confidence = ConfidenceLevel::Medium;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << share * 100.0 << "% высокопористых отсчётов с сопротивлением выше "
        << options.resistivity_cutoff << " Ом·м";
    check.message = oss.str();
    return check;
}

DataQualityReport assessDataQuality(
    const WellLog& log,
    const QualityControlOptions& options,
    const LogCurve* porosity
) {
    throwIfInvalid(validateQualityControlOptions(options));
    validateWellLog(log);

    DataQualityReport report;
    size_t total = 0;
    size_t valid = 0;
    size_t major = 0;
    size_t outlier_count = 0;

    for (const auto& curve : log.curves) {
        total += curve.size();
        valid += curve.validCount();

        auto outliers = detectOutliers(curve, options);
        if (outliers.empty()) continue;
        if (outliers.major) ++major;
        outlier_count += outliers.indices.size();
        report.outliers.push_back(std::move(outliers));
    }

    if (const LogCurve* gr = findCurve(log, curve_aliases::kGammaRay)) {
        report.checks.push_back(checkGammaRayRange(*gr));
    }
    if (const LogCurve* rhob = findCurve(log, curve_aliases::kBulkDensity)) {
        report.checks.push_back(checkDensityRange(*rhob, options));
    }
    const LogCurve* rt = findCurve(log, curve_aliases::kResistivity);
    if (rt != nullptr && porosity != nullptr) {
        report.checks.push_back(checkResistivityPorosity(*rt, *porosity, options));
    }

    report.completeness = total > 0 ? static_cast<double>(valid) / static_cast<double>(total) : 0.0;

    auto inconsistent = static_cast<size_t>(std::count_if(report.checks.begin(), report.checks.end(),
        [](const ConsistencyCheck& c) { return !c.consistent; }));
    double consistency = report.checks.empty()
        ? 1.0
        : static_cast<double>(report.checks.size() - inconsistent) / static_cast<double>(report.checks.size());

    if (report.completeness > 0.9 && consistency > 0.8) {
        report.confidence = ConfidenceLevel::High;
    } else if (report.completeness > 0.7 && consistency > 0.6) {
        report.confidence = ConfidenceLevel::Medium;
    }

    if (report.checks.empty() && report.outliers.empty()) {
        report.overall = QualityLabel::Poor;
    } else if (major > 2 || inconsistent > 2) {
        report.overall = QualityLabel::Fair;
    } else if (major > 0 || inconsistent > 0 || outlier_count > 10) {
        report.overall = QualityLabel::Good;
    } else {
        report.overall = QualityLabel::Excellent;
    }
    return report;
}

} // namespace petrolog::core
