/**
 * @file statistics.cpp
 * @brief Реализация статистической сводки
 */

#include "statistics.hpp"
#include "model/errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace petrolog::core {

namespace {

std::vector<double> validValues(const std::vector<double>& values) {
    std::vector<double> valid;
    valid.reserve(values.size());
    for (double v : values) {
        if (!isNull(v)) {
            valid.push_back(v);
        }
    }
    return valid;
}

ConfidenceLevel confidenceFromCompleteness(double completeness) noexcept {
    if (completeness > 0.9) return ConfidenceLevel::High;
    if (completeness > 0.7) return ConfidenceLevel::Medium;
    return ConfidenceLevel::Low;
}

} // anonymous namespace

double methodUncertainty(PropertyKind kind) noexcept {
    switch (kind) {
        case PropertyKind::DensityPorosity: return 0.02;
        case PropertyKind::NeutronPorosity: return 0.03;
        case PropertyKind::EffectivePorosity: return 0.025;
        case PropertyKind::ShaleVolume: return 0.05;
        case PropertyKind::WaterSaturation: return 0.15;
    }
    return kLowConfidenceUncertainty;
}

double interpolatedQuantile(const std::vector<double>& sorted, double q) noexcept {
    if (sorted.empty()) {
        return 0.0;
    }
    q = std::clamp(q, 0.0, 1.0);
    double pos = q * static_cast<double>(sorted.size() - 1);
    auto lower = static_cast<size_t>(std::floor(pos));
    size_t upper = std::min(lower + 1, sorted.size() - 1);
    double frac = pos - static_cast<double>(lower);
    return sorted[lower] + (sorted[upper] - sorted[lower]) * frac;
}

StatisticsSummary summarize(const std::vector<double>& values, PropertyKind kind) {
    StatisticsSummary summary;
    summary.total_count = values.size();

    std::vector<double> valid = validValues(values);
    summary.valid_count = valid.size();
    summary.completeness = values.empty()
        ? 0.0
        : static_cast<double>(valid.size()) / static_cast<double>(values.size());
    summary.confidence = confidenceFromCompleteness(summary.completeness);

    if (valid.size() < kMinSummarySamples) {
        summary.low_confidence = true;
        summary.confidence = ConfidenceLevel::Low;
        summary.method_uncertainty = kLowConfidenceUncertainty;
        summary.combined_uncertainty = kLowConfidenceUncertainty;
        return summary;
    }

    summary.low_confidence = false;

    const auto n = static_cast<double>(valid.size());
    summary.mean = std::accumulate(valid.begin(), valid.end(), 0.0) / n;

    double sum_sq = 0.0;
    for (double v : valid) {
        double d = v - summary.mean;
        sum_sq += d * d;
    }
    summary.std_dev = std::sqrt(sum_sq / (n - 1.0));

    std::sort(valid.begin(), valid.end());
    summary.min = valid.front();
    summary.max = valid.back();
    summary.median = interpolatedQuantile(valid, 0.5);
    summary.p10 = interpolatedQuantile(valid, 0.1);
    summary.p50 = summary.median;
    summary.p90 = interpolatedQuantile(valid, 0.9);

    double t = valid.size() > kLargeSampleThreshold ? kConfidence95 : kConfidence95Small;
    summary.standard_error = summary.std_dev / std::sqrt(n);
    summary.confidence_95 = {
        summary.mean - t * summary.standard_error,
        summary.mean + t * summary.standard_error
    };

    summary.method_uncertainty = methodUncertainty(kind);
    summary.combined_uncertainty = std::sqrt(
        summary.standard_error * summary.standard_error +
        summary.method_uncertainty * summary.method_uncertainty);

    return summary;
}

StatisticsSummary summarize(const LogCurve& curve, PropertyKind kind) {
    return summarize(curve.samples, kind);
}

void requireValidCount(const LogCurve& curve, size_t minimum, const std::string& what) {
    size_t available = curve.validCount();
    if (available < minimum) {
        throw InsufficientDataError(what, minimum, available);
    }
}

} // namespace petrolog::core
