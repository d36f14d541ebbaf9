/**
 * @file shale_volume.cpp
 * @brief Реализация расчёта глинистости
 */

#include "shale_volume.hpp"
#include "model/errors.hpp"
#include "model/validation.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace petrolog::core {

double gammaRayIndex(double gr, double gr_clean, double gr_shale) noexcept {
    if (isNull(gr)) {
        return kNullValue;
    }
    double igr = (gr - gr_clean) / (gr_shale - gr_clean);
    if (!std::isfinite(igr)) {
        return kNullValue;
    }
    return std::clamp(igr, 0.0, 1.0);
}

double shaleVolumeFromIndex(double igr, ShaleVolumeMethod method) noexcept {
    if (isNull(igr)) {
        return kNullValue;
    }

    double vsh = igr;
    switch (method) {
        case ShaleVolumeMethod::LarionovTertiary:
            vsh = 0.083 * (std::pow(2.0, 3.7 * igr) - 1.0);
            break;
        case ShaleVolumeMethod::LarionovPreTertiary:
            vsh = 0.33 * (std::pow(2.0, 2.0 * igr) - 1.0);
            break;
        case ShaleVolumeMethod::Clavier: {
            // При IGR из [0, 1] подкоренное выражение положительно
            double term = 3.38 - std::pow(igr + 0.7, 2.0);
            if (term < 0.0) {
                return kNullValue;
            }
            vsh = 1.7 - std::sqrt(term);
            break;
        }
        case ShaleVolumeMethod::Linear:
            vsh = igr;
            break;
    }
    return std::clamp(vsh, 0.0, 1.0);
}

double shaleVolume(
    double gr,
    double gr_clean,
    double gr_shale,
    ShaleVolumeMethod method
) noexcept {
    return shaleVolumeFromIndex(gammaRayIndex(gr, gr_clean, gr_shale), method);
}

GammaRayBaselines estimateGammaRayBaselines(const LogCurve& gr, const ParameterSet& params) {
    std::vector<double> valid;
    valid.reserve(gr.size());
    for (double v : gr.samples) {
        if (!isNull(v)) valid.push_back(v);
    }

    if (valid.size() < kMinBaselineSamples) {
        throw InsufficientDataError("Оценка линий ГК по кривой " + gr.mnemonic,
                                    kMinBaselineSamples, valid.size());
    }

    std::sort(valid.begin(), valid.end());
    auto shale_idx = static_cast<size_t>(std::floor(static_cast<double>(valid.size()) * kShaleBaselineQuantile));
    shale_idx = std::min(shale_idx, valid.size() - 1);

    GammaRayBaselines baselines;
    baselines.gr_clean = valid.front();
    baselines.gr_shale = valid[shale_idx];
    baselines.estimated = true;

    if (!(baselines.gr_shale > baselines.gr_clean)) {
        baselines.gr_clean = params.gr_clean;
        baselines.gr_shale = params.gr_shale;
        baselines.estimated = false;
    }
    return baselines;
}

LogCurve calculateShaleVolume(
    const LogCurve& gr,
    const ParameterSet& params,
    ShaleVolumeMethod method
) {
    requireValidParameters(params);

    LogCurve result{"VSH", "V/V"};
    result.description = "Глинистость (" + toString(method) + ")";
    result.samples.reserve(gr.size());
    for (double v : gr.samples) {
        result.samples.push_back(shaleVolume(v, params.gr_clean, params.gr_shale, method));
    }
    return result;
}

} // namespace petrolog::core
