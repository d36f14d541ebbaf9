/**
 * @file net_pay.cpp
 * @brief Реализация расчёта эффективных толщин
 */

#include "net_pay.hpp"
#include "model/errors.hpp"
#include "model/validation.hpp"

namespace petrolog::core {

namespace {

void requireDepthLength(const DepthAxis& depth, const LogCurve& curve) {
    if (curve.size() != depth.size()) {
        throw MalformedInputError(
            "Длина кривой " + curve.mnemonic + " (" + std::to_string(curve.size()) +
            ") не совпадает с длиной оси глубин (" + std::to_string(depth.size()) + ")");
    }
}

double layerAverage(const LogCurve& curve, size_t i) noexcept {
    double upper = curve.samples[i];
    double lower = curve.samples[i + 1];
    if (isNull(upper) || isNull(lower)) {
        return kNullValue;
    }
    return (upper + lower) / 2.0;
}

} // anonymous namespace

NetPaySummary calculateNetPay(
    const DepthAxis& depth,
    const LogCurve& shale_volume,
    const LogCurve& porosity,
    const NetPayCutoffs& cutoffs,
    const LogCurve* water_saturation
) {
    throwIfInvalid(validateNetPayCutoffs(cutoffs));
    requireDepthLength(depth, shale_volume);
    requireDepthLength(depth, porosity);
    if (water_saturation != nullptr) {
        requireDepthLength(depth, *water_saturation);
    }
    if (depth.size() < 2) {
        throw InsufficientDataError("Расчёт эффективных толщин", 2, depth.size());
    }

    NetPaySummary summary;
    double porosity_sum = 0.0;
    double pay = 0.0;
    double saturation_sum = 0.0;

    for (size_t i = 0; i + 1 < depth.size(); ++i) {
        double thickness = depth[i + 1] - depth[i];
        double vsh = layerAverage(shale_volume, i);
        double phi = layerAverage(porosity, i);
        if (!(thickness > 0.0) || isNull(vsh) || isNull(phi)) {
            continue;
        }

        summary.gross_thickness += thickness;
        if (vsh > cutoffs.vsh_max || phi < cutoffs.porosity_min) {
            continue;
        }

        summary.net_reservoir_thickness += thickness;
        porosity_sum += phi * thickness;

        if (water_saturation != nullptr) {
            double sw = layerAverage(*water_saturation, i);
            if (!isNull(sw) && sw <= cutoffs.sw_max) {
                pay += thickness;
                saturation_sum += sw * thickness;
            }
        }
    }

    if (summary.gross_thickness > 0.0) {
        summary.net_to_gross = summary.net_reservoir_thickness / summary.gross_thickness;
    }
    if (summary.net_reservoir_thickness > 0.0) {
        summary.weighted_porosity = porosity_sum / summary.net_reservoir_thickness;
    }

    double vsh_sum = 0.0;
    size_t vsh_count = 0;
    for (double v : shale_volume.samples) {
        if (isNull(v)) continue;
        vsh_sum += v;
        ++vsh_count;
    }
    if (vsh_count > 0) {
        summary.average_shale_volume = vsh_sum / static_cast<double>(vsh_count);
    }

    if (water_saturation != nullptr) {
        summary.net_pay_thickness = pay;
        summary.net_pay_ratio = summary.gross_thickness > 0.0 ? pay / summary.gross_thickness : 0.0;
        if (pay > 0.0) {
            summary.weighted_saturation = saturation_sum / pay;
        }
    }
    return summary;
}

} // namespace petrolog::core
