/**
 * @file saturation.cpp
 * @brief Реализация расчёта водонасыщенности
 */

#include "saturation.hpp"
#include "curve_store.hpp"
#include "model/errors.hpp"
#include "model/validation.hpp"
#include <algorithm>
#include <cmath>

namespace petrolog::core {

namespace {

bool validInputs(double rt, double phi) noexcept {
    return !isNull(rt) && !isNull(phi) && rt > 0.0 && phi > 0.0 && phi <= 1.0;
}

bool validShale(double vsh) noexcept {
    return !isNull(vsh) && vsh >= 0.0 && vsh <= 1.0;
}

double clampUnit(double v) noexcept {
    if (!std::isfinite(v)) {
        return kNullValue;
    }
    return std::clamp(v, 0.0, 1.0);
}

} // anonymous namespace

double archieSaturation(double rt, double phi, const ParameterSet& params) noexcept {
    if (!validInputs(rt, phi)) {
        return kNullValue;
    }

    double formation_factor = params.archie_a / std::pow(phi, params.archie_m);
    double sw = std::pow((formation_factor * params.rw) / rt, 1.0 / params.archie_n);
    return clampUnit(sw);
}

double waxmanSmitsSaturation(
    double rt, double phi, double vsh, const ParameterSet& params) noexcept {
    if (!validInputs(rt, phi) || !validShale(vsh)) {
        return kNullValue;
    }

    const double n = params.archie_n;
    const double phi_m = std::pow(phi, params.archie_m);
    const double qv = params.ws_b * vsh / phi;
    const double target = 1.0 / rt;

    double sw = kWaxmanSmitsInitialSw;
    for (int i = 0; i < kWaxmanSmitsMaxIterations; ++i) {
        double conductivity = phi_m / params.archie_a *
            (std::pow(sw, n) / params.rw + qv * std::pow(sw, n - 1.0));
        double slope = phi_m / params.archie_a *
            (n * std::pow(sw, n - 1.0) / params.rw + qv * (n - 1.0) * std::pow(sw, n - 2.0));
        if (!std::isfinite(slope) || slope <= 0.0) {
            break;
        }

        double sw_new = sw - (conductivity - target) / slope;
        if (std::abs(sw_new - sw) < kWaxmanSmitsTolerance) {
            sw = sw_new;
            break;
        }
        sw = std::clamp(sw_new, 0.0, 1.0);
    }
    return clampUnit(sw);
}

double dualWaterSaturation(
    double rt, double phi, double vsh, const ParameterSet& params) noexcept {
    if (!validInputs(rt, phi) || !validShale(vsh)) {
        return kNullValue;
    }

    double phi_effective = phi * (1.0 - vsh * kBoundWaterFraction);
    if (phi_effective <= 0.0) {
        return 1.0;  // Вся вода связанная
    }

    double formation_factor = params.archie_a / std::pow(phi_effective, params.archie_m);
    double sw_free = std::pow((formation_factor * params.rw) / rt, 1.0 / params.archie_n);
    return clampUnit(sw_free + vsh * kBoundWaterFraction);
}

LogCurve calculateWaterSaturation(
    const LogCurve& rt,
    const LogCurve& porosity,
    const ParameterSet& params,
    SaturationMethod method,
    const LogCurve* shale_volume
) {
    requireValidParameters(params);
    requireSameLength(rt, porosity);

    if (method != SaturationMethod::Archie) {
        if (shale_volume == nullptr) {
            throw InvalidParameterError("saturation.method",
                "Метод " + toString(method) + " требует кривую глинистости");
        }
        requireSameLength(rt, *shale_volume);
    }

    LogCurve result{"SW", "V/V"};
    result.description = "Водонасыщенность (" + toString(method) + ")";
    result.samples.reserve(rt.size());

    for (size_t i = 0; i < rt.size(); ++i) {
        double r = rt.samples[i];
        double phi = porosity.samples[i];
        switch (method) {
            case SaturationMethod::WaxmanSmits:
                result.samples.push_back(waxmanSmitsSaturation(r, phi, shale_volume->samples[i], params));
                break;
            case SaturationMethod::DualWater:
                result.samples.push_back(dualWaterSaturation(r, phi, shale_volume->samples[i], params));
                break;
            case SaturationMethod::Archie:
            default:
                result.samples.push_back(archieSaturation(r, phi, params));
                break;
        }
    }
    return result;
}

LogCurve calculateHydrocarbonSaturation(const LogCurve& water_saturation) {
    LogCurve result{"SH", "V/V"};
    result.description = "Нефтегазонасыщенность";
    result.samples.reserve(water_saturation.size());
    for (double sw : water_saturation.samples) {
        result.samples.push_back(isNull(sw) ? kNullValue : 1.0 - sw);
    }
    return result;
}

LogCurve calculateBulkVolumeWater(const LogCurve& porosity, const LogCurve& water_saturation) {
    requireSameLength(porosity, water_saturation);

    LogCurve result{"BVW", "V/V"};
    result.description = "Объёмная водонасыщенность";
    result.samples.reserve(porosity.size());
    for (size_t i = 0; i < porosity.size(); ++i) {
        double phi = porosity.samples[i];
        double sw = water_saturation.samples[i];
        result.samples.push_back(isNull(phi) || isNull(sw) ? kNullValue : phi * sw);
    }
    return result;
}

} // namespace petrolog::core
