/**
 * @file porosity.cpp
 * @brief Реализация расчёта пористости
 */

#include "porosity.hpp"
#include "curve_store.hpp"
#include "model/errors.hpp"
#include "model/validation.hpp"
#include <algorithm>
#include <cmath>

namespace petrolog::core {

namespace {

double clampPorosity(double phi) noexcept {
    return std::clamp(phi, 0.0, kMaxPorosity);
}

} // anonymous namespace

double densityPorosity(double rhob, const ParameterSet& params) noexcept {
    if (isNull(rhob)) {
        return kNullValue;
    }

    double phi = (params.matrix_density - rhob) / (params.matrix_density - params.fluid_density);

    // Брак измерения отделяется от допустимого, но крайнего значения
    if (phi < kDensityPorosityRejectLow || phi > kDensityPorosityRejectHigh) {
        return kNullValue;
    }
    return clampPorosity(phi);
}

double lithologyFactor(Lithology lithology) noexcept {
    switch (lithology) {
        case Lithology::Limestone: return 1.0;
        case Lithology::Dolomite: return 0.7;
        case Lithology::Sandstone:
        default:
            return 0.9;
    }
}

double neutronPorosity(double nphi, Lithology lithology) noexcept {
    if (isNull(nphi)) {
        return kNullValue;
    }

    double phi = nphi > 1.0 ? nphi / 100.0 : nphi;
    return clampPorosity(phi * lithologyFactor(lithology));
}

double effectivePorosity(
    double phi_d,
    double phi_n,
    PorosityBlend blend,
    double vsh
) noexcept {
    if (isNull(phi_d) || isNull(phi_n)) {
        return kNullValue;
    }

    double phi = 0.0;
    switch (blend) {
        case PorosityBlend::Arithmetic:
            phi = (phi_d + phi_n) / 2.0;
            break;
        case PorosityBlend::Harmonic:
            // Нулевая компонента обнуляет гармоническое среднее
            phi = (phi_d > 0.0 && phi_n > 0.0) ? 2.0 / (1.0 / phi_d + 1.0 / phi_n) : 0.0;
            break;
        case PorosityBlend::Rms:
            phi = std::sqrt((phi_d * phi_d + phi_n * phi_n) / 2.0);
            break;
        case PorosityBlend::Geometric:
        default:
            phi = std::sqrt(phi_d * phi_n);
            break;
    }

    if (!isNull(vsh)) {
        double v = std::clamp(vsh, 0.0, 1.0);
        phi -= v * kShaleCorrectionFactor * phi_n;
    }

    if (!std::isfinite(phi)) {
        return kNullValue;
    }
    return clampPorosity(phi);
}

LogCurve calculateDensityPorosity(const LogCurve& rhob, const ParameterSet& params) {
    requireValidParameters(params);

    LogCurve result{"PHID", "V/V"};
    result.description = "Плотностная пористость";
    result.samples.reserve(rhob.size());
    for (double v : rhob.samples) {
        result.samples.push_back(densityPorosity(v, params));
    }
    return result;
}

LogCurve calculateNeutronPorosity(const LogCurve& nphi, Lithology lithology) {
    LogCurve result{"PHIN", "V/V"};
    result.description = "Нейтронная пористость (" + toString(lithology) + ")";
    result.samples.reserve(nphi.size());
    for (double v : nphi.samples) {
        result.samples.push_back(neutronPorosity(v, lithology));
    }
    return result;
}

LogCurve calculateEffectivePorosity(
    const LogCurve& density_porosity,
    const LogCurve& neutron_porosity,
    PorosityBlend blend,
    const LogCurve* shale_volume
) {
    requireSameLength(density_porosity, neutron_porosity);
    if (shale_volume != nullptr) {
        requireSameLength(density_porosity, *shale_volume);
    }

    LogCurve result{"PHIE", "V/V"};
    result.description = "Эффективная пористость (" + toString(blend) + ")";
    result.samples.reserve(density_porosity.size());
    for (size_t i = 0; i < density_porosity.size(); ++i) {
        double vsh = shale_volume != nullptr ? shale_volume->samples[i] : kNullValue;
        result.samples.push_back(effectivePorosity(
            density_porosity.samples[i], neutron_porosity.samples[i], blend, vsh));
    }
    return result;
}

} // namespace petrolog::core
