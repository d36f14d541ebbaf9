/**
 * @file permeability.cpp
 * @brief Реализация оценки проницаемости
 */

#include "permeability.hpp"
#include "curve_store.hpp"
#include "model/validation.hpp"
#include <cmath>

namespace petrolog::core {

namespace {

bool inOpenUnit(double v) noexcept {
    return !isNull(v) && v > 0.0 && v < 1.0;
}

double plausible(double k) noexcept {
    return (k > 0.0 && k <= kMaxPlausiblePermeabilityMd) ? k : kNullValue;
}

} // anonymous namespace

double kozenyCarmanPermeability(double porosity, double grain_size_um) noexcept {
    if (!inOpenUnit(porosity)) {
        return kNullValue;
    }
    double grain_cm = grain_size_um * 1e-4;
    double porosity_term = std::pow(porosity, 3.0) / std::pow(1.0 - porosity, 2.0);
    double grain_term = grain_cm * grain_cm / 180.0;
    return plausible(porosity_term * grain_term * kSquareCmToMillidarcy);
}

double timurPermeability(double porosity, double swi) noexcept {
    if (!inOpenUnit(porosity) || !inOpenUnit(swi)) {
        return kNullValue;
    }
    return plausible(0.136 * std::pow(porosity, 4.4) / (swi * swi));
}

double coatesDumanoirPermeability(
    double porosity, double swi, const PermeabilityOptions& options) noexcept {
    if (!inOpenUnit(porosity) || !inOpenUnit(swi)) {
        return kNullValue;
    }
    return plausible(options.coates_c * std::pow(porosity, options.coates_x) /
                     std::pow(swi, options.coates_y));
}

double permeabilitySample(double porosity, double swi, const PermeabilityOptions& options) noexcept {
    switch (options.method) {
        case PermeabilityMethod::Timur:
            return timurPermeability(porosity, swi);
        case PermeabilityMethod::CoatesDumanoir:
            return coatesDumanoirPermeability(porosity, swi, options);
        case PermeabilityMethod::KozenyCarman:
        default:
            return kozenyCarmanPermeability(porosity, options.grain_size_um);
    }
}

LogCurve calculatePermeability(
    const LogCurve& porosity,
    const PermeabilityOptions& options,
    const LogCurve* swi
) {
    throwIfInvalid(validatePermeabilityOptions(options));
    if (swi != nullptr) {
        requireSameLength(porosity, *swi);
    }

    LogCurve result{"PERM", "MD"};
    result.description = "Проницаемость (" + toString(options.method) + ")";
    result.samples.reserve(porosity.size());

    for (size_t i = 0; i < porosity.size(); ++i) {
        double sample_swi = swi != nullptr ? swi->samples[i] : options.swi;
        result.samples.push_back(permeabilitySample(porosity.samples[i], sample_swi, options));
    }
    return result;
}

double geometricMean(const LogCurve& curve) noexcept {
    double log_sum = 0.0;
    size_t count = 0;
    for (double v : curve.samples) {
        if (isNull(v) || v <= 0.0) continue;
        log_sum += std::log10(v);
        ++count;
    }
    return count == 0 ? 0.0 : std::pow(10.0, log_sum / static_cast<double>(count));
}

} // namespace petrolog::core
