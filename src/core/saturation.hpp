/**
 * @file saturation.hpp
 * @brief Расчёт водонасыщенности
 */

#pragma once

#include "model/log_curve.hpp"
#include "model/parameters.hpp"
#include "model/types.hpp"

namespace petrolog::core {

using namespace petrolog::model;

/// Параметры итераций Ньютона для модели Ваксмана-Смитса
constexpr int kWaxmanSmitsMaxIterations = 20;
constexpr double kWaxmanSmitsTolerance = 1e-6;
constexpr double kWaxmanSmitsInitialSw = 0.5;

/// Доля глинистости, приходящаяся на связанную воду (двухводная модель)
constexpr double kBoundWaterFraction = 0.5;

/**
 * @brief Водонасыщенность по Арчи
 *
 * Sw = ((a·Rw) / (φ^m·Rt))^(1/n), ограничена [0, 1].
 * NULL при φ <= 0, φ > 1, Rt <= 0 или пропуске во входах.
 */
[[nodiscard]] double archieSaturation(double rt, double phi, const ParameterSet& params) noexcept;

/**
 * @brief Водонасыщенность по Ваксману-Смитсу
 *
 * Qv = B·Vsh/φ; уравнение 1/Rt = φ^m·Sw^n/(a·Rw) + φ^m·Qv·Sw^(n-1)/a
 * решается методом Ньютона от Sw = 0.5. При Vsh = 0 совпадает с Арчи.
 */
[[nodiscard]] double waxmanSmitsSaturation(
    double rt, double phi, double vsh, const ParameterSet& params) noexcept;

/**
 * @brief Водонасыщенность по упрощённой двухводной модели
 *
 * φe = φ·(1 - 0.5·Vsh), Sw = Арчи(φe) + 0.5·Vsh.
 */
[[nodiscard]] double dualWaterSaturation(
    double rt, double phi, double vsh, const ParameterSet& params) noexcept;

/**
 * @brief Кривая водонасыщенности (SW)
 *
 * @param shale_volume Кривая глинистости; обязательна для WaxmanSmits и DualWater
 * @throws InvalidParameterError При некорректных параметрах или отсутствии
 *         кривой глинистости для глинистых моделей
 * @throws MalformedInputError При разной длине кривых
 */
[[nodiscard]] LogCurve calculateWaterSaturation(
    const LogCurve& rt,
    const LogCurve& porosity,
    const ParameterSet& params = {},
    SaturationMethod method = SaturationMethod::Archie,
    const LogCurve* shale_volume = nullptr
);

/**
 * @brief Нефтегазонасыщенность Sh = 1 - Sw
 */
[[nodiscard]] LogCurve calculateHydrocarbonSaturation(const LogCurve& water_saturation);

/**
 * @brief Объёмная водонасыщенность BVW = φ·Sw
 * @throws MalformedInputError При разной длине кривых
 */
[[nodiscard]] LogCurve calculateBulkVolumeWater(
    const LogCurve& porosity,
    const LogCurve& water_saturation
);

} // namespace petrolog::core
