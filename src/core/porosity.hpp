/**
 * @file porosity.hpp
 * @brief Расчёт плотностной, нейтронной и эффективной пористости
 *
 * Все функции чистые и работают поотсчётно. Пропуск во входной кривой
 * даёт пропуск в той же позиции выходной кривой.
 */

#pragma once

#include "model/log_curve.hpp"
#include "model/parameters.hpp"
#include "model/types.hpp"

namespace petrolog::core {

using namespace petrolog::model;

/// Границы правдоподобия неограниченной плотностной пористости
constexpr double kDensityPorosityRejectLow = -0.15;
constexpr double kDensityPorosityRejectHigh = 0.6;

/// Верхняя граница ограничения пористости
constexpr double kMaxPorosity = 0.5;

/// Доля нейтронной пористости, вычитаемая на единицу глинистости
constexpr double kShaleCorrectionFactor = 0.5;

/**
 * @brief Плотностная пористость одного отсчёта
 *
 * φD = (ρma - ρb) / (ρma - ρf). Неограниченный результат вне
 * [-0.15, 0.6] считается браком измерения (NULL), иначе ограничивается [0, 0.5].
 */
[[nodiscard]] double densityPorosity(double rhob, const ParameterSet& params) noexcept;

/**
 * @brief Коэффициент литологической поправки нейтронного метода
 */
[[nodiscard]] double lithologyFactor(Lithology lithology) noexcept;

/**
 * @brief Нейтронная пористость одного отсчёта
 *
 * Значение > 1 трактуется как проценты и делится на 100.
 * Далее умножается на литологический коэффициент и ограничивается [0, 0.5].
 */
[[nodiscard]] double neutronPorosity(double nphi, Lithology lithology) noexcept;

/**
 * @brief Эффективная пористость одного отсчёта
 *
 * @param phi_d Плотностная пористость
 * @param phi_n Нейтронная пористость
 * @param blend Способ объединения
 * @param vsh Глинистость для поправки (NULL - без поправки)
 */
[[nodiscard]] double effectivePorosity(
    double phi_d,
    double phi_n,
    PorosityBlend blend,
    double vsh = kNullValue
) noexcept;

/**
 * @brief Кривая плотностной пористости (PHID)
 * @throws InvalidParameterError При некорректных параметрах
 */
[[nodiscard]] LogCurve calculateDensityPorosity(
    const LogCurve& rhob,
    const ParameterSet& params = {}
);

/**
 * @brief Кривая нейтронной пористости (PHIN)
 */
[[nodiscard]] LogCurve calculateNeutronPorosity(
    const LogCurve& nphi,
    Lithology lithology = Lithology::Sandstone
);

/**
 * @brief Кривая эффективной пористости (PHIE)
 *
 * @param shale_volume Кривая глинистости для поправки, nullptr - без поправки
 * @throws MalformedInputError При разной длине кривых
 */
[[nodiscard]] LogCurve calculateEffectivePorosity(
    const LogCurve& density_porosity,
    const LogCurve& neutron_porosity,
    PorosityBlend blend = PorosityBlend::Geometric,
    const LogCurve* shale_volume = nullptr
);

} // namespace petrolog::core
