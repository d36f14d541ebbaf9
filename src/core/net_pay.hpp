/**
 * @file net_pay.hpp
 * @brief Эффективные толщины по совокупности отсечек
 *
 * Разрез разбивается на слои между соседними отсчётами; мощность слоя -
 * разность глубин, свойства - среднее двух отсчётов. Слой с пропуском
 * глинистости или пористости не входит ни в общую, ни в эффективную толщину.
 */

#pragma once

#include "model/analysis_config.hpp"
#include "model/log_curve.hpp"
#include <optional>

namespace petrolog::core {

using namespace petrolog::model;

/**
 * @brief Сводка эффективных толщин
 */
struct NetPaySummary {
    double gross_thickness = 0.0;              ///< Общая толщина (слои с данными)
    double net_reservoir_thickness = 0.0;      ///< Vsh <= vsh_max и φ >= porosity_min
    double net_to_gross = 0.0;                 ///< net_reservoir / gross
    double weighted_porosity = 0.0;            ///< φ, взвешенная по толщине коллектора
    double average_shale_volume = 0.0;         ///< Среднее Vsh по валидным отсчётам

    // Только при наличии кривой водонасыщенности
    std::optional<double> net_pay_thickness;   ///< Коллектор с Sw <= sw_max
    std::optional<double> net_pay_ratio;       ///< net_pay / gross
    std::optional<double> weighted_saturation; ///< Sw, взвешенная по net_pay
};

/**
 * @brief Расчёт эффективных толщин
 *
 * @param depth Ось глубин
 * @param shale_volume Кривая глинистости
 * @param porosity Кривая эффективной пористости
 * @param cutoffs Отсечки
 * @param water_saturation Кривая Sw; nullptr - нефтенасыщенная толщина не считается
 * @throws InvalidParameterError Отсечка вне [0, 1]
 * @throws MalformedInputError Длины кривых не совпадают с осью глубин
 * @throws InsufficientDataError Меньше двух отсчётов
 */
[[nodiscard]] NetPaySummary calculateNetPay(
    const DepthAxis& depth,
    const LogCurve& shale_volume,
    const LogCurve& porosity,
    const NetPayCutoffs& cutoffs = {},
    const LogCurve* water_saturation = nullptr
);

} // namespace petrolog::core
