/**
 * @file parameters.hpp
 * @brief Физические константы расчёта и их допустимые диапазоны
 */

#pragma once

namespace petrolog::model {

/**
 * @brief Набор физических констант
 *
 * Значения вне допустимого диапазона - ошибка (InvalidParameter),
 * молчаливое ограничение не выполняется.
 */
struct ParameterSet {
    double matrix_density = 2.65;    ///< Плотность матрицы ρma, г/см³
    double fluid_density = 1.0;      ///< Плотность флюида ρf, г/см³
    double gr_clean = 30.0;          ///< ГК чистого песчаника, API
    double gr_shale = 120.0;         ///< ГК глин, API
    double archie_a = 1.0;           ///< Коэффициент извилистости a
    double archie_m = 2.0;           ///< Показатель цементации m
    double archie_n = 2.0;           ///< Показатель насыщения n
    double rw = 0.1;                 ///< Сопротивление пластовой воды Rw, Ом·м
    double ws_b = 0.045;             ///< Коэффициент B Ваксмана-Смитса
};

/**
 * @brief Допустимые диапазоны параметров
 */
namespace parameter_limits {
    constexpr double kMinMatrixDensity = 2.0;
    constexpr double kMaxMatrixDensity = 3.2;
    constexpr double kMinFluidDensity = 0.5;
    constexpr double kMaxFluidDensity = 1.5;
    constexpr double kMinGammaRay = 0.0;
    constexpr double kMaxGrClean = 300.0;
    constexpr double kMaxGrShale = 500.0;
    constexpr double kMinArchieA = 0.4;
    constexpr double kMaxArchieA = 2.5;
    constexpr double kMinExponent = 1.0;   ///< Для m и n
    constexpr double kMaxExponent = 4.0;
    constexpr double kMaxRw = 10.0;        ///< Rw ∈ (0, 10]
    constexpr double kMinWsB = 0.0;
    constexpr double kMaxWsB = 1.0;
}

} // namespace petrolog::model
