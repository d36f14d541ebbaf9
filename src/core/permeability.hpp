/**
 * @file permeability.hpp
 * @brief Оценка проницаемости по пористости
 *
 * Поотсчётные зависимости; пропуск во входах даёт пропуск на выходе.
 * Значение вне (0, 1e6] мД считается недостоверным и заменяется пропуском.
 */

#pragma once

#include "model/analysis_config.hpp"
#include "model/log_curve.hpp"

namespace petrolog::core {

using namespace petrolog::model;

/// Верхняя граница правдоподобной проницаемости, мД
constexpr double kMaxPlausiblePermeabilityMd = 1e6;

/// Перевод см² в мД для формулы Козени-Кармана
constexpr double kSquareCmToMillidarcy = 1.013e9;

/**
 * @brief Козени-Карман
 *
 * k = φ³/(1-φ)² · d²/180, d - размер зерна в см (мкм × 1e-4), результат в мД.
 * Пропуск при φ <= 0 или φ >= 1.
 */
[[nodiscard]] double kozenyCarmanPermeability(double porosity, double grain_size_um) noexcept;

/**
 * @brief Тимур: k = 0.136 · φ^4.4 / Swi²
 *
 * Пропуск при φ или Swi вне (0, 1).
 */
[[nodiscard]] double timurPermeability(double porosity, double swi) noexcept;

/**
 * @brief Коутс-Дюмануар: k = C · φ^x / Swi^y
 */
[[nodiscard]] double coatesDumanoirPermeability(
    double porosity, double swi, const PermeabilityOptions& options) noexcept;

/**
 * @brief Проницаемость в отсчёте выбранным методом
 *
 * @param swi Остаточная водонасыщенность отсчёта (для Козени-Кармана не используется)
 */
[[nodiscard]] double permeabilitySample(
    double porosity, double swi, const PermeabilityOptions& options) noexcept;

/**
 * @brief Кривая проницаемости PERM, мД
 *
 * @param porosity Кривая пористости
 * @param swi Кривая остаточной водонасыщенности; nullptr - постоянная options.swi
 * @throws InvalidParameterError При некорректных опциях
 * @throws MalformedInputError Если длины кривых различаются
 */
[[nodiscard]] LogCurve calculatePermeability(
    const LogCurve& porosity,
    const PermeabilityOptions& options = {},
    const LogCurve* swi = nullptr
);

/**
 * @brief Среднее геометрическое валидных положительных значений
 *
 * Для пустого набора - 0.
 */
[[nodiscard]] double geometricMean(const LogCurve& curve) noexcept;

} // namespace petrolog::core
