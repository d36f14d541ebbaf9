/**
 * @file segmentation.hpp
 * @brief Выделение интервалов разреза по отсечке
 *
 * Однопроходный автомат с состояниями {вне интервала, в интервале}.
 * Пропуск данных всегда закрывает интервал и никогда не перекрывается.
 */

#pragma once

#include "model/analysis_config.hpp"
#include "model/interval.hpp"
#include "model/log_curve.hpp"

namespace petrolog::core {

using namespace petrolog::model;

/**
 * @brief Роль сегментируемой кривой
 *
 * Определяет, какие производные характеристики берутся из самой кривой.
 */
enum class CurveRole {
    Porosity,      ///< Среднее - пористость (проницаемость, доля коллектора)
    ShaleVolume    ///< Среднее - глинистость (эффективная толщина)
};

/**
 * @brief Сопутствующие кривые для производных характеристик
 *
 * Должны иметь длину оси глубин. nullptr - характеристика не считается
 * (если не выводится из самой кривой).
 */
struct CompanionCurves {
    const LogCurve* porosity = nullptr;
    const LogCurve* shale_volume = nullptr;
};

/**
 * @brief Оценка проницаемости по пористости (тип Козени-Кармана)
 *
 * k = φ³ / (1 - φ)² × 1000, мД.
 */
[[nodiscard]] double estimatePermeability(double porosity) noexcept;

/**
 * @brief Доля коллектора по пористости
 *
 * Пороги: >= 0.15 → 0.9, >= 0.10 → 0.75, >= 0.06 → 0.6, иначе 0.4.
 */
[[nodiscard]] double netToGrossFromPorosity(double porosity) noexcept;

/**
 * @brief Выделение интервалов по правилу
 *
 * Интервал открывается первым прошедшим отсечку отсчётом и продлевается
 * следующими. Непрошедший отсчёт или пропуск закрывает интервал; подошва -
 * глубина последнего отсчёта интервала. Интервал, открытый на последнем
 * отсчёте, закрывается на последней глубине. Принимаются интервалы с
 * point_count > rule.min_points и мощностью > rule.min_thickness; отвергнутые
 * отбрасываются без слияния с соседями.
 *
 * @param depth Ось глубин
 * @param curve Производная кривая
 * @param rule Правило отсечки
 * @param role Роль кривой
 * @param companions Сопутствующие кривые
 * @return Интервалы в порядке глубины (rank = 0)
 * @throws MalformedInputError При несовпадении длин
 */
[[nodiscard]] IntervalList segmentIntervals(
    const DepthAxis& depth,
    const LogCurve& curve,
    const SegmentationRule& rule,
    CurveRole role = CurveRole::Porosity,
    const CompanionCurves& companions = {}
);

} // namespace petrolog::core
