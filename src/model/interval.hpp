/**
 * @file interval.hpp
 * @brief Выделенный по отсечке интервал разреза
 */

#pragma once

#include "types.hpp"
#include "units.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace petrolog::model {

/**
 * @brief Интервал разреза
 *
 * thickness = bottom - top > 0. Интервалы одного прохода упорядочены
 * по глубине и не пересекаются.
 */
struct Interval {
    Depth top{0.0};                    ///< Кровля (глубина первого отсчёта)
    Depth bottom{0.0};                 ///< Подошва (глубина последнего отсчёта)
    Depth thickness{0.0};              ///< Мощность
    double mean_value = 0.0;           ///< Среднее значение кривой в интервале
    double peak_value = 0.0;           ///< Максимум кривой в интервале
    size_t point_count = 0;            ///< Число отсчётов

    // Производные характеристики (если есть источник данных)
    std::optional<double> permeability_md;    ///< Оценка проницаемости, мД
    std::optional<double> net_to_gross;       ///< Доля эффективных толщин
    std::optional<double> mean_shale_volume;  ///< Средняя глинистость
    std::optional<double> net_pay_potential;  ///< Эффективная толщина

    QualityLabel quality = QualityLabel::Poor; ///< Оценка качества
    int rank = 0;                      ///< Ранг (1 - лучший, 0 - не ранжирован)

    [[nodiscard]] bool isPrimaryTarget() const noexcept { return rank == 1; }
};

using IntervalList = std::vector<Interval>;

} // namespace petrolog::model
