/**
 * @file statistics_summary.hpp
 * @brief Статистическая сводка по кривой
 */

#pragma once

#include "types.hpp"
#include <cstddef>

namespace petrolog::model {

/**
 * @brief Доверительный интервал среднего
 */
struct ConfidenceInterval {
    double lower = 0.0;
    double upper = 0.0;
};

/**
 * @brief Сводная статистика по валидным отсчётам
 *
 * valid_count <= total_count, std_dev >= 0, доверительный интервал
 * содержит среднее.
 */
struct StatisticsSummary {
    double mean = 0.0;
    double std_dev = 0.0;              ///< Выборочное СКО (знаменатель n-1)
    double min = 0.0;
    double max = 0.0;
    double median = 0.0;
    double p10 = 0.0;
    double p50 = 0.0;
    double p90 = 0.0;
    size_t valid_count = 0;
    size_t total_count = 0;
    ConfidenceInterval confidence_95;  ///< 95% ДИ среднего

    double standard_error = 0.0;       ///< СКО / √n
    double method_uncertainty = 0.0;   ///< Методическая погрешность свойства
    double combined_uncertainty = 0.0; ///< √(SE² + методическая²)

    double completeness = 0.0;         ///< valid_count / total_count
    ConfidenceLevel confidence = ConfidenceLevel::Low;
    bool low_confidence = true;        ///< Менее 3 валидных отсчётов
};

} // namespace petrolog::model
