/**
 * @file statistics.hpp
 * @brief Статистическая сводка и оценка неопределённости
 *
 * Статистика считается только по валидным отсчётам (не пропуск, конечные).
 */

#pragma once

#include "model/log_curve.hpp"
#include "model/statistics_summary.hpp"
#include "model/types.hpp"
#include <string>
#include <vector>

namespace petrolog::core {

using namespace petrolog::model;

/// Квантиль t для 95% ДИ при n > 30 (нормальное приближение)
constexpr double kConfidence95 = 1.96;

/// Квантиль t для 95% ДИ при малой выборке
constexpr double kConfidence95Small = 2.262;

/// Граница "большой" выборки для выбора квантиля
constexpr size_t kLargeSampleThreshold = 30;

/// Минимум валидных отсчётов для содержательной сводки
constexpr size_t kMinSummarySamples = 3;

/// Методическая погрешность для сводки с низкой достоверностью
constexpr double kLowConfidenceUncertainty = 0.1;

/**
 * @brief Методическая погрешность свойства
 *
 * Плотностная 0.02, нейтронная 0.03, эффективная 0.025,
 * глинистость 0.05, водонасыщенность 0.15.
 */
[[nodiscard]] double methodUncertainty(PropertyKind kind) noexcept;

/**
 * @brief Квантиль с линейной интерполяцией между порядковыми статистиками
 *
 * @param sorted Отсортированные по возрастанию значения (не пустые)
 * @param q Уровень в [0, 1]
 */
[[nodiscard]] double interpolatedQuantile(const std::vector<double>& sorted, double q) noexcept;

/**
 * @brief Сводка по набору значений
 *
 * Менее 3 валидных отсчётов - нулевая сводка с флагом low_confidence
 * и методической погрешностью 0.1. Не является ошибкой.
 */
[[nodiscard]] StatisticsSummary summarize(const std::vector<double>& values, PropertyKind kind);

/**
 * @brief Сводка по кривой
 */
[[nodiscard]] StatisticsSummary summarize(const LogCurve& curve, PropertyKind kind);

/**
 * @brief Проверка достаточности валидных отсчётов
 *
 * @param curve Кривая
 * @param minimum Требуемое число валидных отсчётов
 * @param what Что проверяется (для сообщения)
 * @throws InsufficientDataError Если валидных отсчётов меньше minimum
 */
void requireValidCount(const LogCurve& curve, size_t minimum, const std::string& what);

} // namespace petrolog::core
