/**
 * @file classification.hpp
 * @brief Оценка качества и ранжирование интервалов
 */

#pragma once

#include "model/interval.hpp"
#include "model/types.hpp"
#include <string>

namespace petrolog::core {

using namespace petrolog::model;

/**
 * @brief Пороги классификации
 *
 * Шкалы непересекающиеся, каждая граница относится к верхнему классу.
 */
namespace quality_thresholds {
    // Пористость
    constexpr double kPorosityFair = 0.08;
    constexpr double kPorosityGood = 0.12;
    constexpr double kPorosityExcellent = 0.18;

    // Глинистость (верхние границы)
    constexpr double kShaleExcellent = 0.15;
    constexpr double kShaleGood = 0.30;
    constexpr double kShaleFair = 0.50;

    // Зоны высокой пористости
    constexpr double kZoneVeryGood = 0.12;
    constexpr double kZoneExcellent = 0.15;
    constexpr double kZoneExceptional = 0.20;

    // Водонасыщенность (верхние границы)
    constexpr double kSaturationExcellent = 0.35;
    constexpr double kSaturationGood = 0.50;
    constexpr double kSaturationFair = 0.70;
}

[[nodiscard]] QualityLabel classifyPorosity(double porosity) noexcept;
[[nodiscard]] QualityLabel classifyShaleVolume(double shale_volume) noexcept;
[[nodiscard]] QualityLabel classifyHighPorosityZone(double porosity) noexcept;
[[nodiscard]] QualityLabel classifyWaterSaturation(double saturation) noexcept;

/**
 * @brief Классификация значения по шкале свойства
 *
 * Все виды пористости используют шкалу пористости.
 */
[[nodiscard]] QualityLabel classify(PropertyKind kind, double value) noexcept;

/**
 * @brief Присвоить интервалам оценку по среднему значению
 */
void classifyIntervals(IntervalList& intervals, PropertyKind kind);

/**
 * @brief Присвоить зонам высокой пористости оценку по шкале зон
 */
void classifyHighPorosityZones(IntervalList& zones);

/**
 * @brief Составной показатель для ранжирования
 */
enum class RankingScore {
    ValueTimesThickness,   ///< mean_value × мощность (коллекторы)
    NetPayPotential,       ///< Эффективная толщина (чистые песчаники)
    MeanValue              ///< Среднее значение (зоны высокой пористости)
};

/**
 * @brief Значение составного показателя для интервала
 *
 * Для NetPayPotential без эффективной толщины возвращает 0.
 */
[[nodiscard]] double rankingScore(const Interval& interval, RankingScore score) noexcept;

/**
 * @brief Ранжирование интервалов
 *
 * Устойчивая сортировка по убыванию показателя: при равенстве сохраняется
 * порядок по глубине. Ранги с 1.
 */
void rankIntervals(IntervalList& intervals, RankingScore score);

/**
 * @brief Оценка качества скважины по пористости
 *
 * @param mean_porosity Средняя эффективная пористость
 * @param reservoir_count Число коллекторов
 * @param high_porosity_zone_count Число зон высокой пористости
 */
[[nodiscard]] QualityLabel assessPorosityWellQuality(
    double mean_porosity,
    size_t reservoir_count,
    size_t high_porosity_zone_count
) noexcept;

/**
 * @brief Оценка качества скважины по глинистости
 */
[[nodiscard]] QualityLabel assessShaleWellQuality(
    double mean_shale_volume,
    double net_to_gross,
    size_t clean_sand_count
) noexcept;

/**
 * @brief Литологический признак по плотностной и нейтронной пористости
 */
enum class LithologyIndicator {
    Sandstone,
    ShalySandstone,
    Carbonate
};

/**
 * @brief Результат оценки литологии
 */
struct LithologyAssessment {
    LithologyIndicator indicator = LithologyIndicator::Sandstone;
    double matrix_density = 2.65;   ///< Рекомендуемая плотность матрицы, г/см³
};

/**
 * @brief Литология по средним φD и φN
 *
 * φD > 0.12 и φN > 0.15 - глинистый песчаник; φD > 0.15 - карбонат (2.71);
 * иначе песчаник (2.65).
 */
[[nodiscard]] LithologyAssessment assessLithology(
    double mean_density_porosity,
    double mean_neutron_porosity
) noexcept;

[[nodiscard]] std::string toString(LithologyIndicator indicator);

} // namespace petrolog::core
