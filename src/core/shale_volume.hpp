/**
 * @file shale_volume.hpp
 * @brief Расчёт глинистости по гамма-каротажу
 */

#pragma once

#include "model/log_curve.hpp"
#include "model/parameters.hpp"
#include "model/types.hpp"
#include <cstddef>

namespace petrolog::core {

using namespace petrolog::model;

/// Квантиль ГК, принимаемый за линию глин при автооценке
constexpr double kShaleBaselineQuantile = 0.95;

/// Минимум валидных отсчётов ГК для автооценки линий
constexpr size_t kMinBaselineSamples = 10;

/**
 * @brief Индекс гамма-активности IGR
 *
 * IGR = (GR - GRclean) / (GRshale - GRclean), ограничен [0, 1].
 */
[[nodiscard]] double gammaRayIndex(double gr, double gr_clean, double gr_shale) noexcept;

/**
 * @brief Преобразование IGR в глинистость выбранным методом
 *
 * Результат ограничен [0, 1].
 */
[[nodiscard]] double shaleVolumeFromIndex(double igr, ShaleVolumeMethod method) noexcept;

/**
 * @brief Глинистость одного отсчёта ГК
 */
[[nodiscard]] double shaleVolume(
    double gr,
    double gr_clean,
    double gr_shale,
    ShaleVolumeMethod method
) noexcept;

/**
 * @brief Линии чистого песчаника и глин
 */
struct GammaRayBaselines {
    double gr_clean = 0.0;
    double gr_shale = 0.0;
    bool estimated = false;            ///< true - оценены по данным
};

/**
 * @brief Автооценка линий ГК по данным
 *
 * ГКчист - минимум валидных значений, ГКглин - 95-й процентиль
 * (элемент с индексом ⌊0.95·n⌋ отсортированной выборки). Если оценка
 * вырождена (ГКглин <= ГКчист), возвращаются заданные в params значения.
 *
 * @throws InsufficientDataError Если валидных отсчётов меньше 10
 */
[[nodiscard]] GammaRayBaselines estimateGammaRayBaselines(
    const LogCurve& gr,
    const ParameterSet& params = {}
);

/**
 * @brief Кривая глинистости (VSH)
 *
 * Использует params.gr_clean и params.gr_shale.
 *
 * @throws InvalidParameterError При некорректных параметрах
 */
[[nodiscard]] LogCurve calculateShaleVolume(
    const LogCurve& gr,
    const ParameterSet& params = {},
    ShaleVolumeMethod method = ShaleVolumeMethod::LarionovTertiary
);

} // namespace petrolog::core
