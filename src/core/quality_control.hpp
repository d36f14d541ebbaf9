/**
 * @file quality_control.hpp
 * @brief Контроль качества каротажных данных
 *
 * Поиск выбросов по кривым и проверки геологической согласованности
 * (диапазоны ГК и плотности, сопротивление в пористых интервалах).
 */

#pragma once

#include "model/analysis_config.hpp"
#include "model/types.hpp"
#include "model/well_log.hpp"
#include <string>
#include <vector>

namespace petrolog::core {

using namespace petrolog::model;

/// Доля выбросов, при превышении которой замечание считается существенным
constexpr double kMajorOutlierFraction = 0.05;

/// Минимум валидных отсчётов для поиска выбросов
constexpr size_t kMinOutlierSamples = 3;

/// Пористость "высокопористого" отсчёта для проверки сопротивления
constexpr double kHighPorosityForResistivity = 0.15;

/**
 * @brief Выбросы одной кривой
 */
struct OutlierReport {
    std::string mnemonic;
    OutlierMethod method = OutlierMethod::ZScore;
    double threshold = 0.0;
    std::vector<size_t> indices;       ///< Индексы отсчётов-выбросов
    std::vector<double> values;        ///< Значения в этих отсчётах
    bool major = false;                ///< Выбросов больше 5% длины кривой

    [[nodiscard]] bool empty() const noexcept { return indices.empty(); }
};

/**
 * @brief Вид проверки согласованности
 */
enum class ConsistencyCheckKind {
    GammaRayRange,        ///< ГК в [0, 300] с достаточной дифференциацией
    DensityRange,         ///< RHOB в допустимом диапазоне
    ResistivityPorosity   ///< Высокое сопротивление в пористых интервалах
};

[[nodiscard]] std::string toString(ConsistencyCheckKind kind);

/**
 * @brief Результат проверки согласованности
 */
struct ConsistencyCheck {
    ConsistencyCheckKind kind = ConsistencyCheckKind::GammaRayRange;
    bool consistent = false;
    ConfidenceLevel confidence = ConfidenceLevel::Low;
    std::string message;
};

/**
 * @brief Сводка качества данных скважины
 */
struct DataQualityReport {
    QualityLabel overall = QualityLabel::Poor;
    double completeness = 0.0;                 ///< Доля валидных отсчётов по всем кривым
    ConfidenceLevel confidence = ConfidenceLevel::Low;
    std::vector<OutlierReport> outliers;       ///< Только кривые с выбросами
    std::vector<ConsistencyCheck> checks;
};

/**
 * @brief Поиск выбросов
 *
 * z-оценка: |x - среднее| / s (s по n-1) > порога; IQR: вне
 * [Q1 - k·IQR, Q3 + k·IQR], Q1/Q3 - элементы ⌊0.25n⌋/⌊0.75n⌋;
 * модифицированная z: 0.6745·|x - медиана| / MAD > порога.
 * Менее 3 валидных отсчётов - выбросов нет.
 */
[[nodiscard]] OutlierReport detectOutliers(
    const LogCurve& curve,
    const QualityControlOptions& options = {}
);

[[nodiscard]] ConsistencyCheck checkGammaRayRange(const LogCurve& gr);

[[nodiscard]] ConsistencyCheck checkDensityRange(
    const LogCurve& rhob,
    const QualityControlOptions& options = {}
);

/**
 * @brief Доля высокопористых отсчётов с высоким сопротивлением
 *
 * Всегда согласована (сопротивление зависит от насыщения);
 * достоверность растёт с числом пар.
 */
[[nodiscard]] ConsistencyCheck checkResistivityPorosity(
    const LogCurve& rt,
    const LogCurve& porosity,
    const QualityControlOptions& options = {}
);

/**
 * @brief Сводная оценка качества данных
 *
 * Выбросы ищутся по всем кривым. Проверки выполняются для найденных
 * кривых ГК, плотности и сопротивления (последняя - при заданной пористости).
 *
 * @throws InvalidParameterError При некорректных опциях
 */
[[nodiscard]] DataQualityReport assessDataQuality(
    const WellLog& log,
    const QualityControlOptions& options = {},
    const LogCurve* porosity = nullptr
);

} // namespace petrolog::core
