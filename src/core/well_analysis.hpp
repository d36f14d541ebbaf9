/**
 * @file well_analysis.hpp
 * @brief Полный петрофизический анализ скважины
 *
 * Координирует расчёт кривых, выделение и ранжирование интервалов,
 * статистику и оценку качества по пористости, глинистости и насыщенности.
 */

#pragma once

#include "classification.hpp"
#include "net_pay.hpp"
#include "quality_control.hpp"
#include "shale_volume.hpp"
#include "model/analysis_config.hpp"
#include "model/interval.hpp"
#include "model/statistics_summary.hpp"
#include "model/well_log.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace petrolog::core {

using namespace petrolog::model;

/**
 * @brief Результат анализа пористости
 */
struct PorosityAnalysis {
    bool valid = false;                  ///< Анализ выполнен

    LogCurve density_porosity;           ///< PHID
    LogCurve neutron_porosity;           ///< PHIN
    LogCurve effective_porosity;         ///< PHIE
    bool shale_corrected = false;        ///< Применена поправка за глинистость

    StatisticsSummary density_stats;
    StatisticsSummary neutron_stats;
    StatisticsSummary effective_stats;

    IntervalList reservoirs;             ///< Коллекторы, ранжированы по φ × h
    IntervalList high_porosity_zones;    ///< Зоны высокой пористости, по φ
    QualityLabel well_quality = QualityLabel::Poor;
    LithologyAssessment lithology;
};

/**
 * @brief Результат анализа глинистости
 */
struct ShaleAnalysis {
    bool valid = false;

    GammaRayBaselines baselines;         ///< Использованные линии ГК
    LogCurve shale_volume;               ///< VSH
    StatisticsSummary stats;
    double net_to_gross = 0.0;           ///< Доля валидных отсчётов с Vsh <= отсечки
    IntervalList clean_sands;            ///< Чистые песчаники, по эффективной толщине
    QualityLabel well_quality = QualityLabel::Poor;
};

/**
 * @brief Результат расчёта насыщенности
 */
struct SaturationAnalysis {
    bool valid = false;

    LogCurve water_saturation;           ///< SW
    LogCurve hydrocarbon_saturation;     ///< SH
    LogCurve bulk_volume_water;          ///< BVW
    StatisticsSummary stats;             ///< Статистика SW
};

/**
 * @brief Результат оценки проницаемости
 */
struct PermeabilityAnalysis {
    bool valid = false;

    PermeabilityMethod method = PermeabilityMethod::KozenyCarman;
    LogCurve permeability;               ///< PERM, мД
    size_t valid_count = 0;
    double geometric_mean_md = 0.0;      ///< Среднее геометрическое по валидным отсчётам
};

/**
 * @brief Эффективные толщины (нужны глинистость и пористость)
 */
struct NetPayAnalysis {
    bool valid = false;
    NetPayCutoffs cutoffs;
    NetPaySummary summary;
};

/**
 * @brief Сводный отчёт по скважине
 */
struct WellReport {
    std::string well_name;
    Depth top{0.0};
    Depth bottom{0.0};
    size_t sample_count = 0;
    DepthAxis depth;                     ///< Ось глубин анализируемого диапазона

    PorosityAnalysis porosity;
    ShaleAnalysis shale;
    SaturationAnalysis saturation;
    PermeabilityAnalysis permeability;
    NetPayAnalysis net_pay;
    DataQualityReport data_quality;

    std::vector<std::string> diagnostics;  ///< Сообщения о пропущенных этапах
};

/**
 * @brief Callback для индикации прогресса
 *
 * @param progress Прогресс от 0.0 до 1.0
 * @param message Описание текущей операции
 */
using ProgressCallback = std::function<void(double progress, std::string_view message)>;

/**
 * @brief Анализ пористости
 *
 * @param log Набор кривых (нужны RHOB и NPHI)
 * @param config Конфигурация
 * @param shale_volume Кривая глинистости: поправка (если включена)
 *        и эффективная толщина коллекторов
 * @throws CurveNotFoundError Нет плотностной или нейтронной кривой
 * @throws InsufficientDataError Валидных φэф меньше porosity.min_valid_samples
 * @throws InvalidParameterError При некорректных параметрах
 */
[[nodiscard]] PorosityAnalysis analyzePorosity(
    const WellLog& log,
    const AnalysisConfig& config = {},
    const LogCurve* shale_volume = nullptr
);

/**
 * @brief Анализ глинистости
 *
 * При auto_baselines линии ГК оцениваются по данным; если оценка
 * не проходит проверку параметров, используются заданные значения
 * (baselines.estimated = false).
 *
 * @param porosity Кривая пористости для характеристик чистых песчаников
 * @throws CurveNotFoundError Нет кривой ГК
 * @throws InsufficientDataError Валидных отсчётов меньше shale.min_valid_samples
 */
[[nodiscard]] ShaleAnalysis analyzeShale(
    const WellLog& log,
    const AnalysisConfig& config = {},
    const LogCurve* porosity = nullptr
);

/**
 * @brief Расчёт водонасыщенности
 *
 * @throws CurveNotFoundError Нет кривой сопротивления
 * @throws InvalidParameterError Глинистая модель без кривой глинистости
 */
[[nodiscard]] SaturationAnalysis analyzeSaturation(
    const WellLog& log,
    const LogCurve& porosity,
    const AnalysisConfig& config = {},
    const LogCurve* shale_volume = nullptr
);

/**
 * @brief Оценка проницаемости по эффективной пористости
 *
 * @param swi Кривая остаточной водонасыщенности; nullptr - постоянная из опций
 * @throws InvalidParameterError При некорректных опциях
 */
[[nodiscard]] PermeabilityAnalysis analyzePermeability(
    const LogCurve& porosity,
    const AnalysisConfig& config = {},
    const LogCurve* swi = nullptr
);

/**
 * @brief Выделение чистых песчаников по кривой глинистости
 */
[[nodiscard]] IntervalList findCleanSands(
    const DepthAxis& depth,
    const LogCurve& shale_volume,
    const SegmentationRule& rule,
    const LogCurve* porosity = nullptr
);

/**
 * @brief Полный анализ скважины
 *
 * Отсутствие кривой или недостаток данных для отдельного этапа не прерывает
 * анализ: этап помечается невалидным, статистика - низкой достоверности,
 * причина добавляется в diagnostics.
 *
 * @throws MalformedInputError Набор несогласован
 * @throws InvalidParameterError Некорректная конфигурация
 */
[[nodiscard]] WellReport buildWellReport(
    const WellLog& log,
    const AnalysisConfig& config = {},
    ProgressCallback on_progress = nullptr
);

} // namespace petrolog::core
