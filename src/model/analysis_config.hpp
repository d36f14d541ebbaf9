/**
 * @file analysis_config.hpp
 * @brief Настройки анализа скважины
 */

#pragma once

#include "parameters.hpp"
#include "types.hpp"
#include "units.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace petrolog::model {

/**
 * @brief Направление сравнения с отсечкой
 */
enum class CutoffComparison {
    AtLeast,   ///< Отсчёт проходит при value >= cutoff (коллекторы)
    AtMost     ///< Отсчёт проходит при value <= cutoff (чистые песчаники)
};

/**
 * @brief Правило выделения интервалов
 *
 * Замкнутый прогон принимается, если point_count > min_points
 * и мощность > min_thickness (оба неравенства строгие).
 */
struct SegmentationRule {
    std::string name;
    CutoffComparison comparison = CutoffComparison::AtLeast;
    double cutoff = 0.0;
    size_t min_points = 3;
    Depth min_thickness{3.0};

    /// Коллекторы по пористости: >= cutoff, >3 точек, >3 ед. мощности
    [[nodiscard]] static SegmentationRule reservoir(double cutoff = 0.08) {
        return {"reservoir", CutoffComparison::AtLeast, cutoff, 3, Depth{3.0}};
    }

    /// Чистые песчаники по глинистости: <= cutoff, >3 точек, >2 ед. мощности
    [[nodiscard]] static SegmentationRule cleanSand(double cutoff = 0.3) {
        return {"clean_sand", CutoffComparison::AtMost, cutoff, 3, Depth{2.0}};
    }

    /// Зоны высокой пористости: >= cutoff, >2 точек, >1 ед. мощности
    [[nodiscard]] static SegmentationRule highPorosity(double cutoff = 0.12) {
        return {"high_porosity", CutoffComparison::AtLeast, cutoff, 2, Depth{1.0}};
    }

    [[nodiscard]] bool qualifies(double value) const noexcept {
        return comparison == CutoffComparison::AtLeast ? value >= cutoff : value <= cutoff;
    }
};

/**
 * @brief Диапазон глубин анализа (включительно)
 */
struct DepthRange {
    Depth top{0.0};
    Depth bottom{0.0};
};

/**
 * @brief Опции анализа пористости
 */
struct PorosityOptions {
    PorosityBlend blend = PorosityBlend::Geometric;
    Lithology lithology = Lithology::Sandstone;
    bool shale_correction = false;     ///< Поправка за глинистость (нужна кривая ГК)
    SegmentationRule reservoir = SegmentationRule::reservoir();
    SegmentationRule high_porosity = SegmentationRule::highPorosity();
    size_t min_valid_samples = 10;     ///< Минимум валидных отсчётов для статистики
};

/**
 * @brief Опции анализа глинистости
 */
struct ShaleOptions {
    ShaleVolumeMethod method = ShaleVolumeMethod::LarionovTertiary;
    bool auto_baselines = true;        ///< Оценивать ГКчист/ГКглин по данным
    SegmentationRule clean_sand = SegmentationRule::cleanSand();
    size_t min_valid_samples = 10;
};

/**
 * @brief Опции расчёта водонасыщенности
 */
struct SaturationOptions {
    SaturationMethod method = SaturationMethod::Archie;
};

/**
 * @brief Опции оценки проницаемости
 *
 * Козени-Карман использует размер зерна, Тимур и Коутс-Дюмануар -
 * остаточную водонасыщенность.
 */
struct PermeabilityOptions {
    PermeabilityMethod method = PermeabilityMethod::KozenyCarman;
    double grain_size_um = 100.0;      ///< Средний размер зерна, мкм
    double swi = 0.2;                  ///< Остаточная водонасыщенность
    double coates_c = 10000.0;         ///< Коэффициент Коутса-Дюмануара
    double coates_x = 4.0;             ///< Показатель пористости
    double coates_y = 2.0;             ///< Показатель водонасыщенности
};

/**
 * @brief Отсечки эффективных толщин
 *
 * Коллектор: Vsh <= vsh_max и φ >= porosity_min.
 * Эффективная нефтенасыщенная толщина дополнительно требует Sw <= sw_max.
 */
struct NetPayCutoffs {
    double vsh_max = 0.5;
    double porosity_min = 0.08;
    double sw_max = 0.6;
};

/**
 * @brief Опции контроля качества данных
 */
struct QualityControlOptions {
    OutlierMethod outlier_method = OutlierMethod::ZScore;
    double z_score_threshold = 3.0;
    double iqr_multiplier = 1.5;
    double modified_z_score_threshold = 3.5;
    double density_min = 1.8;          ///< Допустимый диапазон RHOB, г/см³
    double density_max = 3.0;
    double resistivity_cutoff = 10.0;  ///< "Высокое" сопротивление, Ом·м
};

/**
 * @brief Полная конфигурация анализа
 */
struct AnalysisConfig {
    ParameterSet parameters;
    PorosityOptions porosity;
    ShaleOptions shale;
    SaturationOptions saturation;
    PermeabilityOptions permeability;
    NetPayCutoffs net_pay;
    QualityControlOptions quality_control;
    std::optional<DepthRange> depth_range;
};

} // namespace petrolog::model
