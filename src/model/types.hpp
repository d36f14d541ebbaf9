/**
 * @file types.hpp
 * @brief Базовые перечисления и их строковые представления
 */

#pragma once

#include <optional>
#include <string>

namespace petrolog::model {

/**
 * @brief Способ объединения плотностной и нейтронной пористости
 */
enum class PorosityBlend {
    Arithmetic,   ///< Среднее арифметическое
    Geometric,    ///< Среднее геометрическое (по умолчанию)
    Harmonic,     ///< Среднее гармоническое
    Rms           ///< Среднеквадратичное ("по Уилли")
};

/**
 * @brief Литология для поправки нейтронной пористости
 */
enum class Lithology {
    Sandstone,    ///< Песчаник (коэффициент 0.9)
    Limestone,    ///< Известняк / карбонат (1.0)
    Dolomite      ///< Доломит (0.7)
};

/**
 * @brief Метод расчёта глинистости по ГК
 */
enum class ShaleVolumeMethod {
    LarionovTertiary,     ///< Ларионов, третичные породы
    LarionovPreTertiary,  ///< Ларионов, дотретичные породы
    Clavier,              ///< Клавье
    Linear                ///< Линейный (Vsh = IGR)
};

/**
 * @brief Метод расчёта водонасыщенности
 */
enum class SaturationMethod {
    Archie,       ///< Уравнение Арчи
    WaxmanSmits,  ///< Ваксман-Смитс (глинистые коллекторы)
    DualWater     ///< Упрощённая двухводная модель
};

/**
 * @brief Метод оценки проницаемости
 */
enum class PermeabilityMethod {
    KozenyCarman,     ///< Козени-Карман (размер зерна)
    Timur,            ///< Тимур (остаточная водонасыщенность)
    CoatesDumanoir    ///< Коутс-Дюмануар
};

/**
 * @brief Метод поиска выбросов
 */
enum class OutlierMethod {
    ZScore,           ///< |x - среднее| / СКО
    Iqr,              ///< Межквартильный размах
    ModifiedZScore    ///< Модифицированный z по медиане и MAD
};

/**
 * @brief Вид петрофизического свойства
 *
 * Определяет методическую погрешность и шкалу классификации.
 */
enum class PropertyKind {
    DensityPorosity,
    NeutronPorosity,
    EffectivePorosity,
    ShaleVolume,
    WaterSaturation
};

/**
 * @brief Порядковая оценка качества
 *
 * Значения упорядочены по возрастанию качества.
 */
enum class QualityLabel {
    Poor,
    Fair,
    Good,
    VeryGood,
    Excellent,
    Exceptional
};

/**
 * @brief Уровень достоверности по полноте данных
 */
enum class ConfidenceLevel {
    Low,
    Medium,
    High
};

[[nodiscard]] inline std::string toString(PorosityBlend blend) {
    switch (blend) {
        case PorosityBlend::Arithmetic: return "arithmetic";
        case PorosityBlend::Geometric: return "geometric";
        case PorosityBlend::Harmonic: return "harmonic";
        case PorosityBlend::Rms: return "rms";
    }
    return "geometric";
}

/**
 * @brief Парсинг PorosityBlend из строки
 *
 * Принимает также названия из исходных инструментов ("average", "wyllie").
 */
[[nodiscard]] inline std::optional<PorosityBlend> parsePorosityBlend(const std::string& str) {
    if (str == "arithmetic" || str == "average") return PorosityBlend::Arithmetic;
    if (str == "geometric") return PorosityBlend::Geometric;
    if (str == "harmonic") return PorosityBlend::Harmonic;
    if (str == "rms" || str == "wyllie") return PorosityBlend::Rms;
    return std::nullopt;
}

[[nodiscard]] inline std::string toString(Lithology lithology) {
    switch (lithology) {
        case Lithology::Sandstone: return "sandstone";
        case Lithology::Limestone: return "limestone";
        case Lithology::Dolomite: return "dolomite";
    }
    return "sandstone";
}

[[nodiscard]] inline std::optional<Lithology> parseLithology(const std::string& str) {
    if (str == "sandstone") return Lithology::Sandstone;
    if (str == "limestone" || str == "carbonate") return Lithology::Limestone;
    if (str == "dolomite") return Lithology::Dolomite;
    return std::nullopt;
}

[[nodiscard]] inline std::string toString(ShaleVolumeMethod method) {
    switch (method) {
        case ShaleVolumeMethod::LarionovTertiary: return "larionov_tertiary";
        case ShaleVolumeMethod::LarionovPreTertiary: return "larionov_pre_tertiary";
        case ShaleVolumeMethod::Clavier: return "clavier";
        case ShaleVolumeMethod::Linear: return "linear";
    }
    return "larionov_tertiary";
}

[[nodiscard]] inline std::optional<ShaleVolumeMethod> parseShaleVolumeMethod(const std::string& str) {
    if (str == "larionov_tertiary") return ShaleVolumeMethod::LarionovTertiary;
    if (str == "larionov_pre_tertiary") return ShaleVolumeMethod::LarionovPreTertiary;
    if (str == "clavier") return ShaleVolumeMethod::Clavier;
    if (str == "linear") return ShaleVolumeMethod::Linear;
    return std::nullopt;
}

[[nodiscard]] inline std::string toString(SaturationMethod method) {
    switch (method) {
        case SaturationMethod::Archie: return "archie";
        case SaturationMethod::WaxmanSmits: return "waxman_smits";
        case SaturationMethod::DualWater: return "dual_water";
    }
    return "archie";
}

[[nodiscard]] inline std::optional<SaturationMethod> parseSaturationMethod(const std::string& str) {
    if (str == "archie") return SaturationMethod::Archie;
    if (str == "waxman_smits") return SaturationMethod::WaxmanSmits;
    if (str == "dual_water") return SaturationMethod::DualWater;
    return std::nullopt;
}

[[nodiscard]] inline std::string toString(PermeabilityMethod method) {
    switch (method) {
        case PermeabilityMethod::KozenyCarman: return "kozeny_carman";
        case PermeabilityMethod::Timur: return "timur";
        case PermeabilityMethod::CoatesDumanoir: return "coates_dumanoir";
    }
    return "kozeny_carman";
}

[[nodiscard]] inline std::optional<PermeabilityMethod> parsePermeabilityMethod(const std::string& str) {
    if (str == "kozeny_carman") return PermeabilityMethod::KozenyCarman;
    if (str == "timur") return PermeabilityMethod::Timur;
    if (str == "coates_dumanoir" || str == "coates") return PermeabilityMethod::CoatesDumanoir;
    return std::nullopt;
}

[[nodiscard]] inline std::string toString(OutlierMethod method) {
    switch (method) {
        case OutlierMethod::ZScore: return "z_score";
        case OutlierMethod::Iqr: return "iqr";
        case OutlierMethod::ModifiedZScore: return "modified_z_score";
    }
    return "z_score";
}

[[nodiscard]] inline std::optional<OutlierMethod> parseOutlierMethod(const std::string& str) {
    if (str == "z_score") return OutlierMethod::ZScore;
    if (str == "iqr") return OutlierMethod::Iqr;
    if (str == "modified_z_score") return OutlierMethod::ModifiedZScore;
    return std::nullopt;
}

[[nodiscard]] inline std::string toString(PropertyKind kind) {
    switch (kind) {
        case PropertyKind::DensityPorosity: return "density_porosity";
        case PropertyKind::NeutronPorosity: return "neutron_porosity";
        case PropertyKind::EffectivePorosity: return "effective_porosity";
        case PropertyKind::ShaleVolume: return "shale_volume";
        case PropertyKind::WaterSaturation: return "water_saturation";
    }
    return "effective_porosity";
}

[[nodiscard]] inline std::string toString(QualityLabel label) {
    switch (label) {
        case QualityLabel::Poor: return "poor";
        case QualityLabel::Fair: return "fair";
        case QualityLabel::Good: return "good";
        case QualityLabel::VeryGood: return "very_good";
        case QualityLabel::Excellent: return "excellent";
        case QualityLabel::Exceptional: return "exceptional";
    }
    return "poor";
}

[[nodiscard]] inline std::string toString(ConfidenceLevel level) {
    switch (level) {
        case ConfidenceLevel::Low: return "low";
        case ConfidenceLevel::Medium: return "medium";
        case ConfidenceLevel::High: return "high";
    }
    return "low";
}

} // namespace petrolog::model
