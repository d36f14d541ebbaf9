/**
 * @file curve_store.hpp
 * @brief Доступ к кривым скважины: псевдонимы и выборка по глубине
 */

#pragma once

#include "model/errors.hpp"
#include "model/units.hpp"
#include "model/well_log.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace petrolog::core {

using namespace petrolog::model;

/**
 * @brief Наборы псевдонимов логических кривых
 *
 * Псевдонимы сравниваются с нормализованными мнемониками (см. normalizeMnemonic).
 */
namespace curve_aliases {
    inline const std::vector<std::string> kDepth = {
        "DEPT", "DEPTH", "MD", "DEPTH_M", "DEPT_M", "TVDSS"
    };
    inline const std::vector<std::string> kBulkDensity = {
        "RHOB", "DENSITY", "RHO", "DEN", "ZDEN", "RHOZ", "BULK_DENSITY"
    };
    inline const std::vector<std::string> kNeutron = {
        "NPHI", "NEUTRON", "PHIN", "TNPH", "NPOR", "NEU", "CNL"
    };
    inline const std::vector<std::string> kGammaRay = {
        "GR", "GAMMA_RAY", "GAMMA", "SGR", "CGR", "GRC"
    };
    inline const std::vector<std::string> kResistivity = {
        "RT", "ILD", "LLD", "RES", "RESD", "AT90", "RDEP", "DEEP_RES"
    };
}

/**
 * @brief Нормализация мнемоники
 *
 * Верхний регистр, разделители (пробел, '-', '_') сводятся к '_',
 * прочие символы отбрасываются, завершающие '_' удаляются.
 */
[[nodiscard]] std::string normalizeMnemonic(std::string_view raw);

/**
 * @brief Проверка согласованности набора
 *
 * @throws MalformedInputError Если длина кривой не равна длине оси глубин,
 *         ось глубин убывает или содержит пропуски
 */
void validateWellLog(const WellLog& log);

/**
 * @brief Проверка совпадения длин двух кривых
 *
 * @throws MalformedInputError Если длины различаются
 */
void requireSameLength(const LogCurve& a, const LogCurve& b);

/**
 * @brief Поиск кривой по набору псевдонимов
 *
 * Псевдонимы проверяются по порядку, первый найденный выигрывает.
 *
 * @return Указатель на кривую внутри log или nullptr
 */
[[nodiscard]] const LogCurve* findCurve(
    const WellLog& log,
    const std::vector<std::string>& aliases
);

/**
 * @brief Поиск обязательной кривой
 *
 * @throws CurveNotFoundError Если ни один псевдоним не найден
 * @throws MalformedInputError Если длина найденной кривой не совпадает с осью глубин
 */
[[nodiscard]] const LogCurve& requireCurve(
    const WellLog& log,
    const std::vector<std::string>& aliases
);

/**
 * @brief Выборка по диапазону глубин [start, end] включительно
 *
 * Возвращает новый согласованный набор с сохранением порядка отсчётов.
 * Метаданные скважины копируются.
 *
 * @throws MalformedInputError Если start > end или набор несогласован
 */
[[nodiscard]] WellLog filterByDepthRange(const WellLog& log, Depth start, Depth end);

} // namespace petrolog::core
