/**
 * @file well_log.hpp
 * @brief Набор кривых каротажа одной скважины
 */

#pragma once

#include "log_curve.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace petrolog::model {

/**
 * @brief Набор кривых скважины, привязанных к общей оси глубин
 *
 * Создаётся один раз при загрузке и далее используется только для чтения.
 */
struct WellLog {
    std::string well;                  ///< Название скважины
    std::string field;                 ///< Месторождение
    std::string depth_unit;            ///< Единицы глубины (M, FT)
    std::unordered_map<std::string, std::string> well_info; ///< Секция ~W

    DepthAxis depth;                   ///< Ось глубин
    std::vector<LogCurve> curves;      ///< Кривые (без кривой глубины)

    [[nodiscard]] size_t size() const noexcept { return depth.size(); }
    [[nodiscard]] bool empty() const noexcept { return depth.empty(); }

    /**
     * @brief Поиск кривой по точной мнемонике
     */
    [[nodiscard]] const LogCurve* findCurve(const std::string& mnemonic) const noexcept {
        for (const auto& curve : curves) {
            if (curve.mnemonic == mnemonic) {
                return &curve;
            }
        }
        return nullptr;
    }

    /**
     * @brief Отображаемое имя скважины
     */
    [[nodiscard]] std::string displayName() const {
        if (!well.empty()) {
            if (!field.empty()) {
                return field + "/" + well;
            }
            return well;
        }
        return "Безымянная скважина";
    }
};

} // namespace petrolog::model
