/**
 * @file log_curve.hpp
 * @brief Кривая каротажа и ось глубин
 */

#pragma once

#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace petrolog::model {

/// Стандартное NULL-значение каротажа (LAS)
constexpr double kNullValue = -999.25;

/**
 * @brief Проверка отсчёта на пропуск
 *
 * Пропуском считается NULL-значение и любое нечисловое/бесконечное значение.
 */
[[nodiscard]] inline bool isNull(double value) noexcept {
    return !std::isfinite(value) || std::abs(value - kNullValue) < 1e-6;
}

/**
 * @brief Ось глубин
 *
 * Неубывающая последовательность глубин, задающая позиции отсчётов
 * всех кривых набора.
 */
using DepthAxis = std::vector<double>;

/**
 * @brief Кривая каротажа
 *
 * Длина samples совпадает с длиной оси глубин набора. Пропуски не удаляются,
 * а помечаются kNullValue.
 */
struct LogCurve {
    std::string mnemonic;              ///< Мнемоника (RHOB, NPHI, PHIE...)
    std::string unit;                  ///< Единицы измерения
    std::string description;           ///< Описание
    std::vector<double> samples;       ///< Отсчёты

    LogCurve() = default;

    LogCurve(std::string mnem, std::string u, std::vector<double> values = {})
        : mnemonic(std::move(mnem)), unit(std::move(u)), samples(std::move(values)) {}

    [[nodiscard]] size_t size() const noexcept { return samples.size(); }
    [[nodiscard]] bool empty() const noexcept { return samples.empty(); }

    /**
     * @brief Количество валидных (не пропущенных) отсчётов
     */
    [[nodiscard]] size_t validCount() const noexcept {
        size_t count = 0;
        for (double v : samples) {
            if (!isNull(v)) ++count;
        }
        return count;
    }
};

} // namespace petrolog::model
