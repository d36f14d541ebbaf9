/**
 * @file units.hpp
 * @brief Строго типизированная глубина
 *
 * Тип-обёртка для глубины по стволу. Единицы (м или фут) задаются
 * файлом каротажа и не пересчитываются.
 */

#pragma once

#include <compare>

namespace petrolog::model {

/**
 * @brief Глубина по стволу
 */
struct Depth {
    double value;

    constexpr explicit Depth(double v = 0.0) noexcept : value(v) {}

    /// Мощность между двумя глубинами
    constexpr Depth operator-(Depth other) const noexcept {
        return Depth{value - other.value};
    }

    constexpr auto operator<=>(const Depth& other) const noexcept = default;
};

} // namespace petrolog::model
