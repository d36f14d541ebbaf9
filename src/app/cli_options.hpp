/**
 * @file cli_options.hpp
 * @brief Разбор числовых значений параметров командной строки
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace petrolog::app {

/**
 * @brief Разбор глубины (--top, --bottom)
 *
 * Значение должно целиком быть конечным числом.
 *
 * @return nullopt при некорректном значении
 */
[[nodiscard]] std::optional<double> parseDepthArgument(std::string_view text);

/**
 * @brief Разбор числа параллельных задач (--jobs)
 *
 * Допускаются только десятичные цифры; 0 означает "по числу потоков".
 *
 * @return nullopt при некорректном значении
 */
[[nodiscard]] std::optional<size_t> parseJobsArgument(std::string_view text);

} // namespace petrolog::app
