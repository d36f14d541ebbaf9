/**
 * @file text_utils.hpp
 * @brief Перекодировка текстовых строк LAS в UTF-8
 *
 * Российские LAS файлы часто записаны в Windows-1251. Отчёты формируются
 * в UTF-8, поэтому строки заголовка перекодируются при чтении.
 */

#pragma once

#include <string>
#include <string_view>

namespace petrolog::io {

/**
 * @brief Проверка, является ли строка корректной UTF-8
 *
 * Отклоняет избыточные (overlong) последовательности, суррогаты
 * и кодовые точки выше U+10FFFF.
 */
[[nodiscard]] bool isValidUtf8(std::string_view input) noexcept;

/**
 * @brief Перекодировка CP1251 -> UTF-8
 *
 * Неопределённый в CP1251 байт 0x98 заменяется на '?'.
 */
[[nodiscard]] std::string convertCp1251ToUtf8(std::string_view input);

/**
 * @brief Строка в UTF-8
 *
 * Корректная UTF-8 строка возвращается без изменений,
 * иначе считается записанной в CP1251.
 */
[[nodiscard]] std::string ensureUtf8(std::string_view input);

} // namespace petrolog::io
