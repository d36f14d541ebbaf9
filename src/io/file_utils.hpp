/**
 * @file file_utils.hpp
 * @brief Чтение входных файлов и атомарная запись отчётов
 */

#pragma once

#include <filesystem>
#include <string>

namespace petrolog::io {

/**
 * @brief Прочитать файл целиком
 *
 * @throws std::runtime_error Файл не удалось открыть
 */
[[nodiscard]] std::string readTextFile(const std::filesystem::path& path);

/**
 * @brief Атомарная запись (временный файл + rename)
 *
 * Каталог создаётся при необходимости. Имя временного файла уникально
 * для потока, поэтому параллельные записи в один каталог не пересекаются.
 *
 * @throws std::runtime_error При ошибке записи
 */
void atomicWrite(const std::filesystem::path& path, const std::string& content);

} // namespace petrolog::io
