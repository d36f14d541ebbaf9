/**
 * @file config_io.hpp
 * @brief Загрузка конфигурации анализа из JSON
 *
 * Все ключи необязательны; отсутствующие сохраняют значения по умолчанию.
 */

#pragma once

#include "model/analysis_config.hpp"
#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <string>

namespace petrolog::io {

using namespace petrolog::model;

/**
 * @brief Конфигурация из JSON-объекта
 *
 * Если в parameters задан gr_clean или gr_shale, а shale.auto_baselines
 * не указан, линии ГК берутся из конфигурации (auto_baselines = false).
 *
 * @throws InvalidParameterError Неизвестное значение перечисления, неверный тип
 *         или значение вне диапазона
 */
[[nodiscard]] AnalysisConfig configFromJson(const nlohmann::json& j);

/**
 * @brief Конфигурация в JSON-объект (все ключи)
 */
[[nodiscard]] nlohmann::json configToJson(const AnalysisConfig& config);

/**
 * @brief Разбор конфигурации из строки JSON
 *
 * @throws MalformedInputError Некорректный JSON
 * @throws InvalidParameterError См. configFromJson
 */
[[nodiscard]] AnalysisConfig parseAnalysisConfig(const std::string& json_str);

/**
 * @brief Загрузка конфигурации из файла
 *
 * @throws std::runtime_error Файл не открывается
 * @throws MalformedInputError Некорректный JSON
 * @throws InvalidParameterError См. configFromJson
 */
[[nodiscard]] AnalysisConfig loadAnalysisConfig(const std::filesystem::path& path);

} // namespace petrolog::io
