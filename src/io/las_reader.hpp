/**
 * @file las_reader.hpp
 * @brief Импорт каротажных кривых из LAS 2.0 файлов
 */

#pragma once

#include "model/well_log.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace petrolog::io {

using namespace petrolog::model;

/**
 * @brief Информация о кривой LAS
 */
struct LasCurveInfo {
    std::string mnemonic;              ///< Нормализованная мнемоника
    std::string unit;                  ///< Единицы измерения
    std::string description;           ///< Описание
    size_t column_index = 0;           ///< Индекс колонки в данных
};

/**
 * @brief Результат чтения LAS файла
 */
struct LasReadResult {
    WellLog log;                       ///< Ось глубин и кривые
    std::vector<LasCurveInfo> curves;  ///< Все кривые секции ~C (включая глубину)
    std::string version;               ///< Версия LAS
    double null_value = kNullValue;    ///< NULL-значение из заголовка
    size_t depth_column = 0;           ///< Колонка оси глубин
};

/**
 * @brief Разбор текста LAS 2.0
 *
 * Секции ~V, ~W, ~C, ~P, ~O, ~A; строки заголовка "MNEM.UNIT VALUE : DESCRIPTION";
 * строки '#' - комментарии. Значения, равные NULL файла, заменяются на -999.25.
 * Ось глубин - первая кривая с мнемоникой глубины, иначе первая колонка.
 *
 * @param text Содержимое файла
 * @param fallback_well Имя скважины, если в ~W нет WELL
 * @throws MalformedInputError Неверное число значений в строке данных,
 *         нечисловое значение, WRAP YES, нет кривых или данных,
 *         несогласованная ось глубин (с номером строки, где применимо)
 */
[[nodiscard]] LasReadResult parseLas(std::string_view text, const std::string& fallback_well = {});

/**
 * @brief Чтение LAS 2.0 файла
 *
 * Если в ~W нет WELL, именем скважины становится имя файла.
 *
 * @throws std::runtime_error Файл не открывается
 * @throws MalformedInputError При ошибке формата
 */
[[nodiscard]] LasReadResult readLas(const std::filesystem::path& path);

/**
 * @brief Чтение только набора кривых скважины
 */
[[nodiscard]] WellLog readWellLog(const std::filesystem::path& path);

/**
 * @brief Проверка, является ли файл LAS форматом
 */
[[nodiscard]] bool canReadLas(const std::filesystem::path& path) noexcept;

/**
 * @brief Получить список кривых в LAS файле
 *
 * Читает заголовок до секции ~A. Для неоткрываемого файла - пустой список.
 */
[[nodiscard]] std::vector<LasCurveInfo> getLasCurves(const std::filesystem::path& path);

} // namespace petrolog::io
