/**
 * @file batch_runner.hpp
 * @brief Анализ набора LAS файлов из CLI
 *
 * Скважины независимы и обрабатываются параллельно (std::async),
 * число одновременно обрабатываемых скважин ограничено jobs.
 */

#pragma once

#include "model/analysis_config.hpp"
#include "model/errors.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace petrolog::app {

/**
 * @brief Опции пакетного анализа
 */
struct BatchOptions {
    model::AnalysisConfig config;
    std::filesystem::path output_dir;  ///< Каталог отчётов; пусто - отчёт в памяти
    size_t jobs = 0;                   ///< 0 - по числу аппаратных потоков
    bool include_curves = false;       ///< Записывать рассчитанные кривые
};

/**
 * @brief Результат обработки одного файла
 */
struct WellRunResult {
    std::filesystem::path input;
    std::filesystem::path output;      ///< Путь отчёта (если записан)
    std::string well_name;
    bool ok = false;
    std::optional<model::ErrorKind> error_kind;
    std::string error;
    size_t reservoir_count = 0;
    std::vector<std::string> diagnostics;
    std::string report_json;           ///< Отчёт, если output_dir не задан
};

/**
 * @brief Результат пакетного анализа (в порядке входных файлов)
 */
struct BatchResult {
    std::vector<WellRunResult> wells;

    [[nodiscard]] size_t failedCount() const noexcept;
    [[nodiscard]] int exitCode() const noexcept { return failedCount() == 0 ? 0 : 1; }
};

/**
 * @brief Анализ одного LAS файла
 *
 * Ошибки чтения и анализа не выбрасываются, а записываются в результат.
 *
 * @param output Путь отчёта; пусто - output_dir / <имя файла>.json
 */
[[nodiscard]] WellRunResult analyzeWellFile(
    const std::filesystem::path& input,
    const BatchOptions& options,
    const std::filesystem::path& output = {}
);

/**
 * @brief Пути отчётов для набора файлов
 *
 * Отчёт называется по имени входного файла. Если имя повторяется
 * (одноимённые файлы из разных каталогов), последующим добавляется
 * суффикс _2, _3, ..., не совпадающий с именами других файлов набора.
 * При пустом output_dir все пути пустые.
 */
[[nodiscard]] std::vector<std::filesystem::path> reportPaths(
    const std::vector<std::filesystem::path>& inputs,
    const std::filesystem::path& output_dir
);

/**
 * @brief Анализ набора LAS файлов
 */
[[nodiscard]] BatchResult runBatch(
    const std::vector<std::filesystem::path>& inputs,
    const BatchOptions& options
);

/**
 * @brief Фактическое число параллельных задач
 */
[[nodiscard]] size_t effectiveJobs(size_t requested) noexcept;

} // namespace petrolog::app
