/**
 * @file report_json.hpp
 * @brief Сериализация результатов анализа в JSON
 *
 * Имена полей в snake_case. Пропуски в кривых записываются как -999.25.
 */

#pragma once

#include "core/well_analysis.hpp"
#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <string>

namespace petrolog::io {

using namespace petrolog::model;

/**
 * @brief Опции записи отчёта
 */
struct ReportWriteOptions {
    bool include_curves = false;   ///< Записывать рассчитанные кривые поотсчётно
    int indent = 2;                ///< Отступ JSON (-1 - в одну строку)
};

[[nodiscard]] nlohmann::json curveToJson(const LogCurve& curve);
[[nodiscard]] nlohmann::json intervalToJson(const Interval& interval);
[[nodiscard]] nlohmann::json intervalsToJson(const IntervalList& intervals);
[[nodiscard]] nlohmann::json summaryToJson(const StatisticsSummary& summary);

/**
 * @brief Сводный отчёт по скважине
 *
 * Для невалидного этапа записываются valid = false, пустые интервалы
 * и сводка низкой достоверности.
 */
[[nodiscard]] nlohmann::json wellReportToJson(
    const core::WellReport& report,
    const ReportWriteOptions& options = {}
);

/**
 * @brief Отчёт в строку JSON
 */
[[nodiscard]] std::string reportToString(
    const core::WellReport& report,
    const ReportWriteOptions& options = {}
);

/**
 * @brief Запись отчёта в файл (атомарно)
 *
 * @throws std::runtime_error При ошибке записи
 */
void writeReport(
    const core::WellReport& report,
    const std::filesystem::path& path,
    const ReportWriteOptions& options = {}
);

} // namespace petrolog::io
