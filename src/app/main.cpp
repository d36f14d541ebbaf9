/**
 * @file main.cpp
 * @brief Точка входа утилиты petrolog
 */

#include "batch_runner.hpp"
#include "cli_options.hpp"
#include "io/config_io.hpp"
#include "io/las_reader.hpp"
#include "model/types.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

void printUsage() {
    std::cout
        << "Использование:\n"
        << "  petrolog --analyze <файл.las>... [опции]\n"
        << "      --config <файл.json>   Конфигурация анализа\n"
        << "      --out <каталог>        Каталог отчётов (по умолчанию - stdout)\n"
        << "      --top <глубина>        Кровля диапазона анализа\n"
        << "      --bottom <глубина>     Подошва диапазона анализа\n"
        << "      --jobs <N>             Число параллельно обрабатываемых скважин\n"
        << "      --with-curves          Записывать рассчитанные кривые\n"
        << "  petrolog --curves <файл.las>\n"
        << "      Список кривых файла\n";
}

int runCurves(const std::filesystem::path& path) {
    if (!petrolog::io::canReadLas(path)) {
        std::cerr << "Файл не является LAS: " << path << std::endl;
        return 1;
    }
    auto curves = petrolog::io::getLasCurves(path);
    for (const auto& curve : curves) {
        std::cout << curve.column_index + 1 << "\t" << curve.mnemonic << "\t"
                  << curve.unit << "\t" << curve.description << "\n";
    }
    return 0;
}

int runAnalyze(int argc, char* argv[]) {
    std::vector<std::filesystem::path> inputs;
    std::optional<std::filesystem::path> config_path;
    std::optional<double> top;
    std::optional<double> bottom;
    petrolog::app::BatchOptions options;

    for (int i = 2; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--config" && i + 1 < argc) {
            config_path = std::filesystem::path(argv[++i]);
        } else if (arg == "--out" && i + 1 < argc) {
            options.output_dir = std::filesystem::path(argv[++i]);
        } else if ((arg == "--top" || arg == "--bottom") && i + 1 < argc) {
            auto depth = petrolog::app::parseDepthArgument(argv[++i]);
            if (!depth) {
                std::cerr << "Некорректное значение " << arg << ": " << argv[i] << std::endl;
                return 2;
            }
            (arg == "--top" ? top : bottom) = *depth;
        } else if (arg == "--jobs" && i + 1 < argc) {
            auto jobs = petrolog::app::parseJobsArgument(argv[++i]);
            if (!jobs) {
                std::cerr << "Некорректное значение --jobs: " << argv[i] << std::endl;
                return 2;
            }
            options.jobs = *jobs;
        } else if (arg == "--with-curves") {
            options.include_curves = true;
        } else if (!arg.empty() && arg.front() == '-') {
            std::cerr << "Неизвестный параметр: " << arg << std::endl;
            return 2;
        } else {
            inputs.emplace_back(argv[i]);
        }
    }

    if (inputs.empty()) {
        std::cerr << "Не указаны LAS файлы для анализа" << std::endl;
        return 2;
    }

    if (config_path) {
        options.config = petrolog::io::loadAnalysisConfig(*config_path);
    }
    if (top.has_value() != bottom.has_value()) {
        std::cerr << "Диапазон глубин требует и --top, и --bottom" << std::endl;
        return 2;
    }
    if (top && bottom) {
        options.config.depth_range = petrolog::model::DepthRange{
            petrolog::model::Depth{*top}, petrolog::model::Depth{*bottom}};
    }

    auto batch = petrolog::app::runBatch(inputs, options);

    for (const auto& well : batch.wells) {
        if (!well.ok) {
            std::cerr << well.input.string() << ": ";
            if (well.error_kind) {
                std::cerr << "[" << petrolog::model::toString(*well.error_kind) << "] ";
            }
            std::cerr << well.error << std::endl;
            continue;
        }

        if (options.output_dir.empty()) {
            std::cout << well.report_json << std::endl;
        } else {
            std::cout << well.well_name << ": коллекторов " << well.reservoir_count
                      << ", отчёт " << well.output.string() << std::endl;
        }
        for (const auto& message : well.diagnostics) {
            std::cerr << well.input.string() << ": " << message << std::endl;
        }
    }

    if (batch.wells.size() > 1) {
        std::cerr << "Обработано скважин: " << batch.wells.size()
                  << ", с ошибками: " << batch.failedCount() << std::endl;
    }
    return batch.exitCode();
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        if (argc < 2) {
            printUsage();
            return 2;
        }

        std::string_view command(argv[1]);

        // Анализ скважин: --analyze <файлы> [опции]
        if (command == "--analyze") {
            return runAnalyze(argc, argv);
        }

        // Список кривых: --curves <файл>
        if (command == "--curves" && argc >= 3) {
            return runCurves(std::filesystem::path(argv[2]));
        }

        if (command == "--help" || command == "-h") {
            printUsage();
            return 0;
        }

        printUsage();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Критическая ошибка: " << e.what() << std::endl;
        return 1;
    }
}
