/**
 * @file batch_runner.cpp
 * @brief Реализация пакетного анализа
 */

#include "batch_runner.hpp"
#include "core/well_analysis.hpp"
#include "io/las_reader.hpp"
#include "io/report_json.hpp"
#include <algorithm>
#include <deque>
#include <future>
#include <set>
#include <string>
#include <thread>
#include <utility>

namespace petrolog::app {

size_t BatchResult::failedCount() const noexcept {
    return static_cast<size_t>(std::count_if(wells.begin(), wells.end(),
        [](const WellRunResult& w) { return !w.ok; }));
}

size_t effectiveJobs(size_t requested) noexcept {
    if (requested > 0) {
        return requested;
    }
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

std::vector<std::filesystem::path> reportPaths(
    const std::vector<std::filesystem::path>& inputs,
    const std::filesystem::path& output_dir
) {
    std::vector<std::filesystem::path> paths(inputs.size());
    if (output_dir.empty()) {
        return paths;
    }

    std::set<std::string> stems;
    for (const auto& input : inputs) {
        stems.insert(input.stem().string());
    }

    std::set<std::string> used;
    for (size_t i = 0; i < inputs.size(); ++i) {
        std::string name = inputs[i].stem().string();
        if (used.count(name) > 0) {
            const std::string base = name;
            for (size_t n = 2; used.count(name) > 0 || stems.count(name) > 0; ++n) {
                name = base + "_" + std::to_string(n);
            }
        }
        used.insert(name);
        paths[i] = output_dir / (name + ".json");
    }
    return paths;
}

WellRunResult analyzeWellFile(
    const std::filesystem::path& input,
    const BatchOptions& options,
    const std::filesystem::path& output
) {
    WellRunResult result;
    result.input = input;

    try {
        auto log = io::readWellLog(input);
        result.well_name = log.displayName();

        auto report = core::buildWellReport(log, options.config);
        result.reservoir_count = report.porosity.reservoirs.size();
        result.diagnostics = report.diagnostics;

        io::ReportWriteOptions write_options;
        write_options.include_curves = options.include_curves;

        if (options.output_dir.empty()) {
            result.report_json = io::reportToString(report, write_options);
        } else {
            result.output = output.empty()
                ? options.output_dir / (input.stem().string() + ".json")
                : output;
            io::writeReport(report, result.output, write_options);
        }
        result.ok = true;
    } catch (const model::PetroError& e) {
        result.error_kind = e.kind();
        result.error = e.what();
    } catch (const std::exception& e) {
        result.error = e.what();
    }

    return result;
}

BatchResult runBatch(const std::vector<std::filesystem::path>& inputs, const BatchOptions& options) {
    BatchResult batch;
    batch.wells.resize(inputs.size());

    const auto outputs = reportPaths(inputs, options.output_dir);
    const size_t jobs = effectiveJobs(options.jobs);
    std::deque<std::pair<size_t, std::future<WellRunResult>>> in_flight;

    auto collectOldest = [&]() {
        auto [index, future] = std::move(in_flight.front());
        in_flight.pop_front();
        batch.wells[index] = future.get();
    };

    for (size_t i = 0; i < inputs.size(); ++i) {
        if (in_flight.size() >= jobs) {
            collectOldest();
        }
        in_flight.emplace_back(i, std::async(std::launch::async,
            [&inputs, &outputs, &options, i]() {
                return analyzeWellFile(inputs[i], options, outputs[i]);
            }));
    }
    while (!in_flight.empty()) {
        collectOldest();
    }

    return batch;
}

} // namespace petrolog::app
