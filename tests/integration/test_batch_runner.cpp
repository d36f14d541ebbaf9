/**
 * @file test_batch_runner.cpp
 * @brief Интеграционные тесты пакетного анализа
 */

#include <doctest/doctest.h>
#include "app/batch_runner.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace petrolog::app;
using namespace petrolog::model;

namespace {

std::filesystem::path fixturePath(const std::string& name) {
    return std::filesystem::path(PETROLOG_SOURCE_DIR) / "tests" / "fixtures" / name;
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

TEST_CASE("Пакетный анализ сохраняет порядок входных файлов") {
    std::vector<std::filesystem::path> inputs{
        fixturePath("sample_well.las"),
        fixturePath("missing.las"),
        fixturePath("sample_well.las")
    };

    BatchOptions options;
    options.jobs = 2;

    auto batch = runBatch(inputs, options);

    REQUIRE(batch.wells.size() == 3);
    CHECK(batch.wells[0].ok);
    CHECK_FALSE(batch.wells[1].ok);
    CHECK_FALSE(batch.wells[1].error.empty());
    CHECK(batch.wells[2].ok);
    CHECK(batch.failedCount() == 1);
    CHECK(batch.exitCode() == 1);

    CHECK(batch.wells[0].reservoir_count == 2);
    CHECK(batch.wells[0].report_json == batch.wells[2].report_json);

    auto report = nlohmann::json::parse(batch.wells[0].report_json);
    CHECK(report["well"] == "NORTH FIELD/SAMPLE-1");
}

TEST_CASE("Отчёты записываются в каталог") {
    auto dir = std::filesystem::temp_directory_path() / "petrolog_batch_test";
    std::filesystem::remove_all(dir);

    BatchOptions options;
    options.output_dir = dir;
    options.jobs = 1;

    auto result = analyzeWellFile(fixturePath("sample_well.las"), options);
    REQUIRE(result.ok);
    CHECK(result.output == dir / "sample_well.json");
    CHECK(std::filesystem::exists(result.output));
    CHECK(result.report_json.empty());

    std::filesystem::remove_all(dir);
}

TEST_CASE("Ошибка формата передаётся с видом ошибки") {
    auto dir = std::filesystem::temp_directory_path() / "petrolog_batch_bad";
    std::filesystem::create_directories(dir);
    auto bad = dir / "bad.las";
    {
        std::ofstream out(bad);
        out << "~V\n VERS. 2.0 :\n~C\n DEPT.M :\n GR.GAPI :\n~A\n100.0\n";
    }

    auto result = analyzeWellFile(bad, BatchOptions{});
    CHECK_FALSE(result.ok);
    REQUIRE(result.error_kind.has_value());
    CHECK(*result.error_kind == ErrorKind::MalformedInput);

    std::filesystem::remove_all(dir);

    CHECK(effectiveJobs(3) == 3);
    CHECK(effectiveJobs(0) >= 1);
}

TEST_CASE("Одноимённые файлы из разных каталогов дают разные отчёты") {
    auto dir = std::filesystem::temp_directory_path() / "petrolog_batch_same_stem";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir / "a");
    std::filesystem::create_directories(dir / "b");
    std::filesystem::copy_file(fixturePath("sample_well.las"), dir / "a" / "well.las");
    std::filesystem::copy_file(fixturePath("sample_well.las"), dir / "b" / "well.las");

    BatchOptions options;
    options.output_dir = dir / "out";
    options.jobs = 2;

    auto batch = runBatch({dir / "a" / "well.las", dir / "b" / "well.las"}, options);

    REQUIRE(batch.wells.size() == 2);
    CHECK(batch.wells[0].ok);
    CHECK(batch.wells[1].ok);
    CHECK(batch.wells[0].output == options.output_dir / "well.json");
    CHECK(batch.wells[1].output == options.output_dir / "well_2.json");
    CHECK(std::filesystem::exists(batch.wells[0].output));
    CHECK(std::filesystem::exists(batch.wells[1].output));

    size_t report_count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(options.output_dir)) {
        if (entry.path().extension() == ".json") ++report_count;
    }
    CHECK(report_count == 2);

    std::filesystem::remove_all(dir);
}

TEST_CASE("Суффикс не совпадает с именами других файлов набора") {
    std::filesystem::path out = "reports";
    auto paths = reportPaths({"a/well.las", "b/well.las", "c/well_2.las", "d/other.las"}, out);

    REQUIRE(paths.size() == 4);
    CHECK(paths[0] == out / "well.json");
    CHECK(paths[1] == out / "well_3.json");
    CHECK(paths[2] == out / "well_2.json");
    CHECK(paths[3] == out / "other.json");

    auto in_memory = reportPaths({"a/well.las", "b/well.las"}, {});
    CHECK(in_memory[0].empty());
    CHECK(in_memory[1].empty());
}

TEST_CASE("Скважина с именем в CP1251 анализируется") {
    auto dir = std::filesystem::temp_directory_path() / "petrolog_batch_cp1251";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    // Заменяем имя скважины на "Скв-1" в кодировке Windows-1251
    std::string text = readFile(fixturePath("sample_well.las"));
    const std::string well_line = "WELL.";
    auto pos = text.find(well_line);
    REQUIRE(pos != std::string::npos);
    auto colon = text.find(':', pos);
    REQUIRE(colon != std::string::npos);
    text.replace(pos, colon - pos, "WELL. \xD1\xEA\xE2-1 ");

    auto input = dir / "cp1251.las";
    {
        std::ofstream out(input, std::ios::binary);
        out << text;
    }

    auto result = analyzeWellFile(input, BatchOptions{});
    REQUIRE_MESSAGE(result.ok, result.error);
    CHECK(result.reservoir_count == 2);

    auto report = nlohmann::json::parse(result.report_json);
    CHECK(report["well"] == "NORTH FIELD/\u0421\u043A\u0432-1");

    std::filesystem::remove_all(dir);
}
