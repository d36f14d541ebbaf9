/**
 * @file test_import_las.cpp
 * @brief Интеграционные тесты импорта LAS
 */

#include <doctest/doctest.h>
#include "io/las_reader.hpp"
#include "model/errors.hpp"
#include <filesystem>
#include <fstream>

using namespace petrolog::io;
using namespace petrolog::model;

namespace {

std::filesystem::path fixturePath(const std::string& name) {
    return std::filesystem::path(PETROLOG_SOURCE_DIR) / "tests" / "fixtures" / name;
}

const char* kMinimalHeader =
    "~Version\n"
    " VERS. 2.0 : CWLS\n"
    " WRAP. NO  : ONE LINE PER DEPTH STEP\n"
    "~Well\n"
    " WELL. W-7 : WELL\n"
    " NULL. -9999 : NULL VALUE\n"
    "~Curve\n"
    " DEPT.M  : DEPTH\n"
    " GR.GAPI : GAMMA RAY\n"
    "~A\n";

} // namespace

TEST_CASE("sample_well.las импортируется целиком") {
    auto path = fixturePath("sample_well.las");
    REQUIRE(canReadLas(path));

    auto result = readLas(path);
    const auto& log = result.log;

    CHECK(result.version == "2.0");
    CHECK(log.well == "SAMPLE-1");
    CHECK(log.field == "NORTH FIELD");
    CHECK(log.displayName() == "NORTH FIELD/SAMPLE-1");
    CHECK(log.depth_unit == "M");
    CHECK(log.well_info.at("COMP") == "PETROLOG TEST");
    CHECK(log.well_info.at("STEP") == "0.5000");

    REQUIRE(log.size() == 61);
    CHECK(log.depth.front() == doctest::Approx(1500.0));
    CHECK(log.depth.back() == doctest::Approx(1530.0));

    REQUIRE(log.curves.size() == 4);
    CHECK(log.curves[0].mnemonic == "GR");
    CHECK(log.curves[1].mnemonic == "RHOB");
    CHECK(log.curves[1].unit == "G/C3");
    CHECK(log.curves[3].mnemonic == "ILD");

    // Провал плотностного метода на 1518.0 м
    const LogCurve* rhob = log.findCurve("RHOB");
    REQUIRE(rhob != nullptr);
    CHECK(rhob->validCount() == 60);
    CHECK(isNull(rhob->samples[36]));
}

TEST_CASE("Список кривых LAS") {
    auto curves = getLasCurves(fixturePath("sample_well.las"));
    REQUIRE(curves.size() == 5);
    CHECK(curves[0].mnemonic == "DEPT");
    CHECK(curves[2].description == "3  BULK DENSITY");
    CHECK(curves[4].column_index == 4);

    CHECK(getLasCurves(fixturePath("missing.las")).empty());
    CHECK_FALSE(canReadLas(fixturePath("analysis_config.json")));
}

TEST_CASE("NULL из заголовка заменяется стандартным пропуском") {
    std::string text = std::string(kMinimalHeader) +
        "100.0 50.0\n"
        "100.5 -9999\n"
        "101.0 60.0\n";

    auto result = parseLas(text, "fallback");
    CHECK(result.null_value == doctest::Approx(-9999.0));
    CHECK(result.log.well == "W-7");
    REQUIRE(result.log.curves.size() == 1);
    CHECK(result.log.curves[0].samples[1] == doctest::Approx(kNullValue));
    CHECK(result.log.curves[0].validCount() == 2);
}

TEST_CASE("Комментарии и пустые строки пропускаются, имя скважины по умолчанию") {
    std::string text =
        "# экспорт станции\n"
        "~V\n"
        " VERS. 2.0 :\n"
        "\n"
        "~C\n"
        " DEPTH.M :\n"
        " RHOB.G/C3 :\n"
        "~A\n"
        "# данные\n"
        "10.0 2.3\n"
        "11.0 2.4\n";

    auto result = parseLas(text, "from-file");
    CHECK(result.log.well == "from-file");
    CHECK(result.log.depth == DepthAxis{10.0, 11.0});
}

TEST_CASE("Ошибки формата LAS") {
    SUBCASE("Неверное число значений в строке данных") {
        std::string text = std::string(kMinimalHeader) +
            "100.0 50.0\n"
            "100.5\n";
        try {
            (void)parseLas(text);
            FAIL("ожидалось исключение");
        } catch (const MalformedInputError& e) {
            CHECK(e.kind() == ErrorKind::MalformedInput);
            CHECK(e.line() == 12);
        }
    }

    SUBCASE("Нечисловое значение") {
        std::string text = std::string(kMinimalHeader) + "100.0 abc\n";
        CHECK_THROWS_AS((void)parseLas(text), MalformedInputError);
    }

    SUBCASE("Перенос строк не поддерживается") {
        std::string text =
            "~V\n VERS. 2.0 :\n WRAP. YES :\n~C\n DEPT.M :\n~A\n100.0\n";
        try {
            (void)parseLas(text);
            FAIL("ожидалось исключение");
        } catch (const MalformedInputError& e) {
            CHECK(e.line() == 3);
        }
    }

    SUBCASE("Нет данных") {
        CHECK_THROWS_AS((void)parseLas(kMinimalHeader), MalformedInputError);
    }

    SUBCASE("Убывающая глубина") {
        std::string text = std::string(kMinimalHeader) + "101.0 50.0\n100.0 60.0\n";
        CHECK_THROWS_AS((void)parseLas(text), MalformedInputError);
    }

    SUBCASE("Файл не существует") {
        CHECK_THROWS_AS((void)readLas(fixturePath("missing.las")), std::runtime_error);
    }
}

TEST_CASE("Заголовок в CP1251 перекодируется в UTF-8") {
    // "Скв-1", "Восточное", "ГК" в кодировке Windows-1251
    std::string text =
        "~V\n"
        " VERS. 2.0 :\n"
        "~W\n"
        " WELL. \xD1\xEA\xE2-1 : \xD1\xEA\xE2\xE0\xE6\xE8\xED\xE0\n"
        " FLD.  \xC2\xEE\xF1\xF2\xEE\xF7\xED\xEE\xE5 :\n"
        "~C\n"
        " DEPT.M :\n"
        " GR.GAPI : \xC3\xCA\n"
        "~A\n"
        "100.0 50.0\n"
        "100.5 55.0\n";

    auto result = parseLas(text);
    CHECK(result.log.well == "Скв-1");
    CHECK(result.log.field == "Восточное");
    CHECK(result.log.well_info.at("WELL") == "Скв-1");
    REQUIRE(result.curves.size() == 2);
    CHECK(result.curves[1].description == "ГК");

    auto dir = std::filesystem::temp_directory_path() / "petrolog_las_cp1251";
    std::filesystem::create_directories(dir);
    auto path = dir / "cp1251.las";
    {
        std::ofstream out(path, std::ios::binary);
        out << text;
    }

    CHECK(canReadLas(path));
    auto curves = getLasCurves(path);
    REQUIRE(curves.size() == 2);
    CHECK(curves[1].mnemonic == "GR");
    CHECK(curves[1].description == "ГК");

    std::filesystem::remove_all(dir);
}
