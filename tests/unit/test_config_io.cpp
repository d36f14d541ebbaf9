/**
 * @file test_config_io.cpp
 * @brief Юнит-тесты загрузки конфигурации анализа
 */

#include <doctest/doctest.h>
#include "io/config_io.hpp"
#include "model/errors.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>

using namespace petrolog::io;
using namespace petrolog::model;

namespace {

std::filesystem::path fixturePath(const std::string& name) {
    return std::filesystem::path(PETROLOG_SOURCE_DIR) / "tests" / "fixtures" / name;
}

} // namespace

TEST_CASE("Пустой объект даёт значения по умолчанию") {
    auto config = parseAnalysisConfig("{}");

    CHECK(config.parameters.matrix_density == doctest::Approx(2.65));
    CHECK(config.porosity.blend == PorosityBlend::Geometric);
    CHECK(config.porosity.lithology == Lithology::Sandstone);
    CHECK_FALSE(config.porosity.shale_correction);
    CHECK(config.porosity.reservoir.cutoff == doctest::Approx(0.08));
    CHECK(config.porosity.reservoir.min_points == 3);
    CHECK(config.porosity.high_porosity.cutoff == doctest::Approx(0.12));
    CHECK(config.shale.method == ShaleVolumeMethod::LarionovTertiary);
    CHECK(config.shale.auto_baselines);
    CHECK(config.shale.clean_sand.cutoff == doctest::Approx(0.3));
    CHECK(config.saturation.method == SaturationMethod::Archie);
    CHECK(config.permeability.method == PermeabilityMethod::KozenyCarman);
    CHECK(config.permeability.grain_size_um == doctest::Approx(100.0));
    CHECK(config.net_pay.vsh_max == doctest::Approx(0.5));
    CHECK(config.net_pay.porosity_min == doctest::Approx(0.08));
    CHECK(config.net_pay.sw_max == doctest::Approx(0.6));
    CHECK(config.quality_control.outlier_method == OutlierMethod::ZScore);
    CHECK(config.quality_control.z_score_threshold == doctest::Approx(3.0));
    CHECK_FALSE(config.depth_range.has_value());
}

TEST_CASE("Файл конфигурации из fixtures") {
    auto config = loadAnalysisConfig(fixturePath("analysis_config.json"));

    CHECK(config.parameters.matrix_density == doctest::Approx(2.71));
    CHECK(config.parameters.rw == doctest::Approx(0.05));
    CHECK(config.porosity.blend == PorosityBlend::Arithmetic);
    CHECK(config.porosity.lithology == Lithology::Limestone);
    CHECK(config.porosity.shale_correction);
    CHECK(config.porosity.reservoir.cutoff == doctest::Approx(0.1));
    CHECK(config.porosity.reservoir.min_thickness.value == doctest::Approx(2.0));
    CHECK(config.porosity.high_porosity.cutoff == doctest::Approx(0.15));
    CHECK(config.shale.method == ShaleVolumeMethod::Clavier);
    CHECK_FALSE(config.shale.auto_baselines);
    CHECK(config.saturation.method == SaturationMethod::WaxmanSmits);
    CHECK(config.permeability.method == PermeabilityMethod::Timur);
    CHECK(config.permeability.swi == doctest::Approx(0.25));
    CHECK(config.net_pay.vsh_max == doctest::Approx(0.4));
    CHECK(config.net_pay.sw_max == doctest::Approx(0.5));
    CHECK(config.quality_control.outlier_method == OutlierMethod::Iqr);
    CHECK(config.quality_control.iqr_multiplier == doctest::Approx(3.0));
    REQUIRE(config.depth_range.has_value());
    CHECK(config.depth_range->top.value == doctest::Approx(1500.0));
    CHECK(config.depth_range->bottom.value == doctest::Approx(1520.0));
}

TEST_CASE("Синонимы способов объединения") {
    CHECK(parseAnalysisConfig(R"({"porosity": {"blend": "wyllie"}})").porosity.blend == PorosityBlend::Rms);
    CHECK(parseAnalysisConfig(R"({"porosity": {"blend": "average"}})").porosity.blend == PorosityBlend::Arithmetic);
    CHECK(parseAnalysisConfig(R"({"porosity": {"lithology": "carbonate"}})").porosity.lithology
          == Lithology::Limestone);
}

TEST_CASE("Ошибки конфигурации") {
    SUBCASE("Неизвестный метод глинистости") {
        try {
            (void)parseAnalysisConfig(R"({"shale": {"method": "steiber"}})");
            FAIL("ожидалось исключение");
        } catch (const InvalidParameterError& e) {
            CHECK(e.name() == "shale.method");
        }
    }

    SUBCASE("Параметр вне диапазона") {
        CHECK_THROWS_AS((void)parseAnalysisConfig(R"({"parameters": {"archie_m": 5.0}})"),
                        InvalidParameterError);
    }

    SUBCASE("Неверный тип значения") {
        CHECK_THROWS_AS((void)parseAnalysisConfig(R"({"parameters": {"rw": "0.1"}})"),
                        InvalidParameterError);
    }

    SUBCASE("Отсечка вне [0, 1]") {
        CHECK_THROWS_AS((void)parseAnalysisConfig(R"({"porosity": {"cutoff": 1.5}})"),
                        InvalidParameterError);
    }

    SUBCASE("Диапазон глубин перевёрнут") {
        CHECK_THROWS_AS((void)parseAnalysisConfig(R"({"depth_range": {"top": 2000, "bottom": 1000}})"),
                        InvalidParameterError);
    }

    SUBCASE("Неизвестный метод проницаемости") {
        try {
            (void)parseAnalysisConfig(R"({"permeability": {"method": "wyllie_rose"}})");
            FAIL("ожидалось исключение");
        } catch (const InvalidParameterError& e) {
            CHECK(e.name() == "permeability.method");
        }
    }

    SUBCASE("Остаточная водонасыщенность вне (0, 1)") {
        CHECK_THROWS_AS((void)parseAnalysisConfig(R"({"permeability": {"swi": 1.0}})"),
                        InvalidParameterError);
    }

    SUBCASE("Отсечка эффективных толщин вне [0, 1]") {
        try {
            (void)parseAnalysisConfig(R"({"net_pay": {"sw_max": 1.2}})");
            FAIL("ожидалось исключение");
        } catch (const InvalidParameterError& e) {
            CHECK(e.name() == "net_pay.sw_max");
        }
    }

    SUBCASE("Перевёрнутый диапазон плотности") {
        CHECK_THROWS_AS((void)parseAnalysisConfig(
            R"({"quality_control": {"density_min": 3.0, "density_max": 2.0}})"), InvalidParameterError);
    }

    SUBCASE("Некорректный JSON") {
        CHECK_THROWS_AS((void)parseAnalysisConfig("{ parameters: "), MalformedInputError);
    }
}

TEST_CASE("Конфигурация переживает запись в JSON и обратно") {
    auto original = loadAnalysisConfig(fixturePath("analysis_config.json"));
    auto restored = configFromJson(configToJson(original));

    CHECK(restored.parameters.matrix_density == doctest::Approx(original.parameters.matrix_density));
    CHECK(restored.porosity.blend == original.porosity.blend);
    CHECK(restored.porosity.high_porosity.min_points == original.porosity.high_porosity.min_points);
    CHECK(restored.shale.method == original.shale.method);
    CHECK(restored.saturation.method == original.saturation.method);
    CHECK(restored.permeability.method == original.permeability.method);
    CHECK(restored.net_pay.porosity_min == doctest::Approx(original.net_pay.porosity_min));
    CHECK(restored.quality_control.outlier_method == original.quality_control.outlier_method);
    CHECK(restored.shale.auto_baselines == original.shale.auto_baselines);
    REQUIRE(restored.depth_range.has_value());
    CHECK(restored.depth_range->bottom == original.depth_range->bottom);
}

TEST_CASE("Заданные линии ГК отключают их оценку по данным") {
    SUBCASE("Обе линии заданы") {
        auto config = parseAnalysisConfig(R"({"parameters": {"gr_clean": 50, "gr_shale": 150}})");
        CHECK_FALSE(config.shale.auto_baselines);
        CHECK(config.parameters.gr_clean == doctest::Approx(50.0));
        CHECK(config.parameters.gr_shale == doctest::Approx(150.0));
    }

    SUBCASE("Задана одна линия") {
        auto config = parseAnalysisConfig(R"({"parameters": {"gr_shale": 150}})");
        CHECK_FALSE(config.shale.auto_baselines);
    }

    SUBCASE("Явный auto_baselines сохраняется") {
        auto config = parseAnalysisConfig(
            R"({"parameters": {"gr_clean": 50, "gr_shale": 150}, "shale": {"auto_baselines": true}})");
        CHECK(config.shale.auto_baselines);
    }

    SUBCASE("Без линий ГК оценка включена") {
        auto config = parseAnalysisConfig(R"({"parameters": {"rw": 0.08}})");
        CHECK(config.shale.auto_baselines);
    }
}
