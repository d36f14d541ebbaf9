/**
 * @file test_shale_volume.cpp
 * @brief Юнит-тесты расчёта глинистости
 */

#include <doctest/doctest.h>
#include "core/shale_volume.hpp"
#include "model/errors.hpp"
#include <cmath>

using namespace petrolog::core;
using namespace petrolog::model;

TEST_CASE("Индекс гамма-активности") {
    CHECK(gammaRayIndex(75.0, 30.0, 120.0) == doctest::Approx(0.5));
    CHECK(gammaRayIndex(10.0, 30.0, 120.0) == doctest::Approx(0.0));
    CHECK(gammaRayIndex(200.0, 30.0, 120.0) == doctest::Approx(1.0));
    CHECK(isNull(gammaRayIndex(kNullValue, 30.0, 120.0)));
}

TEST_CASE("Ларионов (третичные): ГК=75 при линиях 30/120") {
    double vsh = shaleVolume(75.0, 30.0, 120.0, ShaleVolumeMethod::LarionovTertiary);
    CHECK(vsh == doctest::Approx(0.083 * (std::pow(2.0, 1.85) - 1.0)));
    CHECK(vsh == doctest::Approx(0.2154).epsilon(0.01));
}

TEST_CASE("Методы пересчёта IGR в глинистость") {
    CHECK(shaleVolumeFromIndex(0.5, ShaleVolumeMethod::LarionovPreTertiary) == doctest::Approx(0.33));
    CHECK(shaleVolumeFromIndex(0.5, ShaleVolumeMethod::Clavier)
          == doctest::Approx(1.7 - std::sqrt(3.38 - 1.44)));
    CHECK(shaleVolumeFromIndex(0.5, ShaleVolumeMethod::Linear) == doctest::Approx(0.5));

    for (auto method : {ShaleVolumeMethod::LarionovTertiary, ShaleVolumeMethod::LarionovPreTertiary,
                        ShaleVolumeMethod::Clavier, ShaleVolumeMethod::Linear}) {
        CHECK(shaleVolumeFromIndex(0.0, method) == doctest::Approx(0.0).epsilon(0.01));
        double full = shaleVolumeFromIndex(1.0, method);
        CHECK(full >= 0.0);
        CHECK(full <= 1.0);
        CHECK(isNull(shaleVolumeFromIndex(kNullValue, method)));
    }
}

TEST_CASE("Оценка линий ГК по данным") {
    LogCurve gr{"GR", "GAPI", {}};
    for (int i = 0; i < 20; ++i) {
        gr.samples.push_back(20.0 + 5.0 * i);   // 20..115
    }
    gr.samples.push_back(kNullValue);

    auto baselines = estimateGammaRayBaselines(gr);
    CHECK(baselines.estimated);
    CHECK(baselines.gr_clean == doctest::Approx(20.0));
    // floor(0.95 * 20) = 19 → 115
    CHECK(baselines.gr_shale == doctest::Approx(115.0));
}

TEST_CASE("Оценка линий ГК: мало данных или вырожденная выборка") {
    SUBCASE("Меньше 10 валидных отсчётов") {
        LogCurve gr{"GR", "GAPI", {30, 40, 50, kNullValue, 60, 70, 80, 90, 100, kNullValue}};
        try {
            (void)estimateGammaRayBaselines(gr);
            FAIL("ожидалось исключение");
        } catch (const InsufficientDataError& e) {
            CHECK(e.required() == kMinBaselineSamples);
            CHECK(e.available() == 8);
        }
    }

    SUBCASE("Постоянный ГК - используются заданные линии") {
        LogCurve gr{"GR", "GAPI", std::vector<double>(15, 60.0)};
        ParameterSet params;
        auto baselines = estimateGammaRayBaselines(gr, params);
        CHECK_FALSE(baselines.estimated);
        CHECK(baselines.gr_clean == doctest::Approx(params.gr_clean));
        CHECK(baselines.gr_shale == doctest::Approx(params.gr_shale));
    }
}

TEST_CASE("Кривая глинистости сохраняет пропуски") {
    LogCurve gr{"GR", "GAPI", {30.0, kNullValue, 75.0, 120.0}};
    auto vsh = calculateShaleVolume(gr);

    CHECK(vsh.mnemonic == "VSH");
    REQUIRE(vsh.size() == 4);
    CHECK(vsh.samples[0] == doctest::Approx(0.0));
    CHECK(isNull(vsh.samples[1]));
    CHECK(vsh.samples[3] == doctest::Approx(0.083 * (std::pow(2.0, 3.7) - 1.0)));

    ParameterSet bad;
    bad.gr_shale = 20.0;   // ГКглин < ГКчист
    CHECK_THROWS_AS((void)calculateShaleVolume(gr, bad), InvalidParameterError);
}
