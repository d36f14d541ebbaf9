/**
 * @file test_parameters.cpp
 * @brief Юнит-тесты проверки физических констант
 */

#include <doctest/doctest.h>
#include "model/errors.hpp"
#include "model/validation.hpp"
#include <cmath>
#include <limits>

using namespace petrolog::model;

TEST_CASE("Параметры по умолчанию допустимы") {
    ParameterSet params;
    auto result = validateParameters(params);
    CHECK(result.is_valid);
    CHECK_FALSE(result.hasErrors());
    CHECK_NOTHROW(requireValidParameters(params));
}

TEST_CASE("Значения вне диапазона не ограничиваются молча") {
    ParameterSet params;

    SUBCASE("Плотность матрицы") {
        params.matrix_density = 3.3;
        auto result = validateParameters(params);
        REQUIRE(result.hasErrors());
        CHECK(result.errors.front().field == "matrix_density");
    }

    SUBCASE("Rw = 0 исключено") {
        params.rw = 0.0;
        auto result = validateParameters(params);
        REQUIRE(result.hasErrors());
        CHECK(result.errors.front().field == "rw");
    }

    SUBCASE("Rw = 10 допустимо") {
        params.rw = 10.0;
        CHECK_FALSE(validateParameters(params).hasErrors());
    }

    SUBCASE("NaN") {
        params.archie_m = std::numeric_limits<double>::quiet_NaN();
        CHECK(validateParameters(params).hasErrors());
    }
}

TEST_CASE("Согласованность пар параметров") {
    ParameterSet params;

    SUBCASE("ρma <= ρf") {
        params.matrix_density = 2.0;
        params.fluid_density = 1.5;
        CHECK_FALSE(validateParameters(params).hasErrors());

        params.matrix_density = params.fluid_density;
        auto result = validateParameters(params);
        REQUIRE(result.hasErrors());
        CHECK(result.errors.front().field == "matrix_density");
    }

    SUBCASE("ГКглин <= ГКчист") {
        params.gr_clean = 100.0;
        params.gr_shale = 100.0;
        try {
            requireValidParameters(params);
            FAIL("ожидалось исключение");
        } catch (const InvalidParameterError& e) {
            CHECK(e.kind() == ErrorKind::InvalidParameter);
            CHECK(e.name() == "gr_shale");
        }
    }
}
