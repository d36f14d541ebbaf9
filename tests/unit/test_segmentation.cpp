/**
 * @file test_segmentation.cpp
 * @brief Юнит-тесты выделения интервалов
 */

#include <doctest/doctest.h>
#include "core/segmentation.hpp"
#include "model/errors.hpp"
#include <cmath>

using namespace petrolog::core;
using namespace petrolog::model;

namespace {

DepthAxis makeDepth(double start, size_t count, double step = 1.0) {
    DepthAxis depth;
    for (size_t i = 0; i < count; ++i) {
        depth.push_back(start + step * static_cast<double>(i));
    }
    return depth;
}

} // namespace

TEST_CASE("Интервал 102-108 по отсечке 0.08 на глубинах 100-110") {
    auto depth = makeDepth(100.0, 11);
    LogCurve phie{"PHIE", "V/V", {0.02, 0.05, 0.10, 0.12, 0.15, 0.11, 0.09, 0.13, 0.10, 0.04, 0.03}};

    auto intervals = segmentIntervals(depth, phie, SegmentationRule::reservoir(0.08));

    REQUIRE(intervals.size() == 1);
    const auto& interval = intervals.front();
    CHECK(interval.top.value == doctest::Approx(102.0));
    CHECK(interval.bottom.value == doctest::Approx(108.0));
    CHECK(interval.point_count == 7);
    CHECK(interval.thickness.value == doctest::Approx(6.0));
    CHECK(interval.mean_value == doctest::Approx(0.80 / 7.0));
    CHECK(interval.peak_value == doctest::Approx(0.15));
    CHECK(interval.rank == 0);

    double phi = interval.mean_value;
    REQUIRE(interval.permeability_md.has_value());
    CHECK(*interval.permeability_md == doctest::Approx(std::pow(phi, 3.0) / std::pow(1.0 - phi, 2.0) * 1000.0));
    REQUIRE(interval.net_to_gross.has_value());
    CHECK(*interval.net_to_gross == doctest::Approx(0.75));
    CHECK_FALSE(interval.mean_shale_volume.has_value());
    CHECK_FALSE(interval.net_pay_potential.has_value());
}

TEST_CASE("Пропуск данных закрывает интервал") {
    auto depth = makeDepth(100.0, 12);
    LogCurve phie{"PHIE", "V/V", {0.2, 0.2, 0.2, 0.2, 0.2, kNullValue, 0.2, 0.2, 0.2, 0.2, 0.2, 0.2}};

    auto intervals = segmentIntervals(depth, phie, SegmentationRule::reservoir(0.08));

    REQUIRE(intervals.size() == 2);
    CHECK(intervals[0].top.value == doctest::Approx(100.0));
    CHECK(intervals[0].bottom.value == doctest::Approx(104.0));
    CHECK(intervals[1].top.value == doctest::Approx(106.0));
    CHECK(intervals[1].bottom.value == doctest::Approx(111.0));
}

TEST_CASE("Интервал, открытый на последнем отсчёте, закрывается на последней глубине") {
    auto depth = makeDepth(100.0, 8);
    LogCurve phie{"PHIE", "V/V", {0.01, 0.01, 0.01, 0.2, 0.2, 0.2, 0.2, 0.2}};

    auto intervals = segmentIntervals(depth, phie, SegmentationRule::reservoir(0.08));
    REQUIRE(intervals.size() == 1);
    CHECK(intervals[0].top.value == doctest::Approx(103.0));
    CHECK(intervals[0].bottom.value == doctest::Approx(107.0));
    CHECK(intervals[0].point_count == 5);
}

TEST_CASE("Граничные условия по числу точек и мощности") {
    SUBCASE("Достаточно точек, но мощность не больше минимальной") {
        // 7 точек с шагом 0.5 → мощность 3.0, требуется > 3
        auto depth = makeDepth(100.0, 7, 0.5);
        LogCurve phie{"PHIE", "V/V", std::vector<double>(7, 0.2)};
        CHECK(segmentIntervals(depth, phie, SegmentationRule::reservoir()).empty());
    }

    SUBCASE("Достаточно мощности и точек") {
        auto depth = makeDepth(100.0, 9, 0.5);   // мощность 4.0
        LogCurve phie{"PHIE", "V/V", std::vector<double>(9, 0.2)};
        CHECK(segmentIntervals(depth, phie, SegmentationRule::reservoir()).size() == 1);
    }

    SUBCASE("Мощность достаточна, но точек не больше минимума") {
        auto depth = DepthAxis{100.0, 102.0, 104.0};   // 3 точки, мощность 4
        LogCurve phie{"PHIE", "V/V", std::vector<double>(3, 0.2)};
        CHECK(segmentIntervals(depth, phie, SegmentationRule::reservoir()).empty());
    }
}

TEST_CASE("Чистые песчаники: отсечка сверху и эффективная толщина") {
    auto depth = makeDepth(200.0, 8);
    LogCurve vsh{"VSH", "V/V", {0.6, 0.1, 0.2, 0.1, 0.2, 0.1, 0.5, 0.7}};
    LogCurve phie{"PHIE", "V/V", {0.05, 0.18, 0.16, kNullValue, 0.14, 0.12, 0.05, 0.04}};

    CompanionCurves companions;
    companions.porosity = &phie;
    auto intervals = segmentIntervals(depth, vsh, SegmentationRule::cleanSand(0.3),
                                      CurveRole::ShaleVolume, companions);

    REQUIRE(intervals.size() == 1);
    const auto& sand = intervals.front();
    CHECK(sand.top.value == doctest::Approx(201.0));
    CHECK(sand.bottom.value == doctest::Approx(205.0));
    CHECK(sand.mean_value == doctest::Approx(0.14));
    REQUIRE(sand.mean_shale_volume.has_value());
    CHECK(*sand.mean_shale_volume == doctest::Approx(0.14));
    REQUIRE(sand.net_pay_potential.has_value());
    CHECK(*sand.net_pay_potential == doctest::Approx(4.0 * 0.86));

    // Пористость по валидным отсчётам интервала: (0.18 + 0.16 + 0.14 + 0.12) / 4 = 0.15
    REQUIRE(sand.net_to_gross.has_value());
    CHECK(*sand.net_to_gross == doctest::Approx(0.9));
}

TEST_CASE("Интервалы не пересекаются, упорядочены и воспроизводимы") {
    auto depth = makeDepth(1000.0, 60, 0.5);
    LogCurve phie{"PHIE", "V/V", {}};
    for (size_t i = 0; i < depth.size(); ++i) {
        phie.samples.push_back((i / 10) % 2 == 0 ? 0.15 : 0.03);
    }

    auto first = segmentIntervals(depth, phie, SegmentationRule::highPorosity(0.12));
    auto second = segmentIntervals(depth, phie, SegmentationRule::highPorosity(0.12));

    REQUIRE(first.size() == 3);
    REQUIRE(first.size() == second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        CHECK(first[i].top == second[i].top);
        CHECK(first[i].bottom == second[i].bottom);
        CHECK(first[i].bottom > first[i].top);
        if (i > 0) {
            CHECK(first[i].top > first[i - 1].bottom);
        }
    }
}

TEST_CASE("Несовпадение длины кривой и оси глубин") {
    auto depth = makeDepth(100.0, 5);
    LogCurve phie{"PHIE", "V/V", {0.1, 0.1, 0.1}};
    CHECK_THROWS_AS((void)segmentIntervals(depth, phie, SegmentationRule::reservoir()), MalformedInputError);
}

TEST_CASE("Оценки проницаемости и доли коллектора") {
    CHECK(estimatePermeability(0.2) == doctest::Approx(0.008 / 0.64 * 1000.0));
    CHECK(estimatePermeability(0.0) == doctest::Approx(0.0));

    CHECK(netToGrossFromPorosity(0.20) == doctest::Approx(0.9));
    CHECK(netToGrossFromPorosity(0.15) == doctest::Approx(0.9));
    CHECK(netToGrossFromPorosity(0.10) == doctest::Approx(0.75));
    CHECK(netToGrossFromPorosity(0.06) == doctest::Approx(0.6));
    CHECK(netToGrossFromPorosity(0.05) == doctest::Approx(0.4));
}
