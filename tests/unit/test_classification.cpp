/**
 * @file test_classification.cpp
 * @brief Юнит-тесты оценки качества и ранжирования
 */

#include <doctest/doctest.h>
#include "core/classification.hpp"

using namespace petrolog::core;
using namespace petrolog::model;

namespace {

Interval makeInterval(double top, double bottom, double mean) {
    Interval interval;
    interval.top = Depth{top};
    interval.bottom = Depth{bottom};
    interval.thickness = Depth{bottom - top};
    interval.mean_value = mean;
    interval.point_count = 5;
    return interval;
}

} // namespace

TEST_CASE("Шкала пористости: границы относятся к верхнему классу") {
    CHECK(classifyPorosity(0.079) == QualityLabel::Poor);
    CHECK(classifyPorosity(0.08) == QualityLabel::Fair);
    CHECK(classifyPorosity(0.119) == QualityLabel::Fair);
    CHECK(classifyPorosity(0.12) == QualityLabel::Good);
    CHECK(classifyPorosity(0.179) == QualityLabel::Good);
    CHECK(classifyPorosity(0.18) == QualityLabel::Excellent);
}

TEST_CASE("Шкалы глинистости, зон высокой пористости и насыщенности") {
    CHECK(classifyShaleVolume(0.15) == QualityLabel::Excellent);
    CHECK(classifyShaleVolume(0.25) == QualityLabel::Good);
    CHECK(classifyShaleVolume(0.5) == QualityLabel::Fair);
    CHECK(classifyShaleVolume(0.51) == QualityLabel::Poor);

    CHECK(classifyHighPorosityZone(0.20) == QualityLabel::Exceptional);
    CHECK(classifyHighPorosityZone(0.16) == QualityLabel::Excellent);
    CHECK(classifyHighPorosityZone(0.12) == QualityLabel::VeryGood);
    CHECK(classifyHighPorosityZone(0.11) == QualityLabel::Good);

    CHECK(classifyWaterSaturation(0.3) == QualityLabel::Excellent);
    CHECK(classifyWaterSaturation(0.5) == QualityLabel::Good);
    CHECK(classifyWaterSaturation(0.7) == QualityLabel::Fair);
    CHECK(classifyWaterSaturation(0.9) == QualityLabel::Poor);

    CHECK(classify(PropertyKind::DensityPorosity, 0.13) == QualityLabel::Good);
    CHECK(classify(PropertyKind::ShaleVolume, 0.13) == QualityLabel::Excellent);
    CHECK(classify(PropertyKind::WaterSaturation, 0.6) == QualityLabel::Fair);
}

TEST_CASE("Ранжирование по φ × h") {
    IntervalList intervals{
        makeInterval(100.0, 104.0, 0.10),   // 0.4
        makeInterval(110.0, 120.0, 0.12),   // 1.2
        makeInterval(130.0, 135.0, 0.20)    // 1.0
    };

    rankIntervals(intervals, RankingScore::ValueTimesThickness);

    CHECK(intervals[0].top.value == doctest::Approx(110.0));
    CHECK(intervals[0].rank == 1);
    CHECK(intervals[0].isPrimaryTarget());
    CHECK(intervals[1].top.value == doctest::Approx(130.0));
    CHECK(intervals[1].rank == 2);
    CHECK(intervals[2].top.value == doctest::Approx(100.0));
    CHECK(intervals[2].rank == 3);
}

TEST_CASE("Равные показатели сохраняют порядок по глубине") {
    IntervalList intervals{
        makeInterval(100.0, 104.0, 0.15),
        makeInterval(110.0, 114.0, 0.15),
        makeInterval(120.0, 124.0, 0.20),
        makeInterval(130.0, 134.0, 0.15)
    };

    rankIntervals(intervals, RankingScore::MeanValue);

    REQUIRE(intervals.size() == 4);
    CHECK(intervals[0].top.value == doctest::Approx(120.0));
    CHECK(intervals[1].top.value == doctest::Approx(100.0));
    CHECK(intervals[2].top.value == doctest::Approx(110.0));
    CHECK(intervals[3].top.value == doctest::Approx(130.0));
    for (size_t i = 0; i < intervals.size(); ++i) {
        CHECK(intervals[i].rank == static_cast<int>(i) + 1);
    }
}

TEST_CASE("Ранжирование по эффективной толщине") {
    auto a = makeInterval(100.0, 110.0, 0.1);
    a.net_pay_potential = 9.0;
    auto b = makeInterval(120.0, 125.0, 0.1);   // без эффективной толщины
    auto c = makeInterval(130.0, 150.0, 0.2);
    c.net_pay_potential = 16.0;

    IntervalList intervals{a, b, c};
    rankIntervals(intervals, RankingScore::NetPayPotential);

    CHECK(intervals[0].top.value == doctest::Approx(130.0));
    CHECK(intervals[1].top.value == doctest::Approx(100.0));
    CHECK(intervals[2].top.value == doctest::Approx(120.0));
    CHECK(rankingScore(intervals[2], RankingScore::NetPayPotential) == doctest::Approx(0.0));
}

TEST_CASE("Оценка качества скважины") {
    CHECK(assessPorosityWellQuality(0.16, 3, 2) == QualityLabel::Excellent);
    CHECK(assessPorosityWellQuality(0.16, 2, 1) == QualityLabel::Good);
    CHECK(assessPorosityWellQuality(0.09, 1, 0) == QualityLabel::Fair);
    CHECK(assessPorosityWellQuality(0.09, 0, 0) == QualityLabel::Poor);

    CHECK(assessShaleWellQuality(0.15, 0.8, 3) == QualityLabel::Excellent);
    CHECK(assessShaleWellQuality(0.25, 0.6, 2) == QualityLabel::Good);
    CHECK(assessShaleWellQuality(0.45, 0.35, 0) == QualityLabel::Fair);
    CHECK(assessShaleWellQuality(0.6, 0.2, 0) == QualityLabel::Poor);
}

TEST_CASE("Литологический признак по плотностной и нейтронной пористости") {
    auto shaly = assessLithology(0.13, 0.20);
    CHECK(shaly.indicator == LithologyIndicator::ShalySandstone);

    auto carbonate = assessLithology(0.17, 0.10);
    CHECK(carbonate.indicator == LithologyIndicator::Carbonate);
    CHECK(carbonate.matrix_density == doctest::Approx(2.71));

    auto sandstone = assessLithology(0.10, 0.10);
    CHECK(sandstone.indicator == LithologyIndicator::Sandstone);
    CHECK(sandstone.matrix_density == doctest::Approx(2.65));
    CHECK(toString(LithologyIndicator::ShalySandstone) == "shaly_sandstone");
}
