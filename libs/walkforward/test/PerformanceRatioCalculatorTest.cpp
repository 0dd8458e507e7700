#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "TestUtils.h"
#include "PerformanceRatioCalculator.h"

using namespace wfvalidator;
using Catch::Approx;

TEST_CASE("PerformanceRatioCalculator: validate over train", "[PerformanceRatioCalculator]") {
    auto ratios = PerformanceRatioCalculator::calculate(createMetrics(0.60, 0.50, 2.0),
                                                        createMetrics(0.45, 0.25, 1.4));

    REQUIRE(ratios.getRatio(MetricType::WinRate).value() == Approx(0.75));
    REQUIRE(ratios.getRatio(MetricType::AvgRMultiple).value() == Approx(0.5));
    REQUIRE(ratios.getRatio(MetricType::ProfitFactor).value() == Approx(0.70));
}

TEST_CASE("PerformanceRatioCalculator: zero train value is not computable", "[PerformanceRatioCalculator]") {
    PerformanceRatios ratios;
    REQUIRE_NOTHROW(ratios = PerformanceRatioCalculator::calculate(createMetrics(0.0, 0.0, 0.0),
                                                                  createMetrics(0.5, 0.3, 1.2)));

    REQUIRE_FALSE(ratios.isComputable(MetricType::WinRate));
    REQUIRE_FALSE(ratios.isComputable(MetricType::AvgRMultiple));
    REQUIRE_FALSE(ratios.isComputable(MetricType::ProfitFactor));
    REQUIRE_FALSE(ratios.getRatio(MetricType::SharpeRatio).has_value());

    REQUIRE_FALSE(PerformanceRatioCalculator::calculateRatio(MetricValue::finite(0.0),
                                                             MetricValue::finite(0.0)).has_value());
}

TEST_CASE("PerformanceRatioCalculator: unbounded profit factor", "[PerformanceRatioCalculator]") {
    REQUIRE_FALSE(PerformanceRatioCalculator::calculateRatio(MetricValue::unbounded(),
                                                             MetricValue::finite(1.5)).has_value());
    REQUIRE_FALSE(PerformanceRatioCalculator::calculateRatio(MetricValue::finite(1.5),
                                                             MetricValue::unbounded()).has_value());

    auto ratios = PerformanceRatioCalculator::calculate(createMetricsWithUnboundedPF(0.8, 1.0),
                                                        createMetrics(0.4, 0.5, 1.1));
    REQUIRE_FALSE(ratios.isComputable(MetricType::ProfitFactor));
    REQUIRE(ratios.getRatio(MetricType::WinRate).value() == Approx(0.5));
}

TEST_CASE("PerformanceRatioCalculator: signed metrics", "[PerformanceRatioCalculator]") {
    auto ratio = PerformanceRatioCalculator::calculateRatio(MetricValue::finite(-0.5),
                                                            MetricValue::finite(0.25));
    REQUIRE(ratio.value() == Approx(-0.5));
}
