#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "TestUtils.h"
#include "MetricsBundle.h"
#include "WalkForwardException.h"
#include <sstream>

using namespace wfvalidator;
using Catch::Approx;

TEST_CASE("MetricValue: finite and unbounded", "[MetricValue]") {
    MetricValue finite = MetricValue::finite(1.75);
    MetricValue unbounded = MetricValue::unbounded();

    REQUIRE(finite.isFinite());
    REQUIRE_FALSE(finite.isUnbounded());
    REQUIRE(finite.getFiniteValue().value() == Approx(1.75));

    REQUIRE(unbounded.isUnbounded());
    REQUIRE_FALSE(unbounded.getFiniteValue().has_value());

    REQUIRE(finite != unbounded);
    REQUIRE(unbounded == MetricValue::unbounded());
    REQUIRE(MetricValue::finite(0.0) != unbounded);

    std::ostringstream os;
    os << unbounded;
    REQUIRE(os.str() == "unbounded");
}

TEST_CASE("MetricsBundle: construction and metric lookup", "[MetricsBundle]") {
    MetricsBundle bundle(0.55, 0.4, MetricValue::finite(1.8), 1.2, 0.15, 12.5, 40, 22, 18);

    REQUIRE(bundle.getWinRate() == Approx(0.55));
    REQUIRE(bundle.getAvgRMultiple() == Approx(0.4));
    REQUIRE(bundle.getProfitFactor() == MetricValue::finite(1.8));
    REQUIRE(bundle.getTotalTrades() == 40);
    REQUIRE(bundle.getWinningTrades() == 22);
    REQUIRE(bundle.getLosingTrades() == 18);

    REQUIRE(bundle.getMetric(MetricType::WinRate) == MetricValue::finite(0.55));
    REQUIRE(bundle.getMetric(MetricType::AvgRMultiple) == MetricValue::finite(0.4));
    REQUIRE(bundle.getMetric(MetricType::ProfitFactor) == MetricValue::finite(1.8));
    REQUIRE(bundle.getMetric(MetricType::SharpeRatio) == MetricValue::finite(1.2));
    REQUIRE(bundle.getMetric(MetricType::MaxDrawdown) == MetricValue::finite(0.15));
    REQUIRE(bundle.getMetric(MetricType::TotalReturn) == MetricValue::finite(12.5));
}

TEST_CASE("MetricsBundle: core constructor zeroes the optional metrics", "[MetricsBundle]") {
    MetricsBundle bundle = createMetrics(0.6, -0.2, 1.1);
    REQUIRE(bundle.getSharpeRatio() == 0.0);
    REQUIRE(bundle.getMaxDrawdown() == 0.0);
    REQUIRE(bundle.getTotalReturnPercent() == 0.0);
    REQUIRE(bundle.getTotalTrades() == 0);
    REQUIRE(bundle == createMetrics(0.6, -0.2, 1.1));
    REQUIRE(bundle != createMetrics(0.6, -0.2, 1.2));
}

TEST_CASE("MetricsBundle: rejects out of range values", "[MetricsBundle]") {
    REQUIRE_THROWS_AS(createMetrics(1.5, 0.0, 1.0), std::domain_error);
    REQUIRE_THROWS_AS(createMetrics(-0.1, 0.0, 1.0), std::domain_error);
    REQUIRE_THROWS_AS(createMetrics(0.5, 0.0, -1.0), std::domain_error);
    REQUIRE_THROWS_AS(MetricsBundle(0.5, 0.0, MetricValue::finite(1.0), 0.0, 1.5, 0.0, 0, 0, 0),
                      std::domain_error);
    REQUIRE_THROWS_AS(MetricsBundle(0.5, 0.0, MetricValue::finite(1.0), 0.0, 0.1, 0.0, 10, 8, 5),
                      std::domain_error);
}

TEST_CASE("MetricType names", "[MetricsBundle]") {
    for (MetricType metric : kAllMetricTypes)
        REQUIRE(parseMetricType(getMetricName(metric)) == metric);

    REQUIRE(getMetricName(MetricType::ProfitFactor) == "profit_factor");
    REQUIRE(getMetricName(MetricType::WinRate) == "win_rate");
    REQUIRE_THROWS_AS(parseMetricType("expectancy"), ConfigurationException);

    REQUIRE(isPrimaryMetricCandidate(MetricType::WinRate));
    REQUIRE(isPrimaryMetricCandidate(MetricType::AvgRMultiple));
    REQUIRE(isPrimaryMetricCandidate(MetricType::ProfitFactor));
    REQUIRE(isPrimaryMetricCandidate(MetricType::SharpeRatio));
    REQUIRE_FALSE(isPrimaryMetricCandidate(MetricType::MaxDrawdown));
    REQUIRE_FALSE(isPrimaryMetricCandidate(MetricType::TotalReturn));
}
