#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "StabilityScorer.h"

using namespace wfvalidator;
using Catch::Approx;

TEST_CASE("StabilityScorer: identical values give CV of zero", "[StabilityScorer]") {
    std::vector<double> winRates(6, 0.55);
    StabilitySignal signal = StabilityScorer::score(MetricType::WinRate, winRates);

    REQUIRE(signal.getStatus() == StabilityStatus::Computed);
    REQUIRE(signal.getNumObservations() == 6);
    REQUIRE(signal.getStandardDeviation() == 0.0);
    REQUIRE(signal.getCoefficientOfVariation().value() == 0.0);
    REQUIRE(signal.getReportedScore().value() == 0.0);
}

TEST_CASE("StabilityScorer: sample standard deviation over mean", "[StabilityScorer]") {
    StabilitySignal signal = StabilityScorer::score(MetricType::ProfitFactor,
                                                    std::vector<double>{1.2, 0.9, 1.5, 1.1});

    REQUIRE(signal.isComputed());
    REQUIRE(signal.getMean() == Approx(1.175));
    REQUIRE(signal.getStandardDeviation() == Approx(0.25));
    REQUIRE(signal.getCoefficientOfVariation().value() == Approx(0.21276595744680848));
    REQUIRE(signal.getReportedScore().value() == Approx(0.2128));
}

TEST_CASE("StabilityScorer: fewer than two windows", "[StabilityScorer]") {
    StabilitySignal one = StabilityScorer::score(MetricType::WinRate, std::vector<double>{0.5});
    REQUIRE(one.getStatus() == StabilityStatus::InsufficientWindows);
    REQUIRE_FALSE(one.getCoefficientOfVariation().has_value());
    REQUIRE_FALSE(one.getReportedScore().has_value());

    StabilitySignal none = StabilityScorer::score(MetricType::WinRate, std::vector<double>{});
    REQUIRE(none.getStatus() == StabilityStatus::InsufficientWindows);
    REQUIRE(none.getNumObservations() == 0);
}

TEST_CASE("StabilityScorer: zero mean is undefined", "[StabilityScorer]") {
    StabilitySignal signal = StabilityScorer::score(MetricType::AvgRMultiple,
                                                    std::vector<double>{-1.0, 1.0, -0.5, 0.5});
    REQUIRE(signal.getStatus() == StabilityStatus::ZeroMean);
    REQUIRE_FALSE(signal.getCoefficientOfVariation().has_value());
}

TEST_CASE("StabilityScorer: unbounded observations are dropped", "[StabilityScorer]") {
    std::vector<MetricValue> values = {MetricValue::finite(1.2), MetricValue::unbounded(),
                                       MetricValue::finite(1.2)};
    StabilitySignal signal = StabilityScorer::score(MetricType::ProfitFactor, values);
    REQUIRE(signal.getNumObservations() == 2);
    REQUIRE(signal.getCoefficientOfVariation().value() == 0.0);

    std::vector<MetricValue> mostlyUnbounded = {MetricValue::unbounded(), MetricValue::finite(1.1)};
    REQUIRE(StabilityScorer::score(MetricType::ProfitFactor, mostlyUnbounded).getStatus()
            == StabilityStatus::InsufficientWindows);
}

TEST_CASE("StabilityScorer: scoring is repeatable", "[StabilityScorer]") {
    std::vector<double> values = {0.31, 0.47, 0.52, 0.38, 0.44};
    REQUIRE(StabilityScorer::score(MetricType::WinRate, values)
            == StabilityScorer::score(MetricType::WinRate, values));
}
