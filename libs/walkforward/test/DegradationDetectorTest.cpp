#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "TestUtils.h"
#include "DegradationDetector.h"

using namespace wfvalidator;
using Catch::Approx;

TEST_CASE("DegradationDetector: strict comparison against the threshold", "[DegradationDetector]") {
    REQUIRE(DegradationDetector::evaluate(0.80, 0.80) == DegradationStatus::Healthy);
    REQUIRE(DegradationDetector::evaluate(0.79, 0.80) == DegradationStatus::Degraded);
    REQUIRE(DegradationDetector::evaluate(1.25, 0.80) == DegradationStatus::Healthy);
    REQUIRE(DegradationDetector::evaluate(std::nullopt, 0.80) == DegradationStatus::NotEvaluated);
}

TEST_CASE("DegradationDetector: compares at four decimal digits", "[DegradationDetector]") {
    REQUIRE(DegradationDetector::evaluate(0.79996, 0.80) == DegradationStatus::Healthy);
    REQUIRE(DegradationDetector::evaluate(0.79994, 0.80) == DegradationStatus::Degraded);
}

TEST_CASE("DegradationDetector: profit factor 2.0 to 1.4 is degraded", "[DegradationDetector]") {
    WindowResult result = createScoredResult(0, createMetrics(0.6, 0.5, 2.0), createMetrics(0.6, 0.5, 1.4));

    REQUIRE(result.getPerformanceRatio(MetricType::ProfitFactor).value() == Approx(0.70));
    REQUIRE(result.isDegraded());

    DegradationReport report = DegradationDetector::detect({result}, MetricType::ProfitFactor, 0.80);
    REQUIRE(report.getDegradationCount() == 1);
    REQUIRE(report.getDegradedWindowIndices() == std::vector<unsigned int>{0});
    REQUIRE(report.getDegradationPercentage().value() == Approx(100.0));
}

TEST_CASE("DegradationDetector: failed and non-computable windows leave the denominator", "[DegradationDetector]") {
    std::vector<WindowResult> results = {
        createScoredResult(0, createMetrics(0.6, 0.5, 2.0), createMetrics(0.6, 0.5, 1.0)),
        createScoredResult(1, createMetrics(0.6, 0.5, 2.0), createMetrics(0.6, 0.5, 2.2)),
        createFailedResult(2, WindowFailureKind::Timeout),
        createScoredResult(3, createMetrics(0.6, 0.5, 1.5), createMetrics(0.6, 0.5, 1.5)),
        createScoredResult(4, createMetrics(0.6, 0.5, 0.0), createMetrics(0.6, 0.5, 1.0)),
        createScoredResult(5, createMetricsWithUnboundedPF(0.9, 1.0), createMetrics(0.6, 0.5, 1.0))
    };

    DegradationReport report = DegradationDetector::detect(results, MetricType::ProfitFactor, 0.80);

    REQUIRE(report.getNumEvaluatedWindows() == 3);
    REQUIRE(report.getDegradationCount() == 1);
    REQUIRE(report.getDegradedWindowIndices() == std::vector<unsigned int>{0});
    REQUIRE(report.getDegradationRate().value() == Approx(1.0 / 3.0));
}

TEST_CASE("DegradationDetector: nothing evaluated", "[DegradationDetector]") {
    std::vector<WindowResult> results = {createFailedResult(0, WindowFailureKind::BacktestError)};
    DegradationReport report = DegradationDetector::detect(results, MetricType::ProfitFactor, 0.80);

    REQUIRE(report.getDegradationCount() == 0);
    REQUIRE_FALSE(report.getDegradationRate().has_value());
    REQUIRE_FALSE(report.getDegradationPercentage().has_value());
}

TEST_CASE("DegradationDetector: primary metric selects the ratio", "[DegradationDetector]") {
    std::vector<WindowResult> results = {
        createScoredResult(0, createMetrics(0.60, 0.5, 2.0), createMetrics(0.30, 0.5, 2.0))
    };

    REQUIRE(DegradationDetector::detect(results, MetricType::ProfitFactor, 0.80).getDegradationCount() == 0);
    REQUIRE(DegradationDetector::detect(results, MetricType::WinRate, 0.80).getDegradationCount() == 1);
}

TEST_CASE("WindowResult: failed windows carry no metrics", "[WindowResult]") {
    WindowResult failed = createFailedResult(1, WindowFailureKind::BacktestError);

    REQUIRE(failed.isFailed());
    REQUIRE(failed.getState() == WindowState::Failed);
    REQUIRE(failed.getFailureKind() == WindowFailureKind::BacktestError);
    REQUIRE(failed.getFailureReason() == "window 2 failed");
    REQUIRE(failed.getDegradationStatus() == DegradationStatus::NotEvaluated);
    REQUIRE_THROWS_AS(failed.getTrainMetrics(), std::domain_error);
    REQUIRE_THROWS_AS(failed.getValidateMetrics(), std::domain_error);

    REQUIRE_THROWS_AS(WindowResult::failed(createWindow(0), WindowFailureKind::None, "",
                                           WindowResult::Seconds(0.0)),
                      std::invalid_argument);
}

TEST_CASE("WindowResult: state names", "[WindowResult]") {
    REQUIRE(getWindowStateName(WindowState::Pending) == "PENDING");
    REQUIRE(getWindowStateName(WindowState::Scored) == "SCORED");
    REQUIRE(getWindowStateName(WindowState::Failed) == "FAILED");
    REQUIRE_FALSE(isTerminalState(WindowState::TrainRunning));
    REQUIRE_FALSE(isTerminalState(WindowState::ValidateRunning));
    REQUIRE(isTerminalState(WindowState::Scored));
    REQUIRE(isTerminalState(WindowState::Failed));
}
