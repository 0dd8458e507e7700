#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "TestUtils.h"
#include "SummaryAggregator.h"
#include "WalkForwardException.h"
#include <boost/uuid/nil_generator.hpp>

using namespace wfvalidator;
using Catch::Approx;

namespace
{
  std::vector<WindowResult> createMixedResults()
  {
    return {
      createScoredResult(0, createMetrics(0.60, 0.50, 2.0), createMetrics(0.50, 0.30, 1.4)),
      createScoredResult(1, createMetrics(0.55, 0.40, 1.6), createMetrics(0.55, 0.45, 1.6)),
      createFailedResult(2, WindowFailureKind::BacktestError),
      createScoredResult(3, createMetrics(0.50, 0.20, 1.2), createMetricsWithUnboundedPF(0.70, 0.60)),
      createScoredResult(4, createMetrics(0.65, 0.60, 1.8), createMetrics(0.40, 0.10, 1.0))
    };
  }

  WalkForwardConfig createTestConfig()
  {
    return createConfig("20200101", "20211001", 6, 3);
  }
}

TEST_CASE("SummaryAggregator: validate metric summaries", "[SummaryAggregator]") {
    SummaryStatistics summary = SummaryAggregator::summarize(createMixedResults());

    REQUIRE(summary.getNumWindows() == 5);
    REQUIRE(summary.getNumScoredWindows() == 4);
    REQUIRE(summary.getNumFailedWindows() == 1);

    MetricSummary winRate = summary.getValidateSummary(MetricType::WinRate);
    REQUIRE(winRate.numObservations == 4);
    REQUIRE(winRate.numUnbounded == 0);
    REQUIRE(winRate.mean.value() == Approx(0.5375));
    REQUIRE(winRate.median.value() == Approx(0.525));
    REQUIRE(winRate.min.value() == Approx(0.40));
    REQUIRE(winRate.max.value() == Approx(0.70));

    MetricSummary profitFactor = summary.getValidateSummary(MetricType::ProfitFactor);
    REQUIRE(profitFactor.numObservations == 3);
    REQUIRE(profitFactor.numUnbounded == 1);
    REQUIRE(profitFactor.mean.value() == Approx(4.0 / 3.0));
    REQUIRE(profitFactor.median.value() == Approx(1.4));
}

TEST_CASE("SummaryAggregator: average ratio skips non-computable ratios", "[SummaryAggregator]") {
    SummaryStatistics summary = SummaryAggregator::summarize(createMixedResults());

    RatioSummary pf = summary.getRatioSummary(MetricType::ProfitFactor);
    REQUIRE(pf.numComputable == 3);
    REQUIRE(pf.numNotComputable == 1);
    REQUIRE(pf.averageRatio.value() == Approx((0.7 + 1.0 + 1.0 / 1.8) / 3.0));

    // The core constructor leaves Sharpe at zero, so no ratio is computable
    RatioSummary sharpe = summary.getRatioSummary(MetricType::SharpeRatio);
    REQUIRE(sharpe.numComputable == 0);
    REQUIRE_FALSE(sharpe.averageRatio.has_value());
    REQUIRE_FALSE(summary.getAveragePerformanceRatio(MetricType::SharpeRatio).has_value());
}

TEST_CASE("SummaryAggregator: re-aggregation is idempotent", "[SummaryAggregator]") {
    const auto results = createMixedResults();

    SummaryStatistics first = SummaryAggregator::summarize(results);
    SummaryStatistics second = SummaryAggregator::summarize(results);
    REQUIRE(first == second);

    auto runId = boost::uuids::nil_uuid();
    WalkForwardResult a = SummaryAggregator::aggregate(runId, createTestConfig(), results, false,
                                                       WalkForwardResult::Seconds(1.0));
    WalkForwardResult b = SummaryAggregator::aggregate(runId, createTestConfig(), results, false,
                                                       WalkForwardResult::Seconds(1.0));

    REQUIRE(a.getSummaryStatistics() == b.getSummaryStatistics());
    REQUIRE(a.getStabilitySignals() == b.getStabilitySignals());
    REQUIRE(a.getSignificanceSignal() == b.getSignificanceSignal());
    REQUIRE(a.getDegradationReport() == b.getDegradationReport());
}

TEST_CASE("SummaryAggregator: result contents", "[SummaryAggregator]") {
    const auto results = createMixedResults();
    WalkForwardResult result = SummaryAggregator::aggregate(boost::uuids::nil_uuid(), createTestConfig(),
                                                            results, false, WalkForwardResult::Seconds(2.0));

    REQUIRE(result.getNumWindows() == 5);
    REQUIRE(result.getOutcome() == RunOutcome::CompletedWithFailures);
    REQUIRE_FALSE(result.wasCancelled());

    // Degradation on profit factor: windows 0 (0.70) and 4 (0.5556) of 3 evaluated
    REQUIRE(result.getDegradationCount() == 2);
    REQUIRE(result.getDegradationReport().getNumEvaluatedWindows() == 3);
    REQUIRE(result.getDegradationPercentage().value() == Approx(200.0 / 3.0));

    // Headline stability uses the primary metric with the unbounded window dropped
    REQUIRE(result.getStabilitySignal().getMetric() == MetricType::ProfitFactor);
    REQUIRE(result.getStabilitySignal().getNumObservations() == 3);
    REQUIRE(result.getStabilitySignal(MetricType::WinRate).getNumObservations() == 4);

    const SignificanceSignal& significance = result.getSignificanceSignal();
    REQUIRE(significance.getNumResults() == kAllMetricTypes.size());
    REQUIRE(significance.getResult(MetricType::WinRate).getNumPairs() == 4);
    REQUIRE(significance.getResult(MetricType::ProfitFactor).getNumPairs() == 3);

    REQUIRE(result.getTotalExecutionTime().count() == Approx(2.0));
    REQUIRE(result.getAverageWindowExecutionTime().count() == Approx((4 * 0.25 + 0.5) / 5.0));
}

TEST_CASE("SummaryAggregator: outcome reflects failures and cancellation", "[SummaryAggregator]") {
    std::vector<WindowResult> clean = {
      createScoredResult(0, createMetrics(0.6, 0.5, 2.0), createMetrics(0.6, 0.5, 2.0)),
      createScoredResult(1, createMetrics(0.6, 0.5, 2.0), createMetrics(0.6, 0.5, 2.0))
    };
    REQUIRE(SummaryAggregator::aggregate(boost::uuids::nil_uuid(), createTestConfig(), clean, false,
                                         WalkForwardResult::Seconds(0.0)).getOutcome()
            == RunOutcome::Clean);

    std::vector<WindowResult> cancelled = {
      clean.front(),
      createFailedResult(1, WindowFailureKind::Cancelled)
    };
    WalkForwardResult result = SummaryAggregator::aggregate(boost::uuids::nil_uuid(), createTestConfig(),
                                                            cancelled, true, WalkForwardResult::Seconds(0.0));
    REQUIRE(result.getOutcome() == RunOutcome::Cancelled);
    REQUIRE(result.wasCancelled());
    REQUIRE(result.getSummaryStatistics().getNumScoredWindows() == 1);
}

TEST_CASE("SummaryAggregator: all windows failed", "[SummaryAggregator]") {
    std::vector<WindowResult> results = {
      createFailedResult(0, WindowFailureKind::BacktestError),
      createFailedResult(1, WindowFailureKind::Timeout)
    };

    REQUIRE_THROWS_AS(SummaryAggregator::aggregate(boost::uuids::nil_uuid(), createTestConfig(), results,
                                                   false, WalkForwardResult::Seconds(0.0)),
                      AllWindowsFailedException);

    try {
        SummaryAggregator::aggregate(boost::uuids::nil_uuid(), createTestConfig(), results, false,
                                     WalkForwardResult::Seconds(0.0));
    }
    catch (const AllWindowsFailedException& e) {
        REQUIRE(e.getNumWindows() == 2);
    }
}

TEST_CASE("SummaryAggregator: empty metric series", "[SummaryAggregator]") {
    MetricSummary summary = SummaryAggregator::summarizeMetric({MetricValue::unbounded()});
    REQUIRE(summary.numObservations == 0);
    REQUIRE(summary.numUnbounded == 1);
    REQUIRE_FALSE(summary.mean.has_value());
    REQUIRE_FALSE(summary.median.has_value());
}
