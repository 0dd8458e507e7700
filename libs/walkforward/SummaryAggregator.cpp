// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "SummaryAggregator.h"
#include <algorithm>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include "DegradationDetector.h"
#include "WalkForwardException.h"

namespace wfvalidator
{
  using boost::accumulators::accumulator_set;
  using boost::accumulators::stats;

  typedef boost::accumulators::tag::count count_tag;
  typedef boost::accumulators::tag::mean mean_tag;
  typedef boost::accumulators::tag::min min_tag;
  typedef boost::accumulators::tag::max max_tag;

  static std::vector<MetricValue> validateSeries(const std::vector<WindowResult>& windowResults,
						 MetricType metric)
  {
    std::vector<MetricValue> series;
    for (const auto& result : windowResults)
      {
	if (result.isScored())
	  series.push_back(result.getValidateMetrics().getMetric(metric));
      }

    return series;
  }

  // Sorted-copy median; exact for the handful of windows a run produces
  static double medianOf(std::vector<double> values)
  {
    std::sort(values.begin(), values.end());
    const std::size_t n = values.size();
    if (n % 2 == 0)
      return (values[n / 2 - 1] + values[n / 2]) / 2.0;

    return values[n / 2];
  }

  MetricSummary SummaryAggregator::summarizeMetric(const std::vector<MetricValue>& values)
  {
    MetricSummary summary;
    accumulator_set<double, stats<count_tag, mean_tag, min_tag, max_tag>> acc;
    std::vector<double> finiteValues;

    for (const auto& value : values)
      {
	if (auto v = value.getFiniteValue())
	  {
	    acc(*v);
	    finiteValues.push_back(*v);
	  }
	else
	  ++summary.numUnbounded;
      }

    summary.numObservations = boost::accumulators::count(acc);
    if (summary.numObservations == 0)
      return summary;

    summary.mean = boost::accumulators::mean(acc);
    summary.min = boost::accumulators::min(acc);
    summary.max = boost::accumulators::max(acc);
    summary.median = medianOf(finiteValues);

    return summary;
  }

  SummaryStatistics SummaryAggregator::summarize(const std::vector<WindowResult>& windowResults)
  {
    std::map<MetricType, MetricSummary> validateSummaries;
    std::map<MetricType, RatioSummary> ratioSummaries;

    const std::size_t numScored =
      std::count_if(windowResults.begin(), windowResults.end(),
		    [](const WindowResult& r) { return r.isScored(); });

    for (MetricType metric : kAllMetricTypes)
      {
	validateSummaries[metric] = summarizeMetric(validateSeries(windowResults, metric));

	RatioSummary ratioSummary;
	accumulator_set<double, stats<count_tag, mean_tag>> ratioAcc;

	for (const auto& result : windowResults)
	  {
	    if (!result.isScored())
	      continue;

	    if (auto ratio = result.getPerformanceRatio(metric))
	      ratioAcc(*ratio);
	    else
	      ++ratioSummary.numNotComputable;
	  }

	ratioSummary.numComputable = boost::accumulators::count(ratioAcc);
	if (ratioSummary.numComputable > 0)
	  ratioSummary.averageRatio = boost::accumulators::mean(ratioAcc);

	ratioSummaries[metric] = ratioSummary;
      }

    return SummaryStatistics(validateSummaries, ratioSummaries, numScored,
			     windowResults.size() - numScored);
  }

  std::map<MetricType, StabilitySignal>
  SummaryAggregator::scoreStability(const std::vector<WindowResult>& windowResults)
  {
    std::map<MetricType, StabilitySignal> signals;

    for (MetricType metric : kAllMetricTypes)
      signals.emplace(metric, StabilityScorer::score(metric, validateSeries(windowResults, metric)));

    return signals;
  }

  SignificanceSignal SummaryAggregator::testSignificance(const std::vector<WindowResult>& windowResults)
  {
    SignificanceSignal signal;

    for (MetricType metric : kAllMetricTypes)
      {
	std::vector<SignificanceTester::PairedSample> pairs;
	for (const auto& result : windowResults)
	  {
	    if (result.isScored())
	      pairs.emplace_back(result.getTrainMetrics().getMetric(metric),
				 result.getValidateMetrics().getMetric(metric));
	  }

	signal.addResult(SignificanceTester::test(metric, pairs));
      }

    return signal;
  }

  WalkForwardResult SummaryAggregator::aggregate(const boost::uuids::uuid& runId,
						 const WalkForwardConfig& config,
						 const std::vector<WindowResult>& windowResults,
						 bool cancelled,
						 WalkForwardResult::Seconds totalExecutionTime)
  {
    const bool anyScored = std::any_of(windowResults.begin(), windowResults.end(),
				       [](const WindowResult& r) { return r.isScored(); });

    if (!anyScored)
      throw AllWindowsFailedException("SummaryAggregator: all " + std::to_string(windowResults.size())
				      + " windows failed"
				      + (cancelled ? " (run was cancelled)" : ""),
				      windowResults.size());

    const bool anyFailed = std::any_of(windowResults.begin(), windowResults.end(),
				       [](const WindowResult& r) { return r.isFailed(); });

    RunOutcome outcome = RunOutcome::Clean;
    if (cancelled)
      outcome = RunOutcome::Cancelled;
    else if (anyFailed)
      outcome = RunOutcome::CompletedWithFailures;

    return WalkForwardResult(runId,
			     config,
			     windowResults,
			     summarize(windowResults),
			     scoreStability(windowResults),
			     testSignificance(windowResults),
			     DegradationDetector::detect(windowResults, config.primaryMetric,
							 config.degradationThreshold),
			     outcome,
			     totalExecutionTime);
  }
}
