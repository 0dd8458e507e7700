// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "WalkForwardResult.h"
#include <stdexcept>
#include <boost/uuid/uuid_io.hpp>

namespace wfvalidator
{
  std::string getRunOutcomeName(RunOutcome outcome)
  {
    switch (outcome)
      {
      case RunOutcome::Clean:
	return "completed cleanly";
      case RunOutcome::CompletedWithFailures:
	return "completed with failed windows";
      case RunOutcome::Cancelled:
	return "cancelled";
      }

    throw std::invalid_argument("getRunOutcomeName: unknown outcome");
  }

  WalkForwardResult::WalkForwardResult(const boost::uuids::uuid& runId,
				       const WalkForwardConfig& config,
				       const std::vector<WindowResult>& windowResults,
				       const SummaryStatistics& summary,
				       const std::map<MetricType, StabilitySignal>& stabilitySignals,
				       const SignificanceSignal& significance,
				       const DegradationReport& degradation,
				       RunOutcome outcome,
				       Seconds totalExecutionTime)
    : mRunId(runId),
      mConfig(config),
      mWindowResults(windowResults),
      mSummary(summary),
      mStabilitySignals(stabilitySignals),
      mSignificance(significance),
      mDegradation(degradation),
      mOutcome(outcome),
      mTotalExecutionTime(totalExecutionTime)
  {
    if (mStabilitySignals.find(config.primaryMetric) == mStabilitySignals.end())
      throw std::invalid_argument("WalkForwardResult: missing stability signal for the primary metric");
  }

  std::string WalkForwardResult::getRunIdString() const
  {
    return boost::uuids::to_string(mRunId);
  }

  const StabilitySignal& WalkForwardResult::getStabilitySignal() const
  {
    return getStabilitySignal(mConfig.primaryMetric);
  }

  const StabilitySignal& WalkForwardResult::getStabilitySignal(MetricType metric) const
  {
    auto it = mStabilitySignals.find(metric);
    if (it == mStabilitySignals.end())
      throw std::domain_error("WalkForwardResult::getStabilitySignal: no signal for " + getMetricName(metric));

    return it->second;
  }

  WalkForwardResult::Seconds WalkForwardResult::getAverageWindowExecutionTime() const
  {
    if (mWindowResults.empty())
      return Seconds(0.0);

    Seconds total(0.0);
    for (const auto& result : mWindowResults)
      total += result.getExecutionTime();

    return total / static_cast<double>(mWindowResults.size());
  }
}
