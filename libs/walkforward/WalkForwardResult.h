// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_WALK_FORWARD_RESULT_H
#define __WFV_WALK_FORWARD_RESULT_H 1

#include <chrono>
#include <map>
#include <string>
#include <vector>
#include <boost/uuid/uuid.hpp>
#include "DegradationDetector.h"
#include "SignificanceTester.h"
#include "StabilityScorer.h"
#include "SummaryStatistics.h"
#include "WalkForwardConfig.h"
#include "WindowResult.h"

namespace wfvalidator
{
  /**
   * @brief How a run that produced a result ended.
   *
   * A run that failed to start raises an exception instead.
   */
  enum class RunOutcome
  {
    Clean,                  ///< every window scored
    CompletedWithFailures,  ///< some windows failed, degraded data quality
    Cancelled               ///< cancellation observed; completed windows kept
  };

  std::string getRunOutcomeName(RunOutcome outcome);

  /**
   * @brief Everything one walk-forward run produced. Immutable.
   */
  class WalkForwardResult
  {
  public:
    using Seconds = std::chrono::duration<double>;

    WalkForwardResult(const boost::uuids::uuid& runId,
		      const WalkForwardConfig& config,
		      const std::vector<WindowResult>& windowResults,
		      const SummaryStatistics& summary,
		      const std::map<MetricType, StabilitySignal>& stabilitySignals,
		      const SignificanceSignal& significance,
		      const DegradationReport& degradation,
		      RunOutcome outcome,
		      Seconds totalExecutionTime);

    WalkForwardResult(const WalkForwardResult&) = default;
    WalkForwardResult& operator=(const WalkForwardResult&) = default;
    ~WalkForwardResult() = default;

    const boost::uuids::uuid& getRunId() const
    {
      return mRunId;
    }

    std::string getRunIdString() const;

    const WalkForwardConfig& getConfig() const
    {
      return mConfig;
    }

    const std::vector<WindowResult>& getWindowResults() const
    {
      return mWindowResults;
    }

    std::size_t getNumWindows() const
    {
      return mWindowResults.size();
    }

    const SummaryStatistics& getSummaryStatistics() const
    {
      return mSummary;
    }

    // Stability of the primary metric
    const StabilitySignal& getStabilitySignal() const;

    const StabilitySignal& getStabilitySignal(MetricType metric) const;

    const std::map<MetricType, StabilitySignal>& getStabilitySignals() const
    {
      return mStabilitySignals;
    }

    const SignificanceSignal& getSignificanceSignal() const
    {
      return mSignificance;
    }

    const DegradationReport& getDegradationReport() const
    {
      return mDegradation;
    }

    std::size_t getDegradationCount() const
    {
      return mDegradation.getDegradationCount();
    }

    std::optional<double> getDegradationPercentage() const
    {
      return mDegradation.getDegradationPercentage();
    }

    RunOutcome getOutcome() const
    {
      return mOutcome;
    }

    bool wasCancelled() const
    {
      return mOutcome == RunOutcome::Cancelled;
    }

    Seconds getTotalExecutionTime() const
    {
      return mTotalExecutionTime;
    }

    // Mean execution time of the windows that reached a terminal state
    Seconds getAverageWindowExecutionTime() const;

  private:
    boost::uuids::uuid mRunId;
    WalkForwardConfig mConfig;
    std::vector<WindowResult> mWindowResults;
    SummaryStatistics mSummary;
    std::map<MetricType, StabilitySignal> mStabilitySignals;
    SignificanceSignal mSignificance;
    DegradationReport mDegradation;
    RunOutcome mOutcome;
    Seconds mTotalExecutionTime;
  };
}

#endif
