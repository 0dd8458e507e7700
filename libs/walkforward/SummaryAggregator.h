// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_SUMMARY_AGGREGATOR_H
#define __WFV_SUMMARY_AGGREGATOR_H 1

#include <map>
#include <vector>
#include <boost/uuid/uuid.hpp>
#include "SignificanceTester.h"
#include "StabilityScorer.h"
#include "SummaryStatistics.h"
#include "WalkForwardConfig.h"
#include "WalkForwardResult.h"
#include "WindowResult.h"

namespace wfvalidator
{
  /**
   * @brief Folds the window results of a run into a WalkForwardResult.
   *
   * Pure: the output depends only on the arguments, so aggregating the same
   * window sequence twice yields equal statistics. Failed windows are kept
   * in the result but excluded from every statistic.
   */
  class SummaryAggregator
  {
  public:
    /**
     * @throws AllWindowsFailedException if no window was scored
     */
    static WalkForwardResult aggregate(const boost::uuids::uuid& runId,
				       const WalkForwardConfig& config,
				       const std::vector<WindowResult>& windowResults,
				       bool cancelled,
				       WalkForwardResult::Seconds totalExecutionTime);

    static SummaryStatistics summarize(const std::vector<WindowResult>& windowResults);

    static std::map<MetricType, StabilitySignal>
    scoreStability(const std::vector<WindowResult>& windowResults);

    static SignificanceSignal testSignificance(const std::vector<WindowResult>& windowResults);

    static MetricSummary summarizeMetric(const std::vector<MetricValue>& values);
  };
}

#endif
