// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_BACKTEST_ADAPTER_H
#define __WFV_BACKTEST_ADAPTER_H 1

#include <string>
#include <vector>
#include "DateRange.h"
#include "MetricsBundle.h"
#include "StrategyConfiguration.h"

namespace wfvalidator
{
  /**
   * @brief Runs one backtest of a strategy over one date range.
   *
   * Implemented outside this library by whatever simulator is in use. A
   * failure is reported by throwing; the engine records it as a failure of
   * the window that made the call. Implementations must be safe to call
   * concurrently for different date ranges. The engine never issues two
   * concurrent calls for the same range within a run, and it treats every
   * call as isolated: nothing from a train call may leak into a validate call.
   */
  class BacktestAdapter
  {
  public:
    virtual ~BacktestAdapter() = default;

    virtual MetricsBundle run(const DateRange& dateRange,
			      const StrategyConfiguration& strategyConfig,
			      const std::vector<std::string>& symbols) = 0;
  };
}

#endif
