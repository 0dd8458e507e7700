// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_BACKTEST_RUN_CACHE_H
#define __WFV_BACKTEST_RUN_CACHE_H 1

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "BacktestAdapter.h"
#include "CancellationToken.h"
#include "DateRange.h"
#include "MetricsBundle.h"
#include "StrategyConfiguration.h"

namespace wfvalidator
{
  /**
   * @brief Issues BacktestAdapter calls for one run, at most once per date range.
   *
   * When train and validate lengths are equal, window i's validate range is
   * window i+1's train range; both windows share the single adapter call.
   * A second request for a range that is still running waits on the first
   * call instead of starting another one, so the adapter never sees two
   * concurrent calls for the same range.
   *
   * With a non-zero timeout each call runs on its own detached thread and
   * getMetrics() waits at most that long. An abandoned call keeps the adapter
   * alive through its shared_ptr until it returns. If no thread can be
   * started the call runs on the requesting thread without a timeout.
   */
  class BacktestRunCache
  {
  public:
    BacktestRunCache(std::shared_ptr<BacktestAdapter> adapter,
		     const StrategyConfiguration& strategyConfig,
		     const std::vector<std::string>& symbols,
		     std::chrono::milliseconds callTimeout);

    virtual ~BacktestRunCache() = default;

    BacktestRunCache(const BacktestRunCache&) = delete;
    BacktestRunCache& operator=(const BacktestRunCache&) = delete;

    /**
     * @brief Metrics of one backtest over dateRange.
     *
     * @throws RunCancelledException if cancellation is observed first
     * @throws BacktestTimeoutException if the call exceeds the timeout
     * @throws whatever the adapter threw for this range
     */
    MetricsBundle getMetrics(const DateRange& dateRange, const CancellationToken& cancelToken);

    // Number of adapter calls actually issued
    std::size_t getNumAdapterCalls() const;

  protected:
    // Starts a timed call on its own thread; throws std::system_error when
    // no thread can be created
    virtual void launchDetached(std::function<void()> call);

  private:
    MetricsBundle awaitResult(const DateRange& dateRange,
			      const std::shared_future<MetricsBundle>& result,
			      const CancellationToken& cancelToken) const;

    std::shared_ptr<BacktestAdapter> mAdapter;
    StrategyConfiguration mStrategyConfig;
    std::vector<std::string> mSymbols;
    std::chrono::milliseconds mCallTimeout;

    mutable std::mutex mMutex;
    std::map<DateRange, std::shared_future<MetricsBundle>> mRuns;
    std::size_t mNumAdapterCalls;
  };
}

#endif
