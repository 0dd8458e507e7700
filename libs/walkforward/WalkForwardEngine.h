// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_WALK_FORWARD_ENGINE_H
#define __WFV_WALK_FORWARD_ENGINE_H 1

#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include "BacktestAdapter.h"
#include "BacktestRunCache.h"
#include "CancellationToken.h"
#include "TeeStream.h"
#include "ValidationWindow.h"
#include "WalkForwardConfig.h"
#include "WalkForwardObserver.h"
#include "WalkForwardResult.h"
#include "WindowResult.h"

namespace wfvalidator
{
  /**
   * @brief Runs a complete walk-forward validation.
   *
   * One call to run():
   *  1. validates the configuration and generates the windows (both fail
   *     fast, before any backtest is issued),
   *  2. submits one task per window to an executor bounded by
   *     maxConcurrency; each task backtests the train period, then the
   *     validate period, and scores the window,
   *  3. joins every task and folds the window results into a
   *     WalkForwardResult through SummaryAggregator.
   *
   * A window whose backtest throws, times out or is cancelled is recorded
   * as FAILED; the run only throws when no window could be scored.
   * Diagnostics go to the stream given at construction, prefixed with [WF],
   * and optionally to a log file as well.
   */
  class WalkForwardEngine
  {
  public:
    WalkForwardEngine(std::shared_ptr<BacktestAdapter> backtestAdapter,
		      std::ostream& os,
		      std::shared_ptr<IWalkForwardObserver> observer = nullptr);

    WalkForwardEngine(const WalkForwardEngine&) = delete;
    WalkForwardEngine& operator=(const WalkForwardEngine&) = delete;

    /**
     * @throws ConfigurationException for an invalid configuration
     * @throws InsufficientDataException if the range holds no full window
     * @throws AllWindowsFailedException if every window failed
     */
    WalkForwardResult run(const WalkForwardConfig& config);

    WalkForwardResult run(const WalkForwardConfig& config, const CancellationToken& cancelToken);

    /**
     * @brief Also append the run log and summary to logFilePath.
     *
     * Output keeps going to the stream given at construction. An empty
     * path closes the file and restores that stream alone.
     *
     * @throws ConfigurationException if the file cannot be opened
     */
    void setLogFile(const std::string& logFilePath);

    // Write the end-of-run summary table after each run (on by default)
    void setReportSummary(bool reportSummary)
    {
      mReportSummary = reportSummary;
    }

  private:
    WindowResult runWindow(const ValidationWindow& window,
			   const WalkForwardConfig& config,
			   BacktestRunCache& runCache,
			   const CancellationToken& cancelToken);

    MetricsBundle runBacktest(const ValidationWindow& window,
			      const char* periodName,
			      const DateRange& dateRange,
			      BacktestRunCache& runCache,
			      const CancellationToken& cancelToken);

    void logWindowResult(const WindowResult& result, MetricType primaryMetric);
    void notify(const ValidationWindow& window, WindowState newState);
    void log(const std::string& message);

  private:
    std::shared_ptr<BacktestAdapter> mBacktestAdapter;
    std::ostream& mConsole;
    std::ofstream mLogFile;
    std::unique_ptr<TeeStream> mTee;
    std::ostream* mLog;
    std::shared_ptr<IWalkForwardObserver> mObserver;
    std::mutex mLogMutex;
    std::mutex mObserverMutex;
    bool mReportSummary;
  };
}

#endif
