// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "WalkForwardEngine.h"
#include <algorithm>
#include <chrono>
#include <future>
#include <iomanip>
#include <optional>
#include <sstream>
#include <vector>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "ParallelExecutors.h"
#include "DegradationDetector.h"
#include "PerformanceRatioCalculator.h"
#include "ReportRounding.h"
#include "SummaryAggregator.h"
#include "WalkForwardException.h"
#include "WalkForwardReporter.h"
#include "WindowGenerator.h"

namespace wfvalidator
{
  using Clock = std::chrono::steady_clock;

  static WindowResult::Seconds elapsedSince(Clock::time_point start)
  {
    return std::chrono::duration_cast<WindowResult::Seconds>(Clock::now() - start);
  }

  WalkForwardEngine::WalkForwardEngine(std::shared_ptr<BacktestAdapter> backtestAdapter,
				       std::ostream& os,
				       std::shared_ptr<IWalkForwardObserver> observer)
    : mBacktestAdapter(backtestAdapter),
      mConsole(os),
      mLogFile(),
      mTee(),
      mLog(&os),
      mObserver(observer ? observer : std::make_shared<NullWalkForwardObserver>()),
      mLogMutex(),
      mObserverMutex(),
      mReportSummary(true)
  {
    if (!mBacktestAdapter)
      throw std::invalid_argument("WalkForwardEngine: backtest adapter cannot be null");
  }

  void WalkForwardEngine::setLogFile(const std::string& logFilePath)
  {
    std::lock_guard<std::mutex> lock(mLogMutex);

    mLog = &mConsole;
    mTee.reset();
    if (mLogFile.is_open())
      mLogFile.close();

    if (logFilePath.empty())
      return;

    mLogFile.open(logFilePath, std::ios::out | std::ios::app);
    if (!mLogFile)
      {
	mLogFile.clear();
	throw ConfigurationException("WalkForwardEngine: cannot open log file " + logFilePath);
      }

    mTee = std::make_unique<TeeStream>(mConsole, mLogFile);
    mLog = mTee.get();
  }

  WalkForwardResult WalkForwardEngine::run(const WalkForwardConfig& config)
  {
    CancellationToken neverCancelled;
    return run(config, neverCancelled);
  }

  WalkForwardResult WalkForwardEngine::run(const WalkForwardConfig& config,
					   const CancellationToken& cancelToken)
  {
    const Clock::time_point runStart = Clock::now();

    config.validate();

    WindowGenerator generator(config.trainPeriodMonths, config.validatePeriodMonths);
    const std::vector<ValidationWindow> windows =
      generator.generate(config.overallStartDate, config.overallEndDate);

    boost::uuids::random_generator uuidGenerator;
    const boost::uuids::uuid runId = uuidGenerator();

    auto executor = concurrency::makeBoundedExecutor(config.maxConcurrency);

    {
      std::ostringstream msg;
      msg << "Run " << runId << ": " << windows.size() << " windows ("
	  << config.trainPeriodMonths << "m train / " << config.validatePeriodMonths
	  << "m validate) over " << config.overallStartDate << " .. " << config.overallEndDate
	  << ", concurrency " << executor->getConcurrencyLimit();
      if (config.windowTimeout.count() > 0)
	msg << ", timeout " << config.windowTimeout.count() << " ms";
      log(msg.str());
    }

    BacktestRunCache runCache(mBacktestAdapter, config.strategyConfig, config.symbols,
			      config.windowTimeout);

    // Each task writes only its own slot
    std::vector<std::optional<WindowResult>> slots(windows.size());
    std::vector<std::future<void>> futures;
    futures.reserve(windows.size());

    for (std::size_t i = 0; i < windows.size(); ++i)
      {
	futures.emplace_back(executor->submit([this, i, &windows, &config, &runCache, &cancelToken, &slots]() {
	  slots[i] = runWindow(windows[i], config, runCache, cancelToken);
	}));
      }

    executor->waitAll(futures);

    std::vector<WindowResult> windowResults;
    windowResults.reserve(slots.size());
    for (auto& slot : slots)
      windowResults.push_back(slot.value());

    const bool cancelled =
      std::any_of(windowResults.begin(), windowResults.end(), [](const WindowResult& r) {
	return r.getFailureKind() == WindowFailureKind::Cancelled;
      });

    {
      std::ostringstream msg;
      msg << "All windows joined; " << runCache.getNumAdapterCalls() << " backtest calls issued";
      if (cancelled)
	msg << "; run was cancelled";
      log(msg.str());
    }

    WalkForwardResult result = SummaryAggregator::aggregate(runId, config, windowResults,
							   cancelled, elapsedSince(runStart));

    if (mReportSummary)
      {
	std::lock_guard<std::mutex> lock(mLogMutex);
	WalkForwardReporter::writeSummary(*mLog, result);
	mLog->flush();
      }

    return result;
  }

  WindowResult WalkForwardEngine::runWindow(const ValidationWindow& window,
					    const WalkForwardConfig& config,
					    BacktestRunCache& runCache,
					    const CancellationToken& cancelToken)
  {
    const Clock::time_point windowStart = Clock::now();
    WindowFailureKind failureKind = WindowFailureKind::None;
    std::string failureReason;

    try
      {
	if (cancelToken.isCancelled())
	  throw RunCancelledException("Cancelled before window " + std::to_string(window.getWindowNumber())
				      + " started");

	notify(window, WindowState::TrainRunning);
	const MetricsBundle trainMetrics =
	  runBacktest(window, "train", window.getTrainDateRange(), runCache, cancelToken);

	notify(window, WindowState::ValidateRunning);
	const MetricsBundle validateMetrics =
	  runBacktest(window, "validate", window.getValidateDateRange(), runCache, cancelToken);

	const PerformanceRatios ratios = PerformanceRatioCalculator::calculate(trainMetrics, validateMetrics);
	const DegradationStatus degradation =
	  DegradationDetector::evaluate(ratios.getRatio(config.primaryMetric), config.degradationThreshold);

	WindowResult result = WindowResult::scored(window, trainMetrics, validateMetrics, ratios,
						   degradation, elapsedSince(windowStart));
	notify(window, WindowState::Scored);
	logWindowResult(result, config.primaryMetric);
	return result;
      }
    catch (const BacktestTimeoutException& e)
      {
	failureKind = WindowFailureKind::Timeout;
	failureReason = e.what();
      }
    catch (const RunCancelledException& e)
      {
	failureKind = WindowFailureKind::Cancelled;
	failureReason = e.what();
      }
    catch (const WindowExecutionException& e)
      {
	failureKind = WindowFailureKind::BacktestError;
	failureReason = e.what();
      }
    catch (const std::exception& e)
      {
	// Adapter returned metrics that could not be scored
	failureKind = WindowFailureKind::BacktestError;
	failureReason = std::string("Window ") + std::to_string(window.getWindowNumber())
	  + " could not be scored: " + e.what();
      }

    WindowResult result = WindowResult::failed(window, failureKind, failureReason,
					       elapsedSince(windowStart));
    notify(window, WindowState::Failed);
    logWindowResult(result, config.primaryMetric);
    return result;
  }

  MetricsBundle WalkForwardEngine::runBacktest(const ValidationWindow& window,
					       const char* periodName,
					       const DateRange& dateRange,
					       BacktestRunCache& runCache,
					       const CancellationToken& cancelToken)
  {
    try
      {
	return runCache.getMetrics(dateRange, cancelToken);
      }
    catch (const BacktestTimeoutException&)
      {
	throw;
      }
    catch (const RunCancelledException&)
      {
	throw;
      }
    catch (const std::exception& e)
      {
	throw WindowExecutionException(window.getIndex(),
				       std::string("Window ") + std::to_string(window.getWindowNumber())
				       + " " + periodName + " backtest " + dateRange.toString()
				       + " failed: " + e.what());
      }
    catch (...)
      {
	throw WindowExecutionException(window.getIndex(),
				       std::string("Window ") + std::to_string(window.getWindowNumber())
				       + " " + periodName + " backtest " + dateRange.toString()
				       + " failed with a non-standard exception");
      }
  }

  void WalkForwardEngine::logWindowResult(const WindowResult& result, MetricType primaryMetric)
  {
    const ValidationWindow& window = result.getWindow();
    std::ostringstream msg;

    msg << "Window " << window.getWindowNumber()
	<< " train [" << window.getTrainStart() << ", " << window.getTrainEnd() << ")"
	<< " validate [" << window.getValidateStart() << ", " << window.getValidateEnd() << "): "
	<< getWindowStateName(result.getState());

    if (result.isScored())
      {
	msg << ", " << getMetricName(primaryMetric) << " ratio ";
	if (auto ratio = result.getPerformanceRatio(primaryMetric))
	  msg << std::fixed << std::setprecision(kReportDecimalPlaces) << roundForReport(*ratio)
	      << (result.isDegraded() ? " DEGRADED" : " ok");
	else
	  msg << "not computable";
      }
    else
      msg << " (" << getWindowFailureKindName(result.getFailureKind()) << ") "
	  << result.getFailureReason();

    log(msg.str());
  }

  void WalkForwardEngine::notify(const ValidationWindow& window, WindowState newState)
  {
    std::string observerError;

    {
      std::lock_guard<std::mutex> lock(mObserverMutex);
      try
	{
	  mObserver->onWindowStateChange(window, newState);
	}
      catch (const std::exception& e)
	{
	  observerError = e.what();
	}
      catch (...)
	{
	  observerError = "non-standard exception";
	}
    }

    // Observer failures never change the window's outcome
    if (!observerError.empty())
      log("Observer failed on window " + std::to_string(window.getWindowNumber()) + " "
	  + getWindowStateName(newState) + ": " + observerError);
  }

  void WalkForwardEngine::log(const std::string& message)
  {
    std::lock_guard<std::mutex> lock(mLogMutex);
    *mLog << "   [WF] " << message << '\n';
  }
}
