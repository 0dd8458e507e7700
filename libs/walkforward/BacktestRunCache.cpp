// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "BacktestRunCache.h"
#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <thread>
#include "WalkForwardException.h"

namespace wfvalidator
{
  namespace
  {
    // Granularity of cancellation checks while blocked on a call
    constexpr std::chrono::milliseconds kPollInterval(10);
  }

  BacktestRunCache::BacktestRunCache(std::shared_ptr<BacktestAdapter> adapter,
				     const StrategyConfiguration& strategyConfig,
				     const std::vector<std::string>& symbols,
				     std::chrono::milliseconds callTimeout)
    : mAdapter(adapter),
      mStrategyConfig(strategyConfig),
      mSymbols(symbols),
      mCallTimeout(callTimeout),
      mMutex(),
      mRuns(),
      mNumAdapterCalls(0)
  {
    if (!mAdapter)
      throw std::invalid_argument("BacktestRunCache: backtest adapter cannot be null");
  }

  MetricsBundle BacktestRunCache::getMetrics(const DateRange& dateRange,
					     const CancellationToken& cancelToken)
  {
    std::shared_future<MetricsBundle> result;
    std::shared_ptr<std::packaged_task<MetricsBundle()>> call;

    {
      std::lock_guard<std::mutex> lock(mMutex);

      auto it = mRuns.find(dateRange);
      if (it != mRuns.end())
	result = it->second;
      else
	{
	  if (cancelToken.isCancelled())
	    throw RunCancelledException("Cancelled before backtest of " + dateRange.toString());

	  // The task owns copies of everything it touches so that an abandoned
	  // call can outlive this cache.
	  auto adapter = mAdapter;
	  auto strategyConfig = mStrategyConfig;
	  auto symbols = mSymbols;
	  call = std::make_shared<std::packaged_task<MetricsBundle()>>(
	    [adapter, dateRange, strategyConfig, symbols]() {
	      return adapter->run(dateRange, strategyConfig, symbols);
	    });

	  result = call->get_future().share();
	  mRuns.emplace(dateRange, result);
	  ++mNumAdapterCalls;
	}
    }

    if (call)
      {
	if (mCallTimeout.count() == 0)
	  (*call)();
	else
	  {
	    try
	      {
		launchDetached([call]() { (*call)(); });
	      }
	    catch (const std::system_error&)
	      {
		// Waiters already share this call's future; it must still run
		(*call)();
	      }
	  }
      }

    return awaitResult(dateRange, result, cancelToken);
  }

  void BacktestRunCache::launchDetached(std::function<void()> call)
  {
    std::thread(std::move(call)).detach();
  }

  MetricsBundle BacktestRunCache::awaitResult(const DateRange& dateRange,
					      const std::shared_future<MetricsBundle>& result,
					      const CancellationToken& cancelToken) const
  {
    using Clock = std::chrono::steady_clock;

    const bool hasDeadline = mCallTimeout.count() > 0;
    const Clock::time_point deadline = Clock::now() + mCallTimeout;

    for (;;)
      {
	std::chrono::milliseconds slice = kPollInterval;
	if (hasDeadline)
	  {
	    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
	    slice = std::max(std::chrono::milliseconds(0), std::min(slice, remaining));
	  }

	if (result.wait_for(slice) == std::future_status::ready)
	  return result.get();

	if (cancelToken.isCancelled())
	  throw RunCancelledException("Cancelled while waiting on backtest of " + dateRange.toString());

	if (hasDeadline && Clock::now() >= deadline)
	  throw BacktestTimeoutException("Backtest of " + dateRange.toString() + " exceeded "
					 + std::to_string(mCallTimeout.count()) + " ms timeout");
      }
  }

  std::size_t BacktestRunCache::getNumAdapterCalls() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mNumAdapterCalls;
  }
}
