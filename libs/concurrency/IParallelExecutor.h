// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once
#include <cstddef>
#include <future>
#include <vector>
#include <functional>

namespace concurrency
{
  class IParallelExecutor {
  public:
    virtual ~IParallelExecutor() = default;

    // Schedule a void() task; returns a std::future you can wait on.
    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Upper bound on the number of tasks that may run at the same time.
    virtual std::size_t getConcurrencyLimit() const = 0;

    // Join barrier: waits for every future before rethrowing the first
    // stored exception, so no task is still running when this returns.
    virtual void waitAll(std::vector<std::future<void>>& futures) {
      for (auto& f : futures)
	if (f.valid()) f.wait();
      for (auto& f : futures)
	if (f.valid()) f.get();
    }
  };
} // namespace concurrency
