#pragma once

#include "IParallelExecutor.h"
#include <cstddef>
#include <future>
#include <thread>
#include <vector>
#include <functional>
#include <queue>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <exception>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies used to fan window tasks out and join them.
 *
 * Two implementations of the IParallelExecutor interface:
 *  - SingleThreadExecutor: runs tasks inline on the calling thread (deterministic, no concurrency).
 *  - ThreadPoolExecutor: a fixed-size thread pool whose size is chosen at construction.
 *
 * @section usage Guidance on choosing an executor policy
 * - SingleThreadExecutor: Use in unit tests, when debugging, or when the caller asked
 *   for sequential execution (a concurrency limit of one).
 * - ThreadPoolExecutor: Use when several long-running, blocking tasks should overlap.
 *   At most getConcurrencyLimit() tasks execute at any time; the rest wait in the queue.
 */
namespace concurrency
{
  /**
   * @brief Executes tasks synchronously on the calling thread.
   *
   * All tasks run inline, with no actual concurrency. Exceptions thrown by
   * the task are stored in the returned future.
   */
  class SingleThreadExecutor : public IParallelExecutor {
  public:
    std::future<void> submit(std::function<void()> task) override {
      std::promise<void> prom;
      auto fut = prom.get_future();
      try {
	task();
	prom.set_value();
      } catch (...) {
	prom.set_exception(std::current_exception());
      }
      return fut;
    }

    std::size_t getConcurrencyLimit() const override
    {
      return 1;
    }
  };

  /**
   * @brief Fixed-size thread pool executor.
   *
   * Tasks submitted are queued and executed by a pool of worker threads.
   * If numThreads == 0, std::thread::hardware_concurrency() is used
   * (falling back to 2 if that returns 0).
   *
   * The destructor drains the queue before joining the workers, so every
   * future handed out by submit() eventually becomes ready.
   */
  class ThreadPoolExecutor : public IParallelExecutor {
  public:
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    explicit ThreadPoolExecutor(std::size_t numThreads = 0)
      : stop_(false)
    {
      const std::size_t threads =
	numThreads > 0 ? numThreads
		       : (std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 2);

      try {
	for (std::size_t i = 0; i < threads; ++i) {
	  workers_.emplace_back([this] { workerLoop(); });
	}
      }
      catch (...) {
	{
	  std::lock_guard<std::mutex> lock(tasksMutex_);
	  stop_ = true;
	}
	condition_.notify_all();
	for (auto& w : workers_) if (w.joinable()) w.join();
	throw;
      }
    }

    ~ThreadPoolExecutor()
    {
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	stop_ = true;
      }
      condition_.notify_all();
      for (auto &worker : workers_) {
	if (worker.joinable())
	  worker.join();
      }
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
      auto fut = packaged->get_future();
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	if (stop_)
	  throw std::runtime_error("enqueue on stopped ThreadPoolExecutor");
	tasks_.emplace([packaged]() { (*packaged)(); });
      }
      condition_.notify_one();
      return fut;
    }

    std::size_t getConcurrencyLimit() const override
    {
      return workers_.size();
    }

  private:
    void workerLoop()
    {
      for (;;) {
	std::function<void()> task;
	{
	  std::unique_lock<std::mutex> lock(tasksMutex_);
	  condition_.wait(lock, [this]{ return stop_ || !tasks_.empty(); });
	  if (stop_ && tasks_.empty()) return;
	  task = std::move(tasks_.front());
	  tasks_.pop();
	}
	task();
      }
    }

    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        tasksMutex_;
    std::condition_variable           condition_;
    bool                              stop_;
  };

  /**
   * @brief Picks the executor policy for a concurrency limit.
   *
   * A limit of one (or zero) yields a SingleThreadExecutor; anything larger
   * yields a ThreadPoolExecutor with exactly that many workers.
   */
  inline std::unique_ptr<IParallelExecutor> makeBoundedExecutor(std::size_t concurrencyLimit)
  {
    if (concurrencyLimit <= 1)
      return std::make_unique<SingleThreadExecutor>();

    return std::make_unique<ThreadPoolExecutor>(concurrencyLimit);
  }
} // namespace concurrency
