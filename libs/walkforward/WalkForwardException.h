// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_WALK_FORWARD_EXCEPTION_H
#define __WFV_WALK_FORWARD_EXCEPTION_H 1

#include <cstddef>
#include <stdexcept>
#include <string>

namespace wfvalidator
{
  // Base of every error raised by the walk-forward engine
  class WalkForwardException : public std::runtime_error
  {
  public:
    explicit WalkForwardException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~WalkForwardException() = default;
  };

  // Invalid date range, non-positive period lengths, empty symbol set,
  // malformed configuration file. Raised before any window runs.
  class ConfigurationException : public WalkForwardException
  {
  public:
    explicit ConfigurationException(const std::string& msg)
      : WalkForwardException(msg)
    {}
  };

  // Overall range is too short to hold a single train+validate window
  class InsufficientDataException : public WalkForwardException
  {
  public:
    explicit InsufficientDataException(const std::string& msg)
      : WalkForwardException(msg)
    {}
  };

  // A single window's backtest call failed or timed out. Recovered locally
  // by the engine; the window is recorded as FAILED.
  class WindowExecutionException : public WalkForwardException
  {
  public:
    WindowExecutionException(unsigned int windowIndex, const std::string& msg)
      : WalkForwardException(msg),
	mWindowIndex(windowIndex)
    {}

    unsigned int getWindowIndex() const
    {
      return mWindowIndex;
    }

  private:
    unsigned int mWindowIndex;
  };

  // A backtest call did not complete within the configured window timeout.
  // The call itself keeps running in the background.
  class BacktestTimeoutException : public WalkForwardException
  {
  public:
    explicit BacktestTimeoutException(const std::string& msg)
      : WalkForwardException(msg)
    {}
  };

  // Cancellation was observed before or while waiting on a backtest call
  class RunCancelledException : public WalkForwardException
  {
  public:
    explicit RunCancelledException(const std::string& msg)
      : WalkForwardException(msg)
    {}
  };

  // Every window failed, so no summary can be produced
  class AllWindowsFailedException : public WalkForwardException
  {
  public:
    AllWindowsFailedException(const std::string& msg, std::size_t numWindows)
      : WalkForwardException(msg),
	mNumWindows(numWindows)
    {}

    std::size_t getNumWindows() const
    {
      return mNumWindows;
    }

  private:
    std::size_t mNumWindows;
  };
}

#endif
