// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_WINDOW_RESULT_H
#define __WFV_WINDOW_RESULT_H 1

#include <chrono>
#include <optional>
#include <string>
#include "MetricsBundle.h"
#include "PerformanceRatioCalculator.h"
#include "ValidationWindow.h"

namespace wfvalidator
{
  /**
   * @brief Lifecycle of a window within one run.
   *
   * PENDING -> TRAIN_RUNNING -> VALIDATE_RUNNING -> SCORED, or any
   * non-terminal state -> FAILED. There is no retry transition.
   */
  enum class WindowState
  {
    Pending,
    TrainRunning,
    ValidateRunning,
    Scored,
    Failed
  };

  std::string getWindowStateName(WindowState state);

  bool isTerminalState(WindowState state);

  enum class WindowFailureKind
  {
    None,
    BacktestError,
    Timeout,
    Cancelled
  };

  std::string getWindowFailureKindName(WindowFailureKind kind);

  enum class DegradationStatus
  {
    NotEvaluated,   ///< primary ratio not computable, or window failed
    Healthy,
    Degraded
  };

  /**
   * @brief Terminal outcome of one window. Immutable once built.
   */
  class WindowResult
  {
  public:
    using Seconds = std::chrono::duration<double>;

    static WindowResult scored(const ValidationWindow& window,
			       const MetricsBundle& trainMetrics,
			       const MetricsBundle& validateMetrics,
			       const PerformanceRatios& ratios,
			       DegradationStatus degradation,
			       Seconds executionTime);

    static WindowResult failed(const ValidationWindow& window,
			       WindowFailureKind failureKind,
			       const std::string& failureReason,
			       Seconds executionTime);

    WindowResult(const WindowResult&) = default;
    WindowResult& operator=(const WindowResult&) = default;
    ~WindowResult() = default;

    const ValidationWindow& getWindow() const
    {
      return mWindow;
    }

    WindowState getState() const
    {
      return mState;
    }

    bool isScored() const
    {
      return mState == WindowState::Scored;
    }

    bool isFailed() const
    {
      return mState == WindowState::Failed;
    }

    // Throws std::domain_error for a failed window
    const MetricsBundle& getTrainMetrics() const;
    const MetricsBundle& getValidateMetrics() const;

    const PerformanceRatios& getPerformanceRatios() const
    {
      return mRatios;
    }

    std::optional<double> getPerformanceRatio(MetricType metric) const
    {
      return mRatios.getRatio(metric);
    }

    DegradationStatus getDegradationStatus() const
    {
      return mDegradation;
    }

    bool isDegraded() const
    {
      return mDegradation == DegradationStatus::Degraded;
    }

    WindowFailureKind getFailureKind() const
    {
      return mFailureKind;
    }

    const std::string& getFailureReason() const
    {
      return mFailureReason;
    }

    Seconds getExecutionTime() const
    {
      return mExecutionTime;
    }

  private:
    WindowResult(const ValidationWindow& window,
		 WindowState state,
		 const std::optional<MetricsBundle>& trainMetrics,
		 const std::optional<MetricsBundle>& validateMetrics,
		 const PerformanceRatios& ratios,
		 DegradationStatus degradation,
		 WindowFailureKind failureKind,
		 const std::string& failureReason,
		 Seconds executionTime);

    ValidationWindow mWindow;
    WindowState mState;
    std::optional<MetricsBundle> mTrainMetrics;
    std::optional<MetricsBundle> mValidateMetrics;
    PerformanceRatios mRatios;
    DegradationStatus mDegradation;
    WindowFailureKind mFailureKind;
    std::string mFailureReason;
    Seconds mExecutionTime;
  };
}

#endif
