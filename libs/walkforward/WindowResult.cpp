// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "WindowResult.h"
#include <stdexcept>

namespace wfvalidator
{
  std::string getWindowStateName(WindowState state)
  {
    switch (state)
      {
      case WindowState::Pending:
	return "PENDING";
      case WindowState::TrainRunning:
	return "TRAIN_RUNNING";
      case WindowState::ValidateRunning:
	return "VALIDATE_RUNNING";
      case WindowState::Scored:
	return "SCORED";
      case WindowState::Failed:
	return "FAILED";
      }

    throw std::invalid_argument("getWindowStateName: unknown state");
  }

  bool isTerminalState(WindowState state)
  {
    return (state == WindowState::Scored || state == WindowState::Failed);
  }

  std::string getWindowFailureKindName(WindowFailureKind kind)
  {
    switch (kind)
      {
      case WindowFailureKind::None:
	return "none";
      case WindowFailureKind::BacktestError:
	return "backtest error";
      case WindowFailureKind::Timeout:
	return "timeout";
      case WindowFailureKind::Cancelled:
	return "cancelled";
      }

    throw std::invalid_argument("getWindowFailureKindName: unknown failure kind");
  }

  WindowResult::WindowResult(const ValidationWindow& window,
			     WindowState state,
			     const std::optional<MetricsBundle>& trainMetrics,
			     const std::optional<MetricsBundle>& validateMetrics,
			     const PerformanceRatios& ratios,
			     DegradationStatus degradation,
			     WindowFailureKind failureKind,
			     const std::string& failureReason,
			     Seconds executionTime)
    : mWindow(window),
      mState(state),
      mTrainMetrics(trainMetrics),
      mValidateMetrics(validateMetrics),
      mRatios(ratios),
      mDegradation(degradation),
      mFailureKind(failureKind),
      mFailureReason(failureReason),
      mExecutionTime(executionTime)
  {}

  WindowResult WindowResult::scored(const ValidationWindow& window,
				    const MetricsBundle& trainMetrics,
				    const MetricsBundle& validateMetrics,
				    const PerformanceRatios& ratios,
				    DegradationStatus degradation,
				    Seconds executionTime)
  {
    return WindowResult(window, WindowState::Scored, trainMetrics, validateMetrics, ratios,
			degradation, WindowFailureKind::None, std::string(), executionTime);
  }

  WindowResult WindowResult::failed(const ValidationWindow& window,
				    WindowFailureKind failureKind,
				    const std::string& failureReason,
				    Seconds executionTime)
  {
    if (failureKind == WindowFailureKind::None)
      throw std::invalid_argument("WindowResult::failed: a failed window needs a failure kind");

    return WindowResult(window, WindowState::Failed, std::nullopt, std::nullopt, PerformanceRatios(),
			DegradationStatus::NotEvaluated, failureKind, failureReason, executionTime);
  }

  const MetricsBundle& WindowResult::getTrainMetrics() const
  {
    if (!mTrainMetrics)
      throw std::domain_error("WindowResult::getTrainMetrics: window "
			      + std::to_string(mWindow.getWindowNumber()) + " has no metrics");

    return *mTrainMetrics;
  }

  const MetricsBundle& WindowResult::getValidateMetrics() const
  {
    if (!mValidateMetrics)
      throw std::domain_error("WindowResult::getValidateMetrics: window "
			      + std::to_string(mWindow.getWindowNumber()) + " has no metrics");

    return *mValidateMetrics;
  }
}
