// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_DEGRADATION_DETECTOR_H
#define __WFV_DEGRADATION_DETECTOR_H 1

#include <optional>
#include <vector>
#include "MetricsBundle.h"
#include "WindowResult.h"

namespace wfvalidator
{
  /**
   * @brief Run level degradation counts.
   *
   * Only scored windows whose primary ratio is computable are evaluated;
   * every other window is outside both numerator and denominator.
   */
  class DegradationReport
  {
  public:
    DegradationReport(MetricType primaryMetric,
		      double threshold,
		      const std::vector<unsigned int>& degradedWindowIndices,
		      std::size_t numEvaluatedWindows)
      : mPrimaryMetric(primaryMetric),
	mThreshold(threshold),
	mDegradedWindowIndices(degradedWindowIndices),
	mNumEvaluatedWindows(numEvaluatedWindows)
    {}

    MetricType getPrimaryMetric() const
    {
      return mPrimaryMetric;
    }

    double getThreshold() const
    {
      return mThreshold;
    }

    // 0-based indices of the degraded windows, ascending
    const std::vector<unsigned int>& getDegradedWindowIndices() const
    {
      return mDegradedWindowIndices;
    }

    std::size_t getDegradationCount() const
    {
      return mDegradedWindowIndices.size();
    }

    std::size_t getNumEvaluatedWindows() const
    {
      return mNumEvaluatedWindows;
    }

    // degradation count / evaluated windows; std::nullopt with nothing evaluated
    std::optional<double> getDegradationRate() const
    {
      if (mNumEvaluatedWindows == 0)
	return std::nullopt;

      return static_cast<double>(getDegradationCount()) / static_cast<double>(mNumEvaluatedWindows);
    }

    // getDegradationRate() expressed in percent
    std::optional<double> getDegradationPercentage() const
    {
      if (auto rate = getDegradationRate())
	return *rate * 100.0;

      return std::nullopt;
    }

    bool operator==(const DegradationReport& rhs) const
    {
      return (mPrimaryMetric == rhs.mPrimaryMetric &&
	      mThreshold == rhs.mThreshold &&
	      mDegradedWindowIndices == rhs.mDegradedWindowIndices &&
	      mNumEvaluatedWindows == rhs.mNumEvaluatedWindows);
    }

  private:
    MetricType mPrimaryMetric;
    double mThreshold;
    std::vector<unsigned int> mDegradedWindowIndices;
    std::size_t mNumEvaluatedWindows;
  };

  class DegradationDetector
  {
  public:
    /**
     * @brief Degraded when ratio < threshold (strict).
     *
     * The ratio is compared at reporting precision (four decimal digits) so
     * that a ratio which prints as the threshold is never flagged.
     */
    static DegradationStatus evaluate(const std::optional<double>& performanceRatio, double threshold);

    static DegradationReport detect(const std::vector<WindowResult>& windowResults,
				    MetricType primaryMetric,
				    double threshold);
  };
}

#endif
