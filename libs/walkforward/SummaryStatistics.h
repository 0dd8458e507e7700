// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_SUMMARY_STATISTICS_H
#define __WFV_SUMMARY_STATISTICS_H 1

#include <map>
#include <optional>
#include "MetricsBundle.h"

namespace wfvalidator
{
  /**
   * @brief Distribution of one metric over the validate periods of scored windows.
   *
   * Unbounded observations are counted separately and do not enter the
   * moments; every statistic is std::nullopt when no finite value exists.
   */
  struct MetricSummary
  {
    std::size_t numObservations = 0;
    std::size_t numUnbounded = 0;
    std::optional<double> mean;
    std::optional<double> median;
    std::optional<double> min;
    std::optional<double> max;

    bool operator==(const MetricSummary& rhs) const
    {
      return (numObservations == rhs.numObservations &&
	      numUnbounded == rhs.numUnbounded &&
	      mean == rhs.mean &&
	      median == rhs.median &&
	      min == rhs.min &&
	      max == rhs.max);
    }
  };

  // Mean of the computable validate/train ratios of one metric
  struct RatioSummary
  {
    std::size_t numComputable = 0;
    std::size_t numNotComputable = 0;
    std::optional<double> averageRatio;

    bool operator==(const RatioSummary& rhs) const
    {
      return (numComputable == rhs.numComputable &&
	      numNotComputable == rhs.numNotComputable &&
	      averageRatio == rhs.averageRatio);
    }
  };

  class SummaryStatistics
  {
  public:
    SummaryStatistics(const std::map<MetricType, MetricSummary>& validateSummaries,
		      const std::map<MetricType, RatioSummary>& ratioSummaries,
		      std::size_t numScoredWindows,
		      std::size_t numFailedWindows)
      : mValidateSummaries(validateSummaries),
	mRatioSummaries(ratioSummaries),
	mNumScoredWindows(numScoredWindows),
	mNumFailedWindows(numFailedWindows)
    {}

    MetricSummary getValidateSummary(MetricType metric) const
    {
      auto it = mValidateSummaries.find(metric);
      return (it != mValidateSummaries.end()) ? it->second : MetricSummary();
    }

    RatioSummary getRatioSummary(MetricType metric) const
    {
      auto it = mRatioSummaries.find(metric);
      return (it != mRatioSummaries.end()) ? it->second : RatioSummary();
    }

    std::optional<double> getAveragePerformanceRatio(MetricType metric) const
    {
      return getRatioSummary(metric).averageRatio;
    }

    std::size_t getNumScoredWindows() const
    {
      return mNumScoredWindows;
    }

    std::size_t getNumFailedWindows() const
    {
      return mNumFailedWindows;
    }

    std::size_t getNumWindows() const
    {
      return mNumScoredWindows + mNumFailedWindows;
    }

    bool operator==(const SummaryStatistics& rhs) const
    {
      return (mValidateSummaries == rhs.mValidateSummaries &&
	      mRatioSummaries == rhs.mRatioSummaries &&
	      mNumScoredWindows == rhs.mNumScoredWindows &&
	      mNumFailedWindows == rhs.mNumFailedWindows);
    }

    bool operator!=(const SummaryStatistics& rhs) const
    {
      return !(*this == rhs);
    }

  private:
    std::map<MetricType, MetricSummary> mValidateSummaries;
    std::map<MetricType, RatioSummary> mRatioSummaries;
    std::size_t mNumScoredWindows;
    std::size_t mNumFailedWindows;
  };
}

#endif
