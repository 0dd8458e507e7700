// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_STABILITY_SCORER_H
#define __WFV_STABILITY_SCORER_H 1

#include <optional>
#include <string>
#include <vector>
#include "MetricsBundle.h"

namespace wfvalidator
{
  enum class StabilityStatus
  {
    Computed,
    InsufficientWindows,  ///< fewer than two usable observations
    ZeroMean              ///< CV undefined because the mean is exactly zero
  };

  std::string getStabilityStatusName(StabilityStatus status);

  /**
   * @brief Coefficient of variation of one metric across validate windows.
   */
  class StabilitySignal
  {
  public:
    StabilitySignal(MetricType metric,
		    StabilityStatus status,
		    std::size_t numObservations,
		    double mean,
		    double standardDeviation,
		    std::optional<double> coefficientOfVariation)
      : mMetric(metric),
	mStatus(status),
	mNumObservations(numObservations),
	mMean(mean),
	mStandardDeviation(standardDeviation),
	mCoefficientOfVariation(coefficientOfVariation)
    {}

    MetricType getMetric() const
    {
      return mMetric;
    }

    StabilityStatus getStatus() const
    {
      return mStatus;
    }

    bool isComputed() const
    {
      return mStatus == StabilityStatus::Computed;
    }

    std::size_t getNumObservations() const
    {
      return mNumObservations;
    }

    double getMean() const
    {
      return mMean;
    }

    double getStandardDeviation() const
    {
      return mStandardDeviation;
    }

    // Full precision CV; std::nullopt unless the status is Computed
    std::optional<double> getCoefficientOfVariation() const
    {
      return mCoefficientOfVariation;
    }

    // CV rounded to four decimal digits
    std::optional<double> getReportedScore() const;

    bool operator==(const StabilitySignal& rhs) const;

  private:
    MetricType mMetric;
    StabilityStatus mStatus;
    std::size_t mNumObservations;
    double mMean;
    double mStandardDeviation;
    std::optional<double> mCoefficientOfVariation;
  };

  class StabilityScorer
  {
  public:
    /**
     * @brief CV = sample standard deviation (n - 1) / mean.
     *
     * Unbounded values are dropped before scoring. The CV keeps the sign of
     * the mean; a lower magnitude means more consistent performance.
     */
    static StabilitySignal score(MetricType metric, const std::vector<MetricValue>& values);

    static StabilitySignal score(MetricType metric, const std::vector<double>& values);
  };
}

#endif
