// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_SIGNIFICANCE_TESTER_H
#define __WFV_SIGNIFICANCE_TESTER_H 1

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "MetricsBundle.h"

namespace wfvalidator
{
  enum class SignificanceStatus
  {
    Computed,
    InsufficientSamples   ///< fewer than two usable (train, validate) pairs
  };

  std::string getSignificanceStatusName(SignificanceStatus status);

  /**
   * @brief Two-sided paired t-test of validate vs train for one metric.
   */
  class SignificanceResult
  {
  public:
    SignificanceResult(MetricType metric,
		       SignificanceStatus status,
		       std::size_t numPairs,
		       double meanDifference,
		       std::optional<double> tStatistic,
		       std::optional<double> pValue)
      : mMetric(metric),
	mStatus(status),
	mNumPairs(numPairs),
	mMeanDifference(meanDifference),
	mTStatistic(tStatistic),
	mPValue(pValue)
    {}

    MetricType getMetric() const
    {
      return mMetric;
    }

    SignificanceStatus getStatus() const
    {
      return mStatus;
    }

    bool isComputed() const
    {
      return mStatus == SignificanceStatus::Computed;
    }

    std::size_t getNumPairs() const
    {
      return mNumPairs;
    }

    // Mean of validate[i] - train[i]
    double getMeanDifference() const
    {
      return mMeanDifference;
    }

    std::optional<double> getTStatistic() const
    {
      return mTStatistic;
    }

    std::optional<double> getPValue() const
    {
      return mPValue;
    }

    std::size_t getDegreesOfFreedom() const
    {
      return (mNumPairs > 0) ? mNumPairs - 1 : 0;
    }

    bool operator==(const SignificanceResult& rhs) const;

  private:
    MetricType mMetric;
    SignificanceStatus mStatus;
    std::size_t mNumPairs;
    double mMeanDifference;
    std::optional<double> mTStatistic;
    std::optional<double> mPValue;
  };

  /**
   * @brief Per-metric significance results of one run.
   *
   * Each p-value is independent; no multiple comparison correction is applied.
   */
  class SignificanceSignal
  {
    using Map = std::map<MetricType, SignificanceResult>;

  public:
    typedef Map::const_iterator ConstResultIterator;

    SignificanceSignal()
      : mResults()
    {}

    void addResult(const SignificanceResult& result)
    {
      mResults.insert_or_assign(result.getMetric(), result);
    }

    const SignificanceResult& getResult(MetricType metric) const;

    bool hasResult(MetricType metric) const
    {
      return mResults.find(metric) != mResults.end();
    }

    std::size_t getNumResults() const
    {
      return mResults.size();
    }

    ConstResultIterator beginResults() const
    {
      return mResults.begin();
    }

    ConstResultIterator endResults() const
    {
      return mResults.end();
    }

    bool operator==(const SignificanceSignal& rhs) const
    {
      return mResults == rhs.mResults;
    }

  private:
    Map mResults;
  };

  class SignificanceTester
  {
  public:
    using PairedSample = std::pair<MetricValue, MetricValue>;   ///< (train, validate)

    /**
     * @brief Paired t-test on d[i] = validate[i] - train[i].
     *
     * Pairs with an unbounded side are dropped. With zero dispersion in the
     * differences the p-value is 1.0 when they are all zero and 0.0 otherwise.
     */
    static SignificanceResult test(MetricType metric, const std::vector<PairedSample>& pairs);

    static SignificanceResult test(MetricType metric,
				   const std::vector<double>& trainValues,
				   const std::vector<double>& validateValues);
  };
}

#endif
