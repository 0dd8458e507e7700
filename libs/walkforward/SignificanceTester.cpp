// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "SignificanceTester.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <boost/math/distributions/students_t.hpp>

namespace wfvalidator
{
  std::string getSignificanceStatusName(SignificanceStatus status)
  {
    switch (status)
      {
      case SignificanceStatus::Computed:
	return "computed";
      case SignificanceStatus::InsufficientSamples:
	return "insufficient samples";
      }

    throw std::invalid_argument("getSignificanceStatusName: unknown status");
  }

  bool SignificanceResult::operator==(const SignificanceResult& rhs) const
  {
    return (mMetric == rhs.mMetric &&
	    mStatus == rhs.mStatus &&
	    mNumPairs == rhs.mNumPairs &&
	    mMeanDifference == rhs.mMeanDifference &&
	    mTStatistic == rhs.mTStatistic &&
	    mPValue == rhs.mPValue);
  }

  const SignificanceResult& SignificanceSignal::getResult(MetricType metric) const
  {
    auto it = mResults.find(metric);
    if (it == mResults.end())
      throw std::domain_error("SignificanceSignal::getResult: no result for " + getMetricName(metric));

    return it->second;
  }

  SignificanceResult SignificanceTester::test(MetricType metric, const std::vector<PairedSample>& pairs)
  {
    std::vector<double> trainValues;
    std::vector<double> validateValues;

    for (const auto& sample : pairs)
      {
	const auto train = sample.first.getFiniteValue();
	const auto validate = sample.second.getFiniteValue();
	if (train && validate)
	  {
	    trainValues.push_back(*train);
	    validateValues.push_back(*validate);
	  }
      }

    return test(metric, trainValues, validateValues);
  }

  SignificanceResult SignificanceTester::test(MetricType metric,
					      const std::vector<double>& trainValues,
					      const std::vector<double>& validateValues)
  {
    if (trainValues.size() != validateValues.size())
      throw std::invalid_argument("SignificanceTester::test: train and validate series differ in length");

    const std::size_t n = trainValues.size();

    std::vector<double> differences(n);
    for (std::size_t i = 0; i < n; ++i)
      differences[i] = validateValues[i] - trainValues[i];

    if (n < 2)
      {
	const double meanDiff = (n == 1) ? differences.front() : 0.0;
	return SignificanceResult(metric, SignificanceStatus::InsufficientSamples, n, meanDiff,
				  std::nullopt, std::nullopt);
      }

    const bool noDispersion =
      std::all_of(differences.begin(), differences.end(),
		  [&differences](double d) { return d == differences.front(); });

    if (noDispersion)
      {
	const double d = differences.front();
	if (d == 0.0)
	  return SignificanceResult(metric, SignificanceStatus::Computed, n, 0.0, 0.0, 1.0);

	const double inf = std::numeric_limits<double>::infinity();
	return SignificanceResult(metric, SignificanceStatus::Computed, n, d, (d > 0.0) ? inf : -inf, 0.0);
      }

    const double meanDiff = std::accumulate(differences.begin(), differences.end(), 0.0)
      / static_cast<double>(n);

    const double sumSq = std::accumulate(differences.begin(), differences.end(), 0.0,
					 [meanDiff](double acc, double d) {
					   const double e = d - meanDiff;
					   return acc + e * e;
					 });

    const double sd = std::sqrt(sumSq / static_cast<double>(n - 1));
    const double standardError = sd / std::sqrt(static_cast<double>(n));
    const double t = meanDiff / standardError;

    boost::math::students_t dist(static_cast<double>(n - 1));
    double p = 2.0 * boost::math::cdf(boost::math::complement(dist, std::fabs(t)));
    p = std::min(1.0, std::max(0.0, p));

    return SignificanceResult(metric, SignificanceStatus::Computed, n, meanDiff, t, p);
  }
}
