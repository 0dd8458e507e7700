// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "StabilityScorer.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include "ReportRounding.h"

namespace wfvalidator
{
  std::string getStabilityStatusName(StabilityStatus status)
  {
    switch (status)
      {
      case StabilityStatus::Computed:
	return "computed";
      case StabilityStatus::InsufficientWindows:
	return "insufficient windows";
      case StabilityStatus::ZeroMean:
	return "undefined (zero mean)";
      }

    throw std::invalid_argument("getStabilityStatusName: unknown status");
  }

  std::optional<double> StabilitySignal::getReportedScore() const
  {
    if (!mCoefficientOfVariation)
      return std::nullopt;

    return roundForReport(*mCoefficientOfVariation);
  }

  bool StabilitySignal::operator==(const StabilitySignal& rhs) const
  {
    return (mMetric == rhs.mMetric &&
	    mStatus == rhs.mStatus &&
	    mNumObservations == rhs.mNumObservations &&
	    mMean == rhs.mMean &&
	    mStandardDeviation == rhs.mStandardDeviation &&
	    mCoefficientOfVariation == rhs.mCoefficientOfVariation);
  }

  StabilitySignal StabilityScorer::score(MetricType metric, const std::vector<MetricValue>& values)
  {
    std::vector<double> finiteValues;
    finiteValues.reserve(values.size());

    for (const auto& value : values)
      {
	if (auto v = value.getFiniteValue())
	  finiteValues.push_back(*v);
      }

    return score(metric, finiteValues);
  }

  StabilitySignal StabilityScorer::score(MetricType metric, const std::vector<double>& values)
  {
    const std::size_t n = values.size();

    if (n < 2)
      {
	const double mean = (n == 1) ? values.front() : 0.0;
	return StabilitySignal(metric, StabilityStatus::InsufficientWindows, n, mean, 0.0, std::nullopt);
      }

    // Identical observations have no dispersion; skip the summation so
    // rounding in the mean cannot produce a spurious non-zero deviation.
    if (std::all_of(values.begin(), values.end(), [&values](double v) { return v == values.front(); }))
      {
	const double mean = values.front();
	if (mean == 0.0)
	  return StabilitySignal(metric, StabilityStatus::ZeroMean, n, mean, 0.0, std::nullopt);

	return StabilitySignal(metric, StabilityStatus::Computed, n, mean, 0.0, 0.0);
      }

    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(n);

    const double sumSq = std::accumulate(values.begin(), values.end(), 0.0,
					 [mean](double acc, double v) {
					   const double diff = v - mean;
					   return acc + diff * diff;
					 });

    // Unbiased sample variance (N-1)
    const double stdDev = std::sqrt(sumSq / static_cast<double>(n - 1));

    if (mean == 0.0)
      return StabilitySignal(metric, StabilityStatus::ZeroMean, n, mean, stdDev, std::nullopt);

    return StabilitySignal(metric, StabilityStatus::Computed, n, mean, stdDev, stdDev / mean);
  }
}
