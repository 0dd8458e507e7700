// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "PerformanceRatioCalculator.h"

namespace wfvalidator
{
  std::optional<double>
  PerformanceRatioCalculator::calculateRatio(const MetricValue& trainValue,
					     const MetricValue& validateValue)
  {
    const auto train = trainValue.getFiniteValue();
    const auto validate = validateValue.getFiniteValue();

    if (!train || !validate)
      return std::nullopt;

    if (*train == 0.0)
      return std::nullopt;

    return *validate / *train;
  }

  PerformanceRatios
  PerformanceRatioCalculator::calculate(const MetricsBundle& trainMetrics,
					const MetricsBundle& validateMetrics)
  {
    std::map<MetricType, std::optional<double>> ratios;

    for (MetricType metric : kAllMetricTypes)
      ratios[metric] = calculateRatio(trainMetrics.getMetric(metric),
				      validateMetrics.getMetric(metric));

    return PerformanceRatios(ratios);
  }
}
