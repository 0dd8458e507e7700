// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "DegradationDetector.h"
#include "ReportRounding.h"

namespace wfvalidator
{
  DegradationStatus DegradationDetector::evaluate(const std::optional<double>& performanceRatio,
						  double threshold)
  {
    if (!performanceRatio)
      return DegradationStatus::NotEvaluated;

    if (roundForReport(*performanceRatio) < threshold)
      return DegradationStatus::Degraded;

    return DegradationStatus::Healthy;
  }

  DegradationReport DegradationDetector::detect(const std::vector<WindowResult>& windowResults,
						MetricType primaryMetric,
						double threshold)
  {
    std::vector<unsigned int> degraded;
    std::size_t numEvaluated = 0;

    for (const auto& result : windowResults)
      {
	if (!result.isScored())
	  continue;

	const auto status = evaluate(result.getPerformanceRatio(primaryMetric), threshold);
	if (status == DegradationStatus::NotEvaluated)
	  continue;

	++numEvaluated;
	if (status == DegradationStatus::Degraded)
	  degraded.push_back(result.getWindow().getIndex());
      }

    return DegradationReport(primaryMetric, threshold, degraded, numEvaluated);
  }
}
