// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_PERFORMANCE_RATIO_CALCULATOR_H
#define __WFV_PERFORMANCE_RATIO_CALCULATOR_H 1

#include <map>
#include <optional>
#include "MetricsBundle.h"

namespace wfvalidator
{
  /**
   * @brief validate / train ratio for every shared metric of one window.
   *
   * A ratio is std::nullopt ("not computable") when the train value is zero
   * or either value is unbounded.
   */
  class PerformanceRatios
  {
    using Map = std::map<MetricType, std::optional<double>>;

  public:
    typedef Map::const_iterator ConstRatioIterator;

    PerformanceRatios()
      : mRatios()
    {}

    explicit PerformanceRatios(const Map& ratios)
      : mRatios(ratios)
    {}

    std::optional<double> getRatio(MetricType metric) const
    {
      auto it = mRatios.find(metric);
      if (it == mRatios.end())
	return std::nullopt;

      return it->second;
    }

    bool isComputable(MetricType metric) const
    {
      return getRatio(metric).has_value();
    }

    ConstRatioIterator beginRatios() const
    {
      return mRatios.begin();
    }

    ConstRatioIterator endRatios() const
    {
      return mRatios.end();
    }

    bool operator==(const PerformanceRatios& rhs) const
    {
      return mRatios == rhs.mRatios;
    }

  private:
    Map mRatios;
  };

  class PerformanceRatioCalculator
  {
  public:
    static PerformanceRatios calculate(const MetricsBundle& trainMetrics,
				       const MetricsBundle& validateMetrics);

    static std::optional<double> calculateRatio(const MetricValue& trainValue,
						const MetricValue& validateValue);
  };
}

#endif
