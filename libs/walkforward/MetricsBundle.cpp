// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "MetricsBundle.h"
#include <cmath>
#include <boost/algorithm/string.hpp>
#include "WalkForwardException.h"

namespace wfvalidator
{
  std::ostream& operator<<(std::ostream& os, const MetricValue& value)
  {
    if (value.isUnbounded())
      return os << "unbounded";

    return os << *value.getFiniteValue();
  }

  std::string getMetricName(MetricType metric)
  {
    switch (metric)
      {
      case MetricType::WinRate:
	return "win_rate";
      case MetricType::AvgRMultiple:
	return "avg_r_multiple";
      case MetricType::ProfitFactor:
	return "profit_factor";
      case MetricType::SharpeRatio:
	return "sharpe_ratio";
      case MetricType::MaxDrawdown:
	return "max_drawdown";
      case MetricType::TotalReturn:
	return "total_return_pct";
      }

    throw std::invalid_argument("getMetricName: unknown metric type");
  }

  MetricType parseMetricType(const std::string& name)
  {
    const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));

    for (MetricType metric : kAllMetricTypes)
      {
	if (getMetricName(metric) == key)
	  return metric;
      }

    throw ConfigurationException("parseMetricType: unknown metric name '" + name + "'");
  }

  bool isPrimaryMetricCandidate(MetricType metric)
  {
    return (metric == MetricType::WinRate ||
	    metric == MetricType::AvgRMultiple ||
	    metric == MetricType::ProfitFactor ||
	    metric == MetricType::SharpeRatio);
  }

  MetricsBundle::MetricsBundle(double winRate,
			       double avgRMultiple,
			       const MetricValue& profitFactor,
			       double sharpeRatio,
			       double maxDrawdown,
			       double totalReturnPercent,
			       unsigned int totalTrades,
			       unsigned int winningTrades,
			       unsigned int losingTrades)
    : mWinRate(winRate),
      mAvgRMultiple(avgRMultiple),
      mProfitFactor(profitFactor),
      mSharpeRatio(sharpeRatio),
      mMaxDrawdown(maxDrawdown),
      mTotalReturnPercent(totalReturnPercent),
      mTotalTrades(totalTrades),
      mWinningTrades(winningTrades),
      mLosingTrades(losingTrades)
  {
    if (!std::isfinite(winRate) || winRate < 0.0 || winRate > 1.0)
      throw std::domain_error("MetricsBundle: win rate must be in [0, 1]");

    if (!std::isfinite(avgRMultiple) || !std::isfinite(sharpeRatio) || !std::isfinite(totalReturnPercent))
      throw std::domain_error("MetricsBundle: metrics must be finite numbers");

    if (!std::isfinite(maxDrawdown) || maxDrawdown < 0.0 || maxDrawdown > 1.0)
      throw std::domain_error("MetricsBundle: max drawdown must be in [0, 1]");

    if (profitFactor.isFinite())
      {
	const double pf = *profitFactor.getFiniteValue();
	if (!std::isfinite(pf) || pf < 0.0)
	  throw std::domain_error("MetricsBundle: profit factor must be non-negative");
      }

    if (winningTrades + losingTrades > totalTrades)
      throw std::domain_error("MetricsBundle: winning + losing trades exceed total trades");
  }

  MetricsBundle::MetricsBundle(double winRate,
			       double avgRMultiple,
			       const MetricValue& profitFactor)
    : MetricsBundle(winRate, avgRMultiple, profitFactor, 0.0, 0.0, 0.0, 0, 0, 0)
  {}

  MetricValue MetricsBundle::getMetric(MetricType metric) const
  {
    switch (metric)
      {
      case MetricType::WinRate:
	return MetricValue::finite(mWinRate);
      case MetricType::AvgRMultiple:
	return MetricValue::finite(mAvgRMultiple);
      case MetricType::ProfitFactor:
	return mProfitFactor;
      case MetricType::SharpeRatio:
	return MetricValue::finite(mSharpeRatio);
      case MetricType::MaxDrawdown:
	return MetricValue::finite(mMaxDrawdown);
      case MetricType::TotalReturn:
	return MetricValue::finite(mTotalReturnPercent);
      }

    throw std::invalid_argument("MetricsBundle::getMetric: unknown metric type");
  }

  bool operator==(const MetricsBundle& lhs, const MetricsBundle& rhs)
  {
    for (MetricType metric : kAllMetricTypes)
      {
	if (lhs.getMetric(metric) != rhs.getMetric(metric))
	  return false;
      }

    return (lhs.getTotalTrades() == rhs.getTotalTrades() &&
	    lhs.getWinningTrades() == rhs.getWinningTrades() &&
	    lhs.getLosingTrades() == rhs.getLosingTrades());
  }
}
