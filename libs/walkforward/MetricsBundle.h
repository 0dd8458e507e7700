// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_METRICS_BUNDLE_H
#define __WFV_METRICS_BUNDLE_H 1

#include <array>
#include <optional>
#include <ostream>
#include <string>

namespace wfvalidator
{
  /**
   * @brief Tagged metric value: either a finite real or "unbounded".
   *
   * Profit factor has no finite value when a period has winning trades but no
   * losing trades. Instead of a magic large constant the value carries that
   * fact, and statistics built on top of it drop unbounded observations.
   */
  class MetricValue
  {
  public:
    static MetricValue finite(double value)
    {
      return MetricValue(value, false);
    }

    static MetricValue unbounded()
    {
      return MetricValue(0.0, true);
    }

    MetricValue()
      : MetricValue(0.0, false)
    {}

    bool isFinite() const
    {
      return !mUnbounded;
    }

    bool isUnbounded() const
    {
      return mUnbounded;
    }

    // Finite value, or std::nullopt when unbounded
    std::optional<double> getFiniteValue() const
    {
      if (mUnbounded)
	return std::nullopt;

      return mValue;
    }

  private:
    MetricValue(double value, bool unbounded)
      : mValue(value),
	mUnbounded(unbounded)
    {}

    double mValue;
    bool mUnbounded;
  };

  inline bool operator==(const MetricValue& lhs, const MetricValue& rhs)
  {
    if (lhs.isUnbounded() || rhs.isUnbounded())
      return lhs.isUnbounded() == rhs.isUnbounded();

    return *lhs.getFiniteValue() == *rhs.getFiniteValue();
  }

  inline bool operator!=(const MetricValue& lhs, const MetricValue& rhs)
  {
    return !(lhs == rhs);
  }

  std::ostream& operator<<(std::ostream& os, const MetricValue& value);

  /**
   * @brief The numeric metrics shared by train and validate bundles.
   */
  enum class MetricType
  {
    WinRate,
    AvgRMultiple,
    ProfitFactor,
    SharpeRatio,
    MaxDrawdown,
    TotalReturn
  };

  constexpr std::array<MetricType, 6> kAllMetricTypes = {
    MetricType::WinRate,
    MetricType::AvgRMultiple,
    MetricType::ProfitFactor,
    MetricType::SharpeRatio,
    MetricType::MaxDrawdown,
    MetricType::TotalReturn
  };

  std::string getMetricName(MetricType metric);

  // Accepts the names produced by getMetricName, e.g. "profit_factor"
  MetricType parseMetricType(const std::string& name);

  // True for the metrics allowed to drive degradation detection
  bool isPrimaryMetricCandidate(MetricType metric);

  /**
   * @brief Performance metrics of one backtest run over one date range.
   */
  class MetricsBundle
  {
  public:
    MetricsBundle(double winRate,
		  double avgRMultiple,
		  const MetricValue& profitFactor,
		  double sharpeRatio,
		  double maxDrawdown,
		  double totalReturnPercent,
		  unsigned int totalTrades,
		  unsigned int winningTrades,
		  unsigned int losingTrades);

    MetricsBundle(double winRate,
		  double avgRMultiple,
		  const MetricValue& profitFactor);

    MetricsBundle(const MetricsBundle&) = default;
    MetricsBundle& operator=(const MetricsBundle&) = default;
    ~MetricsBundle() = default;

    double getWinRate() const
    {
      return mWinRate;
    }

    double getAvgRMultiple() const
    {
      return mAvgRMultiple;
    }

    const MetricValue& getProfitFactor() const
    {
      return mProfitFactor;
    }

    double getSharpeRatio() const
    {
      return mSharpeRatio;
    }

    double getMaxDrawdown() const
    {
      return mMaxDrawdown;
    }

    double getTotalReturnPercent() const
    {
      return mTotalReturnPercent;
    }

    unsigned int getTotalTrades() const
    {
      return mTotalTrades;
    }

    unsigned int getWinningTrades() const
    {
      return mWinningTrades;
    }

    unsigned int getLosingTrades() const
    {
      return mLosingTrades;
    }

    MetricValue getMetric(MetricType metric) const;

  private:
    double mWinRate;
    double mAvgRMultiple;
    MetricValue mProfitFactor;
    double mSharpeRatio;
    double mMaxDrawdown;
    double mTotalReturnPercent;
    unsigned int mTotalTrades;
    unsigned int mWinningTrades;
    unsigned int mLosingTrades;
  };

  bool operator==(const MetricsBundle& lhs, const MetricsBundle& rhs);

  inline bool operator!=(const MetricsBundle& lhs, const MetricsBundle& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif
