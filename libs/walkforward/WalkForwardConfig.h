// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_WALK_FORWARD_CONFIG_H
#define __WFV_WALK_FORWARD_CONFIG_H 1

#include <chrono>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "MetricsBundle.h"
#include "StrategyConfiguration.h"

namespace wfvalidator
{
  /**
   * @brief Parameters of one walk-forward run.
   *
   * The overall range is half-open: overallEndDate is the first date that is
   * no longer part of the test, so 2020-01-01 .. 2022-01-01 spans exactly
   * 24 months. Call validate() (the engine does) before using the values.
   */
  struct WalkForwardConfig
  {
    static constexpr double kDefaultDegradationThreshold = 0.80;

    std::vector<std::string> symbols;
    boost::gregorian::date overallStartDate;
    boost::gregorian::date overallEndDate;
    int trainPeriodMonths = 6;
    int validatePeriodMonths = 3;
    double degradationThreshold = kDefaultDegradationThreshold;
    MetricType primaryMetric = MetricType::ProfitFactor;
    StrategyConfiguration strategyConfig;

    // 1 runs windows sequentially on the calling thread
    std::size_t maxConcurrency = 1;

    // Time allowed for each backtest call of a window; zero disables the timeout
    std::chrono::milliseconds windowTimeout{0};

    /**
     * @brief Single validation pass over every field.
     * @throws ConfigurationException describing the first invalid field
     */
    void validate() const;

    int getTotalMonths() const;
  };

  /**
   * @brief Reads a WalkForwardConfig from a one-row CSV file.
   *
   * Expected columns (header row optional):
   *   Symbols,StartDate,EndDate,TrainMonths,ValidateMonths,DegradationThreshold,
   *   PrimaryMetric,MaxConcurrency,WindowTimeoutMs,StrategyParameters
   *
   * Symbols are separated by ';', dates are YYYYMMDD and strategy parameters
   * are key=value pairs separated by '|'.
   */
  class WalkForwardConfigFileReader
  {
  public:
    explicit WalkForwardConfigFileReader (const std::string& configurationFileName);
    ~WalkForwardConfigFileReader()
      {}

    WalkForwardConfig readConfigurationFile() const;

  private:
    std::string mConfigurationFileName;
  };
}

#endif
