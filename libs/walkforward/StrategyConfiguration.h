// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_STRATEGY_CONFIGURATION_H
#define __WFV_STRATEGY_CONFIGURATION_H 1

#include <map>
#include <optional>
#include <string>

namespace wfvalidator
{
  /**
   * @brief Named strategy/backtest parameters.
   *
   * The engine never interprets these; they are handed unchanged to every
   * BacktestAdapter call of a run.
   */
  class StrategyConfiguration
  {
    using Map = std::map<std::string, std::string>;

  public:
    typedef Map::const_iterator ConstParameterIterator;

    StrategyConfiguration()
      : mParameters()
    {}

    explicit StrategyConfiguration(const Map& parameters)
      : mParameters(parameters)
    {}

    StrategyConfiguration(const StrategyConfiguration&) = default;
    StrategyConfiguration& operator=(const StrategyConfiguration&) = default;
    ~StrategyConfiguration() = default;

    void setParameter(const std::string& name, const std::string& value)
    {
      mParameters[name] = value;
    }

    std::optional<std::string> getParameter(const std::string& name) const
    {
      auto it = mParameters.find(name);
      if (it == mParameters.end())
	return std::nullopt;

      return it->second;
    }

    std::size_t getNumParameters() const
    {
      return mParameters.size();
    }

    ConstParameterIterator beginParameters() const
    {
      return mParameters.begin();
    }

    ConstParameterIterator endParameters() const
    {
      return mParameters.end();
    }

    bool operator==(const StrategyConfiguration& rhs) const
    {
      return mParameters == rhs.mParameters;
    }

  private:
    Map mParameters;
  };
}

#endif
