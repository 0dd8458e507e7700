// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <cmath>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"
#include "WalkForwardConfig.h"
#include "WalkForwardException.h"
#include "BoostDateHelper.h"

namespace wfvalidator
{
  void WalkForwardConfig::validate() const
  {
    if (symbols.empty())
      throw ConfigurationException("WalkForwardConfig: symbol set cannot be empty");

    for (const auto& symbol : symbols)
      {
	if (boost::algorithm::trim_copy(symbol).empty())
	  throw ConfigurationException("WalkForwardConfig: symbols cannot be blank");
      }

    if (overallStartDate.is_special() || overallEndDate.is_special())
      throw ConfigurationException("WalkForwardConfig: overall start and end dates must be set");

    if (overallEndDate <= overallStartDate)
      throw ConfigurationException("WalkForwardConfig: overall end date must be after overall start date");

    if (trainPeriodMonths <= 0)
      throw ConfigurationException("WalkForwardConfig: train period months must be greater than 0");

    if (validatePeriodMonths <= 0)
      throw ConfigurationException("WalkForwardConfig: validate period months must be greater than 0");

    if (!std::isfinite(degradationThreshold) ||
	degradationThreshold < 0.0 || degradationThreshold > 1.0)
      throw ConfigurationException("WalkForwardConfig: degradation threshold must be in [0, 1]");

    if (!isPrimaryMetricCandidate(primaryMetric))
      throw ConfigurationException("WalkForwardConfig: " + getMetricName(primaryMetric)
				   + " cannot be used as the primary metric");

    if (maxConcurrency == 0)
      throw ConfigurationException("WalkForwardConfig: max concurrency must be at least 1");

    if (windowTimeout.count() < 0)
      throw ConfigurationException("WalkForwardConfig: window timeout cannot be negative");
  }

  int WalkForwardConfig::getTotalMonths() const
  {
    return whole_months_between(overallStartDate, overallEndDate);
  }

  static std::vector<std::string> splitList(const std::string& field, const char* separators)
  {
    std::vector<std::string> tokens;
    std::vector<std::string> result;

    if (boost::algorithm::trim_copy(field).empty())
      return result;

    boost::algorithm::split(tokens, field, boost::algorithm::is_any_of(separators));
    for (auto& token : tokens)
      {
	boost::algorithm::trim(token);
	if (!token.empty())
	  result.push_back(token);
      }

    return result;
  }

  static StrategyConfiguration parseStrategyParameters(const std::string& field)
  {
    StrategyConfiguration strategyConfig;

    for (const auto& pair : splitList(field, "|"))
      {
	auto pos = pair.find('=');
	if (pos == std::string::npos || pos == 0)
	  throw ConfigurationException("WalkForwardConfigFileReader: strategy parameter '" + pair
				       + "' is not of the form key=value");

	strategyConfig.setParameter(boost::algorithm::trim_copy(pair.substr(0, pos)),
				    boost::algorithm::trim_copy(pair.substr(pos + 1)));
      }

    return strategyConfig;
  }

  template <class T>
  static T parseField(const std::string& fieldName, const std::string& value)
  {
    try
      {
	return boost::lexical_cast<T>(boost::algorithm::trim_copy(value));
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw ConfigurationException("WalkForwardConfigFileReader: invalid value '" + value
				     + "' for " + fieldName);
      }
  }

  static boost::gregorian::date parseDateField(const std::string& fieldName, const std::string& value)
  {
    try
      {
	return parse_undelimited_date(boost::algorithm::trim_copy(value));
      }
    catch (const std::exception& e)
      {
	throw ConfigurationException("WalkForwardConfigFileReader: invalid date '" + value
				     + "' for " + fieldName + ": " + e.what());
      }
  }

  WalkForwardConfigFileReader::WalkForwardConfigFileReader (const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {}

  WalkForwardConfig WalkForwardConfigFileReader::readConfigurationFile() const
  {
    boost::filesystem::path configPath(mConfigurationFileName);
    if (!boost::filesystem::exists(configPath))
      throw ConfigurationException("WalkForwardConfigFileReader: configuration file "
				   + configPath.string() + " does not exist");

    std::string symbolsStr, startDateStr, endDateStr, trainMonthsStr, validateMonthsStr;
    std::string thresholdStr, primaryMetricStr, concurrencyStr, timeoutStr, strategyStr;

    try
      {
	// Check if the file has a header row by reading the first line
	bool hasHeader = false;
	{
	  io::CSVReader<10> csvConfigFileCheck(mConfigurationFileName.c_str());
	  char* firstLine = csvConfigFileCheck.next_line();
	  if (firstLine)
	    {
	      std::string firstLineStr(firstLine);
	      hasHeader = (firstLineStr.find("Symbols") != std::string::npos &&
			   firstLineStr.find("StartDate") != std::string::npos);
	    }
	}

	io::CSVReader<10> csvConfigFile(mConfigurationFileName.c_str());

	if (hasHeader)
	  csvConfigFile.read_header(io::ignore_no_column, "Symbols", "StartDate", "EndDate",
				    "TrainMonths", "ValidateMonths", "DegradationThreshold",
				    "PrimaryMetric", "MaxConcurrency", "WindowTimeoutMs",
				    "StrategyParameters");
	else
	  csvConfigFile.set_header("Symbols", "StartDate", "EndDate",
				   "TrainMonths", "ValidateMonths", "DegradationThreshold",
				   "PrimaryMetric", "MaxConcurrency", "WindowTimeoutMs",
				   "StrategyParameters");

	if (!csvConfigFile.read_row(symbolsStr, startDateStr, endDateStr, trainMonthsStr,
				    validateMonthsStr, thresholdStr, primaryMetricStr,
				    concurrencyStr, timeoutStr, strategyStr))
	  throw ConfigurationException("WalkForwardConfigFileReader: " + mConfigurationFileName
				       + " contains no configuration row");
      }
    catch (const io::error::base& e)
      {
	throw ConfigurationException("WalkForwardConfigFileReader: cannot parse "
				     + mConfigurationFileName + ": " + e.what());
      }

    WalkForwardConfig config;
    config.symbols = splitList(symbolsStr, ";");
    config.overallStartDate = parseDateField("StartDate", startDateStr);
    config.overallEndDate = parseDateField("EndDate", endDateStr);
    config.trainPeriodMonths = parseField<int>("TrainMonths", trainMonthsStr);
    config.validatePeriodMonths = parseField<int>("ValidateMonths", validateMonthsStr);

    if (!boost::algorithm::trim_copy(thresholdStr).empty())
      config.degradationThreshold = parseField<double>("DegradationThreshold", thresholdStr);

    if (!boost::algorithm::trim_copy(primaryMetricStr).empty())
      config.primaryMetric = parseMetricType(primaryMetricStr);

    if (!boost::algorithm::trim_copy(concurrencyStr).empty())
      {
	const int concurrency = parseField<int>("MaxConcurrency", concurrencyStr);
	if (concurrency < 1)
	  throw ConfigurationException("WalkForwardConfigFileReader: MaxConcurrency must be at least 1");
	config.maxConcurrency = static_cast<std::size_t>(concurrency);
      }

    if (!boost::algorithm::trim_copy(timeoutStr).empty())
      config.windowTimeout = std::chrono::milliseconds(parseField<long>("WindowTimeoutMs", timeoutStr));

    config.strategyConfig = parseStrategyParameters(strategyStr);

    config.validate();
    return config;
  }
}
