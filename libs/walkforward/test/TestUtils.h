#pragma once

#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "../MetricsBundle.h"
#include "../ValidationWindow.h"
#include "../WalkForwardConfig.h"
#include "../WindowResult.h"

// YYYYMMDD
boost::gregorian::date createDate (const std::string& dateString);

// Bundle with only the three core metrics set
wfvalidator::MetricsBundle createMetrics (double winRate, double avgRMultiple, double profitFactor);

wfvalidator::MetricsBundle createMetricsWithUnboundedPF (double winRate, double avgRMultiple);

// One symbol, profit factor primary, default threshold, sequential
wfvalidator::WalkForwardConfig createConfig (const std::string& startDate,
					     const std::string& endDate,
					     int trainMonths,
					     int validateMonths);

// Window index of a 6m train / 3m validate run starting 2020-01-01
wfvalidator::ValidationWindow createWindow (unsigned int index);

// Scored result whose ratios and degradation flag are computed the way the engine does
wfvalidator::WindowResult createScoredResult (unsigned int index,
					      const wfvalidator::MetricsBundle& trainMetrics,
					      const wfvalidator::MetricsBundle& validateMetrics,
					      double threshold = 0.80);

wfvalidator::WindowResult createFailedResult (unsigned int index,
					      wfvalidator::WindowFailureKind kind);
