// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <string>
#include "WindowGenerator.h"
#include "BoostDateHelper.h"
#include "WalkForwardException.h"

namespace wfvalidator
{
  WindowGenerator::WindowGenerator(int trainPeriodMonths, int validatePeriodMonths)
    : mTrainPeriodMonths(trainPeriodMonths),
      mValidatePeriodMonths(validatePeriodMonths)
  {
    if (trainPeriodMonths <= 0 || validatePeriodMonths <= 0)
      throw ConfigurationException("WindowGenerator: period lengths must be greater than 0 months");
  }

  std::vector<ValidationWindow>
  WindowGenerator::generate(const boost::gregorian::date& overallStart,
			    const boost::gregorian::date& overallEnd) const
  {
    if (overallStart.is_special() || overallEnd.is_special() || !(overallStart < overallEnd))
      throw ConfigurationException("WindowGenerator: overall end date must be after overall start date");

    // Checked up front so oversized periods never reach the month arithmetic
    const int availableMonths = whole_months_between(overallStart, overallEnd);
    const long long requiredMonths = static_cast<long long>(mTrainPeriodMonths) + mValidatePeriodMonths;
    if (requiredMonths > availableMonths)
      throw InsufficientDataException("WindowGenerator: date range too short for walk-forward test, requires at least "
				      + std::to_string(requiredMonths)
				      + " months but only "
				      + std::to_string(availableMonths)
				      + " available");

    std::vector<ValidationWindow> windows;

    // Every boundary is computed from overallStart so end-of-month clamping
    // in one window never shifts the next one.
    for (int offset = 0; ; offset += mValidatePeriodMonths)
      {
	const auto trainStart = add_months(overallStart, offset);
	const auto trainEnd = add_months(overallStart, offset + mTrainPeriodMonths);
	const auto validateEnd = add_months(overallStart, offset + mTrainPeriodMonths + mValidatePeriodMonths);

	if (validateEnd > overallEnd)
	  break;

	windows.emplace_back(static_cast<unsigned int>(windows.size()), trainStart, trainEnd, validateEnd);
      }

    return windows;
  }

  unsigned int WindowGenerator::countWindows(int totalMonths, int trainPeriodMonths, int validatePeriodMonths)
  {
    if (trainPeriodMonths <= 0 || validatePeriodMonths <= 0 || totalMonths < trainPeriodMonths)
      return 0;

    return static_cast<unsigned int>((totalMonths - trainPeriodMonths) / validatePeriodMonths);
  }
}
