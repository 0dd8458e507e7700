// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_WINDOW_GENERATOR_H
#define __WFV_WINDOW_GENERATOR_H 1

#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "ValidationWindow.h"

namespace wfvalidator
{
  /**
   * @brief Partitions an overall range into rolling train/validate windows.
   *
   * Window k trains on [start + k*V, start + k*V + T) and validates on the
   * following V months, where T and V are the train and validate lengths in
   * months. Windows are produced while the validate end does not pass the
   * overall end, so their number is floor((totalMonths - T) / V).
   */
  class WindowGenerator
  {
  public:
    WindowGenerator(int trainPeriodMonths, int validatePeriodMonths);

    /**
     * @param overallStart first date of the overall range
     * @param overallEnd end of the overall range (exclusive)
     * @throws ConfigurationException if the range or lengths are invalid
     * @throws InsufficientDataException if not even one window fits
     */
    std::vector<ValidationWindow> generate(const boost::gregorian::date& overallStart,
					   const boost::gregorian::date& overallEnd) const;

    // Number of windows generate() would produce, without the error on zero
    static unsigned int countWindows(int totalMonths, int trainPeriodMonths, int validatePeriodMonths);

  private:
    int mTrainPeriodMonths;
    int mValidatePeriodMonths;
  };
}

#endif
