// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_REPORT_ROUNDING_H
#define __WFV_REPORT_ROUNDING_H 1

#include <cmath>

namespace wfvalidator
{
  constexpr int kReportDecimalPlaces = 4;

  // Half away from zero at four decimal digits. Only applied to values that
  // are reported or compared against a configured threshold.
  inline double roundForReport(double value)
  {
    if (!std::isfinite(value))
      return value;

    const double scale = 10000.0;
    return std::round(value * scale) / scale;
  }
}

#endif
