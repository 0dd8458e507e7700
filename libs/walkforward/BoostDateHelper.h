// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//
#ifndef __WFV_BOOST_DATE_HELPER_H
#define __WFV_BOOST_DATE_HELPER_H 1

#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace wfvalidator
{
  typedef boost::gregorian::date WalkForwardDate;
  using boost::gregorian::date_duration;

  /**
   * @brief Calendar month addition with day clamping.
   *
   * The day of month is kept when the target month has it, otherwise it is
   * clamped to the last day of the target month (Jan 31 + 1 month = Feb 28/29).
   * Unlike boost::gregorian::months this never snaps a date that merely
   * happens to be an end of month (Apr 30 + 1 month = May 30, not May 31).
   */
  inline WalkForwardDate add_months (const WalkForwardDate& aDate, int numMonths)
  {
    const long long totalMonths = static_cast<long long>(aDate.year()) * 12
      + static_cast<long long>(aDate.month()) - 1 + numMonths;

    // Gregorian years supported by boost::gregorian::date
    if (totalMonths < 1400LL * 12 || totalMonths > 9999LL * 12 + 11)
      throw std::out_of_range("add_months: " + std::to_string(numMonths) + " months from "
			      + boost::gregorian::to_simple_string(aDate)
			      + " is outside the supported calendar");

    const unsigned short year = static_cast<unsigned short>(totalMonths / 12);
    const unsigned short month = static_cast<unsigned short>(totalMonths % 12 + 1);
    const unsigned short lastDay =
      boost::gregorian::gregorian_calendar::end_of_month_day(year, month);

    unsigned short day = aDate.day().as_number();
    if (day > lastDay)
      day = lastDay;

    return WalkForwardDate(year, month, day);
  }

  /**
   * @brief Number of whole calendar months from firstDate up to lastDate.
   *
   * Counts how many times add_months(firstDate, k) stays <= lastDate, so it
   * agrees with the stepping done by the window generator.
   */
  inline int whole_months_between (const WalkForwardDate& firstDate, const WalkForwardDate& lastDate)
  {
    if (lastDate < firstDate)
      return 0;

    int months = (static_cast<int>(lastDate.year()) - static_cast<int>(firstDate.year())) * 12
      + (static_cast<int>(lastDate.month()) - static_cast<int>(firstDate.month()));

    while (months > 0 && add_months(firstDate, months) > lastDate)
      --months;

    return months;
  }

  // YYYYMMDD, the format used by configuration files
  inline WalkForwardDate parse_undelimited_date (const std::string& dateString)
  {
    return boost::gregorian::from_undelimited_string (dateString);
  }
}

#endif
