// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_DATE_RANGE_H
#define __WFV_DATE_RANGE_H 1

#include <ostream>
#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace wfvalidator
{
  class DateRangeException : public std::runtime_error
  {
  public:
  DateRangeException(const std::string& msg)
    : std::runtime_error(msg)
      {}

    ~DateRangeException()
      {}
  };

  /**
   * @brief Closed calendar range [firstDate, lastDate].
   *
   * This is the range handed to a BacktestAdapter: both dates are trading
   * dates that belong to the period.
   */
  class DateRange
  {
  public:
    DateRange(const boost::gregorian::date& firstDate, const boost::gregorian::date& lastDate)
      : mFirstDate(firstDate),
	mLastDate(lastDate)
    {
      if (firstDate.is_special() || lastDate.is_special())
	throw DateRangeException ("DateRange::DateRange - dates must be valid calendar dates");

      if (lastDate < firstDate)
	throw DateRangeException ("DateRange::DateRange - Second date cannot occur before first date");
    }

    DateRange(const DateRange&) = default;
    DateRange& operator=(const DateRange&) = default;
    ~DateRange() noexcept = default;

    const boost::gregorian::date& getFirstDate() const
    {
      return mFirstDate;
    }

    const boost::gregorian::date& getLastDate() const
    {
      return mLastDate;
    }

    long getNumDays() const
    {
      return (mLastDate - mFirstDate).days() + 1;
    }

    std::string toString() const
    {
      return boost::gregorian::to_iso_extended_string(mFirstDate) + ".."
	+ boost::gregorian::to_iso_extended_string(mLastDate);
    }

  private:
    boost::gregorian::date mFirstDate;
    boost::gregorian::date mLastDate;
  };

  inline bool operator==(const DateRange& lhs, const DateRange& rhs)
    {
      return ((lhs.getFirstDate() == rhs.getFirstDate()) &&
	      (lhs.getLastDate() == rhs.getLastDate()));
    }

  inline bool operator!=(const DateRange& lhs, const DateRange& rhs)
    {
      return !(lhs == rhs);
    }

  // Orders by first date, then last date, so ranges can key a std::map
  inline bool operator<(const DateRange& lhs, const DateRange& rhs)
    {
      if (lhs.getFirstDate() != rhs.getFirstDate())
	return lhs.getFirstDate() < rhs.getFirstDate();

      return lhs.getLastDate() < rhs.getLastDate();
    }

  inline std::ostream& operator<<(std::ostream& os, const DateRange& r)
    {
      return os << r.toString();
    }
}

#endif
