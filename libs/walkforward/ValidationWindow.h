// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __WFV_VALIDATION_WINDOW_H
#define __WFV_VALIDATION_WINDOW_H 1

#include <boost/date_time/gregorian/gregorian.hpp>
#include "DateRange.h"

namespace wfvalidator
{
  /**
   * @brief One train/validate pair of a walk-forward run.
   *
   * Boundaries are half-open: the train period is [trainStart, trainEnd) and
   * the validate period is [validateStart, validateEnd) with
   * validateStart == trainEnd. getTrainDateRange()/getValidateDateRange()
   * give the equivalent closed ranges handed to a BacktestAdapter.
   */
  class ValidationWindow
  {
  public:
    ValidationWindow(unsigned int index,
		     const boost::gregorian::date& trainStart,
		     const boost::gregorian::date& trainEnd,
		     const boost::gregorian::date& validateEnd)
      : mIndex(index),
	mTrainStart(trainStart),
	mTrainEnd(trainEnd),
	mValidateEnd(validateEnd)
    {
      if (!(trainStart < trainEnd) || !(trainEnd < validateEnd))
	throw DateRangeException("ValidationWindow: boundaries must be strictly increasing");
    }

    ValidationWindow(const ValidationWindow&) = default;
    ValidationWindow& operator=(const ValidationWindow&) = default;
    ~ValidationWindow() = default;

    // 0-based ordinal of the window within its run
    unsigned int getIndex() const
    {
      return mIndex;
    }

    // 1-based number used in log output and reports
    unsigned int getWindowNumber() const
    {
      return mIndex + 1;
    }

    const boost::gregorian::date& getTrainStart() const
    {
      return mTrainStart;
    }

    const boost::gregorian::date& getTrainEnd() const
    {
      return mTrainEnd;
    }

    const boost::gregorian::date& getValidateStart() const
    {
      return mTrainEnd;
    }

    const boost::gregorian::date& getValidateEnd() const
    {
      return mValidateEnd;
    }

    DateRange getTrainDateRange() const
    {
      return DateRange(mTrainStart, mTrainEnd - boost::gregorian::days(1));
    }

    DateRange getValidateDateRange() const
    {
      return DateRange(mTrainEnd, mValidateEnd - boost::gregorian::days(1));
    }

  private:
    unsigned int mIndex;
    boost::gregorian::date mTrainStart;
    boost::gregorian::date mTrainEnd;
    boost::gregorian::date mValidateEnd;
  };

  inline bool operator==(const ValidationWindow& lhs, const ValidationWindow& rhs)
  {
    return (lhs.getIndex() == rhs.getIndex() &&
	    lhs.getTrainStart() == rhs.getTrainStart() &&
	    lhs.getTrainEnd() == rhs.getTrainEnd() &&
	    lhs.getValidateEnd() == rhs.getValidateEnd());
  }

  inline bool operator!=(const ValidationWindow& lhs, const ValidationWindow& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif
