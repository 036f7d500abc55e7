// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_DATE_RANGE_H
#define __REBALANCER_DATE_RANGE_H 1

#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "BoostDateHelper.h"

namespace rebalancer
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

  // Closed calendar interval [firstDate, lastDate].
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
	throw DateRangeException ("DateRange::DateRange - Second date " + toDateString (lastDate) +
				  " cannot occur before first date " + toDateString (firstDate));
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

    bool contains (const boost::gregorian::date& aDate) const
    {
      return (aDate >= mFirstDate) && (aDate <= mLastDate);
    }

    // Calendar days from the first to the last date.
    long getNumberOfDays() const
    {
      return (mLastDate - mFirstDate).days();
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
}

#endif
