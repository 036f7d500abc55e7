// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//
#ifndef __REBALANCER_BOOST_DATE_HELPER_H
#define __REBALANCER_BOOST_DATE_HELPER_H 1

#include <string>
#include <stdexcept>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/algorithm/string.hpp>

namespace rebalancer
{
  typedef boost::gregorian::date TimeSeriesDate;
  using boost::gregorian::date_duration;

  inline bool isWeekend (const boost::gregorian::date& aDate)
  {
    return (aDate.day_of_week() == boost::date_time::Saturday ||
	    aDate.day_of_week() == boost::date_time::Sunday);
  }

  inline bool isWeekday (const boost::gregorian::date& aDate)
  {
    return !isWeekend(aDate);
  }

  inline TimeSeriesDate boost_next_month (const boost::gregorian::date& aDate)
  {
    return aDate + boost::gregorian::months(1);
  }

  inline bool is_first_of_month (const boost::gregorian::date& aDate)
  {
    return (aDate.day().as_number() == 1);
  }

  inline TimeSeriesDate first_of_month (const boost::gregorian::date& aDate)
  {
    if (aDate.day().as_number() != 1)
      {
	return boost::gregorian::date (aDate.year(), aDate.month(),boost::gregorian:: greg_day (1));
      }
    else
      return aDate;
  }

  /**
   * @brief   First day of the calendar quarter containing the date.
   * @returns Jan 1, Apr 1, Jul 1 or Oct 1 of the date's year.
   */
  inline TimeSeriesDate first_of_quarter (const boost::gregorian::date& aDate)
  {
    unsigned short quarterStartMonth = ((aDate.month().as_number() - 1) / 3) * 3 + 1;
    return boost::gregorian::date (aDate.year(), quarterStartMonth, 1);
  }

  inline bool is_first_of_quarter (const boost::gregorian::date& aDate)
  {
    return aDate == first_of_quarter (aDate);
  }

  inline TimeSeriesDate first_of_year (const boost::gregorian::date& aDate)
  {
    return boost::gregorian::date (aDate.year(), boost::gregorian::Jan, 1);
  }

  inline bool is_first_of_year (const boost::gregorian::date& aDate)
  {
    return aDate == first_of_year (aDate);
  }

  /**
   * @brief Parses a calendar date.
   *
   * Accepts the ISO extended form (2021-01-04) and the undelimited form
   * (20210104) used by most end of day data vendors.
   *
   * @throws std::domain_error if the string is not a valid date.
   */
  inline TimeSeriesDate parseDateString (const std::string& dateString)
  {
    std::string trimmed = boost::trim_copy(dateString);

    try
      {
	if (trimmed.find('-') != std::string::npos)
	  return boost::gregorian::from_simple_string (trimmed);
	else
	  return boost::gregorian::from_undelimited_string (trimmed);
      }
    catch (const std::exception& e)
      {
	throw std::domain_error ("parseDateString - invalid date '" + dateString + "': " + e.what());
      }
  }

  // YYYY-MM-DD
  inline std::string toDateString (const boost::gregorian::date& aDate)
  {
    return boost::gregorian::to_iso_extended_string (aDate);
  }
}


#endif
