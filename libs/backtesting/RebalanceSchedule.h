// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_REBALANCE_SCHEDULE_H
#define __REBALANCER_REBALANCE_SCHEDULE_H 1

#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "BoostDateHelper.h"
#include "DateRange.h"
#include "TimeFrame.h"
#include "TimeFrameUtility.h"

namespace rebalancer
{
  /**
   * @brief Period start dates within the closed range.
   *
   * MONTHLY yields the 1st of every month, QUARTERLY the 1st of January,
   * April, July and October, YEARLY the 1st of January.
   *
   * @throws TimeFrameException for any other frequency.
   */
  inline std::vector<boost::gregorian::date>
  generateRebalanceDates (const DateRange& range, TimeFrame::Duration frequency)
  {
    using boost::gregorian::date;
    using boost::gregorian::months;

    if (!isRebalanceFrequency (frequency))
      throw TimeFrameException ("generateRebalanceDates: unsupported rebalance frequency " +
				timeFrameToString (frequency));

    int step = 1;
    date first;

    switch (frequency)
      {
      case TimeFrame::MONTHLY:
	step = 1;
	first = first_of_month (range.getFirstDate());
	break;
      case TimeFrame::QUARTERLY:
	step = 3;
	first = first_of_quarter (range.getFirstDate());
	break;
      default:
	step = 12;
	first = first_of_year (range.getFirstDate());
	break;
      }

    if (!range.contains (first))
      first = first + months (step);

    std::vector<date> dates;
    for (date d = first; range.contains (d); d = d + months (step))
      dates.push_back (d);

    return dates;
  }

  // An end date before the start date yields no dates.
  inline std::vector<boost::gregorian::date>
  generateRebalanceDates (const boost::gregorian::date& startDate,
			  const boost::gregorian::date& endDate,
			  TimeFrame::Duration frequency)
  {
    if (endDate < startDate)
      {
	if (!isRebalanceFrequency (frequency))
	  throw TimeFrameException ("generateRebalanceDates: unsupported rebalance frequency " +
				    timeFrameToString (frequency));

	return std::vector<boost::gregorian::date>();
      }

    return generateRebalanceDates (DateRange (startDate, endDate), frequency);
  }
}

#endif
