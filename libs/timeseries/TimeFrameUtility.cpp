// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <boost/algorithm/string.hpp>
#include "TimeFrameUtility.h"

namespace rebalancer
{
  TimeFrame::Duration getTimeFrameFromString(const std::string& timeFrameString)
  {
    std::string upperCaseTimeFrameStr = boost::to_upper_copy(boost::trim_copy(timeFrameString));
    
    if (upperCaseTimeFrameStr == std::string("DAILY") || upperCaseTimeFrameStr == std::string("D"))
      return TimeFrame::DAILY;
    else if (upperCaseTimeFrameStr == std::string("WEEKLY") || upperCaseTimeFrameStr == std::string("W"))
      return TimeFrame::WEEKLY;
    else if (upperCaseTimeFrameStr == std::string("MONTHLY") || upperCaseTimeFrameStr == std::string("M"))
      return TimeFrame::MONTHLY;
    else if (upperCaseTimeFrameStr == std::string("QUARTERLY") || upperCaseTimeFrameStr == std::string("Q"))
      return TimeFrame::QUARTERLY;
    else if (upperCaseTimeFrameStr == std::string("YEARLY") || upperCaseTimeFrameStr == std::string("Y"))
      return TimeFrame::YEARLY;
    else
      throw TimeFrameException("getTimeFrameFromString - timeframe string " +upperCaseTimeFrameStr +" not recognized");
  }

  std::string timeFrameToString(TimeFrame::Duration timeFrame)
  {
    switch (timeFrame)
      {
      case TimeFrame::DAILY:
	return "DAILY";
      case TimeFrame::WEEKLY:
	return "WEEKLY";
      case TimeFrame::MONTHLY:
	return "MONTHLY";
      case TimeFrame::QUARTERLY:
	return "QUARTERLY";
      case TimeFrame::YEARLY:
	return "YEARLY";
      }

    throw TimeFrameException("timeFrameToString - unknown time frame");
  }

  bool isRebalanceFrequency(TimeFrame::Duration timeFrame)
  {
    return (timeFrame == TimeFrame::MONTHLY ||
	    timeFrame == TimeFrame::QUARTERLY ||
	    timeFrame == TimeFrame::YEARLY);
  }
}
