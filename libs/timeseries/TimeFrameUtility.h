// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_TIME_FRAME_UTILITY_H
#define __REBALANCER_TIME_FRAME_UTILITY_H 1

#include <string>
#include "TimeFrame.h"

namespace rebalancer
{
  // Accepts full names (DAILY, MONTHLY, ...) and the single letter rebalance
  // codes M, Q and Y. Case insensitive.
  extern TimeFrame::Duration getTimeFrameFromString(const std::string& timeFrameString);

  extern std::string timeFrameToString(TimeFrame::Duration timeFrame);

  // True for the time frames a portfolio can be rebalanced on.
  extern bool isRebalanceFrequency(TimeFrame::Duration timeFrame);
}

#endif
