// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_TIME_FRAME_H
#define __REBALANCER_TIME_FRAME_H 1

#include <stdexcept>
#include <string>

namespace rebalancer
{
  //
  // class TimeFrameException
  //

  class TimeFrameException : public std::domain_error
  {
  public:
    TimeFrameException(const std::string msg) 
      : std::domain_error(msg)
    {}
    
    ~TimeFrameException()
    {}
    
  };

  // DAILY is the bar frequency of price series. MONTHLY, QUARTERLY and
  // YEARLY double as rebalance frequencies.
  class TimeFrame
  {
  public:
    enum Duration {DAILY, WEEKLY, MONTHLY, QUARTERLY, YEARLY} ;
  };

}

#endif
