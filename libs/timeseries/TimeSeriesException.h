// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_TIMESERIES_EXCEPTION_H
#define __REBALANCER_TIMESERIES_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace rebalancer
{
  class TimeSeriesException : public std::runtime_error
  {
  public:
    TimeSeriesException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~TimeSeriesException() = default;
  };

  // Raised when a bar is added on a date the series already holds or when
  // bars would break the strictly increasing date order.
  class TimeSeriesDuplicateDateException : public TimeSeriesException
  {
  public:
      explicit TimeSeriesDuplicateDateException(const std::string& msg) 
        : TimeSeriesException(msg) {}
  };

  class TimeSeriesDataNotFoundException : public TimeSeriesException
  {
  public:
      explicit TimeSeriesDataNotFoundException(const std::string& msg) 
        : TimeSeriesException(msg) {}
  };

} // namespace rebalancer

#endif // __REBALANCER_TIMESERIES_EXCEPTION_H
