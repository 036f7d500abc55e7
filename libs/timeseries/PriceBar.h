// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_PRICE_BAR_H
#define __REBALANCER_PRICE_BAR_H 1

#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "BoostDateHelper.h"
#include "DecimalConstants.h"
#include "number.h"

namespace rebalancer
{
  //
  // class PriceBarException
  //

  class PriceBarException : public std::domain_error
  {
  public:
    PriceBarException(const std::string msg) 
      : std::domain_error(msg)
    {}
    
    ~PriceBarException()
    {}
    
  };

  //
  // class PriceBar
  //
  // One trading day of open, high, low, close and volume for a single
  // instrument. The constructor rejects bars whose high/low do not bracket
  // the open and close, as well as negative volume.
  //

  template <class Decimal> class PriceBar
  {
  public:
    PriceBar (const boost::gregorian::date& barDate,
	      const Decimal& open,
	      const Decimal& high,
	      const Decimal& low,
	      const Decimal& close,
	      const Decimal& volume)
      : mDate(barDate),
	mOpen(open),
	mHigh(high),
	mLow(low),
	mClose(close),
	mVolume(volume)
    {
      if (high < open)
	throw PriceBarException(std::string ("PriceBarException: on - ") +toDateString (barDate) +std::string (" high of ") +num::toString (high) +std::string(" is less that open of ") +num::toString (open));

      if (high < low)
	throw PriceBarException(std::string ("PriceBarException: on - ") +toDateString (barDate) +std::string (" high of ") +num::toString (high) +std::string(" is less that low of ") +num::toString (low));

      if (high < close)
	throw PriceBarException(std::string ("PriceBarException: on - ") +toDateString (barDate) +std::string (" high of ") +num::toString (high) +std::string(" is less that close of ") +num::toString (close));

      if (low > open)
	throw PriceBarException(std::string ("PriceBarException: on - ") +toDateString (barDate) +std::string (" low of ") +num::toString (low) +std::string (" is greater than open of ") +num::toString (open));

      if (low > close)
	throw PriceBarException(std::string ("PriceBarException: on - ") +toDateString (barDate) +std::string (" low of ") +num::toString (low) +std::string (" is greater than close of ") +num::toString (close));

      if (volume < DecimalConstants<Decimal>::DecimalZero)
	throw PriceBarException(std::string ("PriceBarException: on - ") +toDateString (barDate) +std::string (" negative volume ") +num::toString (volume));
    }

    PriceBar (const PriceBar<Decimal>& rhs) = default;
    PriceBar<Decimal>& operator=(const PriceBar<Decimal>& rhs) = default;
    ~PriceBar() = default;

    const boost::gregorian::date& getDate() const
    {
      return mDate;
    }

    const Decimal& getOpenValue() const
    {
      return mOpen;
    }

    const Decimal& getHighValue() const
    {
      return mHigh;
    }

    const Decimal& getLowValue() const
    {
      return mLow;
    }

    const Decimal& getCloseValue() const
    {
      return mClose;
    }

    const Decimal& getVolumeValue() const
    {
      return mVolume;
    }

  private:
    boost::gregorian::date mDate;
    Decimal mOpen;
    Decimal mHigh;
    Decimal mLow;
    Decimal mClose;
    Decimal mVolume;
  };

  template <class Decimal>
  bool operator==(const PriceBar<Decimal>& lhs, const PriceBar<Decimal>& rhs)
  {
    return ((lhs.getDate() == rhs.getDate()) && 
	    (lhs.getOpenValue() == rhs.getOpenValue()) &&
	    (lhs.getHighValue() == rhs.getHighValue()) &&
	    (lhs.getLowValue() == rhs.getLowValue()) &&
	    (lhs.getCloseValue() == rhs.getCloseValue()) &&
	    (lhs.getVolumeValue() == rhs.getVolumeValue()));
  }

  template <class Decimal>
  bool operator!=(const PriceBar<Decimal>& lhs, const PriceBar<Decimal>& rhs)
  { 
    return !(lhs == rhs); 
  }
}


#endif
