// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_MARKET_DATA_SOURCE_H
#define __REBALANCER_MARKET_DATA_SOURCE_H 1

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "Instrument.h"
#include "PriceSeries.h"

namespace rebalancer
{
  class DataSourceException : public std::runtime_error
  {
  public:
  DataSourceException(const std::string msg) 
    : std::runtime_error(msg)
      {}

    ~DataSourceException()
      {}

  };

  /**
   * @class IMarketDataSource
   * @brief Read-only access to the instrument universe and its price history.
   *
   * The universe order is significant: it is the tie-break order used when
   * ranking candidates with equal scores.
   */
  template <class Decimal>
  class IMarketDataSource
  {
  public:
    virtual ~IMarketDataSource()
    {}

    virtual const std::vector<InstrumentDescriptor>& getUniverse() const = 0;

    /**
     * @brief Price history for an instrument.
     * @return The series, or an empty series when the code is unknown.
     */
    virtual std::shared_ptr<const PriceSeries<Decimal>>
    getPriceHistory (const std::string& code) const = 0;
  };

  /**
   * @class InMemoryMarketDataSource
   * @brief A data source populated by the caller.
   *
   * Instruments are kept in insertion order and codes must be unique.
   */
  template <class Decimal>
  class InMemoryMarketDataSource : public IMarketDataSource<Decimal>
  {
  public:
    typedef std::shared_ptr<const PriceSeries<Decimal>> PriceSeriesPtr;

    InMemoryMarketDataSource()
      : mUniverse(),
	mPriceHistories(),
	mEmptySeries(std::make_shared<PriceSeries<Decimal>>())
    {}

    InMemoryMarketDataSource (const InMemoryMarketDataSource<Decimal>& rhs) = default;
    InMemoryMarketDataSource<Decimal>& operator=(const InMemoryMarketDataSource<Decimal>& rhs) = default;

    ~InMemoryMarketDataSource()
    {}

    /**
     * @brief Add an instrument and its price history.
     * @throws DataSourceException if the code already exists or the series is null.
     */
    void addInstrument (const InstrumentDescriptor& descriptor, PriceSeriesPtr history)
    {
      if (!history)
	throw DataSourceException ("addInstrument - price history for " + descriptor.getCode() + " is null");

      if (mPriceHistories.find (descriptor.getCode()) != mPriceHistories.end())
	throw DataSourceException ("addInstrument - instrument " + descriptor.getCode() + " already exists in data source");

      mUniverse.push_back (descriptor);
      mPriceHistories.insert (std::make_pair (descriptor.getCode(), history));
    }

    const std::vector<InstrumentDescriptor>& getUniverse() const override
    {
      return mUniverse;
    }

    PriceSeriesPtr getPriceHistory (const std::string& code) const override
    {
      auto it = mPriceHistories.find (code);
      if (it == mPriceHistories.end())
	return mEmptySeries;

      return it->second;
    }

    unsigned int getNumInstruments() const
    {
      return static_cast<unsigned int>(mUniverse.size());
    }

    std::optional<InstrumentDescriptor> findInstrument (const std::string& code) const
    {
      for (const auto& descriptor : mUniverse)
	if (descriptor.getCode() == code)
	  return descriptor;

      return std::nullopt;
    }

  private:
    std::vector<InstrumentDescriptor> mUniverse;
    std::map<std::string, PriceSeriesPtr> mPriceHistories;
    PriceSeriesPtr mEmptySeries;
  };
}

#endif
