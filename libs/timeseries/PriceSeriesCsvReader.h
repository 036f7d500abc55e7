// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_PRICE_SERIES_CSV_READER_H
#define __REBALANCER_PRICE_SERIES_CSV_READER_H 1

#include <fstream>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "PriceSeries.h"
#include "BoostDateHelper.h"
#include "DecimalConstants.h"
#include "number.h"
#include "csv.h"

namespace rebalancer
{
  //
  // class PriceSeriesCsvReader
  //
  // Reads an end of day file with a header row of
  //   Date,Open,High,Low,Close,Volume
  // Extra columns are ignored. Dates may be 2021-01-04 or 20210104.
  // Rows whose high/low do not bracket the open and close are skipped and
  // reported to the optional diagnostic stream.
  //

  template <class Decimal>
  class PriceSeriesCsvReader
  {
  public:
    explicit PriceSeriesCsvReader (const std::string& fileName,
				   std::ostream* diagnostics = nullptr)
      : mFileName (fileName),
	mDiagnostics(diagnostics),
	mTimeSeries(std::make_shared<PriceSeries<Decimal>>()),
	mNumRejectedRows(0)
    {
      std::ifstream fin(mFileName);
      if (!fin.is_open())
	throw std::runtime_error("Cannot open file: " + mFileName);
    }

    PriceSeriesCsvReader(const PriceSeriesCsvReader& rhs) = default;
    PriceSeriesCsvReader& operator=(const PriceSeriesCsvReader& rhs) = default;

    ~PriceSeriesCsvReader()
    {}

    const std::string& getFileName() const
    {
      return mFileName;
    }

    std::shared_ptr<PriceSeries<Decimal>> getTimeSeries()
    {
      return mTimeSeries;
    }

    unsigned long getNumRejectedRows() const
    {
      return mNumRejectedRows;
    }

    void readFile()
    {
      io::CSVReader<6, io::trim_chars<' '>, io::double_quote_escape<',','\"'>> csvFile(mFileName.c_str());
      csvFile.read_header(io::ignore_extra_column,
			  "Date", "Open", "High", "Low", "Close", "Volume");

      std::string dateString;
      std::string openString, highString, lowString, closeString, volumeString;

      while (csvFile.read_row(dateString, openString, highString,
			      lowString, closeString, volumeString))
	{
	  const boost::gregorian::date entryDate = parseDateString(dateString);
	  const Decimal openPrice = num::fromString<Decimal>(openString);
	  const Decimal highPrice = num::fromString<Decimal>(highString);
	  const Decimal lowPrice = num::fromString<Decimal>(lowString);
	  const Decimal closePrice = num::fromString<Decimal>(closeString);
	  const Decimal volume = num::fromString<Decimal>(volumeString);

	  if (checkForErrors(entryDate, openPrice, highPrice, lowPrice, closePrice, volume))
	    {
	      mNumRejectedRows++;
	      continue;
	    }

	  mTimeSeries->addEntry(PriceBar<Decimal>(entryDate, openPrice, highPrice,
						  lowPrice, closePrice, volume));
	}
    }

  private:
    bool checkForErrors (const boost::gregorian::date& entryDate,
			 const Decimal& openPrice, const Decimal& highPrice,
			 const Decimal& lowPrice, const Decimal& closePrice,
			 const Decimal& volume)
    {
      bool errorFound = false;

      if (highPrice < openPrice || highPrice < lowPrice || highPrice < closePrice)
	{
	  errorFound = true;
	  report(std::string ("OHLC Error: on - ") +toDateString (entryDate) +std::string (" high of ") +num::toString (highPrice) +std::string(" is below open, low or close"));
	}

      if (lowPrice > openPrice || lowPrice > closePrice)
	{
	  errorFound = true;
	  report(std::string ("OHLC Error: on - ") +toDateString (entryDate) +std::string (" low of ") +num::toString (lowPrice) +std::string (" is above open or close"));
	}

      if (volume < DecimalConstants<Decimal>::DecimalZero)
	{
	  errorFound = true;
	  report(std::string ("OHLC Error: on - ") +toDateString (entryDate) +std::string (" negative volume ") +num::toString (volume));
	}

      return errorFound;
    }

    void report(const std::string& message) const
    {
      if (mDiagnostics)
	(*mDiagnostics) << mFileName << ": " << message << std::endl;
    }

  private:
    std::string mFileName;
    std::ostream* mDiagnostics;
    std::shared_ptr<PriceSeries<Decimal>> mTimeSeries;
    unsigned long mNumRejectedRows;
  };
}

#endif
