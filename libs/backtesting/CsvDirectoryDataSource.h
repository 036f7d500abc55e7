// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_CSV_DIRECTORY_DATA_SOURCE_H
#define __REBALANCER_CSV_DIRECTORY_DATA_SOURCE_H 1

#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include "MarketDataSource.h"
#include "PriceSeriesCsvReader.h"
#include "csv.h"

namespace rebalancer
{
  /**
   * @class CsvDirectoryDataSource
   * @brief Loads a universe and its price histories from a directory of CSV files.
   *
   * Layout:
   *   universe.csv   header row "code,name" plus optional "industry" and
   *                  "market" columns; one instrument per row.
   *   <code>.csv     one end of day file per instrument, read with
   *                  PriceSeriesCsvReader.
   *
   * Instruments without a price file, or with fewer than minDataDays bars,
   * are dropped at load time and reported to the diagnostic stream.
   */
  template <class Decimal>
  class CsvDirectoryDataSource : public IMarketDataSource<Decimal>
  {
  public:
    static constexpr const char* UniverseFileName = "universe.csv";

    CsvDirectoryDataSource (const std::string& directory,
			    unsigned int minDataDays,
			    std::ostream* diagnostics = nullptr)
      : mDirectory(directory),
	mMinDataDays(minDataDays),
	mDiagnostics(diagnostics),
	mSource(),
	mNumDropped(0)
    {
      if (!boost::filesystem::is_directory (mDirectory))
	throw DataSourceException ("CsvDirectoryDataSource - data directory " + mDirectory.string() + " does not exist");

      boost::filesystem::path universePath = mDirectory / UniverseFileName;
      if (!boost::filesystem::exists (universePath))
	throw DataSourceException ("CsvDirectoryDataSource - universe file " + universePath.string() + " does not exist");

      load (universePath);
    }

    const std::vector<InstrumentDescriptor>& getUniverse() const override
    {
      return mSource.getUniverse();
    }

    std::shared_ptr<const PriceSeries<Decimal>>
    getPriceHistory (const std::string& code) const override
    {
      return mSource.getPriceHistory (code);
    }

    // Instruments listed in universe.csv that failed the data quality filter
    unsigned int getNumDropped() const
    {
      return mNumDropped;
    }

  private:
    void load (const boost::filesystem::path& universePath)
    {
      io::CSVReader<4, io::trim_chars<' '>, io::double_quote_escape<',','\"'>> universeFile (universePath.string().c_str());
      universeFile.read_header (io::ignore_extra_column | io::ignore_missing_column,
				"code", "name", "industry", "market");

      if (!universeFile.has_column ("code"))
	throw DataSourceException ("CsvDirectoryDataSource - " + universePath.string() + " has no code column");

      const bool hasIndustry = universeFile.has_column ("industry");
      const bool hasMarket = universeFile.has_column ("market");

      std::string code, name, industry, market;
      unsigned int numListed = 0;

      while (universeFile.read_row (code, name, industry, market))
	{
	  numListed++;

	  InstrumentDescriptor::AttributeMap attributes;
	  if (hasIndustry && !industry.empty())
	    attributes["industry"] = industry;
	  if (hasMarket && !market.empty())
	    attributes["market"] = market;

	  boost::filesystem::path pricePath = mDirectory / (code + ".csv");
	  if (!boost::filesystem::exists (pricePath))
	    {
	      drop (code, "no price file " + pricePath.string());
	      continue;
	    }

	  PriceSeriesCsvReader<Decimal> reader (pricePath.string(), mDiagnostics);
	  reader.readFile();
	  auto series = reader.getTimeSeries();

	  if (series->getNumEntries() < mMinDataDays)
	    {
	      drop (code, "only " + std::to_string (series->getNumEntries()) + " bars, " +
		    std::to_string (mMinDataDays) + " required");
	      continue;
	    }

	  mSource.addInstrument (InstrumentDescriptor (code, name, attributes), series);
	}

      if (mDiagnostics)
	(*mDiagnostics) << "Loaded " << mSource.getNumInstruments() << " of " << numListed
			<< " instruments from " << mDirectory.string() << std::endl;
    }

    void drop (const std::string& code, const std::string& reason)
    {
      mNumDropped++;
      if (mDiagnostics)
	(*mDiagnostics) << "Dropping " << code << ": " << reason << std::endl;
    }

  private:
    boost::filesystem::path mDirectory;
    unsigned int mMinDataDays;
    std::ostream* mDiagnostics;
    InMemoryMarketDataSource<Decimal> mSource;
    unsigned int mNumDropped;
  };
}

#endif
