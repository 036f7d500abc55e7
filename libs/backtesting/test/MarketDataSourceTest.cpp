#include <catch2/catch_test_macros.hpp>
#include <fstream>
#include <sstream>
#include <boost/filesystem.hpp>
#include "TestUtils.h"
#include "CsvDirectoryDataSource.h"
#include "MarketDataSource.h"

using namespace rebalancer;
using namespace boost::gregorian;

namespace
{
  void writeFile (const boost::filesystem::path& p, const std::string& contents)
  {
    std::ofstream out (p.string());
    out << contents;
  }

  std::string priceFile (const date& firstDate, std::size_t numBars, double close)
  {
    std::ostringstream os;
    os << "Date,Open,High,Low,Close,Volume" << std::endl;
    for (const auto& d : weekdaysFrom (firstDate, numBars))
      os << to_iso_extended_string (d) << "," << close << "," << close + 0.1 << ","
	 << close - 0.1 << "," << close << ",100000" << std::endl;

    return os.str();
  }

  class TempDirectory
  {
  public:
    TempDirectory()
      : mPath(boost::filesystem::temp_directory_path() /
	      boost::filesystem::unique_path ("rebalancer-data-%%%%-%%%%"))
    {
      boost::filesystem::create_directories (mPath);
    }

    ~TempDirectory()
    {
      boost::system::error_code ec;
      boost::filesystem::remove_all (mPath, ec);
    }

    const boost::filesystem::path& path() const
    {
      return mPath;
    }

  private:
    boost::filesystem::path mPath;
  };
}

TEST_CASE ("InstrumentDescriptor", "[MarketDataSource]")
{
  InstrumentDescriptor bank ("600000", "Bank", { {"industry", "Finance"} });

  REQUIRE (bank.getCode() == "600000");
  REQUIRE (bank.getName() == "Bank");
  REQUIRE (bank.getAttribute ("industry").value() == "Finance");
  REQUIRE_FALSE (bank.getAttribute ("market").has_value());
  REQUIRE (bank == InstrumentDescriptor ("600000", "Bank", { {"industry", "Finance"} }));
  REQUIRE (bank != InstrumentDescriptor ("600001", "Bank"));
  REQUIRE_THROWS_AS (InstrumentDescriptor ("", "Nameless"), InstrumentException);
}

TEST_CASE ("InMemoryMarketDataSource", "[MarketDataSource]")
{
  InMemoryMarketDataSource<DecimalType> source;
  auto series = createFlatSeries (date (2021, Jan, 4), 10, DecimalType(10));

  source.addInstrument (InstrumentDescriptor ("B", "Beta"), series);
  source.addInstrument (InstrumentDescriptor ("A", "Alpha"), series);

  SECTION ("Universe keeps insertion order")
    {
      REQUIRE (source.getNumInstruments() == 2);
      REQUIRE (source.getUniverse()[0].getCode() == "B");
      REQUIRE (source.getUniverse()[1].getCode() == "A");
      REQUIRE (source.findInstrument ("A")->getName() == "Alpha");
      REQUIRE_FALSE (source.findInstrument ("C").has_value());
    }

  SECTION ("Unknown codes have an empty history")
    {
      REQUIRE (source.getPriceHistory ("A")->getNumEntries() == 10);
      REQUIRE (source.getPriceHistory ("C")->isEmpty());
    }

  SECTION ("Duplicates and null series are rejected")
    {
      REQUIRE_THROWS_AS (source.addInstrument (InstrumentDescriptor ("A", "Again"), series), DataSourceException);
      REQUIRE_THROWS_AS (source.addInstrument (InstrumentDescriptor ("C", "Gamma"), nullptr), DataSourceException);
    }
}

TEST_CASE ("CsvDirectoryDataSource", "[MarketDataSource]")
{
  TempDirectory dir;
  const date firstDate (2021, Jan, 4);

  writeFile (dir.path() / "universe.csv",
	     "code,name,industry\n"
	     "600000,Bank,Finance\n"
	     "000001,Short history,Finance\n"
	     "300750,Battery,\n"
	     "688981,No prices,Semiconductors\n");
  writeFile (dir.path() / "600000.csv", priceFile (firstDate, 120, 10.0));
  writeFile (dir.path() / "000001.csv", priceFile (firstDate, 50, 12.0));
  writeFile (dir.path() / "300750.csv", priceFile (firstDate, 100, 200.0));

  std::ostringstream diagnostics;
  CsvDirectoryDataSource<DecimalType> source (dir.path().string(), 100, &diagnostics);

  SECTION ("Instruments passing the data quality filter are loaded in file order")
    {
      const auto& universe = source.getUniverse();
      REQUIRE (universe.size() == 2);
      REQUIRE (universe[0].getCode() == "600000");
      REQUIRE (universe[1].getCode() == "300750");
      REQUIRE (universe[0].getAttribute ("industry").value() == "Finance");
      REQUIRE_FALSE (universe[1].getAttribute ("industry").has_value());
    }

  SECTION ("Price histories are read from the instrument files")
    {
      auto history = source.getPriceHistory ("300750");
      REQUIRE (history->getNumEntries() == 100);
      REQUIRE (history->getFirstDate() == firstDate);
      REQUIRE (history->getTimeSeriesEntry (firstDate).getCloseValue() == DecimalType(200));
    }

  SECTION ("Dropped instruments are counted and reported")
    {
      REQUIRE (source.getNumDropped() == 2);
      REQUIRE (source.getPriceHistory ("000001")->isEmpty());
      REQUIRE (diagnostics.str().find ("000001") != std::string::npos);
      REQUIRE (diagnostics.str().find ("688981") != std::string::npos);
    }
}

TEST_CASE ("CsvDirectoryDataSource errors", "[MarketDataSource]")
{
  SECTION ("Missing directory")
    {
      REQUIRE_THROWS_AS (CsvDirectoryDataSource<DecimalType> ("/nonexistent/rebalancer-data", 100),
			 DataSourceException);
    }

  SECTION ("Missing universe file")
    {
      TempDirectory dir;
      REQUIRE_THROWS_AS (CsvDirectoryDataSource<DecimalType> (dir.path().string(), 100), DataSourceException);
    }
}
