#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <sstream>
#include <string>
#include "TestUtils.h"
#include "RebalanceBackTester.h"

using namespace rebalancer;
using namespace boost::gregorian;

namespace
{
  typedef IndicatorSnapshot<DecimalType> Snapshot;

  const date historyStart (2020, Jun, 1);

  SelectionStrategy<DecimalType> highestPrice()
  {
    return SelectionStrategy<DecimalType> (
      UserDefinedStrategy<DecimalType> ("HighestPrice", { "price" },
					[](const Snapshot&) { return true; },
					[](const Snapshot& s) { return *s.getValue ("price"); }));
  }

  SelectionStrategy<DecimalType> selectNothing()
  {
    return SelectionStrategy<DecimalType> (
      UserDefinedStrategy<DecimalType> ("Nothing", {},
					[](const Snapshot&) { return false; },
					[](const Snapshot&) { return DecimalType(0); }));
  }

  RebalanceConfiguration<DecimalType> singleDateConfiguration()
  {
    RebalanceConfiguration<DecimalType> config;
    config.startDate = date (2021, Jan, 1);
    config.endDate = date (2021, Jan, 1);
    config.rebalanceFrequency = TimeFrame::QUARTERLY;
    return config;
  }
}

TEST_CASE ("Single instrument initial allocation", "[RebalanceBackTester]")
{
  InMemoryMarketDataSource<DecimalType> source;
  source.addInstrument (InstrumentDescriptor ("600000", "Bank"),
			createFlatSeries (historyStart, 300, DecimalType(10)));

  std::ostringstream log;
  RebalanceBackTester<DecimalType> backTester (source, singleDateConfiguration(), nullptr, &log);
  RunResult<DecimalType> result = backTester.run (highestPrice());

  REQUIRE (result.strategyName == "HighestPrice");
  REQUIRE (result.initialCapital == DecimalType(1000000));
  REQUIRE (result.trades.size() == 1);
  REQUIRE (result.trades[0].action == TradeAction::Buy);
  REQUIRE (result.trades[0].shares == 90000);
  REQUIRE (result.trades[0].price == DecimalType(10));
  REQUIRE (result.finalCash == DecimalType(99730));
  REQUIRE (result.finalPositions.at ("600000") == 90000);

  REQUIRE (result.snapshots.size() == 1);
  REQUIRE (result.snapshots[0].date == date (2021, Jan, 1));
  REQUIRE (result.snapshots[0].cash == DecimalType(99730));
  REQUIRE (result.snapshots[0].totalValue == DecimalType(999730));
  REQUIRE (result.snapshots[0].numPositions == 1);
  REQUIRE (result.finalValue == DecimalType(999730));

  REQUIRE (log.str().find ("Rebalance 2021-01-01") != std::string::npos);
  REQUIRE (log.str().find ("BUY 600000 90000") != std::string::npos);
}

TEST_CASE ("Existing holdings are never trimmed", "[RebalanceBackTester]")
{
  InMemoryMarketDataSource<DecimalType> source;
  source.addInstrument (InstrumentDescriptor ("600000", "Bank"),
			createFlatSeries (historyStart, 400, DecimalType(10)));

  RebalanceConfiguration<DecimalType> config = singleDateConfiguration();
  config.endDate = date (2021, Oct, 1);

  RebalanceBackTester<DecimalType> backTester (source, config);
  RunResult<DecimalType> result = backTester.run (highestPrice());

  // Later targets round down to 89,900 shares, below the 90,000 held.
  REQUIRE (result.snapshots.size() == 4);
  REQUIRE (result.trades.size() == 1);
  for (const auto& snapshot : result.snapshots)
    {
      REQUIRE (snapshot.cash == DecimalType(99730));
      REQUIRE (snapshot.numPositions == 1);
    }
}

TEST_CASE ("Holdings are topped up to the target", "[RebalanceBackTester]")
{
  // Closes at 10 until the end of March 2021, then 5.
  std::vector<date> dates = weekdaysFrom (historyStart, 300);
  std::vector<DecimalType> closes;
  for (const auto& d : dates)
    closes.push_back (d < date (2021, Apr, 1) ? DecimalType(10) : DecimalType(5));

  InMemoryMarketDataSource<DecimalType> source;
  source.addInstrument (InstrumentDescriptor ("600000", "Bank"),
			createSeriesFromCloses (historyStart, closes));

  RebalanceConfiguration<DecimalType> config = singleDateConfiguration();
  config.endDate = date (2021, Apr, 1);

  RebalanceBackTester<DecimalType> backTester (source, config);
  RunResult<DecimalType> result = backTester.run (highestPrice());

  // Valuation 99,730 + 90,000 * 5 = 549,730; target 494,757 at 5 is 98,900 shares.
  REQUIRE (result.trades.size() == 2);
  REQUIRE (result.trades[1].action == TradeAction::Buy);
  REQUIRE (result.trades[1].shares == 8900);
  REQUIRE (result.trades[1].price == DecimalType(5));
  REQUIRE (result.finalPositions.at ("600000") == 98900);
  REQUIRE (result.finalCash == createDecimal ("55216.65"));
}

TEST_CASE ("Unselected holdings are sold before buying", "[RebalanceBackTester]")
{
  InMemoryMarketDataSource<DecimalType> source;
  source.addInstrument (InstrumentDescriptor ("RISER", "Riser"),
			createGeometricSeries (historyStart, 400, DecimalType(5), DecimalType(0.005)));
  source.addInstrument (InstrumentDescriptor ("FLAT", "Flat"),
			createFlatSeries (historyStart, 400, DecimalType(15)));

  RebalanceConfiguration<DecimalType> config = singleDateConfiguration();
  config.endDate = date (2021, Oct, 1);
  config.maxPositions = 1;

  RebalanceBackTester<DecimalType> backTester (source, config);
  RunResult<DecimalType> result = backTester.run (highestPrice());

  REQUIRE (result.trades.front().action == TradeAction::Buy);
  REQUIRE (result.trades.front().code == "FLAT");

  auto sell = std::find_if (result.trades.begin(), result.trades.end(),
			    [](const Trade<DecimalType>& t) { return t.action == TradeAction::Sell; });
  REQUIRE (sell != result.trades.end());
  REQUIRE (sell->code == "FLAT");
  REQUIRE (sell->shares == result.trades.front().shares);

  auto next = sell + 1;
  REQUIRE (next != result.trades.end());
  REQUIRE (next->action == TradeAction::Buy);
  REQUIRE (next->code == "RISER");
  REQUIRE (next->date == sell->date);

  REQUIRE (result.finalPositions.size() == 1);
  REQUIRE (result.finalPositions.count ("RISER") == 1);
}

TEST_CASE ("Empty selections still record snapshots", "[RebalanceBackTester]")
{
  InMemoryMarketDataSource<DecimalType> source;
  source.addInstrument (InstrumentDescriptor ("600000", "Bank"),
			createFlatSeries (historyStart, 400, DecimalType(10)));

  RebalanceConfiguration<DecimalType> config = singleDateConfiguration();
  config.endDate = date (2021, Dec, 31);

  RebalanceBackTester<DecimalType> backTester (source, config);

  SECTION ("From cash")
    {
      RunResult<DecimalType> result = backTester.run (selectNothing());
      REQUIRE (result.snapshots.size() == 4);
      REQUIRE (result.trades.empty());
      for (const auto& snapshot : result.snapshots)
	{
	  REQUIRE (snapshot.totalValue == DecimalType(1000000));
	  REQUIRE (snapshot.cash == DecimalType(1000000));
	  REQUIRE (snapshot.numPositions == 0);
	}
      REQUIRE (result.finalValue == DecimalType(1000000));
    }

  SECTION ("Universe without enough history")
    {
      InMemoryMarketDataSource<DecimalType> shortSource;
      shortSource.addInstrument (InstrumentDescriptor ("NEW", "New listing"),
				 createFlatSeries (date (2021, Nov, 1), 30, DecimalType(10)));
      RebalanceBackTester<DecimalType> shortBackTester (shortSource, config);

      RunResult<DecimalType> result = shortBackTester.run (highestPrice());
      REQUIRE (result.snapshots.size() == 4);
      REQUIRE (result.trades.empty());
    }
}

TEST_CASE ("Ledger invariants hold across a run", "[RebalanceBackTester]")
{
  InMemoryMarketDataSource<DecimalType> source;
  for (int i = 0; i < 10; ++i)
    source.addInstrument (InstrumentDescriptor ("S" + std::to_string (i), "Stock " + std::to_string (i)),
			  createGeometricSeries (historyStart, 500, DecimalType(5 + i),
						 DecimalType(0.0015 * ((i * 3) % 7) - 0.004)));

  RebalanceConfiguration<DecimalType> config;
  config.startDate = date (2021, Jan, 1);
  config.endDate = date (2022, Mar, 31);
  config.rebalanceFrequency = TimeFrame::MONTHLY;
  config.maxPositions = 3;

  RebalanceBackTester<DecimalType> backTester (source, config,
					       std::make_shared<concurrency::ThreadPoolExecutor> (3));
  RunResult<DecimalType> result = backTester.run (highestPrice());

  REQUIRE (result.snapshots.size() == 15);
  REQUIRE_FALSE (result.trades.empty());

  for (const auto& trade : result.trades)
    {
      REQUIRE (trade.shares > 0);
      REQUIRE (trade.shares % config.lotSize == 0);
      REQUIRE (trade.price > DecimalType(0));
    }

  for (const auto& snapshot : result.snapshots)
    {
      REQUIRE (snapshot.cash >= DecimalType(0));
      REQUIRE (snapshot.numPositions <= config.maxPositions);
    }

  REQUIRE (result.finalCash >= DecimalType(0));
  REQUIRE (result.finalPositions.size() <= config.maxPositions);

  SECTION ("Runs are reproducible")
    {
      RunResult<DecimalType> again = backTester.run (highestPrice());
      REQUIRE (again.trades == result.trades);
      REQUIRE (again.snapshots == result.snapshots);
    }
}

TEST_CASE ("RebalanceBackTester argument checks", "[RebalanceBackTester]")
{
  InMemoryMarketDataSource<DecimalType> source;
  RebalanceConfiguration<DecimalType> config;

  SECTION ("Invalid configuration is rejected up front")
    {
      config.initialCapital = DecimalType(0);
      REQUIRE_THROWS_AS (RebalanceBackTester<DecimalType> (source, config), RebalanceConfigurationException);
    }

  SECTION ("End before start")
    {
      RebalanceBackTester<DecimalType> backTester (source, config);
      REQUIRE_THROWS_AS (backTester.run (date (2022, Jan, 1), date (2021, Jan, 1), TimeFrame::MONTHLY, highestPrice()),
			 RebalanceConfigurationException);
    }

  SECTION ("End before start as a date range")
    {
      RebalanceBackTester<DecimalType> backTester (source, config);
      REQUIRE_THROWS_AS (backTester.run (DateRange (date (2022, Jan, 1), date (2021, Jan, 1)),
					 TimeFrame::MONTHLY, highestPrice()),
			 DateRangeException);
    }

  SECTION ("Daily is not a rebalance frequency")
    {
      RebalanceBackTester<DecimalType> backTester (source, config);
      REQUIRE_THROWS_AS (backTester.run (date (2021, Jan, 1), date (2022, Jan, 1), TimeFrame::DAILY, highestPrice()),
			 RebalanceConfigurationException);
    }

  SECTION ("Empty universe")
    {
      RebalanceBackTester<DecimalType> backTester (source, config);
      RunResult<DecimalType> result = backTester.run (highestPrice());
      REQUIRE (result.snapshots.size() == 13);
      REQUIRE (result.trades.empty());
      REQUIRE (result.finalValue == DecimalType(1000000));
    }
}

TEST_CASE ("Runs over an explicit date range", "[RebalanceBackTester]")
{
  InMemoryMarketDataSource<DecimalType> source;
  source.addInstrument (InstrumentDescriptor ("600000", "Bank"),
			createFlatSeries (historyStart, 400, DecimalType(10)));

  RebalanceConfiguration<DecimalType> config;
  RebalanceBackTester<DecimalType> backTester (source, config);

  const DateRange range (date (2021, Jan, 1), date (2021, Jun, 30));
  RunResult<DecimalType> fromRange = backTester.run (range, TimeFrame::QUARTERLY, highestPrice());
  RunResult<DecimalType> fromDates = backTester.run (date (2021, Jan, 1), date (2021, Jun, 30),
						     TimeFrame::QUARTERLY, highestPrice());

  REQUIRE (fromRange.startDate == range.getFirstDate());
  REQUIRE (fromRange.endDate == range.getLastDate());
  REQUIRE (fromRange.snapshots.size() == 2);
  REQUIRE (fromRange.snapshots == fromDates.snapshots);
  REQUIRE (fromRange.trades == fromDates.trades);
}

TEST_CASE ("Strategies must be able to see their indicators", "[RebalanceBackTester]")
{
  InMemoryMarketDataSource<DecimalType> source;
  source.addInstrument (InstrumentDescriptor ("600000", "Bank"),
			createFlatSeries (historyStart, 300, DecimalType(10)));

  SECTION ("Moving averages the momentum rules compare are required")
    {
      RebalanceConfiguration<DecimalType> config = singleDateConfiguration();
      config.indicators.movingAveragePeriods = { 10, 20, 60 };
      RebalanceBackTester<DecimalType> backTester (source, config);

      REQUIRE_THROWS_AS (backTester.run (createBuiltInStrategy<DecimalType> ("momentum")),
			 RebalanceConfigurationException);
      REQUIRE_NOTHROW (backTester.run (createBuiltInStrategy<DecimalType> ("value")));
    }

  SECTION ("Momentum horizons are required too")
    {
      RebalanceConfiguration<DecimalType> config = singleDateConfiguration();
      config.indicators.momentumHorizons = { 5, 10, 20 };
      RebalanceBackTester<DecimalType> backTester (source, config);

      REQUIRE_THROWS_AS (backTester.run (createBuiltInStrategy<DecimalType> ("growth")),
			 RebalanceConfigurationException);
      REQUIRE_NOTHROW (backTester.run (createBuiltInStrategy<DecimalType> ("momentum")));
    }

  SECTION ("User defined strategies are held to their own list")
    {
      RebalanceConfiguration<DecimalType> config = singleDateConfiguration();
      RebalanceBackTester<DecimalType> backTester (source, config);

      SelectionStrategy<DecimalType> needsMa7 (
	UserDefinedStrategy<DecimalType> ("NeedsMa7", { "ma7" },
					  [](const Snapshot&) { return true; },
					  [](const Snapshot&) { return DecimalType(1); }));
      REQUIRE_THROWS_AS (backTester.run (needsMa7), RebalanceConfigurationException);
    }

  SECTION ("Default settings cover every built-in strategy")
    {
      RebalanceBackTester<DecimalType> backTester (source, singleDateConfiguration());
      for (const std::string name : { "momentum", "value", "growth" })
	REQUIRE_NOTHROW (backTester.run (createBuiltInStrategy<DecimalType> (name)));
    }
}
