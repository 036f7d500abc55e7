#include <catch2/catch_test_macros.hpp>
#include <fstream>
#include <sstream>
#include <string>
#include <boost/filesystem.hpp>
#include "number.h"
#include "PerformanceReporter.h"
#include "RunHistoryCsvWriter.h"

using namespace rebalancer;
using namespace boost::gregorian;

using DecimalType = num::DefaultNumber;

namespace
{
  RunResult<DecimalType> sampleRun (std::size_t numTrades)
  {
    RunResult<DecimalType> run;
    run.strategyName = "Momentum";
    run.startDate = date (2021, Jan, 1);
    run.endDate = date (2021, Jul, 1);
    run.rebalanceFrequency = TimeFrame::QUARTERLY;
    run.initialCapital = DecimalType(1000000);
    run.snapshots.push_back (PortfolioSnapshot<DecimalType>{date (2021, Jan, 1), DecimalType(999730), DecimalType(99730), 1});
    run.snapshots.push_back (PortfolioSnapshot<DecimalType>{date (2021, Apr, 1), DecimalType(1089730), DecimalType(99730), 1});
    run.snapshots.push_back (PortfolioSnapshot<DecimalType>{date (2021, Jul, 1), DecimalType(1120000), DecimalType(50000), 2});

    for (std::size_t i = 0; i < numTrades; ++i)
      run.trades.push_back (Trade<DecimalType>{date (2021, Jan, 1) + days (i), i % 2 ? TradeAction::Sell : TradeAction::Buy,
					       "C" + std::to_string (i), 100, DecimalType(10), DecimalType(5)});

    run.finalValue = DecimalType(1120000);
    run.finalCash = DecimalType(50000);
    run.finalPositions = { {"600000", 90000}, {"300750", 200} };
    return run;
  }

  std::string readAll (const std::string& fileName)
  {
    std::ifstream in (fileName);
    std::ostringstream os;
    os << in.rdbuf();
    return os.str();
  }

  std::string tempFileName()
  {
    return (boost::filesystem::temp_directory_path() /
	    boost::filesystem::unique_path ("rebalancer-history-%%%%-%%%%.csv")).string();
  }
}

TEST_CASE ("PerformanceReporter report sections", "[PerformanceReporter]")
{
  RunResult<DecimalType> run = sampleRun (12);
  PerformanceMetrics<DecimalType> metrics = computeMetrics (run);

  std::ostringstream os;
  PerformanceReporter reporter (os);
  reporter.writeReport (run, metrics);
  const std::string text = os.str();

  SECTION ("Summary")
    {
      REQUIRE (text.find ("Momentum backtest summary") != std::string::npos);
      REQUIRE (text.find ("Initial value:        1000000.00") != std::string::npos);
      REQUIRE (text.find ("Total return:         12.00%") != std::string::npos);
      REQUIRE (text.find ("Rating:") != std::string::npos);
    }

  SECTION ("Final positions")
    {
      REQUIRE (text.find ("Final cash:           50000.00") != std::string::npos);
      REQUIRE (text.find ("600000: 90000 shares") != std::string::npos);
    }

  SECTION ("Only the most recent trades are listed")
    {
      REQUIRE (text.find ("Buys:                 6") != std::string::npos);
      REQUIRE (text.find ("Last 10 trades:") != std::string::npos);
      REQUIRE (text.find (" C1 ") == std::string::npos);
      REQUIRE (text.find (" C2 ") != std::string::npos);
      REQUIRE (text.find (" C11 ") != std::string::npos);
    }

  SECTION ("Benchmark comparison")
    {
      REQUIRE (text.find ("Benchmark:            8.00%") != std::string::npos);
      REQUIRE (text.find ("Strategy beat the benchmark") != std::string::npos);
    }
}

TEST_CASE ("PerformanceReporter without trades", "[PerformanceReporter]")
{
  RunResult<DecimalType> run = sampleRun (0);
  std::ostringstream os;
  PerformanceReporter reporter (os);
  reporter.writeTradeAnalysis (run, computeMetrics (run));
  REQUIRE (os.str().find ("No trades") != std::string::npos);
}

TEST_CASE ("RunHistoryCsvWriter", "[RunHistoryCsvWriter]")
{
  RunResult<DecimalType> run = sampleRun (2);

  SECTION ("Snapshot history")
    {
      const std::string fileName = tempFileName();
      {
	RunHistoryCsvWriter<DecimalType> writer (fileName, run, RunHistoryCsvWriter<DecimalType>::Snapshots);
	writer.writeFile();
      }

      REQUIRE (readAll (fileName) ==
	       "date,value,cash,positions\n"
	       "2021-01-01,999730.00,99730.00,1\n"
	       "2021-04-01,1089730.00,99730.00,1\n"
	       "2021-07-01,1120000.00,50000.00,2\n");
      boost::filesystem::remove (fileName);
    }

  SECTION ("Trade log")
    {
      const std::string fileName = tempFileName();
      {
	RunHistoryCsvWriter<DecimalType> writer (fileName, run, RunHistoryCsvWriter<DecimalType>::Trades);
	writer.writeFile();
      }

      REQUIRE (readAll (fileName) ==
	       "date,action,code,shares,price,amount,cost\n"
	       "2021-01-01,BUY,C0,100,10.0000,1000.00,5.00\n"
	       "2021-01-02,SELL,C1,100,10.0000,1000.00,5.00\n");
      boost::filesystem::remove (fileName);
    }

  SECTION ("Unwritable destination")
    {
      REQUIRE_THROWS_AS (RunHistoryCsvWriter<DecimalType> ("/nonexistent/dir/history.csv", run,
							   RunHistoryCsvWriter<DecimalType>::Snapshots),
			 std::runtime_error);
    }
}
