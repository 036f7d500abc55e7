// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <iomanip>
#include <sstream>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "PerformanceReporter.h"

namespace rebalancer
{
  PerformanceReporter::PerformanceReporter(std::ostream& os)
    : mOut(os)
  {}

  void PerformanceReporter::writeRule(char c)
  {
    mOut << std::string(60, c) << std::endl;
  }

  std::string PerformanceReporter::percent(const Decimal& fraction)
  {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << num::to_double(fraction) * 100.0 << "%";
    return os.str();
  }

  std::string PerformanceReporter::money(const Decimal& amount)
  {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << num::to_double(amount);
    return os.str();
  }

  void PerformanceReporter::writeSummary(const PerformanceMetrics<Decimal>& m)
  {
    writeRule();
    mOut << m.strategyName << " backtest summary" << std::endl;
    writeRule();

    mOut << "Initial value:        " << money(m.initialValue) << std::endl
	 << "Final value:          " << money(m.finalValue) << std::endl
	 << "Total return:         " << percent(m.totalReturn) << std::endl
	 << "Annualized return:    " << percent(m.annualizedReturn) << std::endl
	 << "Max drawdown:         " << percent(m.maxDrawdown) << std::endl
	 << "Win rate:             " << percent(m.winRate) << std::endl
	 << "Sharpe ratio:         " << num::toString(m.sharpeRatio, 2) << std::endl
	 << "Information ratio:    " << num::toString(m.informationRatio, 2) << std::endl
	 << "Volatility:           " << percent(m.volatility) << std::endl
	 << "Max losing streak:    " << m.maxLosingStreak << " periods" << std::endl
	 << "Trades:               " << m.tradeCount << std::endl
	 << "Days:                 " << m.elapsedDays << std::endl
	 << "Rating:               " << m.rating << " (" << num::toString(m.strategyScore, 1)
	 << "/100)" << std::endl;
    writeRule();
  }

  void PerformanceReporter::writeTradeAnalysis(const RunResult<Decimal>& run,
					       const PerformanceMetrics<Decimal>& metrics,
					       std::size_t maxTrades)
  {
    mOut << "Trade analysis" << std::endl;
    writeRule('-');

    if (run.trades.empty())
      {
	mOut << "No trades" << std::endl;
	return;
      }

    const TradeStatistics<Decimal>& stats = metrics.tradeStatistics;
    mOut << "Buys:                 " << stats.numBuys << std::endl
	 << "Sells:                " << stats.numSells << std::endl
	 << "Total costs:          " << money(stats.totalCosts) << std::endl;

    if (stats.numBuys > 0)
      mOut << "Average buy amount:   " << money(stats.averageBuyAmount) << std::endl;

    if (stats.numSells > 0)
      mOut << "Average sell amount:  " << money(stats.averageSellAmount) << std::endl;

    const std::size_t first = (run.trades.size() > maxTrades) ? run.trades.size() - maxTrades : 0;
    mOut << std::endl << "Last " << (run.trades.size() - first) << " trades:" << std::endl;

    for (std::size_t i = first; i < run.trades.size(); ++i)
      {
	const Trade<Decimal>& t = run.trades[i];
	mOut << "  " << boost::gregorian::to_iso_extended_string(t.date) << " "
	     << std::left << std::setw(4) << tradeActionToString(t.action) << " "
	     << std::setw(10) << t.code << std::right << " "
	     << std::setw(8) << t.shares << " @ "
	     << std::setw(9) << money(t.price) << "  cost "
	     << money(t.cost) << std::endl;
      }
  }

  void PerformanceReporter::writeFinalPositions(const RunResult<Decimal>& run)
  {
    mOut << "Final cash:           " << money(run.finalCash) << std::endl
	 << "Final positions:      " << run.finalPositions.size() << std::endl;

    for (const auto& position : run.finalPositions)
      mOut << "  " << position.first << ": " << position.second << " shares" << std::endl;
  }

  void PerformanceReporter::writeBenchmarkComparison(const PerformanceMetrics<Decimal>& m)
  {
    mOut << "Benchmark comparison (" << percent(m.benchmarkReturn) << " per year)" << std::endl;
    writeRule('-');
    mOut << "Strategy annualized:  " << percent(m.annualizedReturn) << std::endl
	 << "Benchmark:            " << percent(m.benchmarkReturn) << std::endl
	 << "Excess return:        " << (m.excessReturn > Decimal(0) ? "+" : "")
	 << percent(m.excessReturn) << std::endl
	 << (m.excessReturn > Decimal(0) ? "Strategy beat the benchmark" : "Strategy trailed the benchmark")
	 << std::endl;
  }

  void PerformanceReporter::writeReport(const RunResult<Decimal>& run,
					const PerformanceMetrics<Decimal>& metrics)
  {
    writeSummary(metrics);
    writeFinalPositions(run);
    mOut << std::endl;
    writeTradeAnalysis(run, metrics);
    mOut << std::endl;
    writeBenchmarkComparison(metrics);
  }
}
