// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_PERFORMANCE_METRICS_H
#define __REBALANCER_PERFORMANCE_METRICS_H 1

#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <vector>
#include "Annualizer.h"
#include "StatUtils.h"
#include "RebalanceBackTester.h"
#include "Trade.h"
#include "DecimalConstants.h"
#include "number.h"

namespace rebalancer
{
  template <class Decimal>
  struct TradeStatistics
  {
    unsigned int numBuys = 0;
    unsigned int numSells = 0;
    Decimal totalCosts = Decimal(0);
    Decimal averageBuyAmount = Decimal(0);
    Decimal averageSellAmount = Decimal(0);
  };

  /**
   * @brief Summary statistics of a RunResult.
   *
   * Returns are the period over period changes of the snapshot values. All
   * ratios are zero when the history is too short to define them.
   */
  template <class Decimal>
  struct PerformanceMetrics
  {
    std::string strategyName;
    Decimal initialValue = Decimal(0);
    Decimal finalValue = Decimal(0);
    Decimal totalReturn = Decimal(0);
    Decimal annualizedReturn = Decimal(0);
    Decimal maxDrawdown = Decimal(0);
    Decimal winRate = Decimal(0);
    Decimal volatility = Decimal(0);
    Decimal sharpeRatio = Decimal(0);
    Decimal informationRatio = Decimal(0);
    unsigned int maxLosingStreak = 0;
    unsigned int numPeriods = 0;
    unsigned int tradeCount = 0;
    long elapsedDays = 0;
    TradeStatistics<Decimal> tradeStatistics;
    Decimal strategyScore = Decimal(0);
    std::string rating;
    Decimal benchmarkReturn = Decimal(0);
    Decimal excessReturn = Decimal(0);

    /**
     * @brief The numeric metrics keyed by name.
     */
    std::map<std::string, Decimal> getNamedValues() const
    {
      return {
	{ "initial_value", initialValue },
	{ "final_value", finalValue },
	{ "total_return", totalReturn },
	{ "annual_return", annualizedReturn },
	{ "max_drawdown", maxDrawdown },
	{ "win_rate", winRate },
	{ "volatility", volatility },
	{ "sharpe_ratio", sharpeRatio },
	{ "information_ratio", informationRatio },
	{ "max_losing_streak", Decimal(static_cast<long>(maxLosingStreak)) },
	{ "trade_count", Decimal(static_cast<long>(tradeCount)) },
	{ "days", Decimal(static_cast<long>(elapsedDays)) },
	{ "strategy_score", strategyScore },
	{ "benchmark_return", benchmarkReturn },
	{ "excess_return", excessReturn }
      };
    }
  };

  template <class Decimal>
  struct PerformanceCalculator
  {
    /**
     * @brief Period over period relative changes of the snapshot values.
     *        A zero previous value yields a zero return.
     */
    static std::vector<Decimal>
    computePeriodReturns(const std::vector<PortfolioSnapshot<Decimal>>& snapshots)
    {
      std::vector<Decimal> returns;
      for (std::size_t i = 1; i < snapshots.size(); ++i)
	{
	  const Decimal& previous = snapshots[i - 1].totalValue;
	  if (num::isNearlyZero(previous))
	    returns.push_back(DecimalConstants<Decimal>::DecimalZero);
	  else
	    returns.push_back(snapshots[i].totalValue / previous - DecimalConstants<Decimal>::DecimalOne);
	}

      return returns;
    }

    // Most negative (value - running peak) / running peak, zero or less.
    static Decimal
    computeMaxDrawdown(const std::vector<PortfolioSnapshot<Decimal>>& snapshots)
    {
      Decimal worst = DecimalConstants<Decimal>::DecimalZero;
      if (snapshots.empty())
	return worst;

      Decimal peak = snapshots.front().totalValue;
      for (const auto& s : snapshots)
	{
	  peak = std::max(peak, s.totalValue);
	  if (peak > DecimalConstants<Decimal>::DecimalZero)
	    worst = std::min(worst, Decimal((s.totalValue - peak) / peak));
	}

      return worst;
    }

    static Decimal computeWinRate(const std::vector<Decimal>& returns)
    {
      if (returns.empty())
	return DecimalConstants<Decimal>::DecimalZero;

      const auto wins = std::count_if(returns.begin(), returns.end(),
				      [](const Decimal& r) { return r > DecimalConstants<Decimal>::DecimalZero; });
      return Decimal(static_cast<long>(wins)) / Decimal(static_cast<long>(returns.size()));
    }

    static unsigned int computeMaxLosingStreak(const std::vector<Decimal>& returns)
    {
      unsigned int longest = 0;
      unsigned int current = 0;
      for (const auto& r : returns)
	{
	  if (r < DecimalConstants<Decimal>::DecimalZero)
	    longest = std::max(longest, ++current);
	  else
	    current = 0;
	}

      return longest;
    }

    static TradeStatistics<Decimal> computeTradeStatistics(const std::vector<Trade<Decimal>>& trades)
    {
      TradeStatistics<Decimal> stats;
      Decimal buyAmount(0), sellAmount(0);

      for (const auto& t : trades)
	{
	  stats.totalCosts += t.cost;
	  if (t.action == TradeAction::Buy)
	    {
	      ++stats.numBuys;
	      buyAmount += t.getAmount();
	    }
	  else
	    {
	      ++stats.numSells;
	      sellAmount += t.getAmount();
	    }
	}

      if (stats.numBuys > 0)
	stats.averageBuyAmount = buyAmount / Decimal(static_cast<long>(stats.numBuys));

      if (stats.numSells > 0)
	stats.averageSellAmount = sellAmount / Decimal(static_cast<long>(stats.numSells));

      return stats;
    }

    /**
     * @brief 0 to 100 composite of return (30), drawdown (25), Sharpe (20),
     *        win rate (15) and losing streak (10) bands.
     */
    static Decimal computeStrategyScore(const PerformanceMetrics<Decimal>& m)
    {
      const double annual = num::to_double(m.annualizedReturn);
      const double drawdown = std::fabs(num::to_double(m.maxDrawdown));
      const double sharpe = num::to_double(m.sharpeRatio);
      const double winRate = num::to_double(m.winRate);
      double score = 0.0;

      if (annual > 0.20)
	score += 30;
      else if (annual > 0.15)
	score += 25;
      else if (annual > 0.10)
	score += 20;
      else if (annual > 0.05)
	score += 15;
      else if (annual > 0.0)
	score += 10;

      if (drawdown < 0.05)
	score += 25;
      else if (drawdown < 0.10)
	score += 20;
      else if (drawdown < 0.15)
	score += 15;
      else if (drawdown < 0.20)
	score += 10;
      else if (drawdown < 0.30)
	score += 5;

      if (sharpe > 2.0)
	score += 20;
      else if (sharpe > 1.5)
	score += 15;
      else if (sharpe > 1.0)
	score += 10;
      else if (sharpe > 0.5)
	score += 5;

      if (winRate > 0.6)
	score += 15;
      else if (winRate > 0.55)
	score += 12;
      else if (winRate > 0.5)
	score += 10;
      else if (winRate > 0.45)
	score += 7;
      else if (winRate > 0.4)
	score += 5;

      if (m.maxLosingStreak <= 2)
	score += 10;
      else if (m.maxLosingStreak <= 3)
	score += 8;
      else if (m.maxLosingStreak <= 5)
	score += 5;
      else if (m.maxLosingStreak <= 7)
	score += 3;

      return Decimal(score);
    }

    static std::string ratingForScore(const Decimal& score)
    {
      const double s = num::to_double(score);
      if (s >= 85)
	return "Excellent";
      else if (s >= 70)
	return "Good";
      else if (s >= 55)
	return "Average";
      else if (s >= 40)
	return "Fair";
      else if (s >= 25)
	return "Poor";

      return "Needs improvement";
    }

    /**
     * @brief Compute every metric of a run.
     * @param riskFreeRate Annual risk free rate used by the Sharpe ratio.
     * @param benchmarkReturn Annual benchmark the annualized return is
     *        compared against.
     */
    static PerformanceMetrics<Decimal> compute(const RunResult<Decimal>& run,
					       const Decimal& riskFreeRate,
					       const Decimal& benchmarkReturn)
    {
      PerformanceMetrics<Decimal> m;
      const auto& snapshots = run.snapshots;

      m.strategyName = run.strategyName;
      m.initialValue = run.initialCapital;
      m.finalValue = snapshots.empty() ? run.initialCapital : snapshots.back().totalValue;
      m.tradeCount = static_cast<unsigned int>(run.trades.size());
      m.tradeStatistics = computeTradeStatistics(run.trades);
      m.benchmarkReturn = benchmarkReturn;

      if (run.initialCapital > DecimalConstants<Decimal>::DecimalZero)
	m.totalReturn = (m.finalValue - run.initialCapital) / run.initialCapital;

      if (!snapshots.empty())
	m.elapsedDays = (snapshots.back().date - snapshots.front().date).days();

      m.annualizedReturn = Annualizer<Decimal>::annualizeOverDays(m.totalReturn, m.elapsedDays);
      m.maxDrawdown = computeMaxDrawdown(snapshots);

      const std::vector<Decimal> returns = computePeriodReturns(snapshots);
      m.numPeriods = static_cast<unsigned int>(returns.size());
      m.winRate = computeWinRate(returns);
      m.maxLosingStreak = computeMaxLosingStreak(returns);

      const double periodsPerYear = computeAnnualizationFactor(run.rebalanceFrequency);
      if (returns.size() > 1)
	{
	  const Decimal mean = StatUtils<Decimal>::computeMean(returns);
	  const Decimal sd = StatUtils<Decimal>::computeStdDev(returns, mean);
	  m.volatility = Annualizer<Decimal>::annualizeVolatility(sd, periodsPerYear);

	  const Decimal periodRiskFree = Annualizer<Decimal>::periodRate(riskFreeRate, periodsPerYear);
	  m.sharpeRatio = StatUtils<Decimal>::scaledMeanToStdDev(returns, periodRiskFree);
	  m.informationRatio = StatUtils<Decimal>::scaledMeanToStdDev(returns);
	}

      m.excessReturn = m.annualizedReturn - benchmarkReturn;
      m.strategyScore = computeStrategyScore(m);
      m.rating = ratingForScore(m.strategyScore);
      return m;
    }
  };

  /**
   * @brief Metrics of a run using the risk free rate and benchmark of the
   *        given configuration.
   */
  template <class Decimal>
  PerformanceMetrics<Decimal> computeMetrics(const RunResult<Decimal>& run,
					     const RebalanceConfiguration<Decimal>& configuration)
  {
    return PerformanceCalculator<Decimal>::compute(run, configuration.riskFreeRate,
						   configuration.benchmarkReturn);
  }

  template <class Decimal>
  PerformanceMetrics<Decimal> computeMetrics(const RunResult<Decimal>& run)
  {
    return computeMetrics(run, RebalanceConfiguration<Decimal>());
  }
}

#endif
