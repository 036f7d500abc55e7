// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_REBALANCE_BACKTESTER_H
#define __REBALANCER_REBALANCE_BACKTESTER_H 1

#include <cmath>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "DateRange.h"
#include "Ledger.h"
#include "MarketDataSource.h"
#include "RebalanceConfiguration.h"
#include "RebalanceSchedule.h"
#include "SelectionStrategy.h"
#include "StockSelector.h"
#include "Trade.h"
#include "TransactionCostModel.h"
#include "IndicatorEngine.h"
#include "TimeFrame.h"
#include "number.h"

namespace rebalancer
{
  using boost::gregorian::date;

  /**
   * @brief Everything produced by one simulation run.
   */
  template <class Decimal>
  struct RunResult
  {
    std::string strategyName;
    date startDate;
    date endDate;
    TimeFrame::Duration rebalanceFrequency;
    Decimal initialCapital;
    std::vector<PortfolioSnapshot<Decimal>> snapshots;
    std::vector<Trade<Decimal>> trades;
    Decimal finalValue;
    Decimal finalCash;
    std::map<std::string, unsigned long> finalPositions;
  };

  /**
   * @class RebalanceBackTester
   * @brief Periodic rebalancing simulation over a fixed universe.
   *
   * At every rebalance date, in order:
   * 1. value the portfolio;
   * 2. select the top ranked instruments;
   * 3. when nothing is selected record a snapshot and move on;
   * 4. sell every holding that was not selected;
   * 5. size each selected instrument at an equal share of the invested
   *    fraction of step 1's valuation, rounded down to whole lots;
   * 6. buy up to that size (existing holdings are never trimmed);
   * 7. record a snapshot.
   *
   * Rebalance dates are processed strictly in sequence and the ledger is only
   * touched from the calling thread. Instrument evaluation within a date may
   * run on the executor.
   */
  template <class Decimal>
  class RebalanceBackTester
  {
  public:
    /**
     * @throws RebalanceConfigurationException if configuration fails
     *         validation.
     */
    RebalanceBackTester (const IMarketDataSource<Decimal>& dataSource,
			 const RebalanceConfiguration<Decimal>& configuration,
			 std::shared_ptr<concurrency::IParallelExecutor> executor = nullptr,
			 std::ostream* log = nullptr)
      : mDataSource(dataSource),
	mConfiguration(validated (configuration)),
	mEngine(mConfiguration.indicators),
	mExecutor(executor),
	mLog(log)
    {}

    RebalanceBackTester (const RebalanceBackTester&) = delete;
    RebalanceBackTester& operator=(const RebalanceBackTester&) = delete;

    ~RebalanceBackTester()
    {}

    /**
     * @brief Run over the configured dates and frequency.
     */
    RunResult<Decimal> run (const SelectionStrategy<Decimal>& strategy) const
    {
      return run (mConfiguration.getDateRange(), mConfiguration.rebalanceFrequency, strategy);
    }

    /**
     * @brief Simulate from startDate to endDate (inclusive).
     * @throws RebalanceConfigurationException when endDate is before
     *         startDate or frequency is not a rebalance frequency.
     */
    RunResult<Decimal> run (const date& startDate,
			    const date& endDate,
			    TimeFrame::Duration frequency,
			    const SelectionStrategy<Decimal>& strategy) const
    {
      try
	{
	  return run (DateRange (startDate, endDate), frequency, strategy);
	}
      catch (const DateRangeException& e)
	{
	  throw RebalanceConfigurationException (std::string ("RebalanceBackTester::run: ") + e.what());
	}
    }

    /**
     * @brief Simulate over a closed date range.
     * @throws RebalanceConfigurationException when frequency is not a
     *         rebalance frequency or the strategy reads an indicator the
     *         configured engine never produces.
     */
    RunResult<Decimal> run (const DateRange& range,
			    TimeFrame::Duration frequency,
			    const SelectionStrategy<Decimal>& strategy) const
    {
      const date& startDate = range.getFirstDate();
      const date& endDate = range.getLastDate();

      if (!isRebalanceFrequency (frequency))
	throw RebalanceConfigurationException ("RebalanceBackTester::run: " +
					       timeFrameToString (frequency) +
					       " is not a rebalance frequency");

      checkIndicatorCoverage (strategy);

      Ledger<Decimal> ledger (mConfiguration.initialCapital,
			      TransactionCostModel<Decimal> (mConfiguration),
			      mConfiguration.lotSize);
      StockSelector<Decimal> selector (mDataSource, mEngine,
				       mConfiguration.minDataDays,
				       mConfiguration.maxPositions,
				       mExecutor);
      const typename Ledger<Decimal>::PriceLookup lookup = makePriceLookup();

      RunResult<Decimal> result;
      result.strategyName = strategy.getName();
      result.startDate = startDate;
      result.endDate = endDate;
      result.rebalanceFrequency = frequency;
      result.initialCapital = mConfiguration.initialCapital;

      if (mLog)
	(*mLog) << "Starting " << strategy.getName() << " run from "
		<< to_iso_extended_string (startDate) << " to "
		<< to_iso_extended_string (endDate) << " ("
		<< timeFrameToString (frequency) << ")" << std::endl;

      for (const date& rebalanceDate : generateRebalanceDates (range, frequency))
	{
	  rebalance (rebalanceDate, strategy, selector, ledger, lookup);
	  result.snapshots.push_back (snapshotOf (rebalanceDate, ledger, lookup));
	}

      result.trades = ledger.getTrades();
      result.finalValue = ledger.valuation (endDate, lookup, mLog);
      result.finalCash = ledger.getCash();
      result.finalPositions = ledger.getPositions();

      if (mLog)
	(*mLog) << "Finished " << strategy.getName() << " run: final value "
		<< num::toString (result.finalValue, 2) << ", "
		<< result.trades.size() << " trades, "
		<< result.finalPositions.size() << " positions" << std::endl;

      return result;
    }

    const RebalanceConfiguration<Decimal>& getConfiguration() const
    {
      return mConfiguration;
    }

  private:
    static const RebalanceConfiguration<Decimal>&
    validated (const RebalanceConfiguration<Decimal>& configuration)
    {
      configuration.validate();
      return configuration;
    }

    typename Ledger<Decimal>::PriceLookup makePriceLookup() const
    {
      const IMarketDataSource<Decimal>* source = &mDataSource;
      return [source](const std::string& code, const date& asOf) -> std::optional<Decimal>
	{
	  auto history = source->getPriceHistory (code);
	  if (!history)
	    return std::nullopt;

	  auto bar = history->getLatestEntryOnOrBefore (asOf);
	  if (!bar)
	    return std::nullopt;

	  return bar->getCloseValue();
	};
    }

    PortfolioSnapshot<Decimal> snapshotOf (const date& snapshotDate,
					   const Ledger<Decimal>& ledger,
					   const typename Ledger<Decimal>::PriceLookup& lookup) const
    {
      return PortfolioSnapshot<Decimal>{snapshotDate,
					ledger.valuation (snapshotDate, lookup, mLog),
					ledger.getCash(),
					ledger.getNumPositions()};
    }

    void rebalance (const date& rebalanceDate,
		    const SelectionStrategy<Decimal>& strategy,
		    const StockSelector<Decimal>& selector,
		    Ledger<Decimal>& ledger,
		    const typename Ledger<Decimal>::PriceLookup& lookup) const
    {
      const Decimal portfolioValue = ledger.valuation (rebalanceDate, lookup, mLog);
      std::vector<Candidate<Decimal>> selected = selector.select (rebalanceDate, strategy);

      if (mLog)
	(*mLog) << "Rebalance " << to_iso_extended_string (rebalanceDate)
		<< ": portfolio value " << num::toString (portfolioValue, 2)
		<< ", " << selected.size() << " selected" << std::endl;

      if (selected.empty())
	return;

      std::set<std::string> selectedCodes;
      for (const auto& candidate : selected)
	selectedCodes.insert (candidate.code);

      // Copy, since selling mutates the position map.
      const typename Ledger<Decimal>::PositionMap held = ledger.getPositions();
      for (const auto& position : held)
	{
	  if (selectedCodes.count (position.first))
	    continue;

	  std::optional<Decimal> price = lookup (position.first, rebalanceDate);
	  if (!price)
	    {
	      if (mLog)
		(*mLog) << "  cannot sell " << position.first << ": no price on or before "
			<< to_iso_extended_string (rebalanceDate) << std::endl;
	      continue;
	    }

	  report (ledger.execute (TradeAction::Sell, position.first, *price,
				  position.second, rebalanceDate),
		  TradeAction::Sell, position.first, position.second, *price);
	}

      const Decimal invested = (Decimal(1) - mConfiguration.cashReserve) * portfolioValue;
      const Decimal targetValue = invested / Decimal(static_cast<long>(selected.size()));
      const unsigned long lotSize = ledger.getLotSize();

      for (const auto& candidate : selected)
	{
	  const unsigned long targetShares = sharesForTarget (targetValue, candidate.price, lotSize);
	  const unsigned long currentShares = ledger.getPositionShares (candidate.code);
	  if (targetShares <= currentShares)
	    continue;

	  const unsigned long shares = targetShares - currentShares;
	  report (ledger.execute (TradeAction::Buy, candidate.code, candidate.price,
				  shares, rebalanceDate),
		  TradeAction::Buy, candidate.code, shares, candidate.price);
	}
    }

    // A strategy reading an indicator the engine never produces would never
    // qualify anything.
    void checkIndicatorCoverage (const SelectionStrategy<Decimal>& strategy) const
    {
      const std::set<std::string> produced (mEngine.getProducedIndicators());
      for (const auto& name : strategy.getRequiredIndicators())
	if (produced.find (name) == produced.end())
	  throw RebalanceConfigurationException ("RebalanceBackTester::run: strategy " + strategy.getName() +
						 " needs indicator " + name +
						 " which the indicator settings do not produce");
    }

    // Whole lots affordable with targetValue at price.
    static unsigned long sharesForTarget (const Decimal& targetValue,
					  const Decimal& price,
					  unsigned long lotSize)
    {
      const Decimal lotValue = price * Decimal(static_cast<long>(lotSize));
      if (!(targetValue > Decimal(0)) || !(lotValue > Decimal(0)))
	return 0;

      unsigned long lots = static_cast<unsigned long>
	(std::floor (num::to_double (targetValue) / num::to_double (lotValue)));
      while (lots > 0 && Decimal(static_cast<long>(lots)) * lotValue > targetValue)
	--lots;

      return lots * lotSize;
    }

    void report (ExecutionStatus status,
		 TradeAction action,
		 const std::string& code,
		 unsigned long shares,
		 const Decimal& price) const
    {
      if (!mLog)
	return;

      (*mLog) << "  " << tradeActionToString (action) << " " << code << " "
	      << shares << " @ " << num::toString (price, 2);

      if (status != ExecutionStatus::Executed)
	(*mLog) << " rejected: " << executionStatusToString (status);

      (*mLog) << std::endl;
    }

    const IMarketDataSource<Decimal>& mDataSource;
    RebalanceConfiguration<Decimal> mConfiguration;
    IndicatorEngine<Decimal> mEngine;
    std::shared_ptr<concurrency::IParallelExecutor> mExecutor;
    std::ostream* mLog;
  };
}

#endif
