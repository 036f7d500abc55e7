// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_STOCK_SELECTOR_H
#define __REBALANCER_STOCK_SELECTOR_H 1

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "MarketDataSource.h"
#include "SelectionStrategy.h"
#include "IndicatorEngine.h"
#include "IndicatorSnapshot.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"

namespace rebalancer
{
  template <class Decimal>
  struct Candidate
  {
    std::string code;
    std::string name;
    Decimal score;
    Decimal price;
    IndicatorSnapshot<Decimal> snapshot;
  };

  /**
   * @class StockSelector
   * @brief Ranks the universe of a data source with a selection strategy.
   *
   * Per instrument work (indicator snapshot, qualification, scoring) is
   * spread across the executor. Results are written into a slot per universe
   * position, so the ranking does not depend on completion order. Equal
   * scores keep universe order.
   */
  template <class Decimal>
  class StockSelector
  {
  public:
    StockSelector (const IMarketDataSource<Decimal>& dataSource,
		   const IndicatorEngine<Decimal>& engine,
		   unsigned int minDataDays,
		   unsigned int maxPositions,
		   std::shared_ptr<concurrency::IParallelExecutor> executor = nullptr)
      : mDataSource(dataSource),
	mEngine(engine),
	mMinDataDays(minDataDays),
	mMaxPositions(maxPositions),
	mExecutor(executor ? executor : std::make_shared<concurrency::SingleThreadExecutor>())
    {}

    /**
     * @brief Top ranked candidates as of selectionDate.
     * @return At most maxPositions candidates ordered by descending score.
     */
    std::vector<Candidate<Decimal>>
    select (const boost::gregorian::date& selectionDate,
	    const SelectionStrategy<Decimal>& strategy) const
    {
      const std::vector<InstrumentDescriptor>& universe = mDataSource.getUniverse();
      std::vector<std::optional<Candidate<Decimal>>> slots =
	concurrency::parallel_evaluate<Candidate<Decimal>> (static_cast<uint32_t>(universe.size()), *mExecutor,
							    [&](uint32_t i)
							    {
							      return evaluate (universe[i], selectionDate, strategy);
							    });

      std::vector<Candidate<Decimal>> ranked;
      for (auto& slot : slots)
	if (slot)
	  ranked.push_back (std::move (*slot));

      std::stable_sort (ranked.begin(), ranked.end(),
			[](const Candidate<Decimal>& lhs, const Candidate<Decimal>& rhs)
			{
			  return lhs.score > rhs.score;
			});

      if (ranked.size() > mMaxPositions)
	ranked.resize (mMaxPositions);

      return ranked;
    }

    /**
     * @brief Evaluate a single instrument.
     * @return std::nullopt when the instrument has too little history, its
     *         snapshot cannot be computed, it fails qualification or scores
     *         below the strategy minimum.
     */
    std::optional<Candidate<Decimal>>
    evaluate (const InstrumentDescriptor& instrument,
	      const boost::gregorian::date& selectionDate,
	      const SelectionStrategy<Decimal>& strategy) const
    {
      auto history = mDataSource.getPriceHistory (instrument.getCode());
      if (!history)
	return std::nullopt;

      if (history->getNumEntriesOnOrBefore (selectionDate) < mMinDataDays)
	return std::nullopt;

      std::optional<IndicatorSnapshot<Decimal>> snapshot = mEngine.compute (*history, selectionDate);
      if (!snapshot || !strategy.qualify (*snapshot))
	return std::nullopt;

      Decimal candidateScore = strategy.score (*snapshot);
      if (candidateScore < strategy.getMinScore())
	return std::nullopt;

      Decimal price = *snapshot->getValue (IndicatorNames::Price);
      return Candidate<Decimal>{instrument.getCode(), instrument.getName(),
				candidateScore, price, std::move (*snapshot)};
    }

    unsigned int getMaxPositions() const
    {
      return mMaxPositions;
    }

    unsigned int getMinDataDays() const
    {
      return mMinDataDays;
    }

  private:
    const IMarketDataSource<Decimal>& mDataSource;
    const IndicatorEngine<Decimal>& mEngine;
    unsigned int mMinDataDays;
    unsigned int mMaxPositions;
    std::shared_ptr<concurrency::IParallelExecutor> mExecutor;
  };
}

#endif
