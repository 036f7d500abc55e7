// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_LEDGER_H
#define __REBALANCER_LEDGER_H 1

#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "Trade.h"
#include "TransactionCostModel.h"
#include "DecimalConstants.h"
#include "number.h"

namespace rebalancer
{
  class LedgerException : public std::runtime_error
  {
  public:
  LedgerException(const std::string msg) 
    : std::runtime_error(msg)
      {}

    ~LedgerException()
      {}

  };

  enum class ExecutionStatus
    {
      Executed,
      InsufficientCash,
      InsufficientShares,
      InvalidQuantity,
      InvalidPrice
    };

  inline std::string executionStatusToString (ExecutionStatus status)
  {
    switch (status)
      {
      case ExecutionStatus::Executed:
	return "executed";
      case ExecutionStatus::InsufficientCash:
	return "insufficient cash";
      case ExecutionStatus::InsufficientShares:
	return "insufficient shares";
      case ExecutionStatus::InvalidQuantity:
	return "invalid quantity";
      case ExecutionStatus::InvalidPrice:
	return "invalid price";
      }

    return "unknown";
  }

  /**
   * @class Ledger
   * @brief Cash, positions and the trade log of a simulated account.
   *
   * Invariants maintained by execute():
   * - cash never becomes negative;
   * - a position never becomes negative and is removed when it reaches zero;
   * - every executed trade is a positive multiple of the lot size.
   *
   * A rejected order returns a failure status and leaves the ledger
   * untouched.
   */
  template <class Decimal>
  class Ledger
  {
  public:
    typedef std::map<std::string, unsigned long> PositionMap;

    /**
     * @brief Callable returning the latest close at or before a date, or
     *        std::nullopt when no such price exists.
     */
    typedef std::function<std::optional<Decimal> (const std::string&,
						  const boost::gregorian::date&)> PriceLookup;

    Ledger (const Decimal& initialCapital,
	    const TransactionCostModel<Decimal>& costModel,
	    unsigned long lotSize)
      : mInitialCapital(initialCapital),
	mCash(initialCapital),
	mCostModel(costModel),
	mLotSize(lotSize),
	mPositions(),
	mTrades()
    {
      if (mInitialCapital < DecimalConstants<Decimal>::DecimalZero)
	throw LedgerException ("Ledger: initial capital cannot be negative");

      if (mLotSize == 0)
	throw LedgerException ("Ledger: lot size must be positive");
    }

    Ledger (const Ledger<Decimal>& rhs) = default;
    Ledger<Decimal>& operator=(const Ledger<Decimal>& rhs) = default;

    ~Ledger()
    {}

    /**
     * @brief Execute a buy or sell.
     * @param action Buy or sell.
     * @param code Instrument code.
     * @param price Execution price per share, must be positive.
     * @param shares Number of shares, a positive multiple of the lot size.
     * @param tradeDate Date recorded in the trade log.
     */
    ExecutionStatus execute (TradeAction action,
			     const std::string& code,
			     const Decimal& price,
			     unsigned long shares,
			     const boost::gregorian::date& tradeDate)
    {
      if (!(price > DecimalConstants<Decimal>::DecimalZero))
	return ExecutionStatus::InvalidPrice;

      if (shares == 0 || (shares % mLotSize) != 0)
	return ExecutionStatus::InvalidQuantity;

      const Decimal amount = Decimal(static_cast<long>(shares)) * price;

      if (action == TradeAction::Buy)
	{
	  const Decimal cost = mCostModel.buyCost (amount);
	  const Decimal total = amount + cost;
	  if (mCash < total)
	    return ExecutionStatus::InsufficientCash;

	  mCash -= total;
	  mPositions[code] += shares;
	  mTrades.push_back (Trade<Decimal>{tradeDate, action, code, shares, price, cost});
	}
      else
	{
	  auto it = mPositions.find (code);
	  if (it == mPositions.end() || it->second < shares)
	    return ExecutionStatus::InsufficientShares;

	  const Decimal cost = mCostModel.sellCost (amount);
	  mCash += (amount - cost);
	  it->second -= shares;
	  if (it->second == 0)
	    mPositions.erase (it);

	  mTrades.push_back (Trade<Decimal>{tradeDate, action, code, shares, price, cost});
	}

      return ExecutionStatus::Executed;
    }

    /**
     * @brief Cash plus the market value of every position.
     *
     * A position with no price at or before the date contributes zero and is
     * reported to the diagnostic stream.
     */
    Decimal valuation (const boost::gregorian::date& valuationDate,
		       const PriceLookup& priceLookup,
		       std::ostream* diagnostics = nullptr) const
    {
      Decimal total (mCash);
      for (const auto& position : mPositions)
	{
	  std::optional<Decimal> price = priceLookup (position.first, valuationDate);
	  if (!price)
	    {
	      if (diagnostics)
		(*diagnostics) << "Valuation " << boost::gregorian::to_iso_extended_string (valuationDate)
			       << ": no price for " << position.first << ", valued at 0" << std::endl;
	      continue;
	    }

	  total += Decimal(static_cast<long>(position.second)) * (*price);
	}

      return total;
    }

    const Decimal& getInitialCapital() const
    {
      return mInitialCapital;
    }

    const Decimal& getCash() const
    {
      return mCash;
    }

    unsigned long getLotSize() const
    {
      return mLotSize;
    }

    const TransactionCostModel<Decimal>& getCostModel() const
    {
      return mCostModel;
    }

    const PositionMap& getPositions() const
    {
      return mPositions;
    }

    unsigned int getNumPositions() const
    {
      return static_cast<unsigned int>(mPositions.size());
    }

    unsigned long getPositionShares (const std::string& code) const
    {
      auto it = mPositions.find (code);
      return (it == mPositions.end()) ? 0 : it->second;
    }

    bool isHolding (const std::string& code) const
    {
      return mPositions.find (code) != mPositions.end();
    }

    const std::vector<Trade<Decimal>>& getTrades() const
    {
      return mTrades;
    }

  private:
    Decimal mInitialCapital;
    Decimal mCash;
    TransactionCostModel<Decimal> mCostModel;
    unsigned long mLotSize;
    PositionMap mPositions;
    std::vector<Trade<Decimal>> mTrades;
  };
}

#endif
