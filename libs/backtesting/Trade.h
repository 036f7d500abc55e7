// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_TRADE_H
#define __REBALANCER_TRADE_H 1

#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace rebalancer
{
  enum class TradeAction { Buy, Sell };

  inline std::string tradeActionToString (TradeAction action)
  {
    return (action == TradeAction::Buy) ? "BUY" : "SELL";
  }

  /**
   * @brief One executed order.
   *
   * cost is the commission plus, for sells, the stamp tax. The cash moved by
   * the trade is shares * price + cost for a buy and shares * price - cost
   * for a sell.
   */
  template <class Decimal>
  struct Trade
  {
    boost::gregorian::date date;
    TradeAction action;
    std::string code;
    unsigned long shares;
    Decimal price;
    Decimal cost;

    Decimal getAmount() const
    {
      return Decimal(static_cast<long>(shares)) * price;
    }
  };

  template <class Decimal>
  bool operator==(const Trade<Decimal>& lhs, const Trade<Decimal>& rhs)
  {
    return (lhs.date == rhs.date) && (lhs.action == rhs.action) &&
      (lhs.code == rhs.code) && (lhs.shares == rhs.shares) &&
      (lhs.price == rhs.price) && (lhs.cost == rhs.cost);
  }

  /**
   * @brief Portfolio state recorded after each rebalance.
   */
  template <class Decimal>
  struct PortfolioSnapshot
  {
    boost::gregorian::date date;
    Decimal totalValue;
    Decimal cash;
    unsigned int numPositions;
  };

  template <class Decimal>
  bool operator==(const PortfolioSnapshot<Decimal>& lhs, const PortfolioSnapshot<Decimal>& rhs)
  {
    return (lhs.date == rhs.date) && (lhs.totalValue == rhs.totalValue) &&
      (lhs.cash == rhs.cash) && (lhs.numPositions == rhs.numPositions);
  }
}

#endif
