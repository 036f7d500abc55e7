// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_TRANSACTION_COST_MODEL_H
#define __REBALANCER_TRANSACTION_COST_MODEL_H 1

#include <algorithm>
#include "RebalanceConfiguration.h"
#include "DecimalConstants.h"

namespace rebalancer
{
  //
  // class TransactionCostModel
  //
  // Broker commission is charged on both sides with a minimum per trade.
  // Stamp tax is charged on sells only.
  //

  template <class Decimal>
  class TransactionCostModel
  {
  public:
    TransactionCostModel (const Decimal& commissionRate,
			  const Decimal& minCommission,
			  const Decimal& stampTaxRate)
      : mCommissionRate(commissionRate),
	mMinCommission(minCommission),
	mStampTaxRate(stampTaxRate)
    {}

    explicit TransactionCostModel (const RebalanceConfiguration<Decimal>& config)
      : TransactionCostModel (config.commissionRate, config.minCommission, config.stampTaxRate)
    {}

    TransactionCostModel (const TransactionCostModel<Decimal>& rhs) = default;
    TransactionCostModel<Decimal>& operator=(const TransactionCostModel<Decimal>& rhs) = default;

    Decimal commission (const Decimal& tradeAmount) const
    {
      return std::max (Decimal(tradeAmount * mCommissionRate), mMinCommission);
    }

    Decimal stampTax (const Decimal& tradeAmount) const
    {
      return tradeAmount * mStampTaxRate;
    }

    Decimal buyCost (const Decimal& tradeAmount) const
    {
      return commission (tradeAmount);
    }

    Decimal sellCost (const Decimal& tradeAmount) const
    {
      return commission (tradeAmount) + stampTax (tradeAmount);
    }

    const Decimal& getCommissionRate() const
    {
      return mCommissionRate;
    }

    const Decimal& getMinCommission() const
    {
      return mMinCommission;
    }

    const Decimal& getStampTaxRate() const
    {
      return mStampTaxRate;
    }

  private:
    Decimal mCommissionRate;
    Decimal mMinCommission;
    Decimal mStampTaxRate;
  };
}

#endif
