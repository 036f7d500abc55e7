// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_REBALANCE_CONFIGURATION_H
#define __REBALANCER_REBALANCE_CONFIGURATION_H 1

#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "DateRange.h"
#include "IndicatorEngine.h"
#include "TimeFrame.h"
#include "TimeFrameUtility.h"
#include "DecimalConstants.h"
#include "number.h"

namespace rebalancer
{
  class RebalanceConfigurationException : public std::runtime_error
  {
  public:
    RebalanceConfigurationException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~RebalanceConfigurationException()
    {}
  };

  /**
   * @brief Every tunable of a rebalancing simulation.
   *
   * Components receive this struct explicitly; none of them carry defaults
   * of their own. The defaults below are the historical settings of the
   * system.
   */
  template <class Decimal>
  struct RebalanceConfiguration
  {
    // Account
    Decimal initialCapital = Decimal(1000000);
    unsigned int maxPositions = 6;

    // Costs
    Decimal commissionRate = Decimal(0.0003);
    Decimal minCommission = Decimal(5);
    Decimal stampTaxRate = Decimal(0.001);

    // Board lot and fraction of valuation kept as cash at each rebalance
    unsigned int lotSize = 100;
    Decimal cashReserve = Decimal(0.10);

    // Data quality and indicators
    unsigned int minDataDays = 100;
    IndicatorParameters indicators;

    // Schedule
    TimeFrame::Duration rebalanceFrequency = TimeFrame::QUARTERLY;
    boost::gregorian::date startDate = boost::gregorian::date(2021, 1, 1);
    boost::gregorian::date endDate = boost::gregorian::date(2024, 1, 1);

    // Performance evaluation
    Decimal riskFreeRate = Decimal(0.03);
    Decimal benchmarkReturn = Decimal(0.08);

    /**
     * @throws DateRangeException when endDate is before startDate or either
     *         date is not a calendar date.
     */
    DateRange getDateRange() const
    {
      return DateRange (startDate, endDate);
    }

    /**
     * @brief Rejects settings a simulation cannot run with.
     * @throws RebalanceConfigurationException naming the first offending field.
     */
    void validate() const
    {
      const Decimal zero(DecimalConstants<Decimal>::DecimalZero);
      const Decimal one(DecimalConstants<Decimal>::DecimalOne);

      if (!(initialCapital > zero))
	fail ("initial capital must be positive, got " + num::toString (initialCapital));

      if (maxPositions == 0)
	fail ("max positions must be positive");

      try
	{
	  getDateRange();
	}
      catch (const DateRangeException& e)
	{
	  fail (e.what());
	}

      if (commissionRate < zero || minCommission < zero || stampTaxRate < zero)
	fail ("commission, minimum commission and stamp tax must not be negative");

      if (lotSize == 0)
	fail ("lot size must be positive");

      if (cashReserve < zero || !(cashReserve < one))
	fail ("cash reserve must be in [0, 1), got " + num::toString (cashReserve));

      if (!isRebalanceFrequency (rebalanceFrequency))
	fail ("rebalance frequency must be MONTHLY, QUARTERLY or YEARLY, got " +
	      timeFrameToString (rebalanceFrequency));

      if (indicators.movingAveragePeriods.empty())
	fail ("moving average periods must not be empty");

      if (indicators.momentumHorizons.empty())
	fail ("momentum horizons must not be empty");

      if (indicators.lookbackBars == 0)
	fail ("lookback must be positive");

      try
	{
	  IndicatorEngine<Decimal> check (indicators);
	}
      catch (const TimeSeriesException& e)
	{
	  fail (e.what());
	}
    }

  private:
    static void fail (const std::string& reason)
    {
      throw RebalanceConfigurationException ("RebalanceConfiguration: " + reason);
    }
  };
}

#endif
