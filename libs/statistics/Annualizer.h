// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_ANNUALIZER_H
#define __REBALANCER_ANNUALIZER_H 1

#include <cmath>
#include <stdexcept>
#include "number.h"
#include "DecimalConstants.h"
#include "TimeFrame.h"
#include "TimeFrameUtility.h"

namespace rebalancer
{
  /**
   * @brief Number of periods of the given frequency in a year.
   *
   * @param timeFrame Spacing of the returns being annualized, normally the
   *        rebalance frequency of a run.
   * @param trading_days_per_year Periods per year for DAILY data.
   * @throws std::invalid_argument for a duration with no yearly count.
   */
  inline double computeAnnualizationFactor(TimeFrame::Duration timeFrame,
                                           double trading_days_per_year = 252.0)
  {
    switch (timeFrame)
      {
      case TimeFrame::YEARLY:
	return 1.0;
      case TimeFrame::QUARTERLY:
	return 4.0;
      case TimeFrame::MONTHLY:
	return 12.0;
      case TimeFrame::WEEKLY:
	return 52.0;
      case TimeFrame::DAILY:
	return trading_days_per_year;
      }

    throw std::invalid_argument("computeAnnualizationFactor: no yearly period count for " +
				timeFrameToString(timeFrame));
  }

  /**
   * @brief Conversions between per-period and yearly figures of a rebalancing run.
   */
  template <class Decimal>
  class Annualizer
  {
  public:
    /**
     * Compound a per-period return over periodsPerYear periods,
     * (1 + r)^periodsPerYear - 1, evaluated as exp(K * log1p(r)) - 1.
     *
     * A return at or below -1 is a total loss and annualizes to -1.
     *
     * @throws std::invalid_argument if periodsPerYear is not positive and finite.
     */
    static Decimal compound(const Decimal& periodReturn, double periodsPerYear)
    {
      if (!(periodsPerYear > 0.0) || !std::isfinite(periodsPerYear))
	throw std::invalid_argument("Annualizer::compound: period count must be positive and finite");

      const double r = num::to_double(periodReturn);
      if (r <= -1.0)
	return DecimalConstants<Decimal>::DecimalMinusOne;

      return Decimal(std::expm1(periodsPerYear * std::log1p(r)));
    }

    /**
     * Annualize a return earned over elapsedDays calendar days:
     *   (1 + total)^(daysPerYear / elapsedDays) - 1
     *
     * Returns zero when elapsedDays is not positive.
     */
    static Decimal annualizeOverDays(const Decimal& totalReturn,
				     long elapsedDays,
				     double daysPerYear = 365.0)
    {
      if (elapsedDays <= 0)
	return DecimalConstants<Decimal>::DecimalZero;

      return compound(totalReturn, daysPerYear / static_cast<double>(elapsedDays));
    }

    // Simple (non compounded) share of a yearly rate for one period.
    static Decimal periodRate(const Decimal& annualRate, double periodsPerYear)
    {
      return annualRate / Decimal(periodsPerYear);
    }

    // Square root of time scaling of a per-period standard deviation.
    static Decimal annualizeVolatility(const Decimal& periodStdDev, double periodsPerYear)
    {
      return periodStdDev * Decimal(std::sqrt(periodsPerYear));
    }
  };
}

#endif
