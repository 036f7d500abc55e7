// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_INDICATOR_ENGINE_H
#define __REBALANCER_INDICATOR_ENGINE_H 1

#include <algorithm>
#include <cmath>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "PriceSeries.h"
#include "IndicatorSnapshot.h"
#include "TimeSeriesIndicators.h"
#include "TimeSeriesException.h"
#include "DecimalConstants.h"

namespace rebalancer
{
  /**
   * @brief Window lengths and constants used to derive an IndicatorSnapshot.
   *
   * The defaults reproduce the signals the selection strategies were tuned
   * against.
   */
  struct IndicatorParameters
  {
    unsigned int lookbackBars = 60;
    std::vector<unsigned int> movingAveragePeriods = {5, 10, 20, 60};
    std::vector<unsigned int> momentumHorizons = {5, 10, 20, 60};
    unsigned int rsiPeriod = 14;
    unsigned int macdFastSpan = 12;
    unsigned int macdSlowSpan = 26;
    unsigned int macdSignalSpan = 9;
    unsigned int bollingerPeriod = 20;
    double bollingerWidth = 2.0;
    unsigned int rateOfChangePeriod = 10;
    unsigned int volatilityWindow = 20;
    unsigned int barsPerYear = 252;
    unsigned int atrPeriod = 14;
    unsigned int volumeWindow = 20;
    unsigned int pricePositionWindow = 60;
    unsigned int rangeWindow = 252;
  };

  /**
   * @brief Maps a price history prefix to an IndicatorSnapshot.
   *
   * compute() only reads bars dated on or before the as-of date and has no
   * side effects, so one engine can be shared by concurrent selection tasks.
   */
  template <class Decimal>
  class IndicatorEngine
  {
  public:
    explicit IndicatorEngine(const IndicatorParameters& params)
      : mParams(params)
    {
      if (mParams.lookbackBars == 0)
	throw TimeSeriesException("IndicatorEngine: lookback must be positive");

      if (mParams.movingAveragePeriods.empty() || mParams.momentumHorizons.empty())
	throw TimeSeriesException("IndicatorEngine: moving average periods and momentum horizons must not be empty");

      checkPositive(mParams.movingAveragePeriods, "moving average period");
      checkPositive(mParams.momentumHorizons, "momentum horizon");
      checkPositive({mParams.rsiPeriod, mParams.macdFastSpan, mParams.macdSlowSpan,
		     mParams.macdSignalSpan, mParams.bollingerPeriod, mParams.rateOfChangePeriod,
		     mParams.volatilityWindow, mParams.barsPerYear, mParams.atrPeriod,
		     mParams.volumeWindow, mParams.pricePositionWindow, mParams.rangeWindow},
		    "indicator window");
    }

    const IndicatorParameters& getParameters() const
    {
      return mParams;
    }

    /**
     * @brief Names of every indicator compute() can emit with these
     *        parameters, given enough history.
     */
    std::set<std::string> getProducedIndicators() const
    {
      std::set<std::string> names = {
	IndicatorNames::Price, IndicatorNames::High52Week, IndicatorNames::Low52Week,
	IndicatorNames::Rsi, IndicatorNames::RateOfChange10,
	IndicatorNames::Macd, IndicatorNames::MacdSignal, IndicatorNames::MacdHistogram,
	IndicatorNames::BollingerUpper, IndicatorNames::BollingerMiddle,
	IndicatorNames::BollingerLower, IndicatorNames::BollingerPosition,
	IndicatorNames::Volatility, IndicatorNames::AverageTrueRange,
	IndicatorNames::PricePosition, IndicatorNames::VolumeMovingAverage,
	IndicatorNames::VolumeRatio, IndicatorNames::OnBalanceVolume,
	IndicatorNames::VolumePriceTrend
      };

      for (auto period : mParams.movingAveragePeriods)
	names.insert(IndicatorNames::movingAverage(period));

      for (auto horizon : mParams.momentumHorizons)
	names.insert(IndicatorNames::momentum(horizon));

      const std::set<unsigned int> distinctPeriods(mParams.movingAveragePeriods.begin(),
						   mParams.movingAveragePeriods.end());
      if (distinctPeriods.size() >= 3)
	names.insert(IndicatorNames::MovingAverageTrend);

      return names;
    }

    /**
     * @brief Computes every indicator as of the given date.
     * @param series Full price history of one instrument.
     * @param asOfDate Bars dated after this date are ignored.
     * @return std::nullopt when fewer than lookbackBars bars are available.
     */
    std::optional<IndicatorSnapshot<Decimal>> compute(const PriceSeries<Decimal>& series,
						      const boost::gregorian::date& asOfDate) const
    {
      if (series.getNumEntriesOnOrBefore(asOfDate) < mParams.lookbackBars)
	return std::nullopt;

      return computeFromHistory(TruncateSeries(series, asOfDate), asOfDate);
    }

  private:
    std::optional<IndicatorSnapshot<Decimal>>
    computeFromHistory(const PriceSeries<Decimal>& history,
		       const boost::gregorian::date& asOfDate) const
    {
      const Decimal zero(DecimalConstants<Decimal>::DecimalZero);
      const std::vector<Decimal> closes(CloseValues(history));
      const std::vector<Decimal> highs(HighValues(history));
      const std::vector<Decimal> lows(LowValues(history));
      const std::vector<Decimal> volumes(VolumeValues(history));

      IndicatorSnapshot<Decimal> snapshot(asOfDate);
      const Decimal& price = closes.back();

      snapshot.setValue(IndicatorNames::Price, price);
      snapshot.setValue(IndicatorNames::High52Week, RollingMax(highs, mParams.rangeWindow));
      snapshot.setValue(IndicatorNames::Low52Week, RollingMin(lows, mParams.rangeWindow));

      // Moving averages and their alignment
      for (auto period : mParams.movingAveragePeriods)
	snapshot.setValue(IndicatorNames::movingAverage(period), RollingMean(closes, period));

      setMovingAverageTrend(snapshot, closes);

      // Momentum
      snapshot.setValue(IndicatorNames::Rsi, RelativeStrengthIndex(closes, mParams.rsiPeriod));

      for (auto horizon : mParams.momentumHorizons)
	snapshot.setValue(IndicatorNames::momentum(horizon), HorizonReturn(closes, horizon));

      auto roc = HorizonReturn(closes, mParams.rateOfChangePeriod);
      if (roc)
	snapshot.setValue(IndicatorNames::RateOfChange10, *roc * DecimalConstants<Decimal>::DecimalOneHundred);

      // Trend
      setMacd(snapshot, closes);
      setBollingerBands(snapshot, closes);

      // Volatility
      std::vector<Decimal> returns(PercentChanges(closes));
      auto stdDev = RollingSampleStdDev(returns, mParams.volatilityWindow);
      if (stdDev)
	snapshot.setValue(IndicatorNames::Volatility,
			  *stdDev * Decimal(std::sqrt(static_cast<double>(mParams.barsPerYear))));

      snapshot.setValue(IndicatorNames::AverageTrueRange,
			AverageTrueRange(highs, lows, closes, mParams.atrPeriod));

      auto highestHigh = RollingMax(highs, mParams.pricePositionWindow);
      auto lowestLow = RollingMin(lows, mParams.pricePositionWindow);
      if (highestHigh && lowestLow && !num::isNearlyZero(Decimal(*highestHigh - *lowestLow)))
	snapshot.setValue(IndicatorNames::PricePosition, (price - *lowestLow) / (*highestHigh - *lowestLow));

      // Volume
      auto volumeMean = RollingMean(volumes, mParams.volumeWindow);
      snapshot.setValue(IndicatorNames::VolumeMovingAverage, volumeMean);
      if (volumeMean && *volumeMean > zero)
	snapshot.setValue(IndicatorNames::VolumeRatio, volumes.back() / *volumeMean);

      snapshot.setValue(IndicatorNames::OnBalanceVolume, OnBalanceVolume(closes, volumes));
      snapshot.setValue(IndicatorNames::VolumePriceTrend, VolumePriceTrend(closes, volumes));

      return snapshot;
    }

    // +1 when the three shortest averages are stacked short over long, -1
    // when stacked the other way, 0 otherwise.
    void setMovingAverageTrend(IndicatorSnapshot<Decimal>& snapshot,
			       const std::vector<Decimal>& closes) const
    {
      std::vector<unsigned int> periods(mParams.movingAveragePeriods);
      std::sort(periods.begin(), periods.end());
      periods.erase(std::unique(periods.begin(), periods.end()), periods.end());
      if (periods.size() < 3)
	return;

      auto shortMa = RollingMean(closes, periods[0]);
      auto midMa = RollingMean(closes, periods[1]);
      auto longMa = RollingMean(closes, periods[2]);
      if (!shortMa || !midMa || !longMa)
	return;

      if (*shortMa > *midMa && *midMa > *longMa)
	snapshot.setValue(IndicatorNames::MovingAverageTrend, DecimalConstants<Decimal>::DecimalOne);
      else if (*shortMa < *midMa && *midMa < *longMa)
	snapshot.setValue(IndicatorNames::MovingAverageTrend, DecimalConstants<Decimal>::DecimalMinusOne);
      else
	snapshot.setValue(IndicatorNames::MovingAverageTrend, DecimalConstants<Decimal>::DecimalZero);
    }

    void setMacd(IndicatorSnapshot<Decimal>& snapshot,
		 const std::vector<Decimal>& closes) const
    {
      std::vector<Decimal> fast(AdjustedEmaSeries(closes, mParams.macdFastSpan));
      std::vector<Decimal> slow(AdjustedEmaSeries(closes, mParams.macdSlowSpan));
      if (fast.empty() || fast.size() != slow.size())
	return;

      std::vector<Decimal> macdLine;
      macdLine.reserve(fast.size());
      for (std::size_t i = 0; i < fast.size(); ++i)
	macdLine.push_back(fast[i] - slow[i]);

      std::vector<Decimal> signal(AdjustedEmaSeries(macdLine, mParams.macdSignalSpan));

      snapshot.setValue(IndicatorNames::Macd, macdLine.back());
      snapshot.setValue(IndicatorNames::MacdSignal, signal.back());
      snapshot.setValue(IndicatorNames::MacdHistogram, macdLine.back() - signal.back());
    }

    void setBollingerBands(IndicatorSnapshot<Decimal>& snapshot,
			   const std::vector<Decimal>& closes) const
    {
      auto middle = RollingMean(closes, mParams.bollingerPeriod);
      auto stdDev = RollingSampleStdDev(closes, mParams.bollingerPeriod);
      if (!middle || !stdDev)
	return;

      const Decimal width(Decimal(mParams.bollingerWidth) * *stdDev);
      const Decimal upper(*middle + width);
      const Decimal lower(*middle - width);

      snapshot.setValue(IndicatorNames::BollingerUpper, upper);
      snapshot.setValue(IndicatorNames::BollingerMiddle, *middle);
      snapshot.setValue(IndicatorNames::BollingerLower, lower);

      if (!num::isNearlyZero(Decimal(upper - lower)))
	snapshot.setValue(IndicatorNames::BollingerPosition, (closes.back() - lower) / (upper - lower));
    }

    static void checkPositive(const std::vector<unsigned int>& values, const std::string& what)
    {
      for (auto v : values)
	if (v == 0)
	  throw TimeSeriesException("IndicatorEngine: " + what + " must be positive");
    }

  private:
    IndicatorParameters mParams;
  };
}

#endif
