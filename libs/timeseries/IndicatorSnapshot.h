// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_INDICATOR_SNAPSHOT_H
#define __REBALANCER_INDICATOR_SNAPSHOT_H 1

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace rebalancer
{
  namespace IndicatorNames
  {
    const std::string Price("price");
    const std::string High52Week("high_52w");
    const std::string Low52Week("low_52w");
    const std::string MovingAverageTrend("ma_trend");
    const std::string Rsi("rsi");
    const std::string Macd("macd");
    const std::string MacdSignal("macd_signal");
    const std::string MacdHistogram("macd_hist");
    const std::string BollingerUpper("bb_upper");
    const std::string BollingerMiddle("bb_middle");
    const std::string BollingerLower("bb_lower");
    const std::string BollingerPosition("bb_position");
    const std::string RateOfChange10("roc_10");
    const std::string Volatility("volatility");
    const std::string AverageTrueRange("atr");
    const std::string VolumeRatio("volume_ratio");
    const std::string VolumeMovingAverage("volume_ma20");
    const std::string PricePosition("price_position");
    const std::string OnBalanceVolume("obv");
    const std::string VolumePriceTrend("vpt");

    // ma5, ma10, ...
    inline std::string movingAverage(unsigned int period)
    {
      return "ma" + std::to_string(period);
    }

    // momentum_5d, momentum_20d, ...
    inline std::string momentum(unsigned int horizon)
    {
      return "momentum_" + std::to_string(horizon) + "d";
    }
  }

  /**
   * @brief Named indicator values for one instrument as of one date.
   *
   * An indicator that could not be computed is simply absent; callers see it
   * as std::nullopt from getValue().
   */
  template <class Decimal>
  class IndicatorSnapshot
  {
  public:
    using ConstIterator = typename std::map<std::string, Decimal>::const_iterator;

    explicit IndicatorSnapshot(const boost::gregorian::date& asOfDate)
      : mAsOfDate(asOfDate),
	mValues()
    {}

    IndicatorSnapshot(const IndicatorSnapshot& rhs) = default;
    IndicatorSnapshot& operator=(const IndicatorSnapshot& rhs) = default;

    const boost::gregorian::date& getAsOfDate() const
    {
      return mAsOfDate;
    }

    void setValue(const std::string& name, const Decimal& value)
    {
      mValues[name] = value;
    }

    void setValue(const std::string& name, const std::optional<Decimal>& value)
    {
      if (value)
	mValues[name] = *value;
      else
	mValues.erase(name);
    }

    std::optional<Decimal> getValue(const std::string& name) const
    {
      auto it = mValues.find(name);
      if (it == mValues.end())
	return std::nullopt;

      return it->second;
    }

    bool hasValue(const std::string& name) const
    {
      return mValues.find(name) != mValues.end();
    }

    unsigned long getNumValues() const
    {
      return static_cast<unsigned long>(mValues.size());
    }

    ConstIterator beginValues() const
    {
      return mValues.begin();
    }

    ConstIterator endValues() const
    {
      return mValues.end();
    }

  private:
    boost::gregorian::date mAsOfDate;
    std::map<std::string, Decimal> mValues;
  };

  template <class Decimal>
  bool operator==(const IndicatorSnapshot<Decimal>& lhs, const IndicatorSnapshot<Decimal>& rhs)
  {
    return (lhs.getAsOfDate() == rhs.getAsOfDate()) &&
      (lhs.getNumValues() == rhs.getNumValues()) &&
      std::equal(lhs.beginValues(), lhs.endValues(), rhs.beginValues());
  }
}

#endif
