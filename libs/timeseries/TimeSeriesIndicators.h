// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_TIME_SERIES_INDICATORS_H
#define __REBALANCER_TIME_SERIES_INDICATORS_H 1

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <vector>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include "PriceSeries.h"
#include "DecimalConstants.h"
#include "number.h"

/**
 * @file TimeSeriesIndicators.h
 * @brief Trailing-window building blocks for technical indicators.
 *
 * Every function here looks only at the tail of the vector it is given. When
 * the requested window is longer than the data the result is std::nullopt
 * ("not computable"), never zero.
 */
namespace rebalancer
{
  using namespace boost::accumulators;

  template <class Decimal>
  std::vector<Decimal> CloseValues (const PriceSeries<Decimal>& series)
  {
    std::vector<Decimal> out;
    out.reserve(series.getNumEntries());
    for (auto it = series.beginSortedAccess(); it != series.endSortedAccess(); ++it)
      out.push_back(it->getCloseValue());

    return out;
  }

  template <class Decimal>
  std::vector<Decimal> HighValues (const PriceSeries<Decimal>& series)
  {
    std::vector<Decimal> out;
    out.reserve(series.getNumEntries());
    for (auto it = series.beginSortedAccess(); it != series.endSortedAccess(); ++it)
      out.push_back(it->getHighValue());

    return out;
  }

  template <class Decimal>
  std::vector<Decimal> LowValues (const PriceSeries<Decimal>& series)
  {
    std::vector<Decimal> out;
    out.reserve(series.getNumEntries());
    for (auto it = series.beginSortedAccess(); it != series.endSortedAccess(); ++it)
      out.push_back(it->getLowValue());

    return out;
  }

  template <class Decimal>
  std::vector<Decimal> VolumeValues (const PriceSeries<Decimal>& series)
  {
    std::vector<Decimal> out;
    out.reserve(series.getNumEntries());
    for (auto it = series.beginSortedAccess(); it != series.endSortedAccess(); ++it)
      out.push_back(it->getVolumeValue());

    return out;
  }

  /**
   * @brief Arithmetic mean of the last `window` values.
   */
  template <class Decimal>
  std::optional<Decimal> RollingMean (const std::vector<Decimal>& values, std::size_t window)
  {
    if (window == 0 || values.size() < window)
      return std::nullopt;

    accumulator_set<double, stats<tag::mean>> acc;
    for (auto it = values.end() - window; it != values.end(); ++it)
      acc(num::to_double(*it));

    return Decimal(mean(acc));
  }

  /**
   * @brief Sample (n - 1) standard deviation of the last `window` values.
   *
   * boost::accumulators computes the population variance, which is rescaled
   * by n / (n - 1). A window of fewer than two values is not computable.
   */
  template <class Decimal>
  std::optional<Decimal> RollingSampleStdDev (const std::vector<Decimal>& values, std::size_t window)
  {
    if (window < 2 || values.size() < window)
      return std::nullopt;

    accumulator_set<double, stats<tag::variance>> acc;
    for (auto it = values.end() - window; it != values.end(); ++it)
      acc(num::to_double(*it));

    const double n = static_cast<double>(window);
    const double sampleVariance = variance(acc) * n / (n - 1.0);
    return Decimal(std::sqrt(std::max(sampleVariance, 0.0)));
  }

  template <class Decimal>
  std::optional<Decimal> RollingMax (const std::vector<Decimal>& values, std::size_t window)
  {
    if (window == 0 || values.size() < window)
      return std::nullopt;

    return *std::max_element(values.end() - window, values.end());
  }

  template <class Decimal>
  std::optional<Decimal> RollingMin (const std::vector<Decimal>& values, std::size_t window)
  {
    if (window == 0 || values.size() < window)
      return std::nullopt;

    return *std::min_element(values.end() - window, values.end());
  }

  /**
   * @brief Simple return over `horizon` bars: x[t] / x[t - horizon] - 1.
   *
   * Needs horizon + 1 values; not computable when the base value is zero.
   */
  template <class Decimal>
  std::optional<Decimal> HorizonReturn (const std::vector<Decimal>& values, std::size_t horizon)
  {
    if (horizon == 0 || values.size() < horizon + 1)
      return std::nullopt;

    const Decimal& base = values[values.size() - 1 - horizon];
    if (base == DecimalConstants<Decimal>::DecimalZero)
      return std::nullopt;

    return values.back() / base - DecimalConstants<Decimal>::DecimalOne;
  }

  /**
   * @brief Bar-to-bar percentage changes. The result has one fewer element.
   *
   * A change whose base value is zero is reported as zero.
   */
  template <class Decimal>
  std::vector<Decimal> PercentChanges (const std::vector<Decimal>& values)
  {
    std::vector<Decimal> out;
    if (values.size() < 2)
      return out;

    out.reserve(values.size() - 1);
    for (std::size_t i = 1; i < values.size(); ++i)
      {
	if (values[i - 1] == DecimalConstants<Decimal>::DecimalZero)
	  out.push_back(DecimalConstants<Decimal>::DecimalZero);
	else
	  out.push_back(values[i] / values[i - 1] - DecimalConstants<Decimal>::DecimalOne);
      }

    return out;
  }

  /**
   * @brief Bias-adjusted exponentially weighted moving average series.
   *
   * With alpha = 2 / (span + 1) each output is
   *   sum_i (1 - alpha)^i x[t - i]  /  sum_i (1 - alpha)^i
   * over the whole history seen so far, computed recursively.
   */
  template <class Decimal>
  std::vector<Decimal> AdjustedEmaSeries (const std::vector<Decimal>& values, unsigned int span)
  {
    std::vector<Decimal> out;
    if (values.empty() || span == 0)
      return out;

    out.reserve(values.size());
    const double alpha = 2.0 / (static_cast<double>(span) + 1.0);
    const double decay = 1.0 - alpha;

    double numerator = 0.0;
    double denominator = 0.0;
    for (const auto& v : values)
      {
	numerator = num::to_double(v) + decay * numerator;
	denominator = 1.0 + decay * denominator;
	out.push_back(Decimal(numerator / denominator));
      }

    return out;
  }

  /**
   * @brief Relative strength index over the trailing `period` deltas.
   *
   * Gains and losses are the rolling means of the positive and negative parts
   * of close-to-close deltas. The delta of the first bar is taken as zero, so
   * `period` closes are enough. A zero average loss yields 100.
   */
  template <class Decimal>
  std::optional<Decimal> RelativeStrengthIndex (const std::vector<Decimal>& closes, std::size_t period)
  {
    if (period == 0 || closes.size() < period)
      return std::nullopt;

    const Decimal zero(DecimalConstants<Decimal>::DecimalZero);
    std::vector<Decimal> gains, losses;
    gains.reserve(period);
    losses.reserve(period);

    const std::size_t start = closes.size() - period;
    for (std::size_t i = start; i < closes.size(); ++i)
      {
	Decimal delta = (i == 0) ? zero : closes[i] - closes[i - 1];
	gains.push_back(delta > zero ? delta : zero);
	losses.push_back(delta < zero ? -delta : zero);
      }

    Decimal avgGain = *RollingMean(gains, period);
    Decimal avgLoss = *RollingMean(losses, period);

    if (avgLoss == zero)
      return DecimalConstants<Decimal>::DecimalOneHundred;

    Decimal rs = avgGain / avgLoss;
    return DecimalConstants<Decimal>::DecimalOneHundred -
      (DecimalConstants<Decimal>::DecimalOneHundred / (DecimalConstants<Decimal>::DecimalOne + rs));
  }

  /**
   * @brief Average true range over the trailing `period` bars.
   *
   * The true range of the first bar of the history, which has no previous
   * close, is its high minus low.
   */
  template <class Decimal>
  std::optional<Decimal> AverageTrueRange (const std::vector<Decimal>& highs,
					   const std::vector<Decimal>& lows,
					   const std::vector<Decimal>& closes,
					   std::size_t period)
  {
    const std::size_t n = closes.size();
    if (period == 0 || n < period || highs.size() != n || lows.size() != n)
      return std::nullopt;

    std::vector<Decimal> trueRanges;
    trueRanges.reserve(period);
    for (std::size_t i = n - period; i < n; ++i)
      {
	Decimal tr = highs[i] - lows[i];
	if (i > 0)
	  {
	    tr = std::max(tr, num::abs(Decimal(highs[i] - closes[i - 1])));
	    tr = std::max(tr, num::abs(Decimal(lows[i] - closes[i - 1])));
	  }
	trueRanges.push_back(tr);
      }

    return RollingMean(trueRanges, period);
  }

  /**
   * @brief On-balance volume accumulated over the whole history.
   */
  template <class Decimal>
  Decimal OnBalanceVolume (const std::vector<Decimal>& closes, const std::vector<Decimal>& volumes)
  {
    Decimal obv(DecimalConstants<Decimal>::DecimalZero);
    const std::size_t n = std::min(closes.size(), volumes.size());
    for (std::size_t i = 1; i < n; ++i)
      {
	if (closes[i] > closes[i - 1])
	  obv += volumes[i];
	else if (closes[i] < closes[i - 1])
	  obv -= volumes[i];
      }

    return obv;
  }

  /**
   * @brief Volume-price trend accumulated over the whole history.
   */
  template <class Decimal>
  Decimal VolumePriceTrend (const std::vector<Decimal>& closes, const std::vector<Decimal>& volumes)
  {
    Decimal vpt(DecimalConstants<Decimal>::DecimalZero);
    const std::size_t n = std::min(closes.size(), volumes.size());
    for (std::size_t i = 1; i < n; ++i)
      {
	if (closes[i - 1] != DecimalConstants<Decimal>::DecimalZero)
	  vpt += volumes[i] * (closes[i] / closes[i - 1] - DecimalConstants<Decimal>::DecimalOne);
      }

    return vpt;
  }
}

#endif
