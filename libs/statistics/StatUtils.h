// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_STAT_UTILS_H
#define __REBALANCER_STAT_UTILS_H 1

#include <cmath>
#include <numeric>
#include <utility>
#include <vector>
#include "number.h"
#include "DecimalConstants.h"

namespace rebalancer
{
  /**
   * @class StatUtils
   * @brief Sample statistics over a vector of returns.
   */
  template<class Decimal>
  struct StatUtils
  {
    /**
     * @brief Computes the arithmetic mean of a vector of Decimal values.
     * @return The mean of the data, zero when data is empty.
     */
    static Decimal computeMean(const std::vector<Decimal>& data)
    {
      if (data.empty()) {
	return DecimalConstants<Decimal>::DecimalZero;
      }
      Decimal sum = std::accumulate(data.begin(), data.end(), DecimalConstants<Decimal>::DecimalZero);
      return sum / Decimal(static_cast<long>(data.size()));
    }

    /**
     * @brief Computes the (unbiased) sample variance given a precomputed mean.
     *        Returns 0 when data.size() < 2.
     */
    static Decimal computeVariance(const std::vector<Decimal>& data, const Decimal& mean)
    {
      const size_t n = data.size();
      if (n < 2)
        return DecimalConstants<Decimal>::DecimalZero;

      // Squared deviations of daily returns are below the decimal resolution,
      // so they are summed in double.
      const double m = num::to_double(mean);
      const double sq_sum = std::accumulate(data.begin(), data.end(), 0.0,
					    [m](double acc, const Decimal& val) {
					      const double diff = num::to_double(val) - m;
					      return acc + diff * diff;
					    });

      // Unbiased sample variance (N-1)
      return Decimal(sq_sum / static_cast<double>(n - 1));
    }

    static Decimal computeStdDev(const std::vector<Decimal>& data, const Decimal& mean)
    {
      const size_t n = data.size();
      if (n < 2)
        return DecimalConstants<Decimal>::DecimalZero;

      const double m = num::to_double(mean);
      double sq_sum = 0.0;
      for (const auto& val : data)
	{
	  const double diff = num::to_double(val) - m;
	  sq_sum += diff * diff;
	}

      return Decimal(std::sqrt(sq_sum / static_cast<double>(n - 1)));
    }

    static std::pair<Decimal, Decimal> computeMeanAndStdDev(const std::vector<Decimal>& data)
    {
      const Decimal mean = computeMean(data);
      return {mean, computeStdDev(data, mean)};
    }

    /**
     * @brief mean / stddev * sqrt(n) of the series after subtracting
     *        perPeriodHurdle from every element.
     *
     * Returns zero with fewer than two observations or a standard deviation
     * at or below eps.
     */
    static Decimal scaledMeanToStdDev(const std::vector<Decimal>& data,
				      const Decimal& perPeriodHurdle = DecimalConstants<Decimal>::DecimalZero,
				      double eps = 1e-12)
    {
      if (data.size() < 2)
	return DecimalConstants<Decimal>::DecimalZero;

      std::vector<Decimal> excess;
      excess.reserve(data.size());
      for (const auto& r : data)
	excess.push_back(r - perPeriodHurdle);

      auto [mean, sd] = computeMeanAndStdDev(excess);
      if (!(num::to_double(sd) > eps))
	return DecimalConstants<Decimal>::DecimalZero;

      return mean / sd * Decimal(std::sqrt(static_cast<double>(data.size())));
    }
  };
}

#endif
