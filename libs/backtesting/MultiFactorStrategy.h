// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_MULTI_FACTOR_STRATEGY_H
#define __REBALANCER_MULTI_FACTOR_STRATEGY_H 1

#include <algorithm>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include "StrategySupport.h"
#include "IndicatorSnapshot.h"

namespace rebalancer
{
  /**
   * @brief Maps a raw indicator value onto a 0 to 100 sub-score.
   *
   * LinearClamp: (x - offset) * scale, clamped to [0, 100].
   *
   * Ramp: 0 below floor, rising linearly to 100 at ceiling, then falling by
   * overshootPenalty points per unit above ceiling (never below 0).
   */
  template <class Decimal>
  class FactorTransform
  {
  public:
    enum Kind { LinearClamp, Ramp };

    static FactorTransform linearClamp (const Decimal& scale,
					const Decimal& offset = Decimal(0))
    {
      return FactorTransform (LinearClamp, scale, offset, Decimal(0), Decimal(0), Decimal(0));
    }

    static FactorTransform ramp (const Decimal& floor,
				 const Decimal& ceiling,
				 const Decimal& overshootPenalty = Decimal(0))
    {
      if (!(ceiling > floor))
	throw StrategyException ("FactorTransform::ramp: ceiling must be above floor");

      return FactorTransform (Ramp, Decimal(0), Decimal(0), floor, ceiling, overshootPenalty);
    }

    Decimal apply (const Decimal& x) const
    {
      const Decimal zero(0);
      const Decimal hundred(100);

      if (mKind == LinearClamp)
	return std::min (hundred, std::max (zero, Decimal((x - mOffset) * mScale)));

      if (x < mFloor)
	return zero;

      if (x > mCeiling)
	return std::max (zero, Decimal(hundred - (x - mCeiling) * mOvershootPenalty));

      return (x - mFloor) / (mCeiling - mFloor) * hundred;
    }

    Kind getKind() const
    {
      return mKind;
    }

    std::string toString() const
    {
      std::ostringstream os;
      if (mKind == LinearClamp)
	os << "(x - " << num::toString (mOffset, 2) << ") x " << num::toString (mScale, 1)
	   << ", clamped to 0..100";
      else
	os << "ramp " << num::toString (mFloor, 2) << " -> " << num::toString (mCeiling, 2)
	   << ", minus " << num::toString (mOvershootPenalty, 1) << " per unit above";
      return os.str();
    }

  private:
    FactorTransform (Kind kind,
		     const Decimal& scale,
		     const Decimal& offset,
		     const Decimal& floor,
		     const Decimal& ceiling,
		     const Decimal& overshootPenalty)
      : mKind(kind),
	mScale(scale),
	mOffset(offset),
	mFloor(floor),
	mCeiling(ceiling),
	mOvershootPenalty(overshootPenalty)
    {}

    Kind mKind;
    Decimal mScale;
    Decimal mOffset;
    Decimal mFloor;
    Decimal mCeiling;
    Decimal mOvershootPenalty;
  };

  template <class Decimal>
  struct Factor
  {
    std::string indicator;
    FactorTransform<Decimal> transform;
    Decimal weight;
  };

  // Inclusive bounds on a single indicator. An empty bound is unchecked.
  template <class Decimal>
  struct IndicatorBound
  {
    std::string indicator;
    std::optional<Decimal> minimum;
    std::optional<Decimal> maximum;
  };

  template <class Decimal>
  struct MultiFactorStrategy
  {
    std::string name = "MultiFactor";
    Decimal minScore = Decimal(0);
    std::vector<IndicatorBound<Decimal>> bounds;
    std::vector<Factor<Decimal>> factors;
  };

  template <class Decimal>
  std::vector<std::string> requiredIndicators (const MultiFactorStrategy<Decimal>& s)
  {
    std::vector<std::string> names;
    for (const auto& b : s.bounds)
      names.push_back (b.indicator);

    for (const auto& f : s.factors)
      if (std::find (names.begin(), names.end(), f.indicator) == names.end())
	names.push_back (f.indicator);

    return names;
  }

  template <class Decimal>
  bool satisfiesBound (const IndicatorBound<Decimal>& bound, const Decimal& value)
  {
    if (bound.minimum && value < *bound.minimum)
      return false;

    if (bound.maximum && value > *bound.maximum)
      return false;

    return true;
  }

  template <class Decimal>
  bool qualifies (const MultiFactorStrategy<Decimal>& s, const IndicatorSnapshot<Decimal>& snapshot)
  {
    if (!hasAllIndicators (snapshot, requiredIndicators (s)))
      return false;

    return std::all_of (s.bounds.begin(), s.bounds.end(),
			[&snapshot](const IndicatorBound<Decimal>& b)
			{
			  return satisfiesBound (b, indicatorValue (snapshot, b.indicator));
			});
  }

  /**
   * @brief Weighted mean of the factor sub-scores.
   * @return 0 when the weights sum to zero.
   */
  template <class Decimal>
  Decimal compositeScore (const std::vector<Factor<Decimal>>& factors,
			  const IndicatorSnapshot<Decimal>& snapshot)
  {
    Decimal weighted(0);
    Decimal totalWeight(0);

    for (const auto& f : factors)
      {
	weighted += f.weight * f.transform.apply (indicatorValue (snapshot, f.indicator));
	totalWeight += f.weight;
      }

    if (num::isNearlyZero (totalWeight))
      return Decimal(0);

    return weighted / totalWeight;
  }

  template <class Decimal>
  Decimal score (const MultiFactorStrategy<Decimal>& s, const IndicatorSnapshot<Decimal>& snapshot)
  {
    return compositeScore (s.factors, snapshot);
  }

  template <class Decimal>
  void describeFactors (std::ostream& os, const std::vector<Factor<Decimal>>& factors)
  {
    os << "Factors:" << std::endl;
    for (const auto& f : factors)
      os << "  " << f.indicator << " (weight " << num::toString (f.weight, 2) << "): "
	 << f.transform.toString() << std::endl;
  }

  template <class Decimal>
  std::string describe (const MultiFactorStrategy<Decimal>& s)
  {
    std::ostringstream os;
    os << s.name << " strategy: weighted composite of factor scores" << std::endl;

    if (!s.bounds.empty())
      {
	os << "Qualification:" << std::endl;
	for (const auto& b : s.bounds)
	  {
	    os << "  " << b.indicator;
	    if (b.minimum)
	      os << " >= " << num::toString (*b.minimum, 2);
	    if (b.minimum && b.maximum)
	      os << " and";
	    if (b.maximum)
	      os << " <= " << num::toString (*b.maximum, 2);
	    os << std::endl;
	  }
      }

    describeFactors (os, s.factors);
    os << "Minimum score: " << num::toString (s.minScore, 2) << std::endl;
    return os.str();
  }
}

#endif
