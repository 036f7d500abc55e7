#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <map>
#include <string>
#include "TestUtils.h"
#include "SelectionStrategy.h"

using namespace rebalancer;
using namespace boost::gregorian;
using Catch::Approx;
using num::to_double;

namespace
{
  typedef IndicatorSnapshot<DecimalType> Snapshot;

  Snapshot snapshotOf (const std::map<std::string, double>& values)
  {
    Snapshot snapshot (date (2021, Apr, 1));
    for (const auto& v : values)
      snapshot.setValue (v.first, DecimalType(v.second));

    return snapshot;
  }

  Snapshot momentumCandidate()
  {
    return snapshotOf ({ {"price", 11.0}, {"ma5", 10.8}, {"ma10", 10.6}, {"ma20", 10.4}, {"ma60", 10.0},
			 {"rsi", 60.0}, {"momentum_5d", 0.02}, {"momentum_10d", 0.04},
			 {"momentum_20d", 0.06}, {"macd", 0.3}, {"macd_signal", 0.2},
			 {"macd_hist", 0.1}, {"bb_position", 0.6}, {"volatility", 0.3},
			 {"volume_ratio", 1.1}, {"price_position", 0.7} });
  }

  Snapshot valueCandidate()
  {
    return snapshotOf ({ {"price", 10.5}, {"ma60", 10.0}, {"price_position", 0.3}, {"rsi", 45.0},
			 {"bb_position", 0.3}, {"volatility", 0.25}, {"volume_ratio", 0.8} });
  }

  Snapshot growthCandidate()
  {
    return snapshotOf ({ {"price", 12.0}, {"ma20", 11.0}, {"ma60", 10.0}, {"momentum_20d", 0.10},
			 {"momentum_60d", 0.20}, {"rsi", 65.0}, {"volume_ratio", 1.6},
			 {"price_position", 0.8}, {"macd_hist", 0.05}, {"volatility", 0.35} });
  }
}

TEST_CASE ("MomentumStrategy qualification and score", "[SelectionStrategy]")
{
  MomentumStrategy<DecimalType> strategy;
  Snapshot snapshot = momentumCandidate();

  SECTION ("A stacked uptrend qualifies")
    {
      REQUIRE (qualifies (strategy, snapshot));
    }

  SECTION ("Score follows the weighted formula")
    {
      const double expected = 0.02 * 20 + 0.04 * 15 + 0.06 * 5 + (11.0 / 10.4 - 1.0) * 25 +
	(80.0 - 10.0) * 0.3 + 0.1 * 100 + 0.7 * 10;
      REQUIRE (to_double (score (strategy, snapshot)) == Approx (expected));
      REQUIRE (to_double (score (strategy, snapshot)) == Approx (40.7423077));
    }

  SECTION ("Broken moving average order disqualifies")
    {
      snapshot.setValue ("ma10", DecimalType(10.9));
      REQUIRE_FALSE (qualifies (strategy, snapshot));
    }

  SECTION ("RSI bounds are inclusive")
    {
      snapshot.setValue ("rsi", DecimalType(75));
      REQUIRE (qualifies (strategy, snapshot));
      snapshot.setValue ("rsi", DecimalType(75.5));
      REQUIRE_FALSE (qualifies (strategy, snapshot));
    }

  SECTION ("MACD below signal disqualifies")
    {
      snapshot.setValue ("macd", DecimalType(0.1));
      REQUIRE_FALSE (qualifies (strategy, snapshot));
    }

  SECTION ("A missing indicator disqualifies")
    {
      snapshot.setValue ("bb_position", std::optional<DecimalType>());
      REQUIRE_FALSE (qualifies (strategy, snapshot));
    }

  SECTION ("Thresholds are tunable")
    {
      strategy.maxVolatility = DecimalType(0.25);
      REQUIRE_FALSE (qualifies (strategy, snapshot));
    }

  SECTION ("Scoring an incomplete snapshot throws")
    {
      snapshot.setValue ("momentum_10d", std::optional<DecimalType>());
      REQUIRE_THROWS_AS (score (strategy, snapshot), StrategyException);
    }
}

TEST_CASE ("ValueStrategy qualification and score", "[SelectionStrategy]")
{
  ValueStrategy<DecimalType> strategy;
  Snapshot snapshot = valueCandidate();

  REQUIRE (qualifies (strategy, snapshot));
  REQUIRE (to_double (score (strategy, snapshot)) == Approx (63.75));

  SECTION ("RSI above the cap adds nothing")
    {
      snapshot.setValue ("rsi", DecimalType(70));
      REQUIRE (to_double (score (strategy, snapshot)) == Approx (63.75 - 12.5));
    }

  SECTION ("Trading below ma60 disqualifies")
    {
      snapshot.setValue ("price", DecimalType(9.5));
      REQUIRE_FALSE (qualifies (strategy, snapshot));
    }

  SECTION ("High in the range disqualifies")
    {
      snapshot.setValue ("price_position", DecimalType(0.65));
      REQUIRE_FALSE (qualifies (strategy, snapshot));
    }

  SECTION ("Thin volume disqualifies")
    {
      snapshot.setValue ("volume_ratio", DecimalType(0.3));
      REQUIRE_FALSE (qualifies (strategy, snapshot));
    }
}

TEST_CASE ("GrowthStrategy qualification and composite score", "[SelectionStrategy]")
{
  GrowthStrategy<DecimalType> strategy;
  Snapshot snapshot = growthCandidate();

  REQUIRE (qualifies (strategy, snapshot));
  // 0.30 * 20 + 0.25 * 20 + 0.20 * 50 + 0.15 * 30 + 0.10 * 80
  REQUIRE (to_double (score (strategy, snapshot)) == Approx (33.5));

  SECTION ("Weak 60 day momentum disqualifies")
    {
      snapshot.setValue ("momentum_60d", DecimalType(0.09));
      REQUIRE_FALSE (qualifies (strategy, snapshot));
    }

  SECTION ("Low volume ratio disqualifies")
    {
      snapshot.setValue ("volume_ratio", DecimalType(1.1));
      REQUIRE_FALSE (qualifies (strategy, snapshot));
    }

  SECTION ("Overbought RSI is penalised in the score")
    {
      snapshot.setValue ("rsi", DecimalType(85));
      REQUIRE_FALSE (qualifies (strategy, snapshot));
      // rsi sub-score 75 instead of 50
      REQUIRE (to_double (score (strategy, snapshot)) == Approx (33.5 + 0.20 * 25));
    }

  SECTION ("Factor weights are tunable")
    {
      strategy.factors = { { "price_position", FactorTransform<DecimalType>::linearClamp (DecimalType(100)),
			     DecimalType(2) } };
      REQUIRE (to_double (score (strategy, snapshot)) == Approx (80.0));
    }
}

TEST_CASE ("FactorTransform mappings", "[SelectionStrategy]")
{
  typedef FactorTransform<DecimalType> T;

  SECTION ("Linear transforms clamp to 0..100")
    {
      T momentum = T::linearClamp (DecimalType(200));
      REQUIRE (to_double (momentum.apply (DecimalType(0.1))) == Approx (20.0));
      REQUIRE (to_double (momentum.apply (DecimalType(0.8))) == Approx (100.0));
      REQUIRE (to_double (momentum.apply (DecimalType(-0.1))) == Approx (0.0));

      T volume = T::linearClamp (DecimalType(50), DecimalType(1));
      REQUIRE (to_double (volume.apply (DecimalType(1.6))) == Approx (30.0));
      REQUIRE (to_double (volume.apply (DecimalType(0.9))) == Approx (0.0));
    }

  SECTION ("Ramps rise between floor and ceiling and fall after")
    {
      T rsi = T::ramp (DecimalType(50), DecimalType(80), DecimalType(5));
      REQUIRE (to_double (rsi.apply (DecimalType(40))) == Approx (0.0));
      REQUIRE (to_double (rsi.apply (DecimalType(50))) == Approx (0.0));
      REQUIRE (to_double (rsi.apply (DecimalType(65))) == Approx (50.0));
      REQUIRE (to_double (rsi.apply (DecimalType(80))) == Approx (100.0));
      REQUIRE (to_double (rsi.apply (DecimalType(85))) == Approx (75.0));
      REQUIRE (to_double (rsi.apply (DecimalType(110))) == Approx (0.0));
      REQUIRE (rsi.getKind() == T::Ramp);
    }

  SECTION ("A ramp needs a ceiling above its floor")
    {
      REQUIRE_THROWS_AS (T::ramp (DecimalType(80), DecimalType(80)), StrategyException);
    }
}

TEST_CASE ("MultiFactorStrategy composite", "[SelectionStrategy]")
{
  typedef FactorTransform<DecimalType> T;
  MultiFactorStrategy<DecimalType> strategy;
  strategy.name = "Quality";
  strategy.factors = { { "momentum_20d", T::linearClamp (DecimalType(200)), DecimalType(3) },
		       { "price_position", T::linearClamp (DecimalType(100)), DecimalType(1) } };
  strategy.bounds = { { "volatility", std::nullopt, DecimalType(0.4) } };

  Snapshot snapshot = growthCandidate();

  REQUIRE (qualifies (strategy, snapshot));
  REQUIRE (to_double (score (strategy, snapshot)) == Approx ((3 * 20.0 + 1 * 80.0) / 4.0));

  SECTION ("Bounds are inclusive")
    {
      snapshot.setValue ("volatility", DecimalType(0.4));
      REQUIRE (qualifies (strategy, snapshot));
      snapshot.setValue ("volatility", DecimalType(0.41));
      REQUIRE_FALSE (qualifies (strategy, snapshot));
    }

  SECTION ("A missing factor input disqualifies")
    {
      snapshot.setValue ("momentum_20d", std::optional<DecimalType>());
      REQUIRE_FALSE (qualifies (strategy, snapshot));
    }

  SECTION ("Zero total weight scores zero")
    {
      for (auto& f : strategy.factors)
	f.weight = DecimalType(0);
      REQUIRE (to_double (score (strategy, snapshot)) == Approx (0.0));
    }

  SECTION ("No factors scores zero")
    {
      strategy.factors.clear();
      REQUIRE (to_double (score (strategy, snapshot)) == Approx (0.0));
    }

  SECTION ("describe lists factors and bounds")
    {
      std::string text = describe (strategy);
      REQUIRE (text.find ("Quality") != std::string::npos);
      REQUIRE (text.find ("momentum_20d") != std::string::npos);
      REQUIRE (text.find ("volatility <= 0.40") != std::string::npos);
    }
}

TEST_CASE ("UserDefinedStrategy", "[SelectionStrategy]")
{
  int calls = 0;
  UserDefinedStrategy<DecimalType> strategy ("Cheap",
					     { "price" },
					     [&calls](const Snapshot& s)
					     {
					       ++calls;
					       return *s.getValue ("price") < DecimalType(11);
					     },
					     [](const Snapshot& s)
					     {
					       return DecimalType(100) - *s.getValue ("price");
					     },
					     "prefers low prices");

  REQUIRE (qualifies (strategy, valueCandidate()));
  REQUIRE (to_double (score (strategy, valueCandidate())) == Approx (89.5));
  REQUIRE_FALSE (qualifies (strategy, growthCandidate()));

  SECTION ("Callables never see snapshots missing required indicators")
    {
      const int before = calls;
      REQUIRE_FALSE (qualifies (strategy, Snapshot (date (2021, Apr, 1))));
      REQUIRE (calls == before);
    }

  SECTION ("Construction checks")
    {
      REQUIRE_THROWS_AS (UserDefinedStrategy<DecimalType> ("", {}, [](const Snapshot&) { return true; },
							   [](const Snapshot&) { return DecimalType(0); }),
			 StrategyException);
      REQUIRE_THROWS_AS (UserDefinedStrategy<DecimalType> ("NoScore", {}, [](const Snapshot&) { return true; },
							   nullptr),
			 StrategyException);
    }

  SECTION ("describe includes the description")
    {
      REQUIRE (describe (strategy).find ("prefers low prices") != std::string::npos);
    }
}

TEST_CASE ("SelectionStrategy dispatch", "[SelectionStrategy]")
{
  SECTION ("Forwards to the held strategy")
    {
      SelectionStrategy<DecimalType> momentum ((MomentumStrategy<DecimalType>()));
      REQUIRE (momentum.getName() == "Momentum");
      REQUIRE (momentum.qualify (momentumCandidate()));
      REQUIRE (to_double (momentum.score (momentumCandidate())) == Approx (40.7423077));
      REQUIRE (to_double (momentum.getMinScore()) == Approx (0.0));
      REQUIRE (momentum.describe().find ("RSI between 20 and 75") != std::string::npos);
      REQUIRE (momentum.getRequiredIndicators().size() == 16);
      REQUIRE (std::holds_alternative<MomentumStrategy<DecimalType>> (momentum.getStrategy()));
    }

  SECTION ("Built-in strategies by name")
    {
      REQUIRE (createBuiltInStrategy<DecimalType> ("momentum").getName() == "Momentum");
      REQUIRE (createBuiltInStrategy<DecimalType> (" Value ").getName() == "Value");
      REQUIRE (createBuiltInStrategy<DecimalType> ("GROWTH").getName() == "Growth");
      REQUIRE_THROWS_AS (createBuiltInStrategy<DecimalType> ("contrarian"), StrategyException);
    }

  SECTION ("describe texts name the thresholds")
    {
      REQUIRE (createBuiltInStrategy<DecimalType> ("value").describe().find ("RSI <= 70") != std::string::npos);
      REQUIRE (createBuiltInStrategy<DecimalType> ("growth").describe().find ("volume ratio >= 1.20") != std::string::npos);
    }

  SECTION ("Minimum score is carried by the strategy")
    {
      ValueStrategy<DecimalType> value;
      value.minScore = DecimalType(70);
      SelectionStrategy<DecimalType> s (value);
      REQUIRE (to_double (s.getMinScore()) == Approx (70.0));
    }
}
