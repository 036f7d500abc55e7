#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <vector>
#include "TestUtils.h"
#include "StatUtils.h"

using namespace rebalancer;
using Catch::Approx;
using num::to_double;

using Stat = StatUtils<DecimalType>;

TEST_CASE("StatUtils sample moments", "[StatUtils]")
{
  const std::vector<DecimalType> data = createDecimalVector({0.02, -0.01, 0.03, 0.00});

  SECTION("Mean")
    {
      REQUIRE(Stat::computeMean(data) == createDecimal("0.01"));
      REQUIRE(Stat::computeMean({}) == DecimalType(0));
    }

  SECTION("Sample variance uses n - 1")
    {
      // deviations 0.01, -0.02, 0.02, -0.01
      REQUIRE(to_double(Stat::computeVariance(data, createDecimal("0.01"))) == Approx(0.001 / 3.0).margin(1e-7));
      REQUIRE(to_double(Stat::computeStdDev(data, createDecimal("0.01"))) == Approx(std::sqrt(0.001 / 3.0)));
    }

  SECTION("Fewer than two points have no variance")
    {
      const std::vector<DecimalType> single = createDecimalVector({0.05});
      REQUIRE(Stat::computeVariance(single, createDecimal("0.05")) == DecimalType(0));
      auto [mean, sd] = Stat::computeMeanAndStdDev(single);
      REQUIRE(mean == createDecimal("0.05"));
      REQUIRE(sd == DecimalType(0));
    }
}

TEST_CASE("StatUtils scaledMeanToStdDev", "[StatUtils]")
{
  const std::vector<DecimalType> data = createDecimalVector({0.02, -0.01, 0.03, 0.00});
  const double sd = std::sqrt(0.001 / 3.0);

  SECTION("Scaled by the square root of the sample size")
    {
      REQUIRE(to_double(Stat::scaledMeanToStdDev(data)) == Approx(0.01 / sd * 2.0));
    }

  SECTION("Hurdle is subtracted from every observation")
    {
      REQUIRE(to_double(Stat::scaledMeanToStdDev(data, createDecimal("0.0075"))) == Approx(0.0025 / sd * 2.0));
    }

  SECTION("Degenerate inputs give zero")
    {
      REQUIRE(Stat::scaledMeanToStdDev(createDecimalVector({0.01})) == DecimalType(0));
      REQUIRE(Stat::scaledMeanToStdDev(createDecimalVector({0.01, 0.01, 0.01})) == DecimalType(0));
      REQUIRE(Stat::scaledMeanToStdDev({}) == DecimalType(0));
    }
}

TEST_CASE("StatUtils keeps precision for small daily returns", "[StatUtils]")
{
  // Squared deviations of 1e-4 are far below the decimal resolution.
  const std::vector<DecimalType> data = createDecimalVector({0.0001, -0.0001, 0.0001, -0.0001});
  const double expected = std::sqrt(4 * 1e-8 / 3.0);

  REQUIRE(to_double(Stat::computeStdDev(data, Stat::computeMean(data))) == Approx(expected).epsilon(1e-3));
}
