#include <catch2/catch_test_macros.hpp>
#include "TestUtils.h"
#include "PriceBar.h"

using namespace rebalancer;
using namespace boost::gregorian;

TEST_CASE ("PriceBar operations", "[PriceBar]")
{
  auto entry0 = createPriceBar ("20210104", "10.00", "10.50", "9.80", "10.20", "1200000");
  auto entry1 = createPriceBar ("20210105", "10.20", "10.40", "10.00", "10.30", "900000");

  SECTION ("Getters return the constructed values")
    {
      REQUIRE (entry0->getDate() == date (2021, Jan, 4));
      REQUIRE (entry0->getOpenValue() == createDecimal ("10.00"));
      REQUIRE (entry0->getHighValue() == createDecimal ("10.50"));
      REQUIRE (entry0->getLowValue() == createDecimal ("9.80"));
      REQUIRE (entry0->getCloseValue() == createDecimal ("10.20"));
      REQUIRE (entry0->getVolumeValue() == createDecimal ("1200000"));
    }

  SECTION ("Equality")
    {
      auto sameAsEntry0 = createPriceBar ("2021-01-04", "10.00", "10.50", "9.80", "10.20", "1200000");
      REQUIRE (*entry0 == *sameAsEntry0);
      REQUIRE (*entry0 != *entry1);

      EntryType copied (*entry1);
      REQUIRE (copied == *entry1);
    }

  SECTION ("Inconsistent bars are rejected")
    {
      // high below open
      REQUIRE_THROWS_AS (createPriceBar ("20210104", "10.60", "10.50", "9.80", "10.20", "100"), PriceBarException);
      // high below close
      REQUIRE_THROWS_AS (createPriceBar ("20210104", "10.00", "10.50", "9.80", "10.70", "100"), PriceBarException);
      // low above open
      REQUIRE_THROWS_AS (createPriceBar ("20210104", "9.70", "10.50", "9.80", "10.20", "100"), PriceBarException);
      // low above close
      REQUIRE_THROWS_AS (createPriceBar ("20210104", "10.00", "10.50", "9.80", "9.75", "100"), PriceBarException);
      // negative volume
      REQUIRE_THROWS_AS (createPriceBar ("20210104", "10.00", "10.50", "9.80", "10.20", "-1"), PriceBarException);
    }
}
