#include <catch2/catch_test_macros.hpp>
#include "TestUtils.h"
#include "BoostDateHelper.h"
#include "TimeFrameUtility.h"

using namespace rebalancer;
using namespace boost::gregorian;

TEST_CASE ("Period start helpers", "[BoostDateHelper]")
{
  SECTION ("first_of_month")
    {
      REQUIRE (first_of_month (date (2021, Feb, 17)) == date (2021, Feb, 1));
      REQUIRE (is_first_of_month (date (2021, Feb, 1)));
      REQUIRE_FALSE (is_first_of_month (date (2021, Feb, 2)));
    }

  SECTION ("first_of_quarter")
    {
      REQUIRE (first_of_quarter (date (2021, Jan, 31)) == date (2021, Jan, 1));
      REQUIRE (first_of_quarter (date (2021, May, 15)) == date (2021, Apr, 1));
      REQUIRE (first_of_quarter (date (2021, Sep, 30)) == date (2021, Jul, 1));
      REQUIRE (first_of_quarter (date (2021, Dec, 31)) == date (2021, Oct, 1));
      REQUIRE (is_first_of_quarter (date (2021, Jul, 1)));
      REQUIRE_FALSE (is_first_of_quarter (date (2021, Aug, 1)));
    }

  SECTION ("first_of_year")
    {
      REQUIRE (first_of_year (date (2022, Aug, 9)) == date (2022, Jan, 1));
      REQUIRE (is_first_of_year (date (2022, Jan, 1)));
      REQUIRE_FALSE (is_first_of_year (date (2022, Feb, 1)));
    }

  SECTION ("boost_next_month advances one month")
    {
      REQUIRE (boost_next_month (date (2021, Jan, 1)) == date (2021, Feb, 1));
      REQUIRE (boost_next_month (date (2021, Dec, 1)) == date (2022, Jan, 1));
    }

  SECTION ("Weekdays")
    {
      REQUIRE (isWeekend (date (2021, Jan, 2)));
      REQUIRE (isWeekday (date (2021, Jan, 4)));
    }
}

TEST_CASE ("Date strings", "[BoostDateHelper]")
{
  REQUIRE (parseDateString ("2021-01-04") == date (2021, Jan, 4));
  REQUIRE (parseDateString ("20210104") == date (2021, Jan, 4));
  REQUIRE (parseDateString (" 2021-01-04 ") == date (2021, Jan, 4));
  REQUIRE_THROWS_AS (parseDateString ("not a date"), std::domain_error);
  REQUIRE_THROWS_AS (parseDateString ("2021-02-30"), std::domain_error);
  REQUIRE (toDateString (date (2023, Oct, 1)) == "2023-10-01");
}

TEST_CASE ("Time frame strings", "[TimeFrameUtility]")
{
  REQUIRE (getTimeFrameFromString ("monthly") == TimeFrame::MONTHLY);
  REQUIRE (getTimeFrameFromString ("Q") == TimeFrame::QUARTERLY);
  REQUIRE (getTimeFrameFromString ("YEARLY") == TimeFrame::YEARLY);
  REQUIRE (getTimeFrameFromString ("d") == TimeFrame::DAILY);
  REQUIRE_THROWS_AS (getTimeFrameFromString ("fortnightly"), TimeFrameException);

  REQUIRE (timeFrameToString (TimeFrame::QUARTERLY) == "QUARTERLY");

  REQUIRE (isRebalanceFrequency (TimeFrame::MONTHLY));
  REQUIRE (isRebalanceFrequency (TimeFrame::QUARTERLY));
  REQUIRE (isRebalanceFrequency (TimeFrame::YEARLY));
  REQUIRE_FALSE (isRebalanceFrequency (TimeFrame::DAILY));
  REQUIRE_FALSE (isRebalanceFrequency (TimeFrame::WEEKLY));
}
