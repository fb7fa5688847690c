#include <catch2/catch_test_macros.hpp>
#include "DateRange.h"
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

using namespace stratval;
using boost::gregorian::date;
using boost::posix_time::ptime;
using boost::posix_time::hours;

TEST_CASE("DateRange: valid construction and getters", "[DateRange]") {
    date d1(2020, 1, 1);
    date d2(2020, 12, 31);
    DateRange range(d1, d2);
    REQUIRE(range.getFirstDate() == d1);
    REQUIRE(range.getLastDate() == d2);
}

TEST_CASE("DateRange: invalid construction throws", "[DateRange]") {
    date d1(2020, 12, 31);
    date d2(2020, 1, 1);
    REQUIRE_THROWS_AS(DateRange(d1, d2), DateRangeException);
    REQUIRE_THROWS_AS(DateRange(ptime(), ptime(d1)), DateRangeException);
}

TEST_CASE("DateRange: copy and assignment", "[DateRange]") {
    date d1(2019, 5, 5);
    date d2(2019, 6, 6);
    DateRange original(d1, d2);
    DateRange copyConstructed(original);
    REQUIRE(copyConstructed == original);

    DateRange assigned = DateRange(d1, d1);
    REQUIRE(assigned != original);
    assigned = original;
    REQUIRE(assigned == original);
}

TEST_CASE("DateRange: contains covers both end days", "[DateRange]") {
    DateRange range(date(2021, 1, 1), date(2022, 12, 31));

    REQUIRE(range.contains(date(2021, 1, 1)));
    REQUIRE(range.contains(date(2022, 12, 31)));
    REQUIRE_FALSE(range.contains(date(2020, 12, 31)));
    REQUIRE_FALSE(range.contains(date(2023, 1, 1)));

    // intraday stamp late on the last day is still inside
    REQUIRE(range.contains(ptime(date(2022, 12, 31), hours(16))));
    REQUIRE_FALSE(range.contains(ptime(date(2023, 1, 1), hours(0))));
}

TEST_CASE("DateRange: overlap detection", "[DateRange]") {
    DateRange train(date(2018, 1, 1), date(2020, 12, 31));
    DateRange validation(date(2021, 1, 1), date(2022, 12, 31));
    DateRange straddle(date(2020, 6, 1), date(2021, 6, 1));

    REQUIRE_FALSE(train.overlaps(validation));
    REQUIRE_FALSE(validation.overlaps(train));
    REQUIRE(train.overlaps(straddle));
    REQUIRE(straddle.overlaps(validation));
    REQUIRE(train.overlaps(train));
}

TEST_CASE("DateRange: toString uses ISO dates", "[DateRange]") {
    DateRange range(date(2023, 1, 1), date(2024, 12, 31));
    REQUIRE(range.toString() == "2023-01-01..2024-12-31");
}
