#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "ReturnsSeries.h"
#include <boost/date_time/gregorian/gregorian.hpp>
#include <limits>
#include <vector>

using namespace stratval;
using boost::gregorian::date;
using boost::gregorian::days;

namespace
{
  ReturnsSeries makeDailySeries(date start, const std::vector<double>& values)
  {
    std::vector<ReturnsSeriesEntry> entries;
    date d = start;
    for (double v : values)
      {
	entries.emplace_back(d, v);
	d += days(1);
      }
    return ReturnsSeries(TimeFrame::DAILY, std::move(entries));
  }
}

TEST_CASE("ReturnsSeries: construction and accessors", "[ReturnsSeries]") {
    ReturnsSeries series = makeDailySeries(date(2021, 1, 1), {0.01, -0.02, 0.03});

    REQUIRE(series.size() == 3);
    REQUIRE_FALSE(series.empty());
    REQUIRE(series.getTimeFrame() == TimeFrame::DAILY);
    REQUIRE(series.getReturn(1) == Catch::Approx(-0.02));
    REQUIRE(series.getDate(2) == date(2021, 1, 3));
    REQUIRE(series.getFirstDate() == date(2021, 1, 1));
    REQUIRE(series.getLastDate() == date(2021, 1, 3));
    REQUIRE(series.getReturnValues().size() == 3);
    REQUIRE_THROWS_AS(series.getReturn(3), ReturnsSeriesException);
}

TEST_CASE("ReturnsSeries: rejects duplicate and decreasing timestamps", "[ReturnsSeries]") {
    std::vector<ReturnsSeriesEntry> duplicate = {
      ReturnsSeriesEntry(date(2021, 1, 1), 0.01),
      ReturnsSeriesEntry(date(2021, 1, 1), 0.02)
    };
    REQUIRE_THROWS_AS(ReturnsSeries(TimeFrame::DAILY, duplicate), ReturnsSeriesException);

    std::vector<ReturnsSeriesEntry> decreasing = {
      ReturnsSeriesEntry(date(2021, 1, 2), 0.01),
      ReturnsSeriesEntry(date(2021, 1, 1), 0.02)
    };
    REQUIRE_THROWS_AS(ReturnsSeries(TimeFrame::DAILY, decreasing), ReturnsSeriesException);
}

TEST_CASE("ReturnsSeries: rejects non-finite returns", "[ReturnsSeries]") {
    std::vector<ReturnsSeriesEntry> entries = {
      ReturnsSeriesEntry(date(2021, 1, 1), 0.01),
      ReturnsSeriesEntry(date(2021, 1, 2), std::numeric_limits<double>::quiet_NaN())
    };
    REQUIRE_THROWS_AS(ReturnsSeries(TimeFrame::DAILY, entries), ReturnsSeriesException);
}

TEST_CASE("ReturnsSeries: half-open index slice", "[ReturnsSeries]") {
    ReturnsSeries series = makeDailySeries(date(2021, 1, 1), {0.1, 0.2, 0.3, 0.4, 0.5});

    ReturnsSeries middle = series.slice(1, 4);
    REQUIRE(middle.size() == 3);
    REQUIRE(middle.getReturn(0) == Catch::Approx(0.2));
    REQUIRE(middle.getReturn(2) == Catch::Approx(0.4));
    REQUIRE(middle.getFirstDate() == date(2021, 1, 2));

    REQUIRE(series.slice(2, 2).empty());
    REQUIRE_THROWS_AS(series.slice(3, 2), ReturnsSeriesException);
    REQUIRE_THROWS_AS(series.slice(0, 6), ReturnsSeriesException);

    // source is untouched
    REQUIRE(series.size() == 5);
}

TEST_CASE("ReturnsSeries: filterDates keeps the closed calendar range", "[ReturnsSeries]") {
    ReturnsSeries series = makeDailySeries(date(2020, 12, 30), {0.1, 0.2, 0.3, 0.4, 0.5});

    ReturnsSeries filtered = series.filterDates(DateRange(date(2020, 12, 31), date(2021, 1, 2)));
    REQUIRE(filtered.size() == 3);
    REQUIRE(filtered.getFirstDate() == date(2020, 12, 31));
    REQUIRE(filtered.getLastDate() == date(2021, 1, 2));

    ReturnsSeries none = series.filterDates(DateRange(date(2022, 1, 1), date(2022, 2, 1)));
    REQUIRE(none.empty());
    REQUIRE_THROWS_AS(none.getFirstDate(), ReturnsSeriesException);
}
