#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <memory>
#include <sstream>
#include <vector>
#include "ReportPeriodFilter.h"

using namespace stratval;
using boost::gregorian::date;
using boost::gregorian::days;
using boost::posix_time::ptime;

namespace
{
  std::shared_ptr<const BacktestReport> seriesReport()
  {
    std::vector<ReturnsSeriesEntry> entries;
    date d(2020, 12, 28);
    for (double v : {0.01, 0.02, 0.03, 0.04, 0.05, 0.06, 0.07})
      {
	entries.emplace_back(d, v);
	d += days(1);
      }
    return std::make_shared<SeriesBacktestReport>("series",
						  ReturnsSeries(TimeFrame::DAILY, std::move(entries)));
  }

  std::shared_ptr<const BacktestReport> curveReport()
  {
    std::vector<ptime> marks;
    std::vector<double> equity;
    double e = 100.0;
    date d(2020, 12, 28);
    for (int i = 0; i < 7; ++i)
      {
	marks.push_back(ptime(d));
	equity.push_back(e);
	e *= 1.01;
	d += days(1);
      }
    return std::make_shared<EquityCurveBacktestReport>("curve", TimeFrame::DAILY, marks, equity);
  }

  std::shared_ptr<const BacktestReport> opaqueReport()
  {
    return std::make_shared<SummaryBacktestReport>("opaque", TimeFrame::DAILY,
						   std::vector<double>{0.01, 0.02, 0.03});
  }

  const DateRange newYear(date(2021, 1, 1), date(2021, 1, 2));
}

TEST_CASE("ReportPeriodFilter resolves capabilities", "[ReportPeriodFilter]") {
    REQUIRE(ReportPeriodFilter::resolveCapability(*curveReport()) == FilterMethod::SelfFiltered);
    REQUIRE(ReportPeriodFilter::resolveCapability(*seriesReport()) == FilterMethod::SeriesSliced);
    REQUIRE(ReportPeriodFilter::resolveCapability(*opaqueReport()) == FilterMethod::Unsupported);
    REQUIRE(std::string(filterMethodToString(FilterMethod::Unsupported)) == "Unsupported");
}

TEST_CASE("ReportPeriodFilter slices date-indexed reports", "[ReportPeriodFilter]") {
    std::ostringstream log;
    ReportPeriodFilter filter(true);

    auto result = filter.restrict(seriesReport(), newYear, log);

    REQUIRE(result.filtered);
    REQUIRE(result.method == FilterMethod::SeriesSliced);
    REQUIRE_FALSE(result.warning.has_value());
    REQUIRE(result.report->getReturnValues() == std::vector<double>{0.05, 0.06});
    REQUIRE(result.report->getStrategyId() == "series");
    REQUIRE(log.str().empty());
}

TEST_CASE("ReportPeriodFilter delegates to self-filtering reports", "[ReportPeriodFilter]") {
    std::ostringstream log;
    ReportPeriodFilter filter(true);

    auto result = filter.restrict(curveReport(), newYear, log);

    REQUIRE(result.filtered);
    REQUIRE(result.method == FilterMethod::SelfFiltered);
    auto returns = result.report->getReturnValues();
    REQUIRE(returns.size() == 2);
    REQUIRE(returns[0] == Catch::Approx(0.01));
}

TEST_CASE("ReportPeriodFilter never silently leaks unfiltered data", "[ReportPeriodFilter]") {
    auto report = opaqueReport();

    SECTION("Strict mode raises") {
        std::ostringstream log;
        ReportPeriodFilter strict(true);
        REQUIRE(strict.isStrict());
        REQUIRE_THROWS_AS(strict.restrict(report, newYear, log), UnsupportedFilteringException);
    }

    SECTION("Default mode returns the unfiltered report and a warning") {
        std::ostringstream log;
        ReportPeriodFilter lenient;
        REQUIRE_FALSE(lenient.isStrict());

        auto result = lenient.restrict(report, newYear, log);

        REQUIRE_FALSE(result.filtered);
        REQUIRE(result.method == FilterMethod::Unsupported);
        REQUIRE(result.report == report);
        REQUIRE(result.warning.has_value());
        REQUIRE(result.warning->find("UnsupportedFilteringWarning") != std::string::npos);
        REQUIRE(log.str().find("UnsupportedFilteringWarning") != std::string::npos);
    }

    SECTION("Null report is rejected") {
        std::ostringstream log;
        ReportPeriodFilter lenient;
        REQUIRE_THROWS_AS(lenient.restrict(nullptr, newYear, log), std::invalid_argument);
    }
}
