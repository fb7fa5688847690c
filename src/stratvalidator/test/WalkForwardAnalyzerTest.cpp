#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include "TimeSeriesException.h"
#include "ValidationTestHelpers.h"
#include "validation/WalkForwardAnalyzer.h"

using namespace stratvalidator;
using namespace stratvalidator::validation;
using namespace stratvalidator::testhelpers;

namespace
{
  // Consecutive blocks of blockLength returns, each with exactly the given Sharpe ratio
  std::vector<double> blockReturns(const std::vector<double>& blockSharpes, std::size_t blockLength,
				   uint64_t seed)
  {
    std::vector<double> returns;
    for (std::size_t b = 0; b < blockSharpes.size(); ++b)
      {
	auto block = returnsWithSharpe(blockLength, blockSharpes[b], 0.01, seed + b);
	returns.insert(returns.end(), block.begin(), block.end());
      }
    return returns;
  }
}

TEST_CASE("WalkForwardAnalyzer: 945 periods hold exactly three 252/63 windows", "[WalkForwardAnalyzer]")
{
  auto bounds = WalkForwardAnalyzer::computeWindowBounds(945, 252, 63);

  REQUIRE(bounds.size() == 3);
  REQUIRE(bounds[0].trainBegin == 0);
  REQUIRE(bounds[0].testBegin == 252);
  REQUIRE(bounds[0].testEnd == 315);
  REQUIRE(bounds[1].trainBegin == 315);
  REQUIRE(bounds[2].trainBegin == 630);
  REQUIRE(bounds[2].testEnd == 945);
}

TEST_CASE("WalkForwardAnalyzer: no test slice ever overlaps a training slice", "[WalkForwardAnalyzer]")
{
  for (std::size_t n : { 315u, 700u, 945u, 2000u, 5000u })
    {
      auto bounds = WalkForwardAnalyzer::computeWindowBounds(n, 252, 63);

      for (std::size_t i = 0; i < bounds.size(); ++i)
	{
	  REQUIRE(bounds[i].trainEnd == bounds[i].testBegin);
	  REQUIRE(bounds[i].testEnd - bounds[i].testBegin == 63);
	  REQUIRE(bounds[i].testEnd <= n);

	  if (i > 0)
	    REQUIRE(bounds[i].trainBegin == bounds[i - 1].testEnd);

	  for (std::size_t j = 0; j < bounds.size(); ++j)
	    {
	      const bool disjoint = bounds[i].testEnd <= bounds[j].trainBegin ||
		bounds[j].trainEnd <= bounds[i].testBegin;
	      REQUIRE(disjoint);
	    }
	}
    }
}

TEST_CASE("WalkForwardAnalyzer: a short remainder is dropped, not evaluated", "[WalkForwardAnalyzer]")
{
  auto bounds = WalkForwardAnalyzer::computeWindowBounds(944, 252, 63);
  REQUIRE(bounds.size() == 2);
  REQUIRE(bounds.back().testEnd == 630);

  REQUIRE(WalkForwardAnalyzer::computeWindowBounds(314, 252, 63).empty());
  REQUIRE_THROWS_AS(WalkForwardAnalyzer::computeWindowBounds(100, 0, 63), std::invalid_argument);
}

TEST_CASE("WalkForwardAnalyzer: insufficient history is fatal", "[WalkForwardAnalyzer]")
{
  WalkForwardAnalyzer analyzer(WalkForwardParameters(), CalibrationConstants());
  auto returns = returnsWithSharpe(300, 1.0, 0.01, 5u);
  auto report = makeReport("short", tradingDays(date(2020, 1, 1), returns.size()), returns);

  std::ostringstream os;
  REQUIRE_THROWS_AS(analyzer.analyze(*report, os), stratval::InsufficientDataException);
}

TEST_CASE("WalkForwardAnalyzer: stable out-of-sample Sharpe passes", "[WalkForwardAnalyzer]")
{
  // 15 blocks of 63: every test slice is one block with Sharpe 2.0
  std::vector<double> sharpes(15, 2.0);
  auto returns = blockReturns(sharpes, 63, 100u);
  auto dates = tradingDays(date(2019, 1, 1), returns.size());
  auto report = makeReport("stable", dates, returns);

  WalkForwardAnalyzer analyzer(WalkForwardParameters(), CalibrationConstants());
  std::ostringstream os;
  auto result = analyzer.analyze(*report, os);

  REQUIRE(result.windows.size() == 3);
  REQUIRE(result.meanTestSharpe == Catch::Approx(2.0).epsilon(1e-9));
  REQUIRE(result.medianTestSharpe == Catch::Approx(2.0).epsilon(1e-9));
  REQUIRE(result.stdTestSharpe == Catch::Approx(0.0).margin(1e-9));
  REQUIRE(result.windowWinRate == Catch::Approx(1.0));
  REQUIRE(result.verdict.passed());
  REQUIRE(result.verdict.getValidatorName() == WalkForwardAnalyzer::ValidatorName);
  REQUIRE(result.verdict.getStatistic() == Catch::Approx(result.meanTestSharpe));
  REQUIRE(result.verdict.getThreshold() == Catch::Approx(0.5));
  REQUIRE(result.verdict.getNumPeriods() == returns.size());

  // Window dates come from the date index
  REQUIRE(result.windows[0].testDates.has_value());
  REQUIRE(result.windows[0].testDates->getFirstDate() == dates[252]);
  REQUIRE(result.windows[1].trainDates->getFirstDate() == dates[315]);
  REQUIRE(os.str().find("[WalkForward]") != std::string::npos);
}

TEST_CASE("WalkForwardAnalyzer: each criterion can fail on its own", "[WalkForwardAnalyzer]")
{
  WalkForwardAnalyzer analyzer(WalkForwardParameters(), CalibrationConstants());
  std::ostringstream os;

  SECTION("one losing window out of three")
    {
      // Test blocks are 4, 9 and 14
      std::vector<double> sharpes(15, 2.0);
      sharpes[9] = -1.0;
      auto result = analyzer.analyze(makeSeries(tradingDays(date(2019, 1, 1), 945),
						blockReturns(sharpes, 63, 7u)), os);

      REQUIRE(result.worstTestSharpe == Catch::Approx(-1.0).epsilon(1e-9));
      REQUIRE(result.windowWinRate == Catch::Approx(2.0 / 3.0));
      REQUIRE_FALSE(result.verdict.passed());
      REQUIRE(result.verdict.getDiagnostic().find("worst test Sharpe") != std::string::npos);
    }

  SECTION("unstable window Sharpe")
    {
      std::vector<double> sharpes(15, 1.0);
      sharpes[4] = 0.2;
      sharpes[9] = 3.0;
      sharpes[14] = 0.4;
      auto result = analyzer.analyze(makeSeries(tradingDays(date(2019, 1, 1), 945),
						blockReturns(sharpes, 63, 9u)), os);

      REQUIRE(result.stdTestSharpe > 1.0);
      REQUIRE_FALSE(result.verdict.passed());
      REQUIRE(result.verdict.getDiagnostic().find("std") != std::string::npos);
    }

  SECTION("too few windows")
    {
      std::vector<double> sharpes(10, 2.0);
      auto result = analyzer.analyze(makeSeries(tradingDays(date(2019, 1, 1), 630),
						blockReturns(sharpes, 63, 11u)), os);

      REQUIRE(result.windows.size() == 2);
      REQUIRE(result.meanTestSharpe > 0.5);
      REQUIRE_FALSE(result.verdict.passed());
      REQUIRE(result.verdict.getDiagnostic().find("complete windows") != std::string::npos);
    }
}

TEST_CASE("WalkForwardAnalyzer: an opaque report is analyzed by index", "[WalkForwardAnalyzer]")
{
  std::vector<double> sharpes(15, 2.0);
  stratval::SummaryBacktestReport report("opaque", stratval::TimeFrame::DAILY, blockReturns(sharpes, 63, 3u));

  WalkForwardAnalyzer analyzer(WalkForwardParameters(), CalibrationConstants());
  std::ostringstream os;
  auto result = analyzer.analyze(report, os);

  REQUIRE(result.windows.size() == 3);
  REQUIRE_FALSE(result.windows[0].trainDates.has_value());
  REQUIRE_FALSE(result.windows[0].testDates.has_value());
  REQUIRE(result.verdict.passed());
}
