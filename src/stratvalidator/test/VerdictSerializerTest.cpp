#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <boost/filesystem.hpp>
#include <fstream>
#include <limits>
#include <sstream>
#include <rapidjson/document.h>
#include "reporting/ValidationSummary.h"
#include "reporting/VerdictSerializer.h"

using namespace stratvalidator::validation;
using namespace stratvalidator::reporting;

namespace
{
  StrategyValidationResult passingResult()
  {
    std::vector<ValidationVerdict> verdicts = {
      ValidationVerdict("DataSplitValidator", true, 1.8, 1.0, ThresholdComparison::GreaterOrEqual, 1500,
			"validation Sharpe 1.8"),
      ValidationVerdict("BootstrapValidator", true, 0.9, 0.5, ThresholdComparison::GreaterThan, 1500,
			"CI lower 0.9", { ValidationWarning::DegradedBootstrap })
    };
    return StrategyValidationResult("momentum-20", { { "lookback", "20" } }, std::move(verdicts), std::nullopt);
  }

  StrategyValidationResult fatalResult()
  {
    std::vector<ValidationVerdict> verdicts = {
      ValidationVerdict("DataSplitValidator", false, std::numeric_limits<double>::quiet_NaN(),
			std::numeric_limits<double>::quiet_NaN(), ThresholdComparison::GreaterOrEqual, 100,
			"fatal: not enough data")
    };
    return StrategyValidationResult("short", {}, std::move(verdicts), std::string("not enough data"));
  }

  StrategyValidationResult failedResult()
  {
    std::vector<ValidationVerdict> verdicts = {
      ValidationVerdict("DataSplitValidator", true, 1.2, 1.0, ThresholdComparison::GreaterOrEqual, 1500, "ok"),
      ValidationVerdict("WalkForwardAnalyzer", false, 0.2, 0.5, ThresholdComparison::GreaterThan, 1500,
			"mean test Sharpe 0.2")
    };
    return StrategyValidationResult("meanrev", {}, std::move(verdicts), std::nullopt);
  }
}

TEST_CASE("VerdictSerializer: verdict record fields", "[VerdictSerializer]")
{
  auto result = passingResult();
  auto json = VerdictSerializer::verdictToJson(result.getStrategyId(), result.getVerdicts()[1]);

  rapidjson::Document doc;
  doc.Parse(json.c_str());
  REQUIRE_FALSE(doc.HasParseError());
  REQUIRE(doc.IsObject());

  REQUIRE(std::string(doc["strategy_id"].GetString()) == "momentum-20");
  REQUIRE(std::string(doc["validator_name"].GetString()) == "BootstrapValidator");
  REQUIRE(doc["passed"].GetBool());
  REQUIRE(doc["statistic_value"].GetDouble() == Catch::Approx(0.9));
  REQUIRE(doc["threshold_value"].GetDouble() == Catch::Approx(0.5));
  REQUIRE(doc["n_periods"].GetUint64() == 1500);
  REQUIRE(std::string(doc["diagnostic_message"].GetString()) == "CI lower 0.9");
  REQUIRE(std::string(doc["comparison"].GetString()) == "statistic > threshold");
  REQUIRE(doc["warnings"].Size() == 1);
  REQUIRE(std::string(doc["warnings"][0].GetString()) == "DegradedBootstrapWarning");

  REQUIRE_FALSE(doc.HasMember("p_value"));
  REQUIRE(json.find("p_value") == std::string::npos);
}

TEST_CASE("VerdictSerializer: non-finite statistics become null", "[VerdictSerializer]")
{
  auto result = fatalResult();
  auto json = VerdictSerializer::resultToJson(result);

  rapidjson::Document doc;
  doc.Parse(json.c_str());
  REQUIRE_FALSE(doc.HasParseError());

  REQUIRE_FALSE(doc["overall_passed"].GetBool());
  REQUIRE(std::string(doc["fatal_error"].GetString()) == "not enough data");
  REQUIRE(doc["verdicts"].Size() == 1);
  REQUIRE(doc["verdicts"][0]["statistic_value"].IsNull());
  REQUIRE(doc["verdicts"][0]["threshold_value"].IsNull());
}

TEST_CASE("VerdictSerializer: strategy record fields", "[VerdictSerializer]")
{
  auto json = VerdictSerializer::resultToJson(passingResult());

  rapidjson::Document doc;
  doc.Parse(json.c_str());
  REQUIRE_FALSE(doc.HasParseError());

  REQUIRE(std::string(doc["strategy_id"].GetString()) == "momentum-20");
  REQUIRE(doc["overall_passed"].GetBool());
  REQUIRE(doc["fatal_error"].IsNull());
  REQUIRE(std::string(doc["parameters"]["lookback"].GetString()) == "20");
  REQUIRE(doc["checks_run"].Size() == 2);
  REQUIRE(std::string(doc["checks_run"][0].GetString()) == "DataSplitValidator");
  REQUIRE(std::string(doc["checks_run"][1].GetString()) == "BootstrapValidator");
  REQUIRE(doc["verdicts"].Size() == 2);
  REQUIRE(std::string(doc["verdicts"][1]["strategy_id"].GetString()) == "momentum-20");
}

TEST_CASE("ValidationSummary: counts per strategy and per validator", "[ValidationSummary]")
{
  ValidationSummary empty;
  REQUIRE(empty.getTotalCount() == 0);
  REQUIRE(empty.getPassRate() == 0.0);

  ValidationSummary summary({ passingResult(), fatalResult(), failedResult() });

  REQUIRE(summary.getTotalCount() == 3);
  REQUIRE(summary.getPassedCount() == 1);
  REQUIRE(summary.getFailedCount() == 2);
  REQUIRE(summary.getFatalCount() == 1);
  REQUIRE(summary.getPassRate() == Catch::Approx(1.0 / 3.0));

  const auto& tallies = summary.getValidatorTallies();
  REQUIRE(tallies.at("DataSplitValidator").passed == 2);
  REQUIRE(tallies.at("DataSplitValidator").failed == 1);
  REQUIRE(tallies.at("WalkForwardAnalyzer").failed == 1);
  REQUIRE(tallies.at("BootstrapValidator").passed == 1);
  REQUIRE(tallies.find("MultipleComparisonCorrector") == tallies.end());

  REQUIRE(summary.getFailedStrategies() == std::vector<std::string>{ "short", "meanrev" });

  std::ostringstream os;
  summary.print(os);
  REQUIRE(os.str().find("=== Validation Summary ===") != std::string::npos);
  REQUIRE(os.str().find("Pass rate: 33.3%") != std::string::npos);
  REQUIRE(os.str().find("✗ meanrev") != std::string::npos);
}

TEST_CASE("VerdictSerializer: batch document written to a file", "[VerdictSerializer]")
{
  std::vector<StrategyValidationResult> results = { passingResult(), failedResult() };
  ValidationSummary summary(results);

  auto path = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("verdicts-%%%%-%%%%.json");
  REQUIRE(VerdictSerializer::saveToFile(results, summary, path.string()));

  std::ifstream in(path.string());
  std::stringstream buffer;
  buffer << in.rdbuf();

  rapidjson::Document doc;
  doc.Parse(buffer.str().c_str());
  REQUIRE_FALSE(doc.HasParseError());

  REQUIRE(doc["summary"]["total"].GetUint64() == 2);
  REQUIRE(doc["summary"]["passed"].GetUint64() == 1);
  REQUIRE(doc["summary"]["fatal"].GetUint64() == 0);
  REQUIRE(doc["summary"]["pass_rate"].GetDouble() == Catch::Approx(0.5));
  REQUIRE(doc["summary"]["validators"]["WalkForwardAnalyzer"]["failed"].GetUint64() == 1);
  REQUIRE(doc["summary"]["failed_strategies"].Size() == 1);
  REQUIRE(std::string(doc["summary"]["failed_strategies"][0].GetString()) == "meanrev");

  REQUIRE(doc["strategies"].Size() == 2);
  REQUIRE(std::string(doc["strategies"][1]["strategy_id"].GetString()) == "meanrev");
  REQUIRE(buffer.str().find("p_value") == std::string::npos);

  boost::filesystem::remove(path);

  REQUIRE_FALSE(VerdictSerializer::saveToFile(results, summary, "/nonexistent-dir/out.json"));
}
