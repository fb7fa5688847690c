#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <boost/filesystem.hpp>
#include <fstream>
#include "ValidationConfiguration.h"

using namespace stratvalidator;
using boost::gregorian::date;

namespace
{
  boost::filesystem::path writeConfig(const std::string& contents,
				      const boost::filesystem::path& dir = boost::filesystem::temp_directory_path())
  {
    auto path = dir / boost::filesystem::unique_path("validation-config-%%%%-%%%%.csv");
    std::ofstream out(path.string());
    out << contents;
    return path;
  }
}

TEST_CASE("ValidationConfiguration defaults", "[ValidationConfiguration]")
{
  ValidationConfiguration config;

  REQUIRE(config.getCalibration().annualizationFactor == 252.0);
  REQUIRE(config.getCalibration().marketVolatility == Catch::Approx(0.22));
  REQUIRE(config.getCalibration().blockSize == 21);
  REQUIRE(config.getCalibration().timeFrame == TimeFrame::DAILY);

  REQUIRE(config.getWalkForwardParameters().trainingWindow == 252);
  REQUIRE(config.getWalkForwardParameters().testingWindow == 63);
  REQUIRE(config.getWalkForwardParameters().minWindows == 3);

  REQUIRE(config.getBootstrapParameters().iterations == 1000);
  REQUIRE(config.getBootstrapParameters().confidenceLevel == Catch::Approx(0.95));
  REQUIRE_FALSE(config.getBootstrapParameters().seed.has_value());

  REQUIRE(config.getMultipleComparisonParameters().alpha == Catch::Approx(0.05));
  REQUIRE(config.getMultipleComparisonParameters().conservativeFloor == Catch::Approx(0.5));

  const auto& split = config.getDataSplitParameters();
  REQUIRE(split.trainPeriod.getFirstDate() == date(2018, 1, 1));
  REQUIRE(split.validationPeriod.getFirstDate() == date(2021, 1, 1));
  REQUIRE(split.testPeriod.getLastDate() == date(2024, 12, 31));
  REQUIRE(split.minValidationSharpe == Catch::Approx(1.0));
  REQUIRE_FALSE(split.strict);

  REQUIRE(config.getBaselineParameters().minImprovement == Catch::Approx(0.5));
  REQUIRE(config.getBaselineParameters().topN == 50);
  REQUIRE(config.getBaselineParameters().universeFile.empty());

  REQUIRE(config.getNumThreads() == 0);
  REQUIRE(config.getOutputFile() == "validation_results.json");
}

TEST_CASE("ValidationConfiguration rejects out of range parameters", "[ValidationConfiguration]")
{
  BootstrapParameters badConfidence;
  badConfidence.confidenceLevel = 0.4;
  REQUIRE_THROWS_AS(ValidationConfiguration(CalibrationConstants(), WalkForwardParameters(), badConfidence,
					    MultipleComparisonParameters(), DataSplitParameters(),
					    BaselineParameters(), 1, "out.json"),
		    ValidationConfigurationException);

  DataSplitParameters overlapping;
  overlapping.validationPeriod = DateRange(date(2020, 6, 1), date(2022, 12, 31));
  REQUIRE_THROWS_AS(ValidationConfiguration(CalibrationConstants(), WalkForwardParameters(),
					    BootstrapParameters(), MultipleComparisonParameters(),
					    overlapping, BaselineParameters(), 1, "out.json"),
		    ValidationConfigurationException);

  MultipleComparisonParameters badAlpha;
  badAlpha.alpha = 1.5;
  REQUIRE_THROWS_AS(ValidationConfiguration(CalibrationConstants(), WalkForwardParameters(),
					    BootstrapParameters(), badAlpha, DataSplitParameters(),
					    BaselineParameters(), 1, "out.json"),
		    ValidationConfigurationException);
}

TEST_CASE("ValidationConfigurationFileReader reads key,value rows", "[ValidationConfiguration]")
{
  auto path = writeConfig("Key,Value\n"
			  "# calibration\n"
			  "TimeFrame,Weekly\n"
			  "MarketVolatility,0.18\n"
			  "BlockSize,10\n"
			  "TrainingWindow,104\n"
			  "TestingWindow,26\n"
			  "BootstrapIterations,500\n"
			  "RandomSeed,12345\n"
			  "Alpha,0.10\n"
			  "UseBootstrapThreshold,false\n"
			  "TrainStart,20150101\n"
			  "TrainEnd,2017-12-31\n"
			  "ValidationStart,20180101\n"
			  "ValidationEnd,20191231\n"
			  "TestStart,20200101\n"
			  "TestEnd,20211231\n"
			  "StrictFiltering,true\n"
			  "IndexSymbol,SPY\n"
			  "NumThreads,4\n"
			  "OutputFile,results.json\n");

  ValidationConfigurationFileReader reader(path.string());
  auto config = reader.readConfigurationFile();

  REQUIRE(config->getCalibration().timeFrame == TimeFrame::WEEKLY);
  REQUIRE(config->getCalibration().annualizationFactor == Catch::Approx(52.0));
  REQUIRE(config->getCalibration().marketVolatility == Catch::Approx(0.18));
  REQUIRE(config->getCalibration().blockSize == 10);
  REQUIRE(config->getWalkForwardParameters().trainingWindow == 104);
  REQUIRE(config->getWalkForwardParameters().testingWindow == 26);
  REQUIRE(config->getBootstrapParameters().iterations == 500);
  REQUIRE(config->getBootstrapParameters().seed == 12345u);
  REQUIRE(config->getMultipleComparisonParameters().alpha == Catch::Approx(0.10));
  REQUIRE_FALSE(config->getMultipleComparisonParameters().useBootstrapThreshold);

  const auto& split = config->getDataSplitParameters();
  REQUIRE(split.trainPeriod.getFirstDate() == date(2015, 1, 1));
  REQUIRE(split.trainPeriod.getLastDate() == date(2017, 12, 31));
  REQUIRE(split.testPeriod.getLastDate() == date(2021, 12, 31));
  REQUIRE(split.strict);

  REQUIRE(config->getBaselineParameters().indexSymbol == "SPY");
  REQUIRE(config->getNumThreads() == 4);
  REQUIRE(config->getOutputFile() == "results.json");

  // Untouched keys keep their defaults
  REQUIRE(config->getWalkForwardParameters().minWindows == 3);
  REQUIRE(config->getBootstrapParameters().confidenceLevel == Catch::Approx(0.95));

  boost::filesystem::remove(path);
}

TEST_CASE("ValidationConfigurationFileReader explicit annualization wins over the time frame",
	  "[ValidationConfiguration]")
{
  auto path = writeConfig("TimeFrame,Daily\nAnnualizationFactor,365\n");

  ValidationConfigurationFileReader reader(path.string());
  auto config = reader.readConfigurationFile();
  REQUIRE(config->getCalibration().annualizationFactor == Catch::Approx(365.0));

  boost::filesystem::remove(path);
}

TEST_CASE("ValidationConfigurationFileReader resolves the universe file next to the configuration",
	  "[ValidationConfiguration]")
{
  auto dir = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("cfg-%%%%-%%%%");
  boost::filesystem::create_directories(dir);
  {
    std::ofstream universe((dir / "universe.csv").string());
    universe << "Date,Symbol,Close,MarketCap\n";
  }

  auto path = writeConfig("UniverseFile,universe.csv\n", dir);
  ValidationConfigurationFileReader reader(path.string());
  auto config = reader.readConfigurationFile();

  REQUIRE(boost::filesystem::path(config->getBaselineParameters().universeFile) == dir / "universe.csv");

  auto missing = writeConfig("UniverseFile,no-such-universe.csv\n", dir);
  ValidationConfigurationFileReader missingReader(missing.string());
  REQUIRE_THROWS_AS(missingReader.readConfigurationFile(), ValidationConfigurationException);

  boost::filesystem::remove_all(dir);
}

TEST_CASE("ValidationConfigurationFileReader resolves the baseline cache directory", "[ValidationConfiguration]")
{
  auto dir = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("cfg-%%%%-%%%%");
  boost::filesystem::create_directories(dir);

  auto relative = writeConfig("BaselineCacheDir,baseline-cache\n", dir);
  ValidationConfigurationFileReader reader(relative.string());
  auto config = reader.readConfigurationFile();
  REQUIRE(boost::filesystem::path(config->getBaselineParameters().cacheDirectory) == dir / "baseline-cache");

  auto absolute = writeConfig("BaselineCacheDir," + (dir / "elsewhere").string() + "\n", dir);
  ValidationConfigurationFileReader absoluteReader(absolute.string());
  REQUIRE(boost::filesystem::path(absoluteReader.readConfigurationFile()->getBaselineParameters().cacheDirectory) ==
	  dir / "elsewhere");

  REQUIRE(ValidationConfiguration().getBaselineParameters().cacheDirectory.empty());

  boost::filesystem::remove_all(dir);
}

TEST_CASE("ValidationConfigurationFileReader reports bad input", "[ValidationConfiguration]")
{
  SECTION("missing file")
    {
      ValidationConfigurationFileReader reader("/nonexistent/validation.csv");
      REQUIRE_THROWS_AS(reader.readConfigurationFile(), ValidationConfigurationException);
    }

  SECTION("unknown key")
    {
      auto path = writeConfig("BootstrapIterations,100\nNoSuchKey,1\n");
      ValidationConfigurationFileReader reader(path.string());
      REQUIRE_THROWS_AS(reader.readConfigurationFile(), ValidationConfigurationException);
      boost::filesystem::remove(path);
    }

  SECTION("malformed number")
    {
      auto path = writeConfig("MarketVolatility,high\n");
      ValidationConfigurationFileReader reader(path.string());
      REQUIRE_THROWS_AS(reader.readConfigurationFile(), ValidationConfigurationException);
      boost::filesystem::remove(path);
    }

  SECTION("malformed date")
    {
      auto path = writeConfig("TrainStart,2018-13-45\n");
      ValidationConfigurationFileReader reader(path.string());
      REQUIRE_THROWS_AS(reader.readConfigurationFile(), ValidationConfigurationException);
      boost::filesystem::remove(path);
    }

  SECTION("inverted period")
    {
      auto path = writeConfig("TrainStart,20201231\nTrainEnd,20180101\n");
      ValidationConfigurationFileReader reader(path.string());
      REQUIRE_THROWS_AS(reader.readConfigurationFile(), ValidationConfigurationException);
      boost::filesystem::remove(path);
    }
}
