// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <cmath>
#include "csv.h"
#include "ValidationConfiguration.h"
#include "Annualizer.h"

using namespace boost::filesystem;

namespace stratvalidator
{
  using ConfigCsvReader = io::CSVReader<2,
					io::trim_chars<' ', '\t'>,
					io::no_quote_escape<','>,
					io::throw_on_overflow,
					io::single_line_comment<'#'>>;

  static double parseDouble(const std::string& key, const std::string& value);
  static std::size_t parseCount(const std::string& key, const std::string& value);
  static bool parseBool(const std::string& key, const std::string& value);
  static boost::gregorian::date parseDate(const std::string& key, const std::string& value);

  ValidationConfiguration::ValidationConfiguration()
    : ValidationConfiguration(CalibrationConstants(),
			      WalkForwardParameters(),
			      BootstrapParameters(),
			      MultipleComparisonParameters(),
			      DataSplitParameters(),
			      BaselineParameters(),
			      0,
			      "validation_results.json")
  {}

  ValidationConfiguration::ValidationConfiguration(const CalibrationConstants& calibration,
						   const WalkForwardParameters& walkForward,
						   const BootstrapParameters& bootstrap,
						   const MultipleComparisonParameters& multipleComparison,
						   const DataSplitParameters& dataSplit,
						   const BaselineParameters& baseline,
						   std::size_t numThreads,
						   const std::string& outputFile)
    : mCalibration(calibration),
      mWalkForward(walkForward),
      mBootstrap(bootstrap),
      mMultipleComparison(multipleComparison),
      mDataSplit(dataSplit),
      mBaseline(baseline),
      mNumThreads(numThreads),
      mOutputFile(outputFile)
  {
    validate();
  }

  void ValidationConfiguration::validate() const
  {
    if (!(mCalibration.annualizationFactor > 0.0))
      throw ValidationConfigurationException("AnnualizationFactor must be positive");
    if (!(mCalibration.marketVolatility > 0.0))
      throw ValidationConfigurationException("MarketVolatility must be positive");
    if (mCalibration.blockSize == 0)
      throw ValidationConfigurationException("BlockSize must be at least 1");

    if (mWalkForward.trainingWindow == 0 || mWalkForward.testingWindow == 0)
      throw ValidationConfigurationException("TrainingWindow and TestingWindow must be at least 1");
    if (mWalkForward.minWindows == 0)
      throw ValidationConfigurationException("MinWindows must be at least 1");

    if (mBootstrap.iterations == 0)
      throw ValidationConfigurationException("BootstrapIterations must be at least 1");
    if (!(mBootstrap.confidenceLevel > 0.5 && mBootstrap.confidenceLevel < 1.0))
      throw ValidationConfigurationException("ConfidenceLevel must be in (0.5, 1)");
    if (!(mBootstrap.minValidFraction > 0.0 && mBootstrap.minValidFraction <= 1.0))
      throw ValidationConfigurationException("MinValidFraction must be in (0, 1]");
    if (mBootstrap.minObservations < 2)
      throw ValidationConfigurationException("MinObservations must be at least 2");

    if (!(mMultipleComparison.alpha > 0.0 && mMultipleComparison.alpha < 1.0))
      throw ValidationConfigurationException("Alpha must be in (0, 1)");
    if (mMultipleComparison.nullIterations == 0)
      throw ValidationConfigurationException("NullIterations must be at least 1");
    if (!(mMultipleComparison.divergenceFactor > 1.0))
      throw ValidationConfigurationException("DivergenceFactor must be greater than 1");

    if (mDataSplit.trainPeriod.overlaps(mDataSplit.validationPeriod) ||
	mDataSplit.validationPeriod.overlaps(mDataSplit.testPeriod) ||
	mDataSplit.trainPeriod.overlaps(mDataSplit.testPeriod))
      throw ValidationConfigurationException("Train, validation and test periods must be disjoint: " +
					     mDataSplit.trainPeriod.toString() + ", " +
					     mDataSplit.validationPeriod.toString() + ", " +
					     mDataSplit.testPeriod.toString());
    if (!(mDataSplit.consistencyEpsilon >= 0.0))
      throw ValidationConfigurationException("ConsistencyEpsilon must not be negative");
    if (mDataSplit.minPeriodsTested < 2 || mDataSplit.minPeriodsTested > 3)
      throw ValidationConfigurationException("MinPeriodsTested must be 2 or 3");

    if (mBaseline.topN == 0)
      throw ValidationConfigurationException("TopN must be at least 1");
    if (mBaseline.volatilityLookback < 2)
      throw ValidationConfigurationException("VolatilityLookback must be at least 2");
  }

  ValidationConfigurationFileReader::ValidationConfigurationFileReader (const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {}

  std::shared_ptr<ValidationConfiguration> ValidationConfigurationFileReader::readConfigurationFile()
  {
    path configurationPath(mConfigurationFileName);
    if (!exists(configurationPath))
      throw ValidationConfigurationException("Configuration file " + mConfigurationFileName + " does not exist");

    CalibrationConstants calibration;
    WalkForwardParameters walkForward;
    BootstrapParameters bootstrap;
    MultipleComparisonParameters multipleComparison;
    DataSplitParameters dataSplit;
    BaselineParameters baseline;
    std::size_t numThreads = 0;
    std::string outputFile("validation_results.json");

    // Split-period boundaries are applied after all rows are read so that
    // start and end of one period may appear in any order
    boost::gregorian::date trainStart = dataSplit.trainPeriod.getFirstDate();
    boost::gregorian::date trainEnd = dataSplit.trainPeriod.getLastDate();
    boost::gregorian::date validationStart = dataSplit.validationPeriod.getFirstDate();
    boost::gregorian::date validationEnd = dataSplit.validationPeriod.getLastDate();
    boost::gregorian::date testStart = dataSplit.testPeriod.getFirstDate();
    boost::gregorian::date testEnd = dataSplit.testPeriod.getLastDate();

    std::optional<TimeFrame::Duration> timeFrame;
    int intradayMinutes = 0;
    std::optional<double> explicitAnnualization;

    try
      {
	ConfigCsvReader csvConfigFile(mConfigurationFileName.c_str());
	csvConfigFile.set_header("Key", "Value");

	std::string key, value;
	bool firstRow = true;

	while (csvConfigFile.read_row(key, value))
	  {
	    boost::algorithm::trim(key);
	    boost::algorithm::trim(value);

	    if (firstRow)
	      {
		firstRow = false;
		if (boost::iequals(key, "Key") && boost::iequals(value, "Value"))
		  continue;
	      }

	    if (key.empty())
	      continue;

	    if (boost::iequals(key, "AnnualizationFactor"))
	      explicitAnnualization = parseDouble(key, value);
	    else if (boost::iequals(key, "TimeFrame"))
	      timeFrame = stratval::timeFrameFromString(boost::to_upper_copy(value));
	    else if (boost::iequals(key, "IntradayMinutes"))
	      intradayMinutes = static_cast<int>(parseCount(key, value));
	    else if (boost::iequals(key, "MarketVolatility"))
	      calibration.marketVolatility = parseDouble(key, value);
	    else if (boost::iequals(key, "BlockSize"))
	      calibration.blockSize = parseCount(key, value);

	    else if (boost::iequals(key, "TrainingWindow"))
	      walkForward.trainingWindow = parseCount(key, value);
	    else if (boost::iequals(key, "TestingWindow"))
	      walkForward.testingWindow = parseCount(key, value);
	    else if (boost::iequals(key, "MinWindows"))
	      walkForward.minWindows = parseCount(key, value);
	    else if (boost::iequals(key, "MinAverageSharpe"))
	      walkForward.minAverageSharpe = parseDouble(key, value);
	    else if (boost::iequals(key, "MinWindowWinRate"))
	      walkForward.minWinRate = parseDouble(key, value);
	    else if (boost::iequals(key, "MinWorstSharpe"))
	      walkForward.minWorstSharpe = parseDouble(key, value);
	    else if (boost::iequals(key, "MaxSharpeStdDev"))
	      walkForward.maxSharpeStdDev = parseDouble(key, value);

	    else if (boost::iequals(key, "BootstrapIterations"))
	      bootstrap.iterations = parseCount(key, value);
	    else if (boost::iequals(key, "ConfidenceLevel"))
	      bootstrap.confidenceLevel = parseDouble(key, value);
	    else if (boost::iequals(key, "MinLowerBound"))
	      bootstrap.minLowerBound = parseDouble(key, value);
	    else if (boost::iequals(key, "MinValidFraction"))
	      bootstrap.minValidFraction = parseDouble(key, value);
	    else if (boost::iequals(key, "MinObservations"))
	      bootstrap.minObservations = parseCount(key, value);
	    else if (boost::iequals(key, "RandomSeed"))
	      bootstrap.seed = static_cast<uint64_t>(parseCount(key, value));

	    else if (boost::iequals(key, "Alpha"))
	      multipleComparison.alpha = parseDouble(key, value);
	    else if (boost::iequals(key, "ConservativeFloor"))
	      multipleComparison.conservativeFloor = parseDouble(key, value);
	    else if (boost::iequals(key, "NullIterations"))
	      multipleComparison.nullIterations = parseCount(key, value);
	    else if (boost::iequals(key, "DivergenceFactor"))
	      multipleComparison.divergenceFactor = parseDouble(key, value);
	    else if (boost::iequals(key, "UseBootstrapThreshold"))
	      multipleComparison.useBootstrapThreshold = parseBool(key, value);

	    else if (boost::iequals(key, "TrainStart"))
	      trainStart = parseDate(key, value);
	    else if (boost::iequals(key, "TrainEnd"))
	      trainEnd = parseDate(key, value);
	    else if (boost::iequals(key, "ValidationStart"))
	      validationStart = parseDate(key, value);
	    else if (boost::iequals(key, "ValidationEnd"))
	      validationEnd = parseDate(key, value);
	    else if (boost::iequals(key, "TestStart"))
	      testStart = parseDate(key, value);
	    else if (boost::iequals(key, "TestEnd"))
	      testEnd = parseDate(key, value);
	    else if (boost::iequals(key, "MinValidationSharpe"))
	      dataSplit.minValidationSharpe = parseDouble(key, value);
	    else if (boost::iequals(key, "MinConsistency"))
	      dataSplit.minConsistency = parseDouble(key, value);
	    else if (boost::iequals(key, "MinDegradationRatio"))
	      dataSplit.minDegradationRatio = parseDouble(key, value);
	    else if (boost::iequals(key, "ConsistencyEpsilon"))
	      dataSplit.consistencyEpsilon = parseDouble(key, value);
	    else if (boost::iequals(key, "MinPeriodsTested"))
	      dataSplit.minPeriodsTested = parseCount(key, value);
	    else if (boost::iequals(key, "StrictFiltering"))
	      dataSplit.strict = parseBool(key, value);

	    else if (boost::iequals(key, "MinImprovement"))
	      baseline.minImprovement = parseDouble(key, value);
	    else if (boost::iequals(key, "CatastrophicImprovement"))
	      baseline.catastrophicImprovement = parseDouble(key, value);
	    else if (boost::iequals(key, "TopN"))
	      baseline.topN = parseCount(key, value);
	    else if (boost::iequals(key, "VolatilityLookback"))
	      baseline.volatilityLookback = parseCount(key, value);
	    else if (boost::iequals(key, "IndexSymbol"))
	      baseline.indexSymbol = value;
	    else if (boost::iequals(key, "UniverseFile"))
	      baseline.universeFile = value;
	    else if (boost::iequals(key, "BaselineCacheDir"))
	      baseline.cacheDirectory = value;

	    else if (boost::iequals(key, "NumThreads"))
	      numThreads = parseCount(key, value);
	    else if (boost::iequals(key, "OutputFile"))
	      outputFile = value;
	    else
	      throw ValidationConfigurationException("Unknown configuration key '" + key + "' in " +
						     mConfigurationFileName);
	  }
      }
    catch (const io::error::base& e)
      {
	throw ValidationConfigurationException("Cannot parse configuration file " + mConfigurationFileName +
					       ": " + e.what());
      }
    catch (const stratval::TimeFrameException& e)
      {
	throw ValidationConfigurationException(e.what());
      }

    if (timeFrame)
      calibration.timeFrame = *timeFrame;

    if (explicitAnnualization)
      calibration.annualizationFactor = *explicitAnnualization;
    else if (timeFrame)
      {
	try
	  {
	    calibration.annualizationFactor = stratval::computeAnnualizationFactor(*timeFrame, intradayMinutes);
	  }
	catch (const std::invalid_argument& e)
	  {
	    throw ValidationConfigurationException(std::string("TimeFrame: ") + e.what());
	  }
      }

    try
      {
	dataSplit.trainPeriod = DateRange(trainStart, trainEnd);
	dataSplit.validationPeriod = DateRange(validationStart, validationEnd);
	dataSplit.testPeriod = DateRange(testStart, testEnd);
      }
    catch (const stratval::DateRangeException& e)
      {
	throw ValidationConfigurationException(e.what());
      }

    if (!baseline.universeFile.empty())
      {
	path universePath(baseline.universeFile);
	if (universePath.is_relative())
	  universePath = configurationPath.parent_path() / universePath;
	if (!exists(universePath))
	  throw ValidationConfigurationException("Universe file " + universePath.string() + " does not exist");
	baseline.universeFile = universePath.string();
      }

    if (!baseline.cacheDirectory.empty())
      {
	path cachePath(baseline.cacheDirectory);
	if (cachePath.is_relative())
	  cachePath = configurationPath.parent_path() / cachePath;
	baseline.cacheDirectory = cachePath.string();
      }

    return std::make_shared<ValidationConfiguration>(calibration, walkForward, bootstrap,
						     multipleComparison, dataSplit, baseline,
						     numThreads, outputFile);
  }

  static double parseDouble(const std::string& key, const std::string& value)
  {
    try
      {
	const double d = boost::lexical_cast<double>(value);
	if (!std::isfinite(d))
	  throw ValidationConfigurationException("Value for " + key + " must be finite");
	return d;
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw ValidationConfigurationException("Value '" + value + "' for " + key + " is not a number");
      }
  }

  static std::size_t parseCount(const std::string& key, const std::string& value)
  {
    if (!value.empty() && value[0] == '-')
      throw ValidationConfigurationException("Value for " + key + " must not be negative");

    try
      {
	return boost::lexical_cast<std::size_t>(value);
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw ValidationConfigurationException("Value '" + value + "' for " + key + " is not a count");
      }
  }

  static bool parseBool(const std::string& key, const std::string& value)
  {
    if (boost::iequals(value, "true") || boost::iequals(value, "yes") || value == "1")
      return true;
    if (boost::iequals(value, "false") || boost::iequals(value, "no") || value == "0")
      return false;

    throw ValidationConfigurationException("Value '" + value + "' for " + key + " is not a boolean");
  }

  static boost::gregorian::date parseDate(const std::string& key, const std::string& value)
  {
    try
      {
	boost::gregorian::date d = (value.find('-') != std::string::npos)
	  ? boost::gregorian::from_simple_string(value)
	  : boost::gregorian::from_undelimited_string(value);
	if (d.is_special())
	  throw ValidationConfigurationException("Value '" + value + "' for " + key + " is not a date");
	return d;
      }
    catch (const std::out_of_range&)
      {
	throw ValidationConfigurationException("Value '" + value + "' for " + key + " is not a valid date");
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw ValidationConfigurationException("Value '" + value + "' for " + key + " is not a date");
      }
  }
}
