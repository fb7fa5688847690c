// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "DateRange.h"
#include "TimeFrame.h"

namespace stratvalidator
{
  using stratval::DateRange;
  using stratval::TimeFrame;

  class ValidationConfigurationException : public std::runtime_error
  {
  public:
  ValidationConfigurationException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~ValidationConfigurationException()
      {}
  };

  /**
   * @brief Market calibration shared by every validator.
   *
   * Passed explicitly into each validator's constructor so that a validator
   * is a pure function of its inputs and this object.
   */
  struct CalibrationConstants
  {
    double annualizationFactor = 252.0;   ///< Return periods per year
    double marketVolatility = 0.22;       ///< Annualized volatility of the null market
    std::size_t blockSize = 21;           ///< Bootstrap block length, about one trading month
    TimeFrame::Duration timeFrame = TimeFrame::DAILY;   ///< Frequency of the returns files
  };

  struct WalkForwardParameters
  {
    std::size_t trainingWindow = 252;
    std::size_t testingWindow = 63;
    std::size_t minWindows = 3;
    double minAverageSharpe = 0.5;
    double minWinRate = 0.6;              ///< Share of windows with a positive test Sharpe
    double minWorstSharpe = -0.5;
    double maxSharpeStdDev = 1.0;
  };

  struct BootstrapParameters
  {
    std::size_t iterations = 1000;
    double confidenceLevel = 0.95;
    double minLowerBound = 0.5;
    double minValidFraction = 0.9;
    std::size_t minObservations = 252;
    std::optional<uint64_t> seed;         ///< Fixed master seed; drawn at start-up when empty
  };

  struct MultipleComparisonParameters
  {
    double alpha = 0.05;
    double conservativeFloor = 0.5;
    std::size_t nullIterations = 1000;
    double divergenceFactor = 10.0;
    bool useBootstrapThreshold = true;
  };

  struct DataSplitParameters
  {
    DateRange trainPeriod{ boost::gregorian::date(2018, 1, 1), boost::gregorian::date(2020, 12, 31) };
    DateRange validationPeriod{ boost::gregorian::date(2021, 1, 1), boost::gregorian::date(2022, 12, 31) };
    DateRange testPeriod{ boost::gregorian::date(2023, 1, 1), boost::gregorian::date(2024, 12, 31) };
    double minValidationSharpe = 1.0;
    double minConsistency = 0.6;
    double minDegradationRatio = 0.7;
    double consistencyEpsilon = 0.1;
    std::size_t minPeriodsTested = 2;
    bool strict = false;
  };

  struct BaselineParameters
  {
    double minImprovement = 0.5;
    double catastrophicImprovement = -1.0;
    std::size_t topN = 50;
    std::size_t volatilityLookback = 60;
    std::string indexSymbol = "0050";
    std::string universeFile;             ///< Empty disables baseline comparison
    std::string cacheDirectory;           ///< Empty keeps baselines in memory only
  };

  /**
   * @brief Complete, validated configuration of one validation run.
   *
   * Construction checks every parameter and throws
   * ValidationConfigurationException on the first one out of range, so a
   * ValidationConfiguration that exists is always usable.
   */
  class ValidationConfiguration
  {
  public:
    ValidationConfiguration();

    ValidationConfiguration(const CalibrationConstants& calibration,
			    const WalkForwardParameters& walkForward,
			    const BootstrapParameters& bootstrap,
			    const MultipleComparisonParameters& multipleComparison,
			    const DataSplitParameters& dataSplit,
			    const BaselineParameters& baseline,
			    std::size_t numThreads,
			    const std::string& outputFile);

    const CalibrationConstants& getCalibration() const
    {
      return mCalibration;
    }

    const WalkForwardParameters& getWalkForwardParameters() const
    {
      return mWalkForward;
    }

    const BootstrapParameters& getBootstrapParameters() const
    {
      return mBootstrap;
    }

    const MultipleComparisonParameters& getMultipleComparisonParameters() const
    {
      return mMultipleComparison;
    }

    const DataSplitParameters& getDataSplitParameters() const
    {
      return mDataSplit;
    }

    const BaselineParameters& getBaselineParameters() const
    {
      return mBaseline;
    }

    // 0 selects the hardware concurrency
    std::size_t getNumThreads() const
    {
      return mNumThreads;
    }

    const std::string& getOutputFile() const
    {
      return mOutputFile;
    }

  private:
    void validate() const;

  private:
    CalibrationConstants mCalibration;
    WalkForwardParameters mWalkForward;
    BootstrapParameters mBootstrap;
    MultipleComparisonParameters mMultipleComparison;
    DataSplitParameters mDataSplit;
    BaselineParameters mBaseline;
    std::size_t mNumThreads;
    std::string mOutputFile;
  };

  /**
   * @brief Reads a two column Key,Value configuration file.
   *
   * Lines starting with '#' are comments. An optional "Key,Value" header row
   * is accepted. Keys are case insensitive; keys that are not present keep
   * their defaults. Unknown keys and unparsable values raise
   * ValidationConfigurationException.
   */
  class ValidationConfigurationFileReader
  {
  public:
    ValidationConfigurationFileReader (const std::string& configurationFileName);
    ~ValidationConfigurationFileReader()
      {}

    std::shared_ptr<ValidationConfiguration> readConfigurationFile();

  private:
    std::string mConfigurationFileName;
  };
}
