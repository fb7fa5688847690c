#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "IParallelExecutor.h"
#include "ReturnsSeries.h"
#include "ValidationConfiguration.h"
#include "validation/ValidationTypes.h"

namespace stratvalidator
{
namespace validation
{

struct BootstrapValidationResult
{
    double pointEstimate;        ///< Annualized Sharpe of the original series
    double ciLower;              ///< NaN when the bootstrap is unreliable
    double ciUpper;              ///< NaN when the bootstrap is unreliable
    double confidenceLevel;
    std::size_t iterations;
    std::size_t validIterations;
    double validFraction;
    bool reliable;
    double standardError;
    std::size_t blockLength;     ///< Effective block length, min(blockSize, n)
    ValidationVerdict verdict;
};

/**
 * @brief Block-bootstrap confidence interval for the annualized Sharpe ratio.
 *
 * Contiguous circular blocks of CalibrationConstants::blockSize returns are
 * resampled to the original length, preserving serial dependence. The
 * percentile interval at the configured confidence level is reported.
 *
 * Passing requires BOTH a lower bound above zero AND a lower bound strictly
 * above minLowerBound. If fewer than minValidFraction of the resamples give
 * a finite Sharpe the interval is withheld, the verdict fails and carries a
 * DegradedBootstrapWarning.
 *
 * Resamples are seeded from (master seed, strategy id, replicate index), so
 * a fixed master seed reproduces a strategy's interval exactly, whatever
 * executor runs the replicates.
 */
class BootstrapValidator
{
public:
    static const char* const ValidatorName;

    /**
     * @param executor Runs the replicates; a SingleThreadExecutor is used when null.
     * @throws std::invalid_argument on out of range parameters
     */
    BootstrapValidator(const BootstrapParameters& parameters,
                       const CalibrationConstants& calibration,
                       std::shared_ptr<concurrency::IParallelExecutor> executor = nullptr);

    /**
     * @throws stratval::InsufficientDataException below minObservations returns
     */
    BootstrapValidationResult validate(const std::vector<double>& returns,
                                       const std::string& strategyId,
                                       std::ostream& os) const;

    BootstrapValidationResult validate(const stratval::ReturnsSeries& series,
                                       const std::string& strategyId,
                                       std::ostream& os) const;

    uint64_t getMasterSeed() const
    {
        return mMasterSeed;
    }

    const BootstrapParameters& getParameters() const
    {
        return mParameters;
    }

private:
    BootstrapParameters mParameters;
    CalibrationConstants mCalibration;
    std::shared_ptr<concurrency::IParallelExecutor> mExecutor;
    uint64_t mMasterSeed;
};

} // namespace validation
} // namespace stratvalidator
