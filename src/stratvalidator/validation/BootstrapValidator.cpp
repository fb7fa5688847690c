#include "BootstrapValidator.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include "randutils.hpp"
#include "BlockBootstrap.h"
#include "BlockResamplers.h"
#include "ParallelExecutors.h"
#include "RngUtils.h"
#include "StatUtils.h"
#include "TimeSeriesException.h"

namespace stratvalidator
{
namespace validation
{

using stratval::BlockBootstrap;
using stratval::CircularBlockResampler;
using stratval::SharpeRatioStat;
using SharpeBootstrap = BlockBootstrap<SharpeRatioStat,
                                       CircularBlockResampler,
                                       std::mt19937_64,
                                       concurrency::IParallelExecutor>;

const char* const BootstrapValidator::ValidatorName = "BootstrapValidator";

BootstrapValidator::BootstrapValidator(const BootstrapParameters& parameters,
                                       const CalibrationConstants& calibration,
                                       std::shared_ptr<concurrency::IParallelExecutor> executor)
    : mParameters(parameters),
      mCalibration(calibration),
      mExecutor(executor ? std::move(executor)
                         : std::make_shared<concurrency::SingleThreadExecutor>()),
      mMasterSeed(0)
{
    if (mParameters.iterations == 0)
        throw std::invalid_argument("BootstrapValidator: iterations must be positive");
    if (!(mParameters.confidenceLevel > 0.5 && mParameters.confidenceLevel < 1.0))
        throw std::invalid_argument("BootstrapValidator: confidence level must be in (0.5, 1)");
    if (mCalibration.blockSize == 0)
        throw std::invalid_argument("BootstrapValidator: block size must be positive");

    if (mParameters.seed)
    {
        mMasterSeed = *mParameters.seed;
    }
    else
    {
        randutils::mt19937_rng seeder;
        mMasterSeed = (static_cast<uint64_t>(seeder.engine()()) << 32) |
            static_cast<uint64_t>(seeder.engine()());
    }
}

BootstrapValidationResult BootstrapValidator::validate(const stratval::ReturnsSeries& series,
                                                       const std::string& strategyId,
                                                       std::ostream& os) const
{
    return validate(series.getReturnValues(), strategyId, os);
}

BootstrapValidationResult BootstrapValidator::validate(const std::vector<double>& returns,
                                                       const std::string& strategyId,
                                                       std::ostream& os) const
{
    const std::size_t n = returns.size();
    if (n < mParameters.minObservations)
        throw stratval::InsufficientDataException(
            "BootstrapValidator: " + strategyId + " has " + std::to_string(n) +
            " returns, at least " + std::to_string(mParameters.minObservations) + " required");

    CircularBlockResampler resampler(mCalibration.blockSize);
    SharpeBootstrap bootstrap(mParameters.iterations,
                              mParameters.confidenceLevel,
                              resampler,
                              mParameters.minValidFraction,
                              mExecutor);

    stratval::rng_utils::CRNKey key(mMasterSeed);
    stratval::rng_utils::CRNEngineProvider<std::mt19937_64> provider(
        key.with_tag(stratval::rng_utils::hash_string64(strategyId)));

    const auto r = bootstrap.run(returns, SharpeRatioStat(mCalibration.annualizationFactor), provider);
    const std::size_t effectiveL = std::min(mCalibration.blockSize, n);

    os << std::fixed << std::setprecision(4)
       << "   [Bootstrap] " << strategyId << ": n=" << n << " L=" << effectiveL
       << " B=" << r.B << " valid=" << r.effectiveB
       << " (" << std::setprecision(1) << (r.validFraction * 100.0) << "%)\n";

    std::vector<ValidationWarning> warnings;
    std::ostringstream diagnostic;
    diagnostic << std::fixed;
    bool passed = false;

    if (!r.reliable)
    {
        warnings.push_back(ValidationWarning::DegradedBootstrap);
        diagnostic << getValidationWarningString(ValidationWarning::DegradedBootstrap)
                   << ": only " << r.effectiveB << " of " << r.B
                   << " resamples produced a finite Sharpe ratio ("
                   << std::setprecision(1) << (r.validFraction * 100.0) << "% < "
                   << (mParameters.minValidFraction * 100.0)
                   << "%); confidence interval withheld";
        os << "   [Bootstrap] Warning: " << diagnostic.str() << "\n";
        os << "   [Bootstrap] ✗ FAIL: bootstrap unreliable\n";
    }
    else
    {
        const bool excludesZero = r.lower > 0.0;
        const bool clearsMinimum = r.lower > mParameters.minLowerBound;
        passed = excludesZero && clearsMinimum;

        diagnostic << std::setprecision(4) << "Sharpe " << r.pointEstimate
                   << ", " << std::setprecision(0) << (r.cl * 100.0) << "% CI ["
                   << std::setprecision(4) << r.lower << ", " << r.upper << "]";
        if (!excludesZero)
            diagnostic << "; interval includes zero";
        if (!clearsMinimum)
            diagnostic << "; lower bound not above " << mParameters.minLowerBound;

        os << "   [Bootstrap] " << (passed ? "✓ PASS: " : "✗ FAIL: ") << diagnostic.str() << "\n";
    }
    os.unsetf(std::ios_base::floatfield);

    ValidationVerdict verdict(ValidatorName, passed, r.lower, mParameters.minLowerBound,
                              ThresholdComparison::GreaterThan, n, diagnostic.str(),
                              std::move(warnings));

    return BootstrapValidationResult{ r.pointEstimate, r.lower, r.upper, r.cl, r.B, r.effectiveB,
                                      r.validFraction, r.reliable, r.standardError, effectiveL,
                                      std::move(verdict) };
}

} // namespace validation
} // namespace stratvalidator
