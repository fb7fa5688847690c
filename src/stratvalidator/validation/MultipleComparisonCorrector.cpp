#include "MultipleComparisonCorrector.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include "randutils.hpp"
#include "BlockBootstrap.h"
#include "BlockResamplers.h"
#include "NormalQuantile.h"
#include "ParallelExecutors.h"
#include "RngUtils.h"
#include "StatUtils.h"

namespace stratvalidator
{
namespace validation
{

using stratval::AbsoluteSharpeRatioStat;
using stratval::BlockBootstrap;
using stratval::CircularBlockResampler;
using NullBootstrap = BlockBootstrap<AbsoluteSharpeRatioStat,
                                     CircularBlockResampler,
                                     std::mt19937_64,
                                     concurrency::IParallelExecutor>;

const char* const MultipleComparisonCorrector::ValidatorName = "MultipleComparisonCorrector";

MultipleComparisonCorrector::MultipleComparisonCorrector(const MultipleComparisonParameters& parameters,
                                                         const CalibrationConstants& calibration,
                                                         std::shared_ptr<concurrency::IParallelExecutor> executor,
                                                         uint64_t nullSeed)
    : mParameters(parameters),
      mCalibration(calibration),
      mExecutor(executor ? std::move(executor)
                         : std::make_shared<concurrency::SingleThreadExecutor>()),
      mNullSeed(nullSeed),
      mNullMutex(),
      mNullDistributions()
{
    if (!(mParameters.alpha > 0.0 && mParameters.alpha < 1.0))
        throw std::invalid_argument("MultipleComparisonCorrector: alpha must be in (0, 1)");
    if (mParameters.nullIterations == 0)
        throw std::invalid_argument("MultipleComparisonCorrector: nullIterations must be positive");
    if (!(mParameters.divergenceFactor > 1.0))
        throw std::invalid_argument("MultipleComparisonCorrector: divergenceFactor must exceed 1");
}

double MultipleComparisonCorrector::adjustedAlpha(std::size_t numCandidates) const
{
    if (numCandidates == 0)
        throw std::invalid_argument("MultipleComparisonCorrector: number of candidates must be positive");

    return mParameters.alpha / static_cast<double>(numCandidates);
}

double MultipleComparisonCorrector::rawParametricThreshold(std::size_t numCandidates,
                                                           std::size_t numPeriods) const
{
    if (numPeriods == 0)
        throw std::invalid_argument("MultipleComparisonCorrector: number of periods must be positive");

    const double z = stratval::detail::compute_two_tailed_z(adjustedAlpha(numCandidates));
    return z / std::sqrt(static_cast<double>(numPeriods));
}

double MultipleComparisonCorrector::parametricThreshold(std::size_t numCandidates,
                                                        std::size_t numPeriods) const
{
    return std::max(rawParametricThreshold(numCandidates, numPeriods), mParameters.conservativeFloor);
}

std::optional<double> MultipleComparisonCorrector::bootstrapThreshold(std::size_t numCandidates,
                                                                      std::size_t numPeriods) const
{
    const double adj = adjustedAlpha(numCandidates);
    if (numPeriods < 2)
        throw std::invalid_argument("MultipleComparisonCorrector: bootstrap threshold needs at least 2 periods");

    auto nullDistribution = getNullDistribution(numPeriods);
    if (nullDistribution->empty())
        return std::nullopt;

    return stratval::StatUtils::quantileType7(*nullDistribution, 1.0 - adj);
}

ThresholdAssessment MultipleComparisonCorrector::computeThresholds(std::size_t numCandidates,
                                                                   std::size_t numPeriods,
                                                                   std::ostream& os) const
{
    ThresholdAssessment a{};
    a.numCandidates = numCandidates;
    a.numPeriods = numPeriods;
    a.adjustedAlpha = adjustedAlpha(numCandidates);
    a.zScore = stratval::detail::compute_two_tailed_z(a.adjustedAlpha);
    a.rawParametricThreshold = rawParametricThreshold(numCandidates, numPeriods);
    a.parametricThreshold = std::max(a.rawParametricThreshold, mParameters.conservativeFloor);
    a.divergent = false;
    a.governingThreshold = a.parametricThreshold;

    os << std::fixed << std::setprecision(4)
       << "   [MultipleComparison] N=" << numCandidates << " T=" << numPeriods
       << " alpha/N=" << std::setprecision(6) << a.adjustedAlpha
       << std::setprecision(4) << " z=" << a.zScore
       << " parametric=" << a.rawParametricThreshold
       << " (floored " << a.parametricThreshold << ")";

    if (mParameters.useBootstrapThreshold && numPeriods >= 2)
    {
        a.bootstrapThreshold = bootstrapThreshold(numCandidates, numPeriods);
        if (a.bootstrapThreshold)
        {
            os << " bootstrap=" << *a.bootstrapThreshold;

            const double hi = std::max(*a.bootstrapThreshold, a.parametricThreshold);
            const double lo = std::min(*a.bootstrapThreshold, a.parametricThreshold);
            if (lo > 0.0)
            {
                a.divergenceRatio = hi / lo;
                a.divergent = *a.divergenceRatio >= mParameters.divergenceFactor;
            }
            if (a.divergent)
            {
                a.governingThreshold = hi;
                a.warnings.push_back(ValidationWarning::AssumptionDivergence);
            }
        }
        else
        {
            a.warnings.push_back(ValidationWarning::DegradedBootstrap);
        }
    }
    os << "\n";

    if (a.divergent)
        os << "   [MultipleComparison] Warning: "
           << getValidationWarningString(ValidationWarning::AssumptionDivergence)
           << ": thresholds differ by " << *a.divergenceRatio
           << "x; stricter threshold " << a.governingThreshold << " governs\n";

    if (std::find(a.warnings.begin(), a.warnings.end(), ValidationWarning::DegradedBootstrap) != a.warnings.end())
        os << "   [MultipleComparison] Warning: "
           << getValidationWarningString(ValidationWarning::DegradedBootstrap)
           << ": null bootstrap unreliable for T=" << numPeriods
           << "; parametric threshold governs\n";

    os.unsetf(std::ios_base::floatfield);
    return a;
}

bool MultipleComparisonCorrector::isSignificant(double sharpe, double threshold) const
{
    return std::isfinite(sharpe) && std::fabs(sharpe) > threshold;
}

double MultipleComparisonCorrector::familyWiseErrorRate(std::size_t numCandidates) const
{
    const double adj = adjustedAlpha(numCandidates);
    return 1.0 - std::pow(1.0 - adj, static_cast<double>(numCandidates));
}

ValidationVerdict MultipleComparisonCorrector::validate(double sharpe,
                                                        std::size_t numCandidates,
                                                        std::size_t numPeriods,
                                                        std::ostream& os) const
{
    const auto assessment = computeThresholds(numCandidates, numPeriods, os);
    return buildVerdict(sharpe, assessment, os);
}

BatchSignificance MultipleComparisonCorrector::validateBatch(
    const std::vector<std::pair<std::string, double>>& sharpes,
    std::size_t numPeriods,
    std::ostream& os) const
{
    const std::size_t n = sharpes.size();
    const auto assessment = computeThresholds(n, numPeriods, os);

    BatchSignificance batch{};
    batch.numCandidates = n;
    batch.adjustedAlpha = assessment.adjustedAlpha;
    batch.familyWiseErrorRate = familyWiseErrorRate(n);
    batch.expectedFalseDiscoveries = static_cast<double>(n) * assessment.adjustedAlpha;
    batch.numSignificant = 0;

    for (const auto& [strategyId, sharpe] : sharpes)
    {
        if (isSignificant(sharpe, assessment.governingThreshold))
            ++batch.numSignificant;

        os << "   [MultipleComparison] " << strategyId << ":\n";
        batch.verdicts.emplace_back(strategyId, buildVerdict(sharpe, assessment, os));
    }

    batch.estimatedFalseDiscoveryRate = (batch.numSignificant > 0)
        ? batch.expectedFalseDiscoveries / static_cast<double>(batch.numSignificant)
        : 0.0;

    os << std::fixed << std::setprecision(4)
       << "   [MultipleComparison] " << batch.numSignificant << " of " << n
       << " significant; FWER=" << batch.familyWiseErrorRate
       << " expected false discoveries=" << batch.expectedFalseDiscoveries
       << " estimated FDR=" << batch.estimatedFalseDiscoveryRate << "\n";
    os.unsetf(std::ios_base::floatfield);

    return batch;
}

ValidationVerdict MultipleComparisonCorrector::buildVerdict(double sharpe,
                                                            const ThresholdAssessment& assessment,
                                                            std::ostream& os) const
{
    const bool passed = std::isfinite(sharpe) && sharpe > assessment.governingThreshold;

    std::ostringstream diagnostic;
    diagnostic << std::fixed << std::setprecision(4)
               << "Sharpe " << sharpe << " vs threshold " << assessment.governingThreshold
               << " (N=" << assessment.numCandidates
               << ", alpha/N=" << std::setprecision(6) << assessment.adjustedAlpha
               << std::setprecision(4) << ", parametric " << assessment.rawParametricThreshold
               << " floored to " << assessment.parametricThreshold;
    if (assessment.bootstrapThreshold)
        diagnostic << ", bootstrap " << *assessment.bootstrapThreshold;
    diagnostic << ")";

    for (auto warning : assessment.warnings)
    {
        diagnostic << "; " << getValidationWarningString(warning);
        if (warning == ValidationWarning::AssumptionDivergence)
            diagnostic << ": parametric and bootstrap thresholds differ by "
                       << *assessment.divergenceRatio << "x";
        else if (warning == ValidationWarning::DegradedBootstrap)
            diagnostic << ": null bootstrap unreliable";
    }

    if (!passed && sharpe < -assessment.governingThreshold)
        diagnostic << "; significantly negative";

    os << "   [MultipleComparison] " << (passed ? "✓ PASS: " : "✗ FAIL: ") << diagnostic.str() << "\n";

    return ValidationVerdict(ValidatorName, passed, sharpe, assessment.governingThreshold,
                             ThresholdComparison::GreaterThan, assessment.numPeriods,
                             diagnostic.str(), assessment.warnings);
}

std::shared_ptr<const std::vector<double>>
MultipleComparisonCorrector::getNullDistribution(std::size_t numPeriods) const
{
    std::lock_guard<std::mutex> lock(mNullMutex);

    auto it = mNullDistributions.find(numPeriods);
    if (it != mNullDistributions.end())
        return it->second;

    auto distribution = computeNullDistribution(numPeriods);
    mNullDistributions.emplace(numPeriods, distribution);
    return distribution;
}

std::shared_ptr<const std::vector<double>>
MultipleComparisonCorrector::computeNullDistribution(std::size_t numPeriods) const
{
    const double periodVol = mCalibration.marketVolatility / std::sqrt(mCalibration.annualizationFactor);

    // The null series depends on T only, so thresholds for different N share it
    randutils::seed_seq_fe128 seed{ static_cast<uint32_t>(mNullSeed),
                                    static_cast<uint32_t>(mNullSeed >> 32),
                                    static_cast<uint32_t>(numPeriods) };
    randutils::mt19937_rng rng(seed);

    std::vector<double> nullReturns(numPeriods);
    for (auto& r : nullReturns)
        r = rng.variate<double, std::normal_distribution>(0.0, periodVol);

    const double realizedMean = stratval::StatUtils::computeMean(nullReturns);
    for (auto& r : nullReturns)
        r -= realizedMean;

    CircularBlockResampler resampler(mCalibration.blockSize);
    NullBootstrap bootstrap(mParameters.nullIterations, 0.95, resampler, 0.9, mExecutor);

    stratval::rng_utils::CRNEngineProvider<std::mt19937_64> provider(
        stratval::rng_utils::CRNKey(mNullSeed).with_tag(static_cast<uint64_t>(numPeriods)));

    const auto result = bootstrap.run(nullReturns, AbsoluteSharpeRatioStat(mCalibration.annualizationFactor),
                                      provider);

    if (!result.reliable)
        return std::make_shared<const std::vector<double>>();

    return std::make_shared<const std::vector<double>>(bootstrap.getBootstrapStatistics());
}

} // namespace validation
} // namespace stratvalidator
