#include "ValidationTypes.h"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace stratvalidator
{
namespace validation
{

std::string getValidationWarningString(ValidationWarning warning)
{
    switch (warning)
    {
        case ValidationWarning::DegradedBootstrap:
            return "DegradedBootstrapWarning";
        case ValidationWarning::AssumptionDivergence:
            return "AssumptionDivergenceWarning";
        case ValidationWarning::UnsupportedFiltering:
            return "UnsupportedFilteringWarning";
        default:
            throw std::invalid_argument("Unknown ValidationWarning");
    }
}

std::string getThresholdComparisonString(ThresholdComparison comparison)
{
    switch (comparison)
    {
        case ThresholdComparison::GreaterThan:
            return "statistic > threshold";
        case ThresholdComparison::GreaterOrEqual:
            return "statistic >= threshold";
        case ThresholdComparison::LessThan:
            return "statistic < threshold";
        default:
            throw std::invalid_argument("Unknown ThresholdComparison");
    }
}

ValidationVerdict::ValidationVerdict(const std::string& validatorName,
                                     bool passed,
                                     double statistic,
                                     double threshold,
                                     ThresholdComparison comparison,
                                     std::size_t numPeriods,
                                     const std::string& diagnostic,
                                     std::vector<ValidationWarning> warnings)
    : mValidatorName(validatorName),
      mPassed(passed),
      mStatistic(statistic),
      mThreshold(threshold),
      mComparison(comparison),
      mNumPeriods(numPeriods),
      mDiagnostic(diagnostic),
      mWarnings(std::move(warnings))
{
}

bool ValidationVerdict::hasWarning(ValidationWarning warning) const
{
    return std::find(mWarnings.begin(), mWarnings.end(), warning) != mWarnings.end();
}

StrategyValidationResult::StrategyValidationResult(const std::string& strategyId,
                                                   const std::map<std::string, std::string>& parameters,
                                                   std::vector<ValidationVerdict> verdicts,
                                                   std::optional<std::string> fatalError)
    : mStrategyId(strategyId),
      mParameters(parameters),
      mVerdicts(std::move(verdicts)),
      mFatalError(std::move(fatalError)),
      mOverallPassed(false)
{
    mOverallPassed = !mFatalError && !mVerdicts.empty() &&
        std::all_of(mVerdicts.begin(), mVerdicts.end(),
                    [](const ValidationVerdict& v) { return v.passed(); });
}

std::vector<std::string> StrategyValidationResult::getChecksRun() const
{
    std::vector<std::string> names;
    names.reserve(mVerdicts.size());
    for (const auto& verdict : mVerdicts)
        names.push_back(verdict.getValidatorName());
    return names;
}

const ValidationVerdict* StrategyValidationResult::findVerdict(const std::string& validatorName) const
{
    for (const auto& verdict : mVerdicts)
    {
        if (verdict.getValidatorName() == validatorName)
            return &verdict;
    }
    return nullptr;
}

} // namespace validation
} // namespace stratvalidator
