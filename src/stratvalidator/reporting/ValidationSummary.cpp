#include "reporting/ValidationSummary.h"
#include <iomanip>

namespace stratvalidator
{
namespace reporting
{

ValidationSummary::ValidationSummary()
    : mTotalCount(0),
      mPassedCount(0),
      mFatalCount(0),
      mValidatorTallies(),
      mFailedStrategies()
{
}

ValidationSummary::ValidationSummary(const std::vector<StrategyValidationResult>& results)
    : ValidationSummary()
{
    for (const auto& result : results)
        addResult(result);
}

void ValidationSummary::addResult(const StrategyValidationResult& result)
{
    ++mTotalCount;

    if (result.overallPassed())
        ++mPassedCount;
    else
        mFailedStrategies.push_back(result.getStrategyId());

    if (result.getFatalError())
        ++mFatalCount;

    for (const auto& verdict : result.getVerdicts())
    {
        auto& tally = mValidatorTallies[verdict.getValidatorName()];
        if (verdict.passed())
            ++tally.passed;
        else
            ++tally.failed;
    }
}

double ValidationSummary::getPassRate() const
{
    if (mTotalCount == 0)
        return 0.0;

    return static_cast<double>(mPassedCount) / static_cast<double>(mTotalCount);
}

void ValidationSummary::print(std::ostream& os) const
{
    os << "\n=== Validation Summary ===\n";
    os << "Strategies validated: " << mTotalCount << "\n";
    os << "Passed: " << mPassedCount << "\n";
    os << "Failed: " << getFailedCount();
    if (mFatalCount > 0)
        os << " (" << mFatalCount << " aborted by a fatal error)";
    os << "\n";
    os << "Pass rate: " << std::fixed << std::setprecision(1) << (100.0 * getPassRate()) << "%\n";
    os.unsetf(std::ios_base::floatfield);

    if (!mValidatorTallies.empty())
    {
        os << "\nPer validator (passed / failed):\n";
        for (const auto& [name, tally] : mValidatorTallies)
            os << "  " << std::left << std::setw(30) << name << std::right
               << tally.passed << " / " << tally.failed << "\n";
    }

    if (!mFailedStrategies.empty())
    {
        os << "\nFailed strategies:\n";
        for (const auto& id : mFailedStrategies)
            os << "  ✗ " << id << "\n";
    }
    os << "==========================\n";
}

} // namespace reporting
} // namespace stratvalidator
