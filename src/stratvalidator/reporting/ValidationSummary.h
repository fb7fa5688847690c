#pragma once

#include <cstddef>
#include <map>
#include <ostream>
#include <string>
#include <vector>
#include "validation/ValidationTypes.h"

namespace stratvalidator
{
namespace reporting
{

using validation::StrategyValidationResult;

/**
 * @brief Pass and fail counts of a single validator across a batch
 */
struct ValidatorTally
{
    std::size_t passed = 0;
    std::size_t failed = 0;
};

/**
 * @brief Aggregate statistics over the results of one validation batch.
 *
 * Validators that never ran for a strategy (because an earlier check failed)
 * contribute to neither of their counts.
 */
class ValidationSummary
{
public:
    ValidationSummary();

    explicit ValidationSummary(const std::vector<StrategyValidationResult>& results);

    /**
     * @brief Add one strategy's result to the counters
     * @param result Result of a completed strategy validation
     */
    void addResult(const StrategyValidationResult& result);

    std::size_t getTotalCount() const
    {
        return mTotalCount;
    }

    std::size_t getPassedCount() const
    {
        return mPassedCount;
    }

    std::size_t getFailedCount() const
    {
        return mTotalCount - mPassedCount;
    }

    // Strategies aborted by a fatal error, a subset of the failed ones
    std::size_t getFatalCount() const
    {
        return mFatalCount;
    }

    // 0 for an empty batch
    double getPassRate() const;

    const std::map<std::string, ValidatorTally>& getValidatorTallies() const
    {
        return mValidatorTallies;
    }

    const std::vector<std::string>& getFailedStrategies() const
    {
        return mFailedStrategies;
    }

    /**
     * @brief Print the summary block
     * @param os Output stream
     */
    void print(std::ostream& os) const;

private:
    std::size_t mTotalCount;
    std::size_t mPassedCount;
    std::size_t mFatalCount;
    std::map<std::string, ValidatorTally> mValidatorTallies;
    std::vector<std::string> mFailedStrategies;
};

} // namespace reporting
} // namespace stratvalidator
