#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "BacktestReport.h"

namespace stratvalidator
{
namespace validation
{

/**
 * @brief Non-fatal conditions attached to a verdict instead of being thrown
 */
enum class ValidationWarning
{
    DegradedBootstrap,      ///< Too few resamples produced a finite statistic
    AssumptionDivergence,   ///< Parametric and bootstrap thresholds disagree by an order of magnitude
    UnsupportedFiltering    ///< A report could not be restricted to a sub-period
};

/**
 * @brief Name used in logs and serialized output, e.g. "DegradedBootstrapWarning"
 */
std::string getValidationWarningString(ValidationWarning warning);

/**
 * @brief How a verdict's statistic was compared with its threshold
 */
enum class ThresholdComparison
{
    GreaterThan,
    GreaterOrEqual,
    LessThan
};

/**
 * @brief Label of the comparison, e.g. "statistic > threshold"
 */
std::string getThresholdComparisonString(ThresholdComparison comparison);

/**
 * @brief Immutable outcome of one validator for one strategy.
 *
 * A verdict is always a threshold comparison. It never carries a p-value.
 */
class ValidationVerdict
{
public:
    ValidationVerdict(const std::string& validatorName,
                      bool passed,
                      double statistic,
                      double threshold,
                      ThresholdComparison comparison,
                      std::size_t numPeriods,
                      const std::string& diagnostic,
                      std::vector<ValidationWarning> warnings = {});

    const std::string& getValidatorName() const { return mValidatorName; }
    bool passed() const { return mPassed; }
    double getStatistic() const { return mStatistic; }
    double getThreshold() const { return mThreshold; }
    ThresholdComparison getComparison() const { return mComparison; }
    std::size_t getNumPeriods() const { return mNumPeriods; }
    const std::string& getDiagnostic() const { return mDiagnostic; }
    const std::vector<ValidationWarning>& getWarnings() const { return mWarnings; }

    bool hasWarning(ValidationWarning warning) const;

    std::string getComparisonLabel() const
    {
        return getThresholdComparisonString(mComparison);
    }

private:
    std::string mValidatorName;
    bool mPassed;
    double mStatistic;
    double mThreshold;
    ThresholdComparison mComparison;
    std::size_t mNumPeriods;
    std::string mDiagnostic;
    std::vector<ValidationWarning> mWarnings;
};

/**
 * @brief A strategy handed to the orchestrator: id, declared parameters and its report.
 *
 * The parameters are carried through for attribution only.
 */
struct CandidateStrategy
{
    std::string id;
    std::map<std::string, std::string> parameters;
    std::shared_ptr<const stratval::BacktestReport> report;
};

/**
 * @brief Aggregate outcome for one strategy across the checks that ran
 */
class StrategyValidationResult
{
public:
    StrategyValidationResult(const std::string& strategyId,
                             const std::map<std::string, std::string>& parameters,
                             std::vector<ValidationVerdict> verdicts,
                             std::optional<std::string> fatalError);

    const std::string& getStrategyId() const { return mStrategyId; }
    const std::map<std::string, std::string>& getParameters() const { return mParameters; }
    const std::vector<ValidationVerdict>& getVerdicts() const { return mVerdicts; }
    const std::optional<std::string>& getFatalError() const { return mFatalError; }

    // Passed only when no fatal error occurred and every check that ran passed
    bool overallPassed() const { return mOverallPassed; }

    std::vector<std::string> getChecksRun() const;

    // nullptr when the named validator did not run
    const ValidationVerdict* findVerdict(const std::string& validatorName) const;

private:
    std::string mStrategyId;
    std::map<std::string, std::string> mParameters;
    std::vector<ValidationVerdict> mVerdicts;
    std::optional<std::string> mFatalError;
    bool mOverallPassed;
};

} // namespace validation
} // namespace stratvalidator
