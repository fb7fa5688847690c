#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "BacktestReport.h"
#include "DateRange.h"
#include "PerformanceMetrics.h"
#include "ReportPeriodFilter.h"
#include "ValidationConfiguration.h"
#include "validation/ValidationTypes.h"

namespace stratvalidator
{
namespace validation
{

struct PeriodEvaluation
{
    std::string name;                          ///< "train", "validation" or "test"
    stratval::DateRange range;
    bool tested;                               ///< False when the period held fewer than 2 returns
    std::optional<double> sharpe;
    std::optional<stratval::PerformanceMetrics> metrics;  ///< Filled only in the second phase
    stratval::FilterMethod filterMethod;
    std::optional<std::string> warning;
};

struct DataSplitResult
{
    std::vector<PeriodEvaluation> periods;     ///< train, validation, test in that order
    double consistency;
    std::optional<double> degradationRatio;    ///< Empty when the train Sharpe is not positive
    bool shortCircuited;                       ///< Consistency failed before metric extraction
    ValidationVerdict verdict;
};

/**
 * @brief Temporal split validation over disjoint train, validation and test periods.
 *
 * The report is restricted to each period through ReportPeriodFilter. In
 * strict mode an unfilterable report raises UnsupportedFilteringException;
 * otherwise every warning is carried into the verdict.
 *
 * Checks, cheapest first:
 *   1. consistency of the period Sharpe ratios >= minConsistency (short-circuits)
 *   2. validation Sharpe >= minValidationSharpe
 *   3. validation / train Sharpe >= minDegradationRatio, when train Sharpe > 0
 */
class DataSplitValidator
{
public:
    static const char* const ValidatorName;

    DataSplitValidator(const DataSplitParameters& parameters,
                       const CalibrationConstants& calibration);

    /**
     * @brief 1 - stdev / mean of the period Sharpe ratios, clamped to [0, 1]
     *
     * Forced to 0 when the mean is at or below epsilon, so that consistently
     * losing strategies never look stable. Fewer than two values give 0.
     */
    static double computeConsistency(const std::vector<double>& sharpes, double epsilon);

    double computeConsistency(const std::vector<double>& sharpes) const;

    // validation / train, empty when trainSharpe <= 0
    static std::optional<double> computeDegradationRatio(double trainSharpe, double validationSharpe);

    /**
     * @brief Annualized Sharpe of the report restricted to range
     *
     * Empty when the restricted report holds fewer than two returns.
     * @throws stratval::UnsupportedFilteringException in strict mode for unfilterable reports
     */
    std::optional<double> extractPeriodSharpe(const std::shared_ptr<const stratval::BacktestReport>& report,
                                              const stratval::DateRange& range,
                                              std::ostream& os) const;

    /**
     * @throws stratval::UnsupportedFilteringException in strict mode for unfilterable reports
     */
    stratval::PerformanceMetrics extractPeriodMetrics(const std::shared_ptr<const stratval::BacktestReport>& report,
                                                      const stratval::DateRange& range,
                                                      std::ostream& os) const;

    /**
     * @brief Cheap first phase only: per-period Sharpe ratios and consistency
     *
     * The verdict passes when consistency reaches minConsistency.
     * @throws stratval::InsufficientDataException if fewer than minPeriodsTested periods hold data
     */
    DataSplitResult checkConsistency(const std::shared_ptr<const stratval::BacktestReport>& report,
                                     std::ostream& os) const;

    /**
     * @throws stratval::InsufficientDataException if fewer than minPeriodsTested periods hold data
     */
    DataSplitResult validate(const std::shared_ptr<const stratval::BacktestReport>& report,
                             std::ostream& os) const;

    const DataSplitParameters& getParameters() const
    {
        return mParameters;
    }

private:
    struct PhaseOne
    {
        std::vector<PeriodEvaluation> periods;
        std::vector<std::shared_ptr<const stratval::BacktestReport>> restricted;
        std::vector<ValidationWarning> warnings;
        std::vector<double> testedSharpes;
        double consistency;
        std::size_t numPeriods;
    };

    PhaseOne runPhaseOne(const std::shared_ptr<const stratval::BacktestReport>& report,
                         std::ostream& os) const;

    std::string warningText(const PhaseOne& phase) const;

private:
    DataSplitParameters mParameters;
    CalibrationConstants mCalibration;
    stratval::ReportPeriodFilter mFilter;
};

} // namespace validation
} // namespace stratvalidator
