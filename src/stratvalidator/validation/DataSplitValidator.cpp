#include "DataSplitValidator.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include "StatUtils.h"
#include "TimeSeriesException.h"

namespace stratvalidator
{
namespace validation
{

const char* const DataSplitValidator::ValidatorName = "DataSplitValidator";

DataSplitValidator::DataSplitValidator(const DataSplitParameters& parameters,
                                       const CalibrationConstants& calibration)
    : mParameters(parameters),
      mCalibration(calibration),
      mFilter(parameters.strict)
{
}

double DataSplitValidator::computeConsistency(const std::vector<double>& sharpes, double epsilon)
{
    if (sharpes.size() < 2)
        return 0.0;

    const double mean = stratval::StatUtils::computeMean(sharpes);

    // A negative or near-zero mean has no meaningful relative dispersion
    if (!(mean > epsilon))
        return 0.0;

    const double stdDev = stratval::StatUtils::computeSampleStdDev(sharpes);
    const double score = 1.0 - (stdDev / mean);
    return std::min(1.0, std::max(0.0, score));
}

double DataSplitValidator::computeConsistency(const std::vector<double>& sharpes) const
{
    return computeConsistency(sharpes, mParameters.consistencyEpsilon);
}

std::optional<double> DataSplitValidator::computeDegradationRatio(double trainSharpe, double validationSharpe)
{
    if (!(trainSharpe > 0.0))
        return std::nullopt;

    return validationSharpe / trainSharpe;
}

std::optional<double>
DataSplitValidator::extractPeriodSharpe(const std::shared_ptr<const stratval::BacktestReport>& report,
                                        const stratval::DateRange& range,
                                        std::ostream& os) const
{
    const auto filtered = mFilter.restrict(report, range, os);
    const auto returns = filtered.report->getReturnValues();
    if (returns.size() < 2)
        return std::nullopt;

    return stratval::StatUtils::computeSharpeRatio(returns, mCalibration.annualizationFactor);
}

stratval::PerformanceMetrics
DataSplitValidator::extractPeriodMetrics(const std::shared_ptr<const stratval::BacktestReport>& report,
                                         const stratval::DateRange& range,
                                         std::ostream& os) const
{
    const auto filtered = mFilter.restrict(report, range, os);
    return stratval::computePerformanceMetrics(filtered.report->getReturnValues(),
                                               mCalibration.annualizationFactor);
}

DataSplitValidator::PhaseOne
DataSplitValidator::runPhaseOne(const std::shared_ptr<const stratval::BacktestReport>& report,
                                std::ostream& os) const
{
    if (!report)
        throw std::invalid_argument("DataSplitValidator: null report");

    const std::vector<std::pair<std::string, stratval::DateRange>> periods = {
        { "train", mParameters.trainPeriod },
        { "validation", mParameters.validationPeriod },
        { "test", mParameters.testPeriod }
    };

    PhaseOne phase;
    phase.numPeriods = 0;

    for (const auto& [name, range] : periods)
    {
        const auto filtered = mFilter.restrict(report, range, os);
        const auto returns = filtered.report->getReturnValues();
        phase.numPeriods += returns.size();

        PeriodEvaluation evaluation{ name, range, false, std::nullopt, std::nullopt,
                                     filtered.method, filtered.warning };

        if (filtered.warning &&
            std::find(phase.warnings.begin(), phase.warnings.end(),
                      ValidationWarning::UnsupportedFiltering) == phase.warnings.end())
            phase.warnings.push_back(ValidationWarning::UnsupportedFiltering);

        if (returns.size() < 2)
        {
            os << "   [DataSplit] " << name << " period " << range.toString()
               << " skipped: " << returns.size() << " returns\n";
        }
        else
        {
            const double sharpe = stratval::StatUtils::computeSharpeRatio(returns,
                                                                          mCalibration.annualizationFactor);
            evaluation.tested = true;
            evaluation.sharpe = sharpe;
            phase.testedSharpes.push_back(sharpe);

            os << std::fixed << std::setprecision(4)
               << "   [DataSplit] " << name << " period " << range.toString()
               << ": Sharpe=" << sharpe << " (" << returns.size() << " returns)\n";
            os.unsetf(std::ios_base::floatfield);
        }

        phase.periods.push_back(std::move(evaluation));
        phase.restricted.push_back(filtered.report);
    }

    if (phase.testedSharpes.size() < mParameters.minPeriodsTested)
        throw stratval::InsufficientDataException(
            "DataSplitValidator: " + report->getStrategyId() + " has data in " +
            std::to_string(phase.testedSharpes.size()) + " of 3 periods, at least " +
            std::to_string(mParameters.minPeriodsTested) + " required");

    phase.consistency = computeConsistency(phase.testedSharpes);

    os << std::fixed << std::setprecision(4)
       << "   [DataSplit] consistency=" << phase.consistency << "\n";
    os.unsetf(std::ios_base::floatfield);

    return phase;
}

std::string DataSplitValidator::warningText(const PhaseOne& phase) const
{
    std::string text;
    for (const auto& period : phase.periods)
    {
        if (period.warning)
            text += "; " + period.name + ": " + *period.warning;
    }
    return text;
}

DataSplitResult DataSplitValidator::checkConsistency(const std::shared_ptr<const stratval::BacktestReport>& report,
                                                     std::ostream& os) const
{
    auto phase = runPhaseOne(report, os);
    const bool passed = phase.consistency >= mParameters.minConsistency;

    std::ostringstream diagnostic;
    diagnostic << std::fixed << std::setprecision(4)
               << "consistency " << phase.consistency
               << (passed ? " >= " : " < ") << mParameters.minConsistency
               << " over " << phase.testedSharpes.size() << " periods"
               << warningText(phase);

    os << "   [DataSplit] " << (passed ? "✓ consistency pre-check PASS: " : "✗ consistency pre-check FAIL: ")
       << diagnostic.str() << "\n";

    ValidationVerdict verdict(ValidatorName, passed, phase.consistency, mParameters.minConsistency,
                              ThresholdComparison::GreaterOrEqual, phase.numPeriods, diagnostic.str(),
                              phase.warnings);

    return DataSplitResult{ std::move(phase.periods), phase.consistency, std::nullopt,
                            !passed, std::move(verdict) };
}

DataSplitResult DataSplitValidator::validate(const std::shared_ptr<const stratval::BacktestReport>& report,
                                             std::ostream& os) const
{
    auto phase = runPhaseOne(report, os);

    std::ostringstream diagnostic;
    diagnostic << std::fixed << std::setprecision(4);

    if (phase.consistency < mParameters.minConsistency)
    {
        diagnostic << "consistency " << phase.consistency << " < " << mParameters.minConsistency
                   << warningText(phase);
        os << "   [DataSplit] ✗ FAIL: " << diagnostic.str() << "\n";

        ValidationVerdict verdict(ValidatorName, false, phase.consistency, mParameters.minConsistency,
                                  ThresholdComparison::GreaterOrEqual, phase.numPeriods, diagnostic.str(),
                                  phase.warnings);
        return DataSplitResult{ std::move(phase.periods), phase.consistency, std::nullopt,
                                true, std::move(verdict) };
    }

    // Full metrics only for strategies that survived the consistency check
    for (std::size_t i = 0; i < phase.periods.size(); ++i)
    {
        if (phase.periods[i].tested)
            phase.periods[i].metrics = stratval::computePerformanceMetrics(phase.restricted[i]->getReturnValues(),
                                                                           mCalibration.annualizationFactor);
    }

    const auto& train = phase.periods[0];
    const auto& validation = phase.periods[1];

    std::optional<double> degradation;
    if (train.sharpe && validation.sharpe)
        degradation = computeDegradationRatio(*train.sharpe, *validation.sharpe);

    bool passed = true;
    double statistic = validation.sharpe ? *validation.sharpe : 0.0;
    double threshold = mParameters.minValidationSharpe;

    if (!validation.sharpe)
    {
        passed = false;
        diagnostic << "validation period has no data";
    }
    else if (*validation.sharpe < mParameters.minValidationSharpe)
    {
        passed = false;
        diagnostic << "validation Sharpe " << *validation.sharpe << " < " << mParameters.minValidationSharpe;
    }
    else if (degradation && *degradation < mParameters.minDegradationRatio)
    {
        passed = false;
        statistic = *degradation;
        threshold = mParameters.minDegradationRatio;
        diagnostic << "degradation ratio " << *degradation << " < " << mParameters.minDegradationRatio;
    }
    else
    {
        diagnostic << "validation Sharpe " << *validation.sharpe
                   << ", consistency " << phase.consistency;
        if (degradation)
            diagnostic << ", degradation ratio " << *degradation;
        else
            diagnostic << ", degradation ratio not applicable (train Sharpe <= 0 or missing)";
    }
    diagnostic << warningText(phase);

    os << "   [DataSplit] " << (passed ? "✓ PASS: " : "✗ FAIL: ") << diagnostic.str() << "\n";

    ValidationVerdict verdict(ValidatorName, passed, statistic, threshold,
                              ThresholdComparison::GreaterOrEqual, phase.numPeriods, diagnostic.str(),
                              phase.warnings);

    return DataSplitResult{ std::move(phase.periods), phase.consistency, degradation,
                            false, std::move(verdict) };
}

} // namespace validation
} // namespace stratvalidator
