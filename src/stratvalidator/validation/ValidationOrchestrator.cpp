#include "validation/ValidationOrchestrator.h"
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include "BacktestReport.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "StatUtils.h"

namespace stratvalidator
{
namespace validation
{

ValidationOrchestrator::ValidationOrchestrator(const ValidationConfiguration& configuration,
                                               std::shared_ptr<const stratval::MarketUniverse> universe,
                                               std::shared_ptr<BaselineCache> baselineCache)
    : mConfiguration(configuration),
      mExecutor(concurrency::makeExecutor(configuration.getNumThreads())),
      mDataSplit(configuration.getDataSplitParameters(), configuration.getCalibration()),
      mWalkForward(configuration.getWalkForwardParameters(), configuration.getCalibration()),
      mBootstrap(configuration.getBootstrapParameters(), configuration.getCalibration()),
      mMultipleComparison(configuration.getMultipleComparisonParameters(),
                          configuration.getCalibration(),
                          mExecutor),
      mBaselineComparator()
{
    if (universe)
        mBaselineComparator = std::make_unique<BaselineComparator>(configuration.getBaselineParameters(),
                                                                   configuration.getCalibration(),
                                                                   std::move(universe),
                                                                   std::move(baselineCache));
}

stratval::DateRange ValidationOrchestrator::getBaselinePeriod(const stratval::BacktestReport& report) const
{
    const auto* indexed = dynamic_cast<const stratval::DateIndexed*>(&report);
    if (indexed && indexed->getReturnsSeries().size() > 0)
        return stratval::DateRange(indexed->getReturnsSeries().getFirstDate(),
                                   indexed->getReturnsSeries().getLastDate());

    const auto& split = mConfiguration.getDataSplitParameters();
    return stratval::DateRange(split.trainPeriod.getFirstDate(), split.testPeriod.getLastDate());
}

double ValidationOrchestrator::candidateSharpe(const stratval::BacktestReport& report) const
{
    return stratval::StatUtils::computeSharpeRatio(report.getReturnValues(),
                                                   mConfiguration.getCalibration().annualizationFactor);
}

ValidationOrchestrator::StrategyProgress
ValidationOrchestrator::runIndividualChecks(const CandidateStrategy& candidate, std::ostream& os) const
{
    StrategyProgress progress{ {}, std::nullopt, false };
    const std::string& id = candidate.id;
    const char* stage = DataSplitValidator::ValidatorName;

    os << "\n[Orchestrator] Validating " << id << "\n";

    try
    {
        if (!candidate.report)
            throw std::invalid_argument("ValidationOrchestrator: strategy " + id + " has no backtest report");

        const auto& report = *candidate.report;

        // 1. Consistency pre-check and period metrics
        auto split = mDataSplit.validate(candidate.report, os);
        progress.verdicts.push_back(split.verdict);
        if (!split.verdict.passed())
        {
            progress.stopped = true;
            return progress;
        }

        // 2. Walk-forward
        stage = WalkForwardAnalyzer::ValidatorName;
        auto walkForward = mWalkForward.analyze(report, os);
        progress.verdicts.push_back(walkForward.verdict);
        if (!walkForward.verdict.passed())
        {
            progress.stopped = true;
            return progress;
        }

        // 3. Bootstrap confidence interval
        stage = BootstrapValidator::ValidatorName;
        auto bootstrap = mBootstrap.validate(report.getReturnValues(), id, os);
        progress.verdicts.push_back(bootstrap.verdict);
        if (!bootstrap.verdict.passed())
        {
            progress.stopped = true;
            return progress;
        }

        // 4. Passive baselines
        if (mBaselineComparator)
        {
            stage = BaselineComparator::ValidatorName;
            auto comparison = mBaselineComparator->compare(candidateSharpe(report), getBaselinePeriod(report), os);
            progress.verdicts.push_back(comparison.verdict);
            if (!comparison.verdict.passed())
            {
                progress.stopped = true;
                return progress;
            }
        }
        else
        {
            os << "   [Orchestrator] no market universe configured, baseline comparison skipped\n";
        }
    }
    catch (const std::exception& e)
    {
        os << "   [Orchestrator] ✗ " << stage << " aborted " << id << ": " << e.what() << "\n";

        const std::size_t numPeriods = candidate.report ? candidate.report->getNumPeriods() : 0;
        progress.verdicts.emplace_back(stage, false,
                                       std::numeric_limits<double>::quiet_NaN(),
                                       std::numeric_limits<double>::quiet_NaN(),
                                       ThresholdComparison::GreaterOrEqual,
                                       numPeriods,
                                       std::string("fatal: ") + e.what());
        progress.fatalError = e.what();
        progress.stopped = true;
    }

    return progress;
}

void ValidationOrchestrator::applyMultipleComparison(const CandidateStrategy& candidate,
                                                     std::size_t batchSize,
                                                     StrategyProgress& progress,
                                                     std::ostream& os) const
{
    if (progress.stopped)
        return;

    try
    {
        const auto& report = *candidate.report;
        auto verdict = mMultipleComparison.validate(candidateSharpe(report), batchSize,
                                                    report.getNumPeriods(), os);
        progress.stopped = !verdict.passed();
        progress.verdicts.push_back(std::move(verdict));
    }
    catch (const std::exception& e)
    {
        os << "   [Orchestrator] ✗ " << MultipleComparisonCorrector::ValidatorName << " aborted "
           << candidate.id << ": " << e.what() << "\n";

        progress.verdicts.emplace_back(MultipleComparisonCorrector::ValidatorName, false,
                                       std::numeric_limits<double>::quiet_NaN(),
                                       std::numeric_limits<double>::quiet_NaN(),
                                       ThresholdComparison::GreaterThan,
                                       candidate.report->getNumPeriods(),
                                       std::string("fatal: ") + e.what());
        progress.fatalError = e.what();
        progress.stopped = true;
    }
}

StrategyValidationResult ValidationOrchestrator::finish(const CandidateStrategy& candidate,
                                                        StrategyProgress& progress,
                                                        std::ostream& os) const
{
    StrategyValidationResult result(candidate.id, candidate.parameters,
                                    std::move(progress.verdicts), progress.fatalError);

    os << "[Orchestrator] " << (result.overallPassed() ? "✓ " : "✗ ") << candidate.id
       << (result.overallPassed() ? " passed " : " failed after ")
       << result.getVerdicts().size() << " check(s)\n";

    return result;
}

StrategyValidationResult ValidationOrchestrator::validateStrategy(const CandidateStrategy& candidate,
                                                                  std::size_t batchSize,
                                                                  std::ostream& os) const
{
    if (batchSize == 0)
        throw std::invalid_argument("ValidationOrchestrator: batch size must be positive");
    if (!candidate.report)
        throw std::invalid_argument("ValidationOrchestrator: strategy " + candidate.id + " has no backtest report");

    auto progress = runIndividualChecks(candidate, os);
    applyMultipleComparison(candidate, batchSize, progress, os);
    return finish(candidate, progress, os);
}

std::vector<StrategyValidationResult>
ValidationOrchestrator::validateBatch(const std::vector<CandidateStrategy>& candidates, std::ostream& os) const
{
    std::vector<StrategyValidationResult> results;
    if (candidates.empty())
        return results;

    const std::size_t batchSize = candidates.size();
    std::vector<std::ostringstream> logs(batchSize);
    std::vector<std::optional<StrategyProgress>> progress(batchSize);

    os << "[Orchestrator] Validating " << batchSize << " candidate strategies\n";

    concurrency::parallel_for(static_cast<uint32_t>(batchSize), *mExecutor,
                              [&](uint32_t i) {
                                  progress[i] = runIndividualChecks(candidates[i], logs[i]);
                              });

    std::size_t survivors = 0;
    for (std::size_t i = 0; i < batchSize; ++i)
    {
        os << logs[i].str();
        if (!progress[i]->stopped)
            ++survivors;
    }

    os << std::fixed << std::setprecision(4)
       << "\n[Orchestrator] " << survivors << " of " << batchSize
       << " strategies reached the multiple-comparison check (N=" << batchSize
       << ", adjusted alpha=" << mMultipleComparison.adjustedAlpha(batchSize)
       << ", FWER bound=" << mMultipleComparison.familyWiseErrorRate(batchSize) << ")\n";
    os.unsetf(std::ios_base::floatfield);

    results.reserve(batchSize);
    for (std::size_t i = 0; i < batchSize; ++i)
    {
        std::ostringstream log;
        applyMultipleComparison(candidates[i], batchSize, *progress[i], log);
        results.push_back(finish(candidates[i], *progress[i], log));
        os << log.str();
    }

    return results;
}

} // namespace validation
} // namespace stratvalidator
