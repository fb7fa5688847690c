#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "DateRange.h"
#include "IParallelExecutor.h"
#include "MarketUniverse.h"
#include "ValidationConfiguration.h"
#include "validation/BaselineCache.h"
#include "validation/BaselineComparator.h"
#include "validation/BootstrapValidator.h"
#include "validation/DataSplitValidator.h"
#include "validation/MultipleComparisonCorrector.h"
#include "validation/ValidationTypes.h"
#include "validation/WalkForwardAnalyzer.h"

namespace stratvalidator
{
namespace validation
{

/**
 * @brief Runs the validators for one strategy or a whole batch of candidates.
 *
 * Checks run in ascending cost order:
 *   1. DataSplit (consistency pre-check first, then the period metrics)
 *   2. WalkForward
 *   3. Bootstrap
 *   4. Baseline (only when a market universe is supplied)
 *   5. MultipleComparison, with N = batch size and T = the strategy's period count
 *
 * A strategy stops at its first failed check. Every verdict produced up to that
 * point is kept. A fatal error (insufficient data, unsupported filtering in
 * strict mode, an unusable baseline) ends only that strategy's validation and
 * is recorded as a failed verdict of the check that raised it.
 *
 * In a batch the per-strategy checks run in parallel on the orchestrator's
 * executor, each strategy logging into its own buffer. Buffers are flushed in
 * batch order. The multiple-comparison step runs afterwards on the calling
 * thread, since it depends on the size of the whole batch.
 */
class ValidationOrchestrator
{
public:
    /**
     * @param universe Market universe for the baseline comparison; the check is skipped when null.
     * @param baselineCache Shared baseline store; a private one is created when null.
     */
    ValidationOrchestrator(const ValidationConfiguration& configuration,
                           std::shared_ptr<const stratval::MarketUniverse> universe = nullptr,
                           std::shared_ptr<BaselineCache> baselineCache = nullptr);

    /**
     * @brief Validate one strategy as a member of a batch of batchSize candidates
     * @throws std::invalid_argument if batchSize is 0 or the candidate has no report
     */
    StrategyValidationResult validateStrategy(const CandidateStrategy& candidate,
                                              std::size_t batchSize,
                                              std::ostream& os) const;

    /**
     * @brief Validate every candidate; results are in input order
     */
    std::vector<StrategyValidationResult> validateBatch(const std::vector<CandidateStrategy>& candidates,
                                                        std::ostream& os) const;

    /**
     * @brief Period the baselines are computed over for a report
     *
     * The calendar span of a date-indexed report, otherwise the span from the
     * start of the train period to the end of the test period.
     */
    stratval::DateRange getBaselinePeriod(const stratval::BacktestReport& report) const;

    bool hasBaselineComparator() const
    {
        return static_cast<bool>(mBaselineComparator);
    }

    const MultipleComparisonCorrector& getMultipleComparisonCorrector() const
    {
        return mMultipleComparison;
    }

private:
    struct StrategyProgress
    {
        std::vector<ValidationVerdict> verdicts;
        std::optional<std::string> fatalError;
        bool stopped;                 ///< A check failed or raised
    };

    // Checks 1-4; the multiple-comparison check is applied by the caller
    StrategyProgress runIndividualChecks(const CandidateStrategy& candidate, std::ostream& os) const;

    void applyMultipleComparison(const CandidateStrategy& candidate,
                                 std::size_t batchSize,
                                 StrategyProgress& progress,
                                 std::ostream& os) const;

    StrategyValidationResult finish(const CandidateStrategy& candidate,
                                    StrategyProgress& progress,
                                    std::ostream& os) const;

    double candidateSharpe(const stratval::BacktestReport& report) const;

    ValidationConfiguration mConfiguration;
    std::shared_ptr<concurrency::IParallelExecutor> mExecutor;
    DataSplitValidator mDataSplit;
    WalkForwardAnalyzer mWalkForward;
    BootstrapValidator mBootstrap;
    MultipleComparisonCorrector mMultipleComparison;
    std::unique_ptr<BaselineComparator> mBaselineComparator;
};

} // namespace validation
} // namespace stratvalidator
