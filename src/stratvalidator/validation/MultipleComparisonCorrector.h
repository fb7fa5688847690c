#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "IParallelExecutor.h"
#include "ValidationConfiguration.h"
#include "validation/ValidationTypes.h"

namespace stratvalidator
{
namespace validation
{

/**
 * @brief Both significance thresholds for one (N, T) pair and which one governs
 */
struct ThresholdAssessment
{
    std::size_t numCandidates;
    std::size_t numPeriods;
    double adjustedAlpha;                     ///< alpha / N
    double zScore;                            ///< Two-tailed critical value at adjustedAlpha
    double rawParametricThreshold;            ///< z / sqrt(T)
    double parametricThreshold;               ///< max(raw, conservative floor)
    std::optional<double> bootstrapThreshold; ///< Empty when disabled or degraded
    std::optional<double> divergenceRatio;    ///< max/min of the two thresholds
    bool divergent;
    double governingThreshold;
    std::vector<ValidationWarning> warnings;
};

struct BatchSignificance
{
    std::size_t numCandidates;
    std::size_t numSignificant;
    double adjustedAlpha;
    double familyWiseErrorRate;
    double expectedFalseDiscoveries;          ///< N * adjustedAlpha
    double estimatedFalseDiscoveryRate;       ///< expected / significant, 0 when none
    std::vector<std::pair<std::string, ValidationVerdict>> verdicts;
};

/**
 * @brief Bonferroni-style control of the family-wise error rate across N candidates.
 *
 * Parametric threshold: the two-tailed critical value at alpha / N scaled by
 * 1 / sqrt(T), then raised to a conservative floor since
 * Sharpe ratios of fat tailed returns are not normally distributed.
 *
 * Bootstrap threshold: synthetic zero-mean return series at the calibrated
 * market volatility are block resampled; the (1 - alpha / N) quantile of the
 * absolute annualized Sharpe ratios is the empirical threshold. When the two
 * thresholds differ by more than divergenceFactor the stricter one governs
 * and an AssumptionDivergenceWarning is raised. Otherwise the floored
 * parametric threshold governs.
 *
 * Null Sharpe distributions depend only on T, so they are computed once per
 * T and cached. The corrector is safe to share between threads.
 */
class MultipleComparisonCorrector
{
public:
    static const char* const ValidatorName;

    /**
     * @param executor Runs the null resamples; a SingleThreadExecutor is used when null.
     * @param nullSeed Master seed of the synthetic null series.
     */
    MultipleComparisonCorrector(const MultipleComparisonParameters& parameters,
                                const CalibrationConstants& calibration,
                                std::shared_ptr<concurrency::IParallelExecutor> executor = nullptr,
                                uint64_t nullSeed = 0x5eed5eedULL);

    /**
     * @throws std::invalid_argument if numCandidates is 0
     */
    double adjustedAlpha(std::size_t numCandidates) const;

    double rawParametricThreshold(std::size_t numCandidates, std::size_t numPeriods) const;

    // Raw parametric threshold clamped to the conservative floor
    double parametricThreshold(std::size_t numCandidates, std::size_t numPeriods) const;

    /**
     * @brief Empirical threshold from the synthetic null; empty if the null bootstrap degraded
     */
    std::optional<double> bootstrapThreshold(std::size_t numCandidates, std::size_t numPeriods) const;

    ThresholdAssessment computeThresholds(std::size_t numCandidates,
                                          std::size_t numPeriods,
                                          std::ostream& os) const;

    bool isSignificant(double sharpe, double threshold) const;

    // 1 - (1 - alpha / N)^N
    double familyWiseErrorRate(std::size_t numCandidates) const;

    /**
     * @brief Verdict for one strategy tested as one of numCandidates
     *
     * Passes when the strategy's annualized Sharpe exceeds the governing
     * threshold. Losing strategies never pass, however large |Sharpe| is.
     */
    ValidationVerdict validate(double sharpe,
                               std::size_t numCandidates,
                               std::size_t numPeriods,
                               std::ostream& os) const;

    /**
     * @brief Significance of a whole batch sharing one period count
     *
     * A strategy counts as significant when |Sharpe| exceeds the governing threshold.
     */
    BatchSignificance validateBatch(const std::vector<std::pair<std::string, double>>& sharpes,
                                    std::size_t numPeriods,
                                    std::ostream& os) const;

    const MultipleComparisonParameters& getParameters() const
    {
        return mParameters;
    }

private:
    // Finite |Sharpe| null replicates for T periods, empty if degraded
    std::shared_ptr<const std::vector<double>> getNullDistribution(std::size_t numPeriods) const;

    std::shared_ptr<const std::vector<double>> computeNullDistribution(std::size_t numPeriods) const;

    ValidationVerdict buildVerdict(double sharpe,
                                   const ThresholdAssessment& assessment,
                                   std::ostream& os) const;

private:
    MultipleComparisonParameters mParameters;
    CalibrationConstants mCalibration;
    std::shared_ptr<concurrency::IParallelExecutor> mExecutor;
    uint64_t mNullSeed;

    mutable std::mutex mNullMutex;
    mutable std::map<std::size_t, std::shared_ptr<const std::vector<double>>> mNullDistributions;
};

} // namespace validation
} // namespace stratvalidator
