#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "DateRange.h"
#include "MarketUniverse.h"
#include "PerformanceMetrics.h"
#include "TimeSeriesException.h"
#include "ValidationConfiguration.h"
#include "validation/BaselineCache.h"
#include "validation/ValidationTypes.h"

namespace stratvalidator
{
namespace validation
{

class BaselineException : public stratval::TimeSeriesException
{
public:
    explicit BaselineException(const std::string& msg)
        : stratval::TimeSeriesException(msg)
    {}
};

struct BaselineImprovement
{
    BaselineType type;
    double baselineSharpe;
    double improvement;        ///< candidate Sharpe - baseline Sharpe
    double baselineWinRate;    ///< Share of positive periods, diagnostic only
};

struct BaselineComparison
{
    std::vector<BaselineImprovement> improvements;
    double bestImprovement;
    double worstImprovement;
    BaselineType bestBaseline;
    BaselineType worstBaseline;
    ValidationVerdict verdict;
};

/**
 * @brief Compares a candidate's Sharpe with passive reference strategies.
 *
 * Baselines over a period of the market universe:
 *   - BuyAndHold: the index symbol; the equal-weighted average return of all
 *     securities stands in when the symbol is absent (with a warning)
 *   - EqualWeightTopN: the N largest names by the previous day's market cap
 *   - RiskParity: weights proportional to 1 / (rolling volatility + 1e-8),
 *     set from the previous day's volatility estimates
 *
 * Positions are always formed from information available on the previous
 * trading day. Baseline metrics are cached per (universe, period, type).
 *
 * Passes when the candidate beats the best baseline by more than
 * minImprovement AND trails no baseline by catastrophicImprovement or more.
 */
class BaselineComparator
{
public:
    static const char* const ValidatorName;

    /**
     * @param cache Shared store for baseline metrics; when null a private cache is created,
     *              backed by parameters.cacheDirectory when that is set.
     * @throws std::invalid_argument if universe is null
     */
    BaselineComparator(const BaselineParameters& parameters,
                       const CalibrationConstants& calibration,
                       std::shared_ptr<const stratval::MarketUniverse> universe,
                       std::shared_ptr<BaselineCache> cache = nullptr);

    /**
     * @brief Uncached baseline metrics
     * @throws BaselineException if the period holds too few universe dates
     */
    BaselineResult computeBaseline(BaselineType type, const stratval::DateRange& period) const;

    BaselineResult getBaseline(BaselineType type, const stratval::DateRange& period) const;

    BaselineComparison compare(double candidateSharpe,
                               const stratval::DateRange& period,
                               std::ostream& os) const;

    // Baseline return into each universe index in [first, last). Returns and
    // volatility windows draw on universe history before first when it exists;
    // only dates too close to the start of the universe are left out.
    static std::vector<double> buyAndHoldReturns(const stratval::MarketUniverse& universe,
                                                 std::size_t first,
                                                 std::size_t last,
                                                 const std::string& indexSymbol,
                                                 std::optional<std::string>& warning);

    static std::vector<double> equalWeightTopNReturns(const stratval::MarketUniverse& universe,
                                                      std::size_t first,
                                                      std::size_t last,
                                                      std::size_t topN);

    static std::vector<double> riskParityReturns(const stratval::MarketUniverse& universe,
                                                 std::size_t first,
                                                 std::size_t last,
                                                 std::size_t lookback);

    const BaselineCache& getCache() const
    {
        return *mCache;
    }

    const stratval::MarketUniverse& getUniverse() const
    {
        return *mUniverse;
    }

private:
    BaselineParameters mParameters;
    CalibrationConstants mCalibration;
    std::shared_ptr<const stratval::MarketUniverse> mUniverse;
    std::shared_ptr<BaselineCache> mCache;
};

} // namespace validation
} // namespace stratvalidator
