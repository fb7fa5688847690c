#include "BaselineComparator.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include "StatUtils.h"

namespace stratvalidator
{
namespace validation
{

const char* const BaselineComparator::ValidatorName = "BaselineComparator";

namespace
{
    constexpr double kVolatilityEpsilon = 1e-8;

    inline double periodReturn(const stratval::SecurityHistory& history, std::size_t t)
    {
        return history.closes[t] / history.closes[t - 1] - 1.0;
    }
}

BaselineComparator::BaselineComparator(const BaselineParameters& parameters,
                                       const CalibrationConstants& calibration,
                                       std::shared_ptr<const stratval::MarketUniverse> universe,
                                       std::shared_ptr<BaselineCache> cache)
    : mParameters(parameters),
      mCalibration(calibration),
      mUniverse(std::move(universe)),
      mCache(std::move(cache))
{
    if (!mUniverse)
        throw std::invalid_argument("BaselineComparator: market universe must not be null");
    if (mParameters.topN == 0)
        throw std::invalid_argument("BaselineComparator: topN must be positive");
    if (mParameters.volatilityLookback < 2)
        throw std::invalid_argument("BaselineComparator: volatility lookback must be at least 2");

    if (!mCache)
        mCache = mParameters.cacheDirectory.empty() ? std::make_shared<BaselineCache>()
                                                    : std::make_shared<BaselineCache>(mParameters.cacheDirectory);
}

std::vector<double> BaselineComparator::buyAndHoldReturns(const stratval::MarketUniverse& universe,
                                                          std::size_t first,
                                                          std::size_t last,
                                                          const std::string& indexSymbol,
                                                          std::optional<std::string>& warning)
{
    std::vector<double> returns;
    const std::size_t start = std::max<std::size_t>(first, 1);
    if (last <= start)
        return returns;

    returns.reserve(last - start);

    if (universe.hasSymbol(indexSymbol))
    {
        const auto& index = universe.getSecurity(indexSymbol);
        for (std::size_t t = start; t < last; ++t)
            returns.push_back(periodReturn(index, t));
        return returns;
    }

    if (universe.getNumSecurities() == 0)
        throw BaselineException("BaselineComparator: index " + indexSymbol +
                                " not found and the universe is empty");

    warning = "index symbol " + indexSymbol + " not in universe; using the average return of " +
        std::to_string(universe.getNumSecurities()) + " securities as proxy";

    const auto symbols = universe.getSymbols();
    for (std::size_t t = start; t < last; ++t)
    {
        double sum = 0.0;
        for (const auto& symbol : symbols)
            sum += periodReturn(universe.getSecurity(symbol), t);
        returns.push_back(sum / static_cast<double>(symbols.size()));
    }

    return returns;
}

std::vector<double> BaselineComparator::equalWeightTopNReturns(const stratval::MarketUniverse& universe,
                                                               std::size_t first,
                                                               std::size_t last,
                                                               std::size_t topN)
{
    std::vector<double> returns;
    const std::size_t start = std::max<std::size_t>(first, 1);
    if (last <= start)
        return returns;

    const auto symbols = universe.getSymbols();
    std::vector<std::pair<double, const stratval::SecurityHistory*>> ranked;
    ranked.reserve(symbols.size());

    for (std::size_t t = start; t < last; ++t)
    {
        ranked.clear();
        for (const auto& symbol : symbols)
        {
            const auto& history = universe.getSecurity(symbol);
            const double cap = history.marketCaps[t - 1];
            if (cap > 0.0)
                ranked.emplace_back(cap, &history);
        }

        if (ranked.empty())
            continue;

        // Largest names as of the previous close
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const auto& a, const auto& b) { return a.first > b.first; });

        const std::size_t held = std::min(topN, ranked.size());
        double sum = 0.0;
        for (std::size_t k = 0; k < held; ++k)
            sum += periodReturn(*ranked[k].second, t);

        returns.push_back(sum / static_cast<double>(held));
    }

    return returns;
}

std::vector<double> BaselineComparator::riskParityReturns(const stratval::MarketUniverse& universe,
                                                          std::size_t first,
                                                          std::size_t last,
                                                          std::size_t lookback)
{
    std::vector<double> returns;
    const auto symbols = universe.getSymbols();
    if (symbols.empty())
        return returns;

    std::vector<double> window(lookback);
    std::vector<double> inverseVol(symbols.size());

    // Weights for day t use the lookback returns ending at t - 1; the first
    // full window ends at index lookback
    const std::size_t start = std::max<std::size_t>(first, lookback + 1);

    for (std::size_t t = start; t < last; ++t)
    {
        double totalInverse = 0.0;
        for (std::size_t s = 0; s < symbols.size(); ++s)
        {
            const auto& history = universe.getSecurity(symbols[s]);
            for (std::size_t k = 0; k < lookback; ++k)
                window[k] = periodReturn(history, t - lookback + k);

            const double vol = stratval::StatUtils::computeSampleStdDev(window);
            inverseVol[s] = 1.0 / (vol + kVolatilityEpsilon);
            totalInverse += inverseVol[s];
        }

        double portfolioReturn = 0.0;
        for (std::size_t s = 0; s < symbols.size(); ++s)
            portfolioReturn += (inverseVol[s] / totalInverse) * periodReturn(universe.getSecurity(symbols[s]), t);

        returns.push_back(portfolioReturn);
    }

    return returns;
}

BaselineResult BaselineComparator::computeBaseline(BaselineType type, const stratval::DateRange& period) const
{
    const auto [first, last] = mUniverse->getIndexRange(period);

    std::optional<std::string> warning;
    std::vector<double> returns;

    switch (type)
    {
        case BaselineType::BuyAndHold:
            returns = buyAndHoldReturns(*mUniverse, first, last, mParameters.indexSymbol, warning);
            break;
        case BaselineType::EqualWeightTopN:
            returns = equalWeightTopNReturns(*mUniverse, first, last, mParameters.topN);
            break;
        case BaselineType::RiskParity:
            returns = riskParityReturns(*mUniverse, first, last, mParameters.volatilityLookback);
            break;
        default:
            throw std::invalid_argument("BaselineComparator: unknown baseline type");
    }

    if (returns.size() < 2)
        throw BaselineException("BaselineComparator: " + getBaselineTypeString(type) + " has " +
                                std::to_string(returns.size()) + " returns in " + period.toString());

    return BaselineResult{ type,
                           stratval::computePerformanceMetrics(returns, mCalibration.annualizationFactor),
                           warning };
}

BaselineResult BaselineComparator::getBaseline(BaselineType type, const stratval::DateRange& period) const
{
    return mCache->getOrCompute(mUniverse->getFingerprint(), period, type,
                                [this, type, &period]() { return computeBaseline(type, period); });
}

BaselineComparison BaselineComparator::compare(double candidateSharpe,
                                               const stratval::DateRange& period,
                                               std::ostream& os) const
{
    static const BaselineType kTypes[] = { BaselineType::BuyAndHold,
                                           BaselineType::EqualWeightTopN,
                                           BaselineType::RiskParity };

    std::vector<BaselineImprovement> improvements;
    std::string skipped;
    std::string notes;

    os << std::fixed << std::setprecision(4)
       << "   [Baseline] candidate Sharpe=" << candidateSharpe << " over " << period.toString() << "\n";

    for (auto type : kTypes)
    {
        try
        {
            const auto baseline = getBaseline(type, period);
            const double baselineSharpe = baseline.metrics.getSharpeRatio();
            improvements.push_back(BaselineImprovement{ type, baselineSharpe,
                                                        candidateSharpe - baselineSharpe,
                                                        baseline.metrics.getWinRate() });

            os << "   [Baseline] " << getBaselineTypeString(type) << ": Sharpe=" << baselineSharpe
               << " win rate~" << baseline.metrics.getWinRate()
               << " improvement=" << std::showpos << (candidateSharpe - baselineSharpe)
               << std::noshowpos << "\n";

            if (baseline.warning)
            {
                os << "   [Baseline] Warning: " << *baseline.warning << "\n";
                notes += "; " + *baseline.warning;
            }
        }
        catch (const BaselineException& e)
        {
            os << "   [Baseline] " << getBaselineTypeString(type) << " skipped: " << e.what() << "\n";
            skipped += "; " + getBaselineTypeString(type) + " skipped";
        }
    }
    os.unsetf(std::ios_base::floatfield);

    if (improvements.empty())
        throw BaselineException("BaselineComparator: no baseline could be computed for " + period.toString());

    auto best = std::max_element(improvements.begin(), improvements.end(),
                                 [](const auto& a, const auto& b) { return a.improvement < b.improvement; });
    auto worst = std::min_element(improvements.begin(), improvements.end(),
                                  [](const auto& a, const auto& b) { return a.improvement < b.improvement; });

    const double bestImprovement = best->improvement;
    const double worstImprovement = worst->improvement;
    const BaselineType bestBaseline = best->type;
    const BaselineType worstBaseline = worst->type;

    const bool beatsOne = bestImprovement > mParameters.minImprovement;
    const bool noCatastrophe = worstImprovement > mParameters.catastrophicImprovement;
    const bool passed = beatsOne && noCatastrophe;

    std::ostringstream diagnostic;
    diagnostic << std::fixed << std::setprecision(4)
               << "best improvement " << bestImprovement << " vs " << getBaselineTypeString(bestBaseline)
               << ", worst " << worstImprovement << " vs " << getBaselineTypeString(worstBaseline);
    if (!beatsOne)
        diagnostic << "; does not beat any baseline by more than " << mParameters.minImprovement;
    if (!noCatastrophe)
        diagnostic << "; underperforms " << getBaselineTypeString(worstBaseline) << " by "
                   << -worstImprovement << " (limit " << -mParameters.catastrophicImprovement << ")";
    diagnostic << skipped << notes;

    os << "   [Baseline] " << (passed ? "✓ PASS: " : "✗ FAIL: ") << diagnostic.str() << "\n";

    const auto indexRange = mUniverse->getIndexRange(period);
    ValidationVerdict verdict(ValidatorName, passed, bestImprovement, mParameters.minImprovement,
                              ThresholdComparison::GreaterThan, indexRange.second - indexRange.first,
                              diagnostic.str());

    return BaselineComparison{ std::move(improvements), bestImprovement, worstImprovement,
                               bestBaseline, worstBaseline, std::move(verdict) };
}

} // namespace validation
} // namespace stratvalidator
