#include "ValidationTestHelpers.h"
#include <cmath>
#include <map>
#include <random>
#include "randutils.hpp"
#include "StatUtils.h"

namespace stratvalidator
{
namespace testhelpers
{

namespace
{
    bool isWeekday(const date& d)
    {
        const auto dow = d.day_of_week().as_number();
        return dow != boost::gregorian::Saturday && dow != boost::gregorian::Sunday;
    }

    randutils::mt19937_rng makeRng(uint64_t seed)
    {
        randutils::seed_seq_fe128 seeds{ static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32) };
        return randutils::mt19937_rng(seeds);
    }
}

std::vector<double> returnsWithSharpe(std::size_t n, double annualSharpe, double dailyVol, uint64_t seed)
{
    auto rng = makeRng(seed);

    std::vector<double> z(n);
    for (auto& v : z)
        v = rng.variate<double, std::normal_distribution>(0.0, 1.0);

    const double mean = stratval::StatUtils::computeMean(z);
    const double sd = stratval::StatUtils::computeSampleStdDev(z);
    const double dailyMean = annualSharpe * dailyVol / std::sqrt(252.0);

    std::vector<double> returns(n);
    for (std::size_t i = 0; i < n; ++i)
        returns[i] = dailyMean + dailyVol * (z[i] - mean) / sd;

    return returns;
}

std::vector<date> tradingDays(const date& first, std::size_t n)
{
    std::vector<date> days;
    days.reserve(n);
    for (date d = first; days.size() < n; d += boost::gregorian::days(1))
    {
        if (isWeekday(d))
            days.push_back(d);
    }
    return days;
}

std::vector<date> tradingDays(const date& first, const date& last)
{
    std::vector<date> days;
    for (date d = first; d <= last; d += boost::gregorian::days(1))
    {
        if (isWeekday(d))
            days.push_back(d);
    }
    return days;
}

stratval::ReturnsSeries makeSeries(const std::vector<date>& dates, const std::vector<double>& returns)
{
    std::vector<stratval::ReturnsSeriesEntry> entries;
    entries.reserve(returns.size());
    for (std::size_t i = 0; i < returns.size(); ++i)
        entries.emplace_back(dates.at(i), returns[i]);

    return stratval::ReturnsSeries(stratval::TimeFrame::DAILY, std::move(entries));
}

std::shared_ptr<stratval::SeriesBacktestReport> makeReport(const std::string& id,
                                                           const std::vector<date>& dates,
                                                           const std::vector<double>& returns)
{
    return std::make_shared<stratval::SeriesBacktestReport>(id, makeSeries(dates, returns));
}

std::shared_ptr<stratval::SeriesBacktestReport> makeSplitReport(const std::string& id,
                                                                const DataSplitParameters& split,
                                                                double trainSharpe,
                                                                double validationSharpe,
                                                                double testSharpe,
                                                                uint64_t seed)
{
    std::vector<date> dates;
    std::vector<double> returns;

    const std::pair<const DateRange*, double> periods[] = { { &split.trainPeriod, trainSharpe },
                                                            { &split.validationPeriod, validationSharpe },
                                                            { &split.testPeriod, testSharpe } };
    uint64_t periodSeed = seed;
    for (const auto& [range, sharpe] : periods)
    {
        auto days = tradingDays(range->getFirstDate(), range->getLastDate());
        auto r = returnsWithSharpe(days.size(), sharpe, 0.01, periodSeed++);
        dates.insert(dates.end(), days.begin(), days.end());
        returns.insert(returns.end(), r.begin(), r.end());
    }

    return makeReport(id, dates, returns);
}

stratval::MarketUniverse makeUniverse(const std::vector<date>& dates,
                                      std::size_t numSecurities,
                                      const std::string& indexSymbol,
                                      uint64_t seed)
{
    auto rng = makeRng(seed);
    std::map<std::string, stratval::SecurityHistory> securities;

    auto randomWalk = [&](double drift, double vol, double cap) {
        stratval::SecurityHistory history;
        double close = 100.0;
        for (std::size_t t = 0; t < dates.size(); ++t)
        {
            if (t > 0)
                close *= 1.0 + rng.variate<double, std::normal_distribution>(drift, vol);
            history.closes.push_back(close);
            history.marketCaps.push_back(cap * close);
        }
        return history;
    };

    for (std::size_t s = 0; s < numSecurities; ++s)
    {
        const std::string symbol = "S" + std::to_string(1000 + s);
        securities[symbol] = randomWalk(0.0003, 0.01 + 0.002 * static_cast<double>(s % 5),
                                        1e7 * static_cast<double>(s + 1));
    }

    if (!indexSymbol.empty())
        securities[indexSymbol] = randomWalk(0.0003, 0.008, 1e10);

    return stratval::MarketUniverse(dates, securities);
}

} // namespace testhelpers
} // namespace stratvalidator
