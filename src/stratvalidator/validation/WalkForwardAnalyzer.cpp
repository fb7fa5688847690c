#include "WalkForwardAnalyzer.h"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include "StatUtils.h"
#include "TimeSeriesException.h"

namespace stratvalidator
{
namespace validation
{

using boost::accumulators::accumulator_set;
using boost::accumulators::stats;
namespace tag = boost::accumulators::tag;

const char* const WalkForwardAnalyzer::ValidatorName = "WalkForwardAnalyzer";

WalkForwardAnalyzer::WalkForwardAnalyzer(const WalkForwardParameters& parameters,
                                         const CalibrationConstants& calibration)
    : mParameters(parameters),
      mCalibration(calibration)
{
    if (mParameters.trainingWindow == 0 || mParameters.testingWindow == 0)
        throw std::invalid_argument("WalkForwardAnalyzer: window lengths must be positive");
    if (mParameters.minWindows == 0)
        throw std::invalid_argument("WalkForwardAnalyzer: minWindows must be positive");
}

std::vector<WalkForwardWindowBounds>
WalkForwardAnalyzer::computeWindowBounds(std::size_t numPeriods,
                                         std::size_t trainingWindow,
                                         std::size_t testingWindow)
{
    if (trainingWindow == 0 || testingWindow == 0)
        throw std::invalid_argument("WalkForwardAnalyzer::computeWindowBounds: window lengths must be positive");

    std::vector<WalkForwardWindowBounds> bounds;
    const std::size_t span = trainingWindow + testingWindow;

    std::size_t position = 0;
    while (numPeriods >= span && position <= numPeriods - span)
    {
        const std::size_t testBegin = position + trainingWindow;
        const std::size_t testEnd = testBegin + testingWindow;
        bounds.push_back(WalkForwardWindowBounds{ position, testBegin, testBegin, testEnd });

        // Next training slice begins after this window's test slice
        position = testEnd;
    }

    return bounds;
}

WalkForwardResult WalkForwardAnalyzer::analyze(const stratval::ReturnsSeries& series,
                                               std::ostream& os) const
{
    return analyzeReturns(series.getReturnValues(), &series.getDateTimes(), os);
}

WalkForwardResult WalkForwardAnalyzer::analyze(const stratval::BacktestReport& report,
                                               std::ostream& os) const
{
    const auto* indexed = dynamic_cast<const stratval::DateIndexed*>(&report);
    if (indexed != nullptr)
        return analyze(indexed->getReturnsSeries(), os);

    return analyzeReturns(report.getReturnValues(), nullptr, os);
}

WalkForwardResult WalkForwardAnalyzer::analyzeReturns(const std::vector<double>& returns,
                                                      const std::vector<boost::posix_time::ptime>* dates,
                                                      std::ostream& os) const
{
    const auto bounds = computeWindowBounds(returns.size(),
                                            mParameters.trainingWindow,
                                            mParameters.testingWindow);

    if (bounds.empty())
        throw stratval::InsufficientDataException(
            "WalkForwardAnalyzer: " + std::to_string(returns.size()) +
            " periods cannot hold one window of " + std::to_string(mParameters.trainingWindow) +
            " training + " + std::to_string(mParameters.testingWindow) + " testing periods");

    os << "   [WalkForward] " << bounds.size() << " windows over " << returns.size()
       << " periods (train=" << mParameters.trainingWindow
       << ", test=" << mParameters.testingWindow << ")\n";

    const double ppy = mCalibration.annualizationFactor;

    std::vector<WalkForwardWindow> windows;
    windows.reserve(bounds.size());

    std::vector<double> testSharpes;
    testSharpes.reserve(bounds.size());

    accumulator_set<double, stats<tag::count, tag::mean, tag::min, tag::max>> testAcc;
    accumulator_set<double, stats<tag::mean>> trainAcc;
    std::size_t positiveWindows = 0;

    for (std::size_t w = 0; w < bounds.size(); ++w)
    {
        const auto& b = bounds[w];

        std::vector<double> trainSlice(returns.begin() + b.trainBegin, returns.begin() + b.trainEnd);
        std::vector<double> testSlice(returns.begin() + b.testBegin, returns.begin() + b.testEnd);

        std::optional<stratval::DateRange> trainDates;
        std::optional<stratval::DateRange> testDates;
        if (dates != nullptr)
        {
            trainDates = stratval::DateRange((*dates)[b.trainBegin], (*dates)[b.trainEnd - 1]);
            testDates = stratval::DateRange((*dates)[b.testBegin], (*dates)[b.testEnd - 1]);
        }

        auto trainMetrics = stratval::computePerformanceMetrics(trainSlice, ppy);
        auto testMetrics = stratval::computePerformanceMetrics(testSlice, ppy);

        const double testSharpe = testMetrics.getSharpeRatio();
        testSharpes.push_back(testSharpe);
        testAcc(testSharpe);
        trainAcc(trainMetrics.getSharpeRatio());
        if (testSharpe > 0.0)
            ++positiveWindows;

        os << "      Window " << (w + 1) << ": train [" << b.trainBegin << ", " << b.trainEnd
           << ") test [" << b.testBegin << ", " << b.testEnd << ")";
        if (testDates)
            os << " " << testDates->toString();
        os << std::fixed << std::setprecision(4)
           << "  train Sharpe=" << trainMetrics.getSharpeRatio()
           << "  test Sharpe=" << testSharpe << "\n";
        os.unsetf(std::ios_base::floatfield);

        windows.push_back(WalkForwardWindow{ w, b, trainDates, testDates, trainMetrics, testMetrics });
    }

    const double meanTest = boost::accumulators::mean(testAcc);
    const double medianTest = stratval::StatUtils::computeMedian(testSharpes);
    const double stdTest = (testSharpes.size() > 1) ? stratval::StatUtils::computeSampleStdDev(testSharpes) : 0.0;
    const double worstTest = boost::accumulators::min(testAcc);
    const double bestTest = boost::accumulators::max(testAcc);
    const double winRate = static_cast<double>(positiveWindows) /
        static_cast<double>(boost::accumulators::count(testAcc));
    const double meanTrain = boost::accumulators::mean(trainAcc);

    os << std::fixed << std::setprecision(4)
       << "   [WalkForward] mean test Sharpe=" << meanTest
       << " median=" << medianTest
       << " std=" << stdTest
       << " worst=" << worstTest
       << " best=" << bestTest
       << " win rate=" << std::setprecision(1) << (winRate * 100.0) << "%\n";
    os.unsetf(std::ios_base::floatfield);

    auto verdict = buildVerdict(windows.size(), meanTest, winRate, worstTest, stdTest, returns.size(), os);

    return WalkForwardResult{ std::move(windows), meanTest, medianTest, stdTest, worstTest,
                              bestTest, winRate, meanTrain, std::move(verdict) };
}

ValidationVerdict WalkForwardAnalyzer::buildVerdict(std::size_t numWindows,
                                                    double meanTestSharpe,
                                                    double windowWinRate,
                                                    double worstTestSharpe,
                                                    double stdTestSharpe,
                                                    std::size_t numPeriods,
                                                    std::ostream& os) const
{
    std::ostringstream diagnostic;
    diagnostic << std::fixed << std::setprecision(4);
    bool passed = true;

    if (numWindows < mParameters.minWindows)
    {
        passed = false;
        diagnostic << "only " << numWindows << " complete windows (need " << mParameters.minWindows << "); ";
    }

    if (!(meanTestSharpe > mParameters.minAverageSharpe))
    {
        passed = false;
        diagnostic << "mean test Sharpe " << meanTestSharpe << " <= " << mParameters.minAverageSharpe << "; ";
    }

    if (!(windowWinRate > mParameters.minWinRate))
    {
        passed = false;
        diagnostic << "window win rate " << windowWinRate << " <= " << mParameters.minWinRate << "; ";
    }

    if (!(worstTestSharpe > mParameters.minWorstSharpe))
    {
        passed = false;
        diagnostic << "worst test Sharpe " << worstTestSharpe << " <= " << mParameters.minWorstSharpe << "; ";
    }

    if (!(stdTestSharpe < mParameters.maxSharpeStdDev))
    {
        passed = false;
        diagnostic << "test Sharpe std " << stdTestSharpe << " >= " << mParameters.maxSharpeStdDev << "; ";
    }

    std::string text;
    if (passed)
    {
        std::ostringstream ok;
        ok << std::fixed << std::setprecision(4)
           << numWindows << " windows, mean test Sharpe " << meanTestSharpe
           << ", win rate " << windowWinRate << ", worst " << worstTestSharpe
           << ", std " << stdTestSharpe;
        text = ok.str();
        os << "   [WalkForward] ✓ PASS: " << text << "\n";
    }
    else
    {
        text = diagnostic.str();
        text.erase(text.size() - 2);   // trailing "; "
        os << "   [WalkForward] ✗ FAIL: " << text << "\n";
    }

    return ValidationVerdict(ValidatorName, passed, meanTestSharpe, mParameters.minAverageSharpe,
                             ThresholdComparison::GreaterThan, numPeriods, text);
}

} // namespace validation
} // namespace stratvalidator
