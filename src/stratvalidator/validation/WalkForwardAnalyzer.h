#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "BacktestReport.h"
#include "DateRange.h"
#include "PerformanceMetrics.h"
#include "ReturnsSeries.h"
#include "ValidationConfiguration.h"
#include "validation/ValidationTypes.h"

namespace stratvalidator
{
namespace validation
{

/**
 * @brief Half-open index ranges of one walk-forward window
 */
struct WalkForwardWindowBounds
{
    std::size_t trainBegin;
    std::size_t trainEnd;    ///< == testBegin
    std::size_t testBegin;
    std::size_t testEnd;
};

struct WalkForwardWindow
{
    std::size_t index;
    WalkForwardWindowBounds bounds;
    std::optional<stratval::DateRange> trainDates;   ///< Only for date-indexed input
    std::optional<stratval::DateRange> testDates;
    stratval::PerformanceMetrics trainMetrics;
    stratval::PerformanceMetrics testMetrics;
};

struct WalkForwardResult
{
    std::vector<WalkForwardWindow> windows;
    double meanTestSharpe;
    double medianTestSharpe;
    double stdTestSharpe;       ///< Sample std (n - 1); 0 with a single window
    double worstTestSharpe;
    double bestTestSharpe;
    double windowWinRate;       ///< Share of windows with a positive test Sharpe
    double meanTrainSharpe;
    ValidationVerdict verdict;
};

/**
 * @brief Rolling out-of-sample stability check.
 *
 * Each window trains on [p, p + train) and tests on [p + train, p + train + test).
 * The next window starts where the previous test slice ended, so no
 * training slice ever contains data that an earlier window tested on.
 * A trailing remainder too short for a complete window is dropped.
 *
 * The verdict passes when all of the following hold and at least
 * minWindows windows exist:
 *   - mean test Sharpe > minAverageSharpe
 *   - window win rate > minWinRate
 *   - worst test Sharpe > minWorstSharpe
 *   - std of test Sharpe < maxSharpeStdDev
 */
class WalkForwardAnalyzer
{
public:
    static const char* const ValidatorName;

    WalkForwardAnalyzer(const WalkForwardParameters& parameters,
                        const CalibrationConstants& calibration);

    /**
     * @brief Index bounds of every complete window over numPeriods observations
     * @throws std::invalid_argument if either window length is zero
     */
    static std::vector<WalkForwardWindowBounds> computeWindowBounds(std::size_t numPeriods,
                                                                    std::size_t trainingWindow,
                                                                    std::size_t testingWindow);

    /**
     * @throws stratval::InsufficientDataException if not even one window fits
     */
    WalkForwardResult analyze(const stratval::ReturnsSeries& series, std::ostream& os) const;

    /**
     * @brief Analyze any report by index; window dates are filled for DateIndexed reports
     * @throws stratval::InsufficientDataException if not even one window fits
     */
    WalkForwardResult analyze(const stratval::BacktestReport& report, std::ostream& os) const;

    const WalkForwardParameters& getParameters() const
    {
        return mParameters;
    }

private:
    WalkForwardResult analyzeReturns(const std::vector<double>& returns,
                                     const std::vector<boost::posix_time::ptime>* dates,
                                     std::ostream& os) const;

    ValidationVerdict buildVerdict(std::size_t numWindows,
                                   double meanTestSharpe,
                                   double windowWinRate,
                                   double worstTestSharpe,
                                   double stdTestSharpe,
                                   std::size_t numPeriods,
                                   std::ostream& os) const;

private:
    WalkForwardParameters mParameters;
    CalibrationConstants mCalibration;
};

} // namespace validation
} // namespace stratvalidator
