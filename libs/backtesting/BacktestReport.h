// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTEST_REPORT_H
#define __BACKTEST_REPORT_H 1

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "DateRange.h"
#include "ReturnsSeries.h"
#include "TimeFrame.h"
#include "TimeSeriesException.h"

namespace stratval
{
  using boost::posix_time::ptime;

  /**
   * @brief Result of executing one strategy, as handed over by the backtest engine.
   *
   * Every report can produce its per-period returns. Whether it can also be
   * restricted to a calendar sub-period is a separate capability, expressed
   * by implementing DateFilterable or DateIndexed. Consumers discover the
   * capability at run time (see ReportPeriodFilter) and must treat a report
   * with neither capability as unfilterable.
   */
  class BacktestReport
  {
  public:
    explicit BacktestReport(const std::string& strategyId)
      : mStrategyId(strategyId)
    {}

    virtual ~BacktestReport()
    {}

    const std::string& getStrategyId() const
    {
      return mStrategyId;
    }

    virtual std::vector<double> getReturnValues() const = 0;

    virtual TimeFrame::Duration getTimeFrame() const = 0;

    virtual std::size_t getNumPeriods() const
    {
      return getReturnValues().size();
    }

  private:
    std::string mStrategyId;
  };

  // Capability: the report knows how to restrict itself to a calendar range
  class DateFilterable
  {
  public:
    virtual ~DateFilterable()
    {}

    virtual std::shared_ptr<const BacktestReport> filterDates(const DateRange& range) const = 0;
  };

  // Capability: the report is a plain date-indexed return series
  class DateIndexed
  {
  public:
    virtual ~DateIndexed()
    {}

    virtual const ReturnsSeries& getReturnsSeries() const = 0;
  };

  //
  // class SeriesBacktestReport
  //
  // Raw series variant. Consumers slice it themselves by date.
  //

  class SeriesBacktestReport : public BacktestReport, public DateIndexed
  {
  public:
    SeriesBacktestReport(const std::string& strategyId, ReturnsSeries series)
      : BacktestReport(strategyId),
	mSeries(std::move(series))
    {}

    std::vector<double> getReturnValues() const override
    {
      return mSeries.getReturnValues();
    }

    TimeFrame::Duration getTimeFrame() const override
    {
      return mSeries.getTimeFrame();
    }

    std::size_t getNumPeriods() const override
    {
      return mSeries.size();
    }

    const ReturnsSeries& getReturnsSeries() const override
    {
      return mSeries;
    }

  private:
    ReturnsSeries mSeries;
  };

  //
  // class EquityCurveBacktestReport
  //
  // Self-filtering variant built from account equity marks. Return i is
  // equity[i] / equity[i-1] - 1 and is stamped with the time of mark i.
  // Filtering keeps the marks inside the range plus the mark just before
  // it, so the filtered report yields exactly the returns dated inside the
  // range.
  //

  class EquityCurveBacktestReport : public BacktestReport, public DateFilterable
  {
  public:
    EquityCurveBacktestReport(const std::string& strategyId,
			      TimeFrame::Duration timeFrame,
			      std::vector<ptime> markTimes,
			      std::vector<double> equity)
      : BacktestReport(strategyId),
	mTimeFrame(timeFrame),
	mMarkTimes(std::move(markTimes)),
	mEquity(std::move(equity))
    {
      if (mMarkTimes.size() != mEquity.size())
	throw ReturnsSeriesException("EquityCurveBacktestReport: " + strategyId +
				     " has mismatched time and equity counts");

      for (std::size_t i = 0; i < mEquity.size(); ++i)
	{
	  if (!(mEquity[i] > 0.0))
	    throw ReturnsSeriesException("EquityCurveBacktestReport: equity must be positive for " + strategyId);

	  if (i > 0 && !(mMarkTimes[i - 1] < mMarkTimes[i]))
	    throw ReturnsSeriesException("EquityCurveBacktestReport: mark times must be strictly increasing for " +
					 strategyId);
	}
    }

    std::vector<double> getReturnValues() const override
    {
      std::vector<double> returns;
      if (mEquity.size() < 2)
	return returns;

      returns.reserve(mEquity.size() - 1);
      for (std::size_t i = 1; i < mEquity.size(); ++i)
	returns.push_back(mEquity[i] / mEquity[i - 1] - 1.0);

      return returns;
    }

    TimeFrame::Duration getTimeFrame() const override
    {
      return mTimeFrame;
    }

    std::shared_ptr<const BacktestReport> filterDates(const DateRange& range) const override
    {
      std::vector<ptime> times;
      std::vector<double> equity;

      for (std::size_t i = 0; i < mMarkTimes.size(); ++i)
	{
	  if (!range.contains(mMarkTimes[i]))
	    continue;

	  // base mark for the first in-range return
	  if (times.empty() && i > 0)
	    {
	      times.push_back(mMarkTimes[i - 1]);
	      equity.push_back(mEquity[i - 1]);
	    }

	  times.push_back(mMarkTimes[i]);
	  equity.push_back(mEquity[i]);
	}

      return std::make_shared<EquityCurveBacktestReport>(getStrategyId(), mTimeFrame,
							 std::move(times), std::move(equity));
    }

    const std::vector<double>& getEquity() const
    {
      return mEquity;
    }

  private:
    TimeFrame::Duration mTimeFrame;
    std::vector<ptime> mMarkTimes;
    std::vector<double> mEquity;
  };

  //
  // class SummaryBacktestReport
  //
  // Opaque variant: the returns are known but not their dates, so the
  // report cannot be restricted to a sub-period in any way.
  //

  class SummaryBacktestReport : public BacktestReport
  {
  public:
    SummaryBacktestReport(const std::string& strategyId,
			  TimeFrame::Duration timeFrame,
			  std::vector<double> returns)
      : BacktestReport(strategyId),
	mTimeFrame(timeFrame),
	mReturns(std::move(returns))
    {}

    std::vector<double> getReturnValues() const override
    {
      return mReturns;
    }

    TimeFrame::Duration getTimeFrame() const override
    {
      return mTimeFrame;
    }

  private:
    TimeFrame::Duration mTimeFrame;
    std::vector<double> mReturns;
  };
}

#endif
