// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RETURNS_SERIES_H
#define __RETURNS_SERIES_H 1

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "DateRange.h"
#include "TimeFrame.h"
#include "TimeSeriesException.h"

namespace stratval
{
  using boost::posix_time::ptime;

  /**
   * @brief One periodic return stamped with the close of its period.
   */
  class ReturnsSeriesEntry
  {
  public:
    ReturnsSeriesEntry(const ptime& dateTime, double value)
      : mDateTime(dateTime),
	mValue(value)
    {}

    ReturnsSeriesEntry(const boost::gregorian::date& entryDate, double value)
      : ReturnsSeriesEntry(ptime(entryDate), value)
    {}

    const ptime& getDateTime() const
    {
      return mDateTime;
    }

    boost::gregorian::date getDate() const
    {
      return mDateTime.date();
    }

    double getValue() const
    {
      return mValue;
    }

  private:
    ptime mDateTime;
    double mValue;
  };

  /**
   * @brief Immutable, time-indexed sequence of periodic returns.
   *
   * Timestamps are strictly increasing (no duplicate periods) and every value
   * is finite. Both properties are checked at construction. Slicing
   * produces a new series and never modifies this one.
   */
  class ReturnsSeries
  {
  public:
    ReturnsSeries(TimeFrame::Duration timeFrame, std::vector<ReturnsSeriesEntry> entries)
      : mTimeFrame(timeFrame),
	mDates(),
	mReturns()
    {
      mDates.reserve(entries.size());
      mReturns.reserve(entries.size());

      for (const auto& entry : entries)
	{
	  if (!std::isfinite(entry.getValue()))
	    throw ReturnsSeriesException("ReturnsSeries: non-finite return at " +
					 boost::posix_time::to_simple_string(entry.getDateTime()));

	  if (!mDates.empty() && !(mDates.back() < entry.getDateTime()))
	    throw ReturnsSeriesException("ReturnsSeries: timestamps must be strictly increasing, offending entry at " +
					 boost::posix_time::to_simple_string(entry.getDateTime()));

	  mDates.push_back(entry.getDateTime());
	  mReturns.push_back(entry.getValue());
	}
    }

    ReturnsSeries(const ReturnsSeries&) = default;
    ReturnsSeries& operator=(const ReturnsSeries&) = default;
    ReturnsSeries(ReturnsSeries&&) = default;
    ReturnsSeries& operator=(ReturnsSeries&&) = default;
    ~ReturnsSeries() = default;

    TimeFrame::Duration getTimeFrame() const
    {
      return mTimeFrame;
    }

    std::size_t size() const
    {
      return mReturns.size();
    }

    bool empty() const
    {
      return mReturns.empty();
    }

    double getReturn(std::size_t i) const
    {
      checkIndex(i, "getReturn");
      return mReturns[i];
    }

    const ptime& getDateTime(std::size_t i) const
    {
      checkIndex(i, "getDateTime");
      return mDates[i];
    }

    boost::gregorian::date getDate(std::size_t i) const
    {
      return getDateTime(i).date();
    }

    const std::vector<double>& getReturnValues() const
    {
      return mReturns;
    }

    const std::vector<ptime>& getDateTimes() const
    {
      return mDates;
    }

    boost::gregorian::date getFirstDate() const
    {
      if (empty())
	throw ReturnsSeriesException("ReturnsSeries::getFirstDate: series is empty");
      return mDates.front().date();
    }

    boost::gregorian::date getLastDate() const
    {
      if (empty())
	throw ReturnsSeriesException("ReturnsSeries::getLastDate: series is empty");
      return mDates.back().date();
    }

    /**
     * @brief Half-open index slice [begin, end).
     * @throws ReturnsSeriesException if begin > end or end > size().
     */
    ReturnsSeries slice(std::size_t begin, std::size_t end) const
    {
      if (begin > end || end > size())
	throw ReturnsSeriesException("ReturnsSeries::slice: invalid range [" + std::to_string(begin) +
				     ", " + std::to_string(end) + ") for series of size " +
				     std::to_string(size()));

      return ReturnsSeries(mTimeFrame,
			   std::vector<ptime>(mDates.begin() + begin, mDates.begin() + end),
			   std::vector<double>(mReturns.begin() + begin, mReturns.begin() + end));
    }

    // All entries whose timestamp lies inside the closed range
    ReturnsSeries filterDates(const DateRange& range) const
    {
      std::vector<ptime> dates;
      std::vector<double> values;

      for (std::size_t i = 0; i < mDates.size(); ++i)
	{
	  if (range.contains(mDates[i]))
	    {
	      dates.push_back(mDates[i]);
	      values.push_back(mReturns[i]);
	    }
	}

      return ReturnsSeries(mTimeFrame, std::move(dates), std::move(values));
    }

  private:
    // Used by slice/filterDates where ordering is already known to hold
    ReturnsSeries(TimeFrame::Duration timeFrame, std::vector<ptime> dates, std::vector<double> returns)
      : mTimeFrame(timeFrame),
	mDates(std::move(dates)),
	mReturns(std::move(returns))
    {}

    void checkIndex(std::size_t i, const char* where) const
    {
      if (i >= mReturns.size())
	throw ReturnsSeriesException(std::string("ReturnsSeries::") + where + ": index " +
				     std::to_string(i) + " out of range");
    }

  private:
    TimeFrame::Duration mTimeFrame;
    std::vector<ptime> mDates;
    std::vector<double> mReturns;
  };
}

#endif
