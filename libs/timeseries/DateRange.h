// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __DATE_RANGE_H
#define __DATE_RANGE_H 1

#include <boost/date_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <stdexcept>
#include <string>

namespace stratval
{
  using boost::posix_time::ptime;

  class DateRangeException : public std::runtime_error
  {
  public:
  DateRangeException(const std::string& msg) 
    : std::runtime_error(msg)
      {}

    ~DateRangeException()
      {}
  };

  /**
   * @brief Closed calendar interval [first, last].
   *
   * A range built from gregorian dates covers the whole of both end days, so
   * intraday timestamps on the last date are inside the range.
   */
  class DateRange
  {
  public:
    DateRange(const boost::gregorian::date& firstDate, const boost::gregorian::date& lastDate)
      : DateRange(ptime(firstDate),
		  ptime(lastDate, endOfDay()))
    {}

    DateRange(const ptime& firstDate, const ptime& lastDate)
      : mFirstDate(firstDate),
	mLastDate(lastDate)
    {
      if (firstDate.is_special() || lastDate.is_special())
	throw DateRangeException ("DateRange::DateRange - dates must be valid calendar times");

      if (lastDate < firstDate)
	throw DateRangeException ("DateRange::DateRange - Second date cannot occur before first date");
    }

    DateRange(const DateRange&) = default;
    DateRange& operator=(const DateRange&) = default;
    ~DateRange() noexcept = default;

    boost::gregorian::date getFirstDate() const
    {
      return mFirstDate.date();
    }

    const ptime& getFirstDateTime() const
    {
      return mFirstDate;
    }

    boost::gregorian::date getLastDate() const
    {
      return mLastDate.date();
    }

    const ptime& getLastDateTime() const
    {
      return mLastDate;
    }

    bool contains(const ptime& t) const
    {
      return (t >= mFirstDate) && (t <= mLastDate);
    }

    bool contains(const boost::gregorian::date& d) const
    {
      return (d >= getFirstDate()) && (d <= getLastDate());
    }

    bool overlaps(const DateRange& other) const
    {
      return !((other.mLastDate < mFirstDate) || (mLastDate < other.mFirstDate));
    }

    std::string toString() const
    {
      return boost::gregorian::to_iso_extended_string(getFirstDate()) + ".." +
	boost::gregorian::to_iso_extended_string(getLastDate());
    }

  private:
    static boost::posix_time::time_duration endOfDay()
    {
      return boost::posix_time::hours(23) + boost::posix_time::minutes(59) +
	boost::posix_time::seconds(59);
    }

  private:
    ptime mFirstDate;
    ptime mLastDate;
  };

  inline bool operator==(const DateRange& lhs, const DateRange& rhs)
    {
      return ((lhs.getFirstDateTime() == rhs.getFirstDateTime()) &&
	      (lhs.getLastDateTime() == rhs.getLastDateTime()));
    }

  inline bool operator!=(const DateRange& lhs, const DateRange& rhs)
    {
      return !(lhs == rhs);
    }
}

#endif
