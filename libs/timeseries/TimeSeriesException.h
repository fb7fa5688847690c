// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TIMESERIES_EXCEPTION_H
#define __TIMESERIES_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace stratval
{
  // Root of the error taxonomy shared by the series, report and validation code
  class TimeSeriesException : public std::runtime_error
  {
  public:
    TimeSeriesException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~TimeSeriesException() = default;
  };

  // Ordering violations, non-finite values or out of range slices of a ReturnsSeries
  class ReturnsSeriesException : public TimeSeriesException
  {
  public:
      explicit ReturnsSeriesException(const std::string& msg)
        : TimeSeriesException(msg) {}
  };

  /**
   * @brief Too few periods for the requested evaluation scheme.
   *
   * Fatal for the strategy being validated. It is never retried; the
   * orchestrator records it and moves on to the next strategy.
   */
  class InsufficientDataException : public TimeSeriesException
  {
  public:
      explicit InsufficientDataException(const std::string& msg)
        : TimeSeriesException(msg) {}
  };

  /**
   * @brief A report cannot be restricted to a calendar sub-period.
   *
   * Raised only in strict mode. In the default mode the same condition is
   * reported as an UnsupportedFiltering warning instead.
   */
  class UnsupportedFilteringException : public TimeSeriesException
  {
  public:
      explicit UnsupportedFilteringException(const std::string& msg)
        : TimeSeriesException(msg) {}
  };

} // namespace stratval

#endif // __TIMESERIES_EXCEPTION_H
