// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __REPORT_PERIOD_FILTER_H
#define __REPORT_PERIOD_FILTER_H 1

#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include "BacktestReport.h"
#include "DateRange.h"
#include "TimeSeriesException.h"

namespace stratval
{
  enum class FilterMethod
  {
    SelfFiltered,   // report implements DateFilterable
    SeriesSliced,   // report implements DateIndexed
    Unsupported     // neither; the report cannot be restricted
  };

  inline const char* filterMethodToString(FilterMethod method)
  {
    switch (method)
      {
      case FilterMethod::SelfFiltered:
	return "SelfFiltered";
      case FilterMethod::SeriesSliced:
	return "SeriesSliced";
      case FilterMethod::Unsupported:
	return "Unsupported";
      }
    return "Unknown";
  }

  /**
   * @brief Outcome of restricting a report to a calendar period.
   *
   * When filtered is false the report is the caller's original, whole-period
   * report and warning explains why. Callers must not present numbers
   * derived from such a report as period-specific without surfacing the
   * warning.
   */
  struct FilteredReport
  {
    std::shared_ptr<const BacktestReport> report;
    bool filtered;
    FilterMethod method;
    std::optional<std::string> warning;
  };

  /**
   * @brief Restricts backtest reports to calendar periods by capability detection.
   *
   * Resolution order is DateFilterable, then DateIndexed. A report with
   * neither capability raises UnsupportedFilteringException in strict mode.
   * In the default mode it is returned unfiltered together with an
   * UnsupportedFilteringWarning, which is also written to the log stream.
   */
  class ReportPeriodFilter
  {
  public:
    explicit ReportPeriodFilter(bool strict = false)
      : mStrict(strict)
    {}

    bool isStrict() const
    {
      return mStrict;
    }

    static FilterMethod resolveCapability(const BacktestReport& report)
    {
      if (dynamic_cast<const DateFilterable*>(&report) != nullptr)
	return FilterMethod::SelfFiltered;
      if (dynamic_cast<const DateIndexed*>(&report) != nullptr)
	return FilterMethod::SeriesSliced;
      return FilterMethod::Unsupported;
    }

    FilteredReport restrict(const std::shared_ptr<const BacktestReport>& report,
			    const DateRange& range,
			    std::ostream& os) const
    {
      if (!report)
	throw std::invalid_argument("ReportPeriodFilter::restrict: null report");

      switch (resolveCapability(*report))
	{
	case FilterMethod::SelfFiltered:
	  {
	    const auto& filterable = dynamic_cast<const DateFilterable&>(*report);
	    return FilteredReport{ filterable.filterDates(range), true,
				   FilterMethod::SelfFiltered, std::nullopt };
	  }

	case FilterMethod::SeriesSliced:
	  {
	    const auto& indexed = dynamic_cast<const DateIndexed&>(*report);
	    auto sliced = std::make_shared<SeriesBacktestReport>(report->getStrategyId(),
								 indexed.getReturnsSeries().filterDates(range));
	    return FilteredReport{ sliced, true, FilterMethod::SeriesSliced, std::nullopt };
	  }

	case FilterMethod::Unsupported:
	  break;
	}

      const std::string detail = "report '" + report->getStrategyId() +
	"' supports neither date filtering nor a date index and cannot be restricted to " +
	range.toString();

      if (mStrict)
	throw UnsupportedFilteringException("ReportPeriodFilter: " + detail);

      const std::string warning = "UnsupportedFilteringWarning: " + detail +
	"; whole-period results returned (deprecated, enable strict filtering)";
      os << "   [ReportFilter] Warning: " << warning << "\n";

      return FilteredReport{ report, false, FilterMethod::Unsupported, warning };
    }

  private:
    bool mStrict;
  };
}

#endif
