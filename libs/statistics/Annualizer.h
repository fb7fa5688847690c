#ifndef __ANNUALIZER_H
#define __ANNUALIZER_H

#include <cmath>
#include <stdexcept>
#include "TimeFrame.h"

namespace stratval
{
  /**
   * @brief Number of return periods per year for a series time frame.
   *
   * @param timeFrame The time frame of the returns (DAILY, WEEKLY, INTRADAY, ...).
   * @param intraday_minutes_per_bar Minutes per bar for INTRADAY data; must be > 0.
   * @param trading_days_per_year Number of trading days per year (default 252).
   * @param trading_hours_per_day Number of trading hours per day (default 6.5).
   */
  inline double computeAnnualizationFactor(TimeFrame::Duration timeFrame,
                                           int intraday_minutes_per_bar = 0,
                                           double trading_days_per_year = 252.0,
                                           double trading_hours_per_day = 6.5)
  {
    switch (timeFrame)
      {
      case TimeFrame::DAILY:
        return trading_days_per_year;

      case TimeFrame::WEEKLY:
        return 52.0;

      case TimeFrame::MONTHLY:
        return 12.0;

      case TimeFrame::INTRADAY:
        {
          if (intraday_minutes_per_bar <= 0)
            {
              throw std::invalid_argument(
					  "computeAnnualizationFactor(INTRADAY): intraday_minutes_per_bar must be specified.");
            }

          const double bars_per_hour = 60.0 / static_cast<double>(intraday_minutes_per_bar);
          if (!(trading_days_per_year > 0.0) || !(trading_hours_per_day > 0.0))
            {
              throw std::invalid_argument("Annualization inputs must be positive finite values.");
            }

          return trading_hours_per_day * bars_per_hour * trading_days_per_year;
        }

      case TimeFrame::QUARTERLY:
        return 4.0;

      case TimeFrame::YEARLY:
        return 1.0;

      default:
        throw std::invalid_argument("Unsupported time frame for annualization.");
      }
  }
}

#endif
