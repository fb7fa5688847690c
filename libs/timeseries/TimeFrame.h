// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TIME_FRAME_H
#define __TIME_FRAME_H 1

#include <stdexcept>
#include <string>

namespace stratval
{
  //
  // class TimeFrameException
  //

  class TimeFrameException : public std::domain_error
  {
  public:
    TimeFrameException(const std::string msg) 
      : std::domain_error(msg)
    {}
    
    ~TimeFrameException()
    {}
    
  };

  class TimeFrame
  {
  public:
    enum Duration {INTRADAY, DAILY, WEEKLY, MONTHLY, QUARTERLY, YEARLY} ;
  };

  inline TimeFrame::Duration timeFrameFromString(const std::string& name)
  {
    if (name == "DAILY" || name == "Daily")
      return TimeFrame::DAILY;
    if (name == "WEEKLY" || name == "Weekly")
      return TimeFrame::WEEKLY;
    if (name == "MONTHLY" || name == "Monthly")
      return TimeFrame::MONTHLY;
    if (name == "QUARTERLY" || name == "Quarterly")
      return TimeFrame::QUARTERLY;
    if (name == "YEARLY" || name == "Yearly")
      return TimeFrame::YEARLY;
    if (name == "INTRADAY" || name == "Intraday")
      return TimeFrame::INTRADAY;

    throw TimeFrameException("timeFrameFromString: unknown time frame " + name);
  }
}

#endif
