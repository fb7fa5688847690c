// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RETURNS_SERIES_CSV_READER_H
#define __RETURNS_SERIES_CSV_READER_H 1

#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/date_time.hpp>
#include "ReturnsSeries.h"
#include "csv.h"

namespace stratval
{
  //
  // class for reading periodic returns produced by the backtest engine
  //
  // The file format is:
  // Date, Return
  //
  // Dates are either undelimited (20210104) or ISO (2021-01-04). Returns are
  // simple per-period fractions (0.0125 = 1.25%).
  //

  class ReturnsSeriesCsvReader
  {
  public:
    ReturnsSeriesCsvReader (const std::string& fileName,
			    TimeFrame::Duration timeFrame,
			    bool hasHeaderRow = true)
      : mFileName (fileName),
	mTimeFrame(timeFrame),
	mHasHeaderRow(hasHeaderRow),
	mSeries()
    {
      std::ifstream fin(mFileName);
      if (!fin.is_open())
	throw std::runtime_error("Cannot open file: " + mFileName);
    }

    const std::string& getFileName() const
    {
      return mFileName;
    }

    TimeFrame::Duration getTimeFrame() const
    {
      return mTimeFrame;
    }

    void readFile()
    {
      io::CSVReader<2> csvFile(mFileName.c_str());

      if (mHasHeaderRow)
	csvFile.read_header(io::ignore_extra_column, "Date", "Return");
      else
	csvFile.set_header("Date", "Return");

      std::vector<ReturnsSeriesEntry> entries;
      std::string dateStamp;
      double periodReturn;

      while (csvFile.read_row(dateStamp, periodReturn))
	entries.emplace_back(parseDate(dateStamp), periodReturn);

      mSeries = std::make_shared<ReturnsSeries>(mTimeFrame, std::move(entries));
    }

    std::shared_ptr<ReturnsSeries> getReturnsSeries() const
    {
      if (!mSeries)
	throw ReturnsSeriesException("ReturnsSeriesCsvReader: readFile() has not been called for " + mFileName);
      return mSeries;
    }

    static boost::gregorian::date parseDate(const std::string& dateStamp)
    {
      try
	{
	  if (dateStamp.find('-') != std::string::npos)
	    return boost::gregorian::from_simple_string(dateStamp);
	  return boost::gregorian::from_undelimited_string(dateStamp);
	}
      catch (const std::exception& e)
	{
	  throw ReturnsSeriesException("ReturnsSeriesCsvReader: cannot parse date '" + dateStamp +
				       "': " + e.what());
	}
    }

  private:
    std::string mFileName;
    TimeFrame::Duration mTimeFrame;
    bool mHasHeaderRow;
    std::shared_ptr<ReturnsSeries> mSeries;
  };
}

#endif
