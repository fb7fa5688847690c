// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MARKET_UNIVERSE_CSV_READER_H
#define __MARKET_UNIVERSE_CSV_READER_H 1

#include <fstream>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <boost/date_time.hpp>
#include "MarketUniverse.h"
#include "csv.h"

namespace stratval
{
  //
  // class for reading a universe snapshot in long format
  //
  // The file format is:
  // Date, Symbol, Close, MarketCap
  //
  // Every symbol must have a row for every date that appears in the file.
  //

  class MarketUniverseCsvReader
  {
  public:
    explicit MarketUniverseCsvReader(const std::string& fileName)
      : mFileName(fileName)
    {
      std::ifstream fin(mFileName);
      if (!fin.is_open())
	throw std::runtime_error("Cannot open file: " + mFileName);
    }

    std::shared_ptr<MarketUniverse> readFile() const
    {
      io::CSVReader<4> csvFile(mFileName.c_str());
      csvFile.read_header(io::ignore_extra_column, "Date", "Symbol", "Close", "MarketCap");

      // symbol -> date -> (close, cap)
      std::map<std::string, std::map<boost::gregorian::date, std::pair<double, double>>> rows;
      std::set<boost::gregorian::date> allDates;

      std::string dateStamp, symbol;
      double close, marketCap;
      while (csvFile.read_row(dateStamp, symbol, close, marketCap))
	{
	  const auto entryDate = parseDate(dateStamp);
	  auto inserted = rows[symbol].emplace(entryDate, std::make_pair(close, marketCap));
	  if (!inserted.second)
	    throw MarketUniverseException("MarketUniverseCsvReader: duplicate row for " + symbol + " on " +
					  boost::gregorian::to_iso_extended_string(entryDate));
	  allDates.insert(entryDate);
	}

      std::vector<boost::gregorian::date> dates(allDates.begin(), allDates.end());
      std::map<std::string, SecurityHistory> securities;

      for (const auto& [sym, byDate] : rows)
	{
	  if (byDate.size() != dates.size())
	    throw MarketUniverseException("MarketUniverseCsvReader: " + sym + " is missing " +
					  std::to_string(dates.size() - byDate.size()) + " dates in " + mFileName);

	  SecurityHistory history;
	  history.closes.reserve(dates.size());
	  history.marketCaps.reserve(dates.size());
	  for (const auto& entry : byDate)
	    {
	      history.closes.push_back(entry.second.first);
	      history.marketCaps.push_back(entry.second.second);
	    }
	  securities.emplace(sym, std::move(history));
	}

      return std::make_shared<MarketUniverse>(std::move(dates), std::move(securities));
    }

  private:
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
	  throw MarketUniverseException("MarketUniverseCsvReader: cannot parse date '" + dateStamp +
					"': " + e.what());
	}
    }

  private:
    std::string mFileName;
  };
}

#endif
