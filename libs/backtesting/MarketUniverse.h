// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MARKET_UNIVERSE_H
#define __MARKET_UNIVERSE_H 1

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "DateRange.h"
#include "RngUtils.h"
#include "TimeSeriesException.h"

namespace stratval
{
  class MarketUniverseException : public TimeSeriesException
  {
  public:
    explicit MarketUniverseException(const std::string& msg)
      : TimeSeriesException(msg)
    {}
  };

  // Closing prices and market capitalisations aligned to the universe dates
  struct SecurityHistory
  {
    std::vector<double> closes;
    std::vector<double> marketCaps;
  };

  /**
   * @brief Immutable snapshot of the tradable universe used by the baselines.
   *
   * All securities share one strictly increasing date axis. The fingerprint
   * is a content hash over every symbol, date and value; two snapshots with
   * the same fingerprint produce the same baselines.
   */
  class MarketUniverse
  {
  public:
    MarketUniverse(std::vector<boost::gregorian::date> dates,
		   std::map<std::string, SecurityHistory> securities)
      : mDates(std::move(dates)),
	mSecurities(std::move(securities)),
	mFingerprint(0)
    {
      for (std::size_t i = 1; i < mDates.size(); ++i)
	if (!(mDates[i - 1] < mDates[i]))
	  throw MarketUniverseException("MarketUniverse: dates must be strictly increasing");

      for (const auto& [symbol, history] : mSecurities)
	{
	  if (history.closes.size() != mDates.size() || history.marketCaps.size() != mDates.size())
	    throw MarketUniverseException("MarketUniverse: " + symbol + " is not aligned with the universe dates");

	  for (double close : history.closes)
	    if (!(close > 0.0) || !std::isfinite(close))
	      throw MarketUniverseException("MarketUniverse: non-positive close for " + symbol);

	  for (double cap : history.marketCaps)
	    if (!(cap >= 0.0) || !std::isfinite(cap))
	      throw MarketUniverseException("MarketUniverse: invalid market cap for " + symbol);
	}

      mFingerprint = computeFingerprint();
    }

    const std::vector<boost::gregorian::date>& getDates() const
    {
      return mDates;
    }

    std::size_t getNumDates() const
    {
      return mDates.size();
    }

    std::size_t getNumSecurities() const
    {
      return mSecurities.size();
    }

    bool hasSymbol(const std::string& symbol) const
    {
      return mSecurities.find(symbol) != mSecurities.end();
    }

    std::vector<std::string> getSymbols() const
    {
      std::vector<std::string> symbols;
      symbols.reserve(mSecurities.size());
      for (const auto& entry : mSecurities)
	symbols.push_back(entry.first);
      return symbols;
    }

    const SecurityHistory& getSecurity(const std::string& symbol) const
    {
      auto it = mSecurities.find(symbol);
      if (it == mSecurities.end())
	throw MarketUniverseException("MarketUniverse: unknown symbol " + symbol);
      return it->second;
    }

    /**
     * @brief Half-open index range [first, last) of the dates inside range.
     * first == last when no universe date falls inside.
     */
    std::pair<std::size_t, std::size_t> getIndexRange(const DateRange& range) const
    {
      std::size_t first = 0;
      while (first < mDates.size() && mDates[first] < range.getFirstDate())
	++first;

      std::size_t last = first;
      while (last < mDates.size() && mDates[last] <= range.getLastDate())
	++last;

      return { first, last };
    }

    uint64_t getFingerprint() const
    {
      return mFingerprint;
    }

  private:
    uint64_t computeFingerprint() const
    {
      using namespace rng_utils;

      uint64_t h = hash_combine64({ static_cast<uint64_t>(mDates.size()),
				    static_cast<uint64_t>(mSecurities.size()) });

      for (const auto& d : mDates)
	h = hash_combine64({ h, static_cast<uint64_t>(d.julian_day()) });

      // std::map iterates in symbol order, so the hash is insertion independent
      for (const auto& [symbol, history] : mSecurities)
	{
	  h = hash_combine64({ h, hash_string64(symbol) });
	  for (double close : history.closes)
	    h = hash_combine64({ h, hash_double64(close) });
	  for (double cap : history.marketCaps)
	    h = hash_combine64({ h, hash_double64(cap) });
	}

      return h;
    }

  private:
    std::vector<boost::gregorian::date> mDates;
    std::map<std::string, SecurityHistory> mSecurities;
    uint64_t mFingerprint;
  };
}

#endif
