#pragma once

#include <cstddef>
#include <vector>
#include "ReturnsSeries.h"
#include "StatUtils.h"

namespace stratval
{
  /**
   * @brief Immutable summary of one return stream over one period.
   *
   * Always computed fresh from the returns it describes. Two metric objects
   * compare equal only when every field is bit-identical.
   */
  class PerformanceMetrics
  {
  public:
    PerformanceMetrics()
      : mSharpeRatio(0.0),
	mAnnualReturn(0.0),
	mMaxDrawdown(0.0),
	mWinRate(0.0),
	mNumPeriods(0)
    {}

    PerformanceMetrics(double sharpeRatio,
		       double annualReturn,
		       double maxDrawdown,
		       double winRate,
		       std::size_t numPeriods)
      : mSharpeRatio(sharpeRatio),
	mAnnualReturn(annualReturn),
	mMaxDrawdown(maxDrawdown),
	mWinRate(winRate),
	mNumPeriods(numPeriods)
    {}

    double getSharpeRatio() const
    {
      return mSharpeRatio;
    }

    double getAnnualReturn() const
    {
      return mAnnualReturn;
    }

    // Non-positive fraction, e.g. -0.25 for a 25% peak-to-trough decline
    double getMaxDrawdown() const
    {
      return mMaxDrawdown;
    }

    double getWinRate() const
    {
      return mWinRate;
    }

    std::size_t getNumPeriods() const
    {
      return mNumPeriods;
    }

  private:
    double mSharpeRatio;
    double mAnnualReturn;
    double mMaxDrawdown;
    double mWinRate;
    std::size_t mNumPeriods;
  };

  inline bool operator==(const PerformanceMetrics& lhs, const PerformanceMetrics& rhs)
  {
    return lhs.getSharpeRatio() == rhs.getSharpeRatio() &&
      lhs.getAnnualReturn() == rhs.getAnnualReturn() &&
      lhs.getMaxDrawdown() == rhs.getMaxDrawdown() &&
      lhs.getWinRate() == rhs.getWinRate() &&
      lhs.getNumPeriods() == rhs.getNumPeriods();
  }

  inline bool operator!=(const PerformanceMetrics& lhs, const PerformanceMetrics& rhs)
  {
    return !(lhs == rhs);
  }

  inline PerformanceMetrics computePerformanceMetrics(const std::vector<double>& returns,
						      double periodsPerYear)
  {
    return PerformanceMetrics(StatUtils::computeSharpeRatio(returns, periodsPerYear),
			      StatUtils::computeAnnualReturn(returns, periodsPerYear),
			      StatUtils::computeMaxDrawdown(returns),
			      StatUtils::computeWinRate(returns),
			      returns.size());
  }

  inline PerformanceMetrics computePerformanceMetrics(const ReturnsSeries& series,
						      double periodsPerYear)
  {
    return computePerformanceMetrics(series.getReturnValues(), periodsPerYear);
  }
}
