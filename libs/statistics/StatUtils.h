#pragma once

#include <vector>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <utility>

namespace stratval
{
  /**
   * @struct StatUtils
   * @brief Static helpers for the descriptive statistics of a return vector.
   *
   * All routines accept simple per-period returns (0.01 == 1%). Sample
   * dispersion uses the unbiased (n - 1) denominator throughout.
   */
  struct StatUtils
  {
    static double computeMean(const std::vector<double>& data)
    {
      if (data.empty())
	return 0.0;

      double mean = 0.0;
      std::size_t k = 0;
      for (double x : data)
	{
	  ++k;
	  mean += (x - mean) / static_cast<double>(k);
	}
      return mean;
    }

    /**
     * @brief Welford mean and sample variance in one pass.
     * @return {mean, variance}; variance is 0 when fewer than two values are given.
     */
    static std::pair<double, double>
    computeMeanAndVariance(const std::vector<double>& data)
    {
      double mean = 0.0;
      double m2 = 0.0;
      std::size_t k = 0;

      for (double x : data)
	{
	  ++k;
	  const double delta = x - mean;
	  mean += delta / static_cast<double>(k);
	  m2 += delta * (x - mean);
	}

      const double var = (k > 1) ? (m2 / static_cast<double>(k - 1)) : 0.0;
      return { mean, var };
    }

    static double computeSampleStdDev(const std::vector<double>& data)
    {
      auto [mean, var] = computeMeanAndVariance(data);
      (void) mean;
      return std::sqrt(std::max(var, 0.0));
    }

    /**
       * @brief Raw annualized Sharpe ratio: mean / stddev * sqrt(periodsPerYear).
       * @details No epsilon ridge is applied. A sample with fewer than two
       * observations or with zero dispersion has no defined ratio and yields
       * a quiet NaN, which bootstrap callers treat as a degenerate replicate.
       * @param data Per-period returns.
       * @param periodsPerYear Annualization factor (252 for daily data).
       * @param riskFreePerPeriod Subtracted from the mean before scaling.
       */
    static double sharpeFromReturns(const std::vector<double>& data,
				    double periodsPerYear,
				    double riskFreePerPeriod = 0.0)
    {
      if (data.size() < 2)
	return std::numeric_limits<double>::quiet_NaN();

      auto [mean, var] = computeMeanAndVariance(data);
      if (!(var > 0.0))
	return std::numeric_limits<double>::quiet_NaN();

      const double ann = (periodsPerYear > 1.0) ? std::sqrt(periodsPerYear) : 1.0;
      return ((mean - riskFreePerPeriod) / std::sqrt(var)) * ann;
    }

    // Reporting flavour of the Sharpe ratio: degenerate samples score 0
    static double computeSharpeRatio(const std::vector<double>& data, double periodsPerYear)
    {
      const double sr = sharpeFromReturns(data, periodsPerYear);
      return std::isfinite(sr) ? sr : 0.0;
    }

    // (1 + mean)^periodsPerYear - 1
    static double computeAnnualReturn(const std::vector<double>& data, double periodsPerYear)
    {
      if (data.empty())
	return 0.0;

      return std::pow(1.0 + computeMean(data), periodsPerYear) - 1.0;
    }

    /**
     * @brief Largest peak-to-trough decline of the compounded equity curve.
     * @return A value in [-1, 0]; 0 for an empty or never-declining series.
     */
    static double computeMaxDrawdown(const std::vector<double>& data)
    {
      double equity = 1.0;
      double peak = 1.0;
      double maxDrawdown = 0.0;

      for (double r : data)
	{
	  equity *= (1.0 + r);
	  peak = std::max(peak, equity);
	  if (peak > 0.0)
	    maxDrawdown = std::min(maxDrawdown, (equity - peak) / peak);
	}

      return maxDrawdown;
    }

    // Fraction of strictly positive periods
    static double computeWinRate(const std::vector<double>& data)
    {
      if (data.empty())
	return 0.0;

      const auto wins = std::count_if(data.begin(), data.end(), [](double r) { return r > 0.0; });
      return static_cast<double>(wins) / static_cast<double>(data.size());
    }

    // Hyndman-Fan type-7 quantile using two nth_element passes (unsorted input).
    static double quantileType7(const std::vector<double>& s, double p)
    {
      if (s.empty())
	throw std::invalid_argument("StatUtils::quantileType7: empty input");
      if (p <= 0.0)
	return *std::min_element(s.begin(), s.end());
      if (p >= 1.0)
	return *std::max_element(s.begin(), s.end());
      if (s.size() == 1)
	return s.front();

      const double nd = static_cast<double>(s.size());
      const double h  = (nd - 1.0) * p + 1.0;
      std::size_t  i1 = static_cast<std::size_t>(std::floor(h));
      if (i1 < 1)         i1 = 1;
      if (i1 >= s.size()) i1 = s.size() - 1;
      const double frac = h - static_cast<double>(i1);

      std::vector<double> w(s.begin(), s.end());
      std::nth_element(w.begin(),
		       w.begin() + static_cast<std::ptrdiff_t>(i1 - 1),
		       w.end());
      const double x0 = w[i1 - 1];

      // the upper neighbour is the minimum of the partition above x0
      const double x1 = *std::min_element(w.begin() + static_cast<std::ptrdiff_t>(i1), w.end());

      return x0 + (x1 - x0) * frac;
    }

    static double computeMedian(const std::vector<double>& data)
    {
      return quantileType7(data, 0.5);
    }
  };

  /**
   * @brief Annualized Sharpe ratio as a bootstrap statistic.
   *
   * Returns NaN for degenerate resamples so the bootstrap engine can count
   * and discard them.
   */
  struct SharpeRatioStat
  {
    explicit SharpeRatioStat(double periodsPerYear)
      : m_periodsPerYear(periodsPerYear)
    {}

    static constexpr bool isRatioStatistic() noexcept
    {
      return true;
    }

    double operator()(const std::vector<double>& returns) const
    {
      return StatUtils::sharpeFromReturns(returns, m_periodsPerYear);
    }

    double periodsPerYear() const
    {
      return m_periodsPerYear;
    }

  private:
    double m_periodsPerYear;
  };

  // |Sharpe|, used when building a two-sided null distribution
  struct AbsoluteSharpeRatioStat
  {
    explicit AbsoluteSharpeRatioStat(double periodsPerYear)
      : m_sharpe(periodsPerYear)
    {}

    double operator()(const std::vector<double>& returns) const
    {
      return std::fabs(m_sharpe(returns));
    }

  private:
    SharpeRatioStat m_sharpe;
  };
}
