#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>
#include "RngUtils.h"

namespace stratval
{
  /**
   * @brief Fixed-length circular block resampler.
   *
   * Builds a resample of length m by concatenating blocks of L consecutive
   * source observations. Each block starts at a uniformly drawn index and
   * wraps circularly past the end of the source, so every observation is
   * equally likely to appear and the serial dependence inside a block is
   * preserved. The last block is truncated to hit m exactly.
   *
   * When the source is shorter than L the effective block length is the
   * source length.
   */
  class CircularBlockResampler
  {
  public:
    explicit CircularBlockResampler(std::size_t blockLength)
      : m_L(blockLength)
    {
      if (m_L == 0)
	throw std::invalid_argument("CircularBlockResampler: block length must be >= 1");
    }

    std::size_t getL() const
    {
      return m_L;
    }

    template <class Rng>
    void operator()(const std::vector<double>& x,
		    std::vector<double>&       y,
		    std::size_t                m,
		    Rng&                       rng) const
    {
      const std::size_t n = x.size();
      if (n == 0)
	throw std::invalid_argument("CircularBlockResampler: empty sample");

      const std::size_t L = std::min(m_L, n);
      y.resize(m);

      std::size_t pos = 0;
      while (pos < m)
	{
	  const std::size_t start = rng_utils::get_random_index(rng, n);
	  const std::size_t len   = std::min(L, m - pos);

	  // [start, n) then wrap to the front for the remainder
	  const std::size_t head = std::min(len, n - start);
	  std::copy(x.begin() + start, x.begin() + start + head, y.begin() + pos);
	  if (head < len)
	    std::copy(x.begin(), x.begin() + (len - head), y.begin() + pos + head);

	  pos += len;
	}
    }

    template <class Rng>
    std::vector<double> operator()(const std::vector<double>& x, std::size_t m, Rng& rng) const
    {
      std::vector<double> y;
      (*this)(x, y, m, rng);
      return y;
    }

  private:
    std::size_t m_L;
  };
}
