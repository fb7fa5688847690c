#pragma once

#include <vector>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <random>

#include "RngUtils.h"
#include "StatUtils.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"

namespace stratval
{
  /**
   * @brief Percentile confidence interval from a block bootstrap.
   *
   * For each replicate b = 0..B-1 a resample of the original length n is
   * drawn with the injected (block) resampler and the statistic is computed
   * on it. Non-finite replicates are discarded and counted. When the share
   * of usable replicates falls below the configured minimum the result is
   * marked unreliable and carries NaN bounds: an interval built from the
   * surviving replicates would look trustworthy when it is not.
   *
   * Otherwise the bounds are the type-7 quantiles of the replicate
   * distribution at (1 - CL)/2 and 1 - (1 - CL)/2.
   *
   * @tparam Sampler   Callable `double(const std::vector<double>&)`.
   * @tparam Resampler Type providing `operator()(x, y, m, rng)` and `getL()`.
   * @tparam Rng       Engine built per replicate. Defaults to `std::mt19937_64`.
   * @tparam Executor  Executor used by `concurrency::parallel_for_chunked`.
   */
  template<
    class Sampler,
    class Resampler,
    class Rng      = std::mt19937_64,
    class Executor = concurrency::SingleThreadExecutor
    >
  class BlockBootstrap
  {
  public:
    struct Result
    {
      double      pointEstimate;  // statistic on the original sample
      double      lower;          // NaN when !reliable
      double      upper;          // NaN when !reliable
      double      cl;
      std::size_t B;
      std::size_t effectiveB;     // finite replicates
      std::size_t skipped;        // non-finite replicates
      std::size_t n;
      std::size_t L;
      double      validFraction;
      bool        reliable;
      double      standardError;  // sd of the usable replicates
    };

  public:
    /**
     * @param B Number of bootstrap replicates (> 0).
     * @param confidenceLevel CL in (0, 1), e.g. 0.95.
     * @param resampler Block resampler used to build each replicate.
     * @param minValidFraction Minimum share of finite replicates, in (0, 1].
     *
     * @throws std::invalid_argument on out of range parameters.
     */
    BlockBootstrap(std::size_t      B,
		   double           confidenceLevel,
		   const Resampler& resampler,
		   double           minValidFraction = 0.9)
      : BlockBootstrap(B, confidenceLevel, resampler, minValidFraction,
		       std::make_shared<Executor>())
    {}

    BlockBootstrap(std::size_t               B,
		   double                    confidenceLevel,
		   const Resampler&          resampler,
		   double                    minValidFraction,
		   std::shared_ptr<Executor> executor)
      : m_B(B),
	m_CL(confidenceLevel),
	m_minValidFraction(minValidFraction),
	m_resampler(resampler),
	m_exec(std::move(executor)),
	m_chunkHint(0),
	m_diagBootstrapStats(),
	m_diagValid(false)
    {
      if (m_B == 0)
	throw std::invalid_argument("BlockBootstrap: B must be > 0");
      if (!(m_CL > 0.0 && m_CL < 1.0))
	throw std::invalid_argument("BlockBootstrap: CL must be in (0,1)");
      if (!(m_minValidFraction > 0.0 && m_minValidFraction <= 1.0))
	throw std::invalid_argument("BlockBootstrap: minValidFraction must be in (0,1]");
      if (!m_exec)
	throw std::invalid_argument("BlockBootstrap: executor must not be null");
    }

    /**
     * @brief Run with an engine provider (CRN-friendly).
     *
     * The provider offers `Rng make_engine(std::size_t b) const`, so replicate
     * b sees the same random stream no matter which thread runs it.
     */
    template<class Provider>
    Result run(const std::vector<double>& x,
	       Sampler                    sampler,
	       const Provider&            provider) const
    {
      auto make_engine = [&provider](std::size_t b) {
	return provider.make_engine(b);
      };

      return run_core_(x, sampler, make_engine);
    }

    // Per-replicate engines are seeded from draws of the caller's generator.
    Result run(const std::vector<double>& x,
	       Sampler                    sampler,
	       Rng&                       rng) const
    {
      std::vector<uint64_t> seeds(m_B);
      for (auto& s : seeds)
	s = rng_utils::get_random_value(rng);

      auto make_engine = [&seeds](std::size_t b) {
	auto seq = rng_utils::make_seed_seq(seeds[b]);
	return rng_utils::construct_seeded_engine<Rng>(seq);
      };

      return run_core_(x, sampler, make_engine);
    }

    void setChunkSizeHint(uint32_t c) const
    {
      m_chunkHint = c;
    }

    std::size_t      B()                const { return m_B; }
    double           CL()               const { return m_CL; }
    double           minValidFraction() const { return m_minValidFraction; }
    const Resampler& resampler()        const { return m_resampler; }

    bool hasDiagnostics() const noexcept
    {
      return m_diagValid;
    }

    /**
     * @brief Finite replicate statistics from the last run().
     * @throws std::logic_error if run() has not been called yet.
     */
    const std::vector<double>& getBootstrapStatistics() const
    {
      if (!m_diagValid)
	throw std::logic_error("BlockBootstrap diagnostics are not available: run() has not been called on this instance.");
      return m_diagBootstrapStats;
    }

  private:
    template<class EngineMaker>
    Result run_core_(const std::vector<double>& x,
		     Sampler                    sampler,
		     EngineMaker&&              make_engine) const
    {
      const std::size_t n = x.size();
      if (n < 2)
	{
	  m_diagValid = false;
	  throw std::invalid_argument("BlockBootstrap: n must be >= 2");
	}

      const double theta_hat = sampler(x);

      // NaN marks skipped replicates
      std::vector<double> thetas(m_B, std::numeric_limits<double>::quiet_NaN());

      concurrency::parallel_for_chunked(
	static_cast<uint32_t>(m_B),
	*m_exec,
	[&](uint32_t b) {
	  auto rng_b = make_engine(b);
	  std::vector<double> y;
	  m_resampler(x, y, n, rng_b);
	  const double v = sampler(y);
	  if (std::isfinite(v))
	    thetas[b] = v;
	},
	m_chunkHint);

      auto it = std::remove_if(thetas.begin(), thetas.end(),
			       [](double v) { return !std::isfinite(v); });
      const std::size_t skipped = static_cast<std::size_t>(std::distance(it, thetas.end()));
      thetas.erase(it, thetas.end());

      const double validFraction = static_cast<double>(thetas.size()) / static_cast<double>(m_B);
      const bool reliable = !thetas.empty() && validFraction >= m_minValidFraction;

      double lower = std::numeric_limits<double>::quiet_NaN();
      double upper = std::numeric_limits<double>::quiet_NaN();
      double se = std::numeric_limits<double>::quiet_NaN();

      if (reliable)
	{
	  const double alpha = 1.0 - m_CL;
	  lower = StatUtils::quantileType7(thetas, alpha / 2.0);
	  upper = StatUtils::quantileType7(thetas, 1.0 - alpha / 2.0);
	  se = StatUtils::computeSampleStdDev(thetas);
	}

      m_diagBootstrapStats = thetas;
      m_diagValid = true;

      return Result{ theta_hat, lower, upper, m_CL, m_B, thetas.size(), skipped, n,
		     m_resampler.getL(), validFraction, reliable, se };
    }

  private:
    std::size_t                m_B;
    double                     m_CL;
    double                     m_minValidFraction;
    Resampler                  m_resampler;
    std::shared_ptr<Executor>  m_exec;
    mutable uint32_t           m_chunkHint;

    mutable std::vector<double> m_diagBootstrapStats;
    mutable bool                m_diagValid;
  };
}
