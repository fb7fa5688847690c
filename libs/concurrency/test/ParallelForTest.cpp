#include <catch2/catch_test_macros.hpp>
#include "ParallelFor.h"
#include "ParallelExecutors.h"
#include <atomic>
#include <stdexcept>
#include <vector>
#include <numeric>

using namespace concurrency;

TEST_CASE("parallel_for basic operations", "[parallel_for]")
{
  SECTION("Basic execution with SingleThreadExecutor")
  {
    SingleThreadExecutor executor;
    std::vector<int> results(10, 0);
    
    parallel_for(10, executor, [&results](uint32_t i) {
      results[i] = i * 2;
    });
    
    for (uint32_t i = 0; i < 10; ++i) {
      REQUIRE(results[i] == static_cast<int>(i * 2));
    }
  }
  
  SECTION("Zero iterations")
  {
    SingleThreadExecutor executor;
    std::atomic<int> counter{0};
    
    parallel_for(0, executor, [&counter](uint32_t) {
      counter.fetch_add(1);
    });
    
    REQUIRE(counter.load() == 0);
  }
  
  SECTION("All indices are visited exactly once")
  {
    ThreadPoolExecutor<4> executor;
    std::vector<std::atomic<int>> visited(1000);
    for (auto& v : visited) v.store(0);
    
    parallel_for(1000, executor, [&visited](uint32_t i) {
      visited[i].fetch_add(1, std::memory_order_relaxed);
    });
    
    for (uint32_t i = 0; i < 1000; ++i) {
      REQUIRE(visited[i].load() == 1);
    }
  }
}

TEST_CASE("parallel_for_chunked honours the chunk size hint", "[parallel_for]")
{
  ThreadPoolExecutor<3> executor;

  SECTION("Explicit hint")
  {
    std::vector<int> results(1000, 0);
    parallel_for_chunked(1000, executor, [&results](uint32_t i) {
      results[i] = static_cast<int>(i);
    }, 7);

    std::vector<int> expected(1000);
    std::iota(expected.begin(), expected.end(), 0);
    REQUIRE(results == expected);
  }

  SECTION("Default hint with fewer items than tasks")
  {
    std::atomic<int> counter{0};
    parallel_for_chunked(3, executor, [&counter](uint32_t) {
      counter.fetch_add(1);
    });
    REQUIRE(counter.load() == 3);
  }
}

TEST_CASE("parallel_for_each visits every element", "[parallel_for]")
{
  StdAsyncExecutor executor;
  std::vector<int> values{1, 2, 3, 4, 5, 6, 7, 8};
  std::atomic<int> sum{0};

  parallel_for_each(executor, values, [&sum](int v) {
    sum.fetch_add(v);
  });

  REQUIRE(sum.load() == 36);
}

TEST_CASE("parallel_for propagates the first task exception", "[parallel_for]")
{
  ThreadPoolExecutor<2> executor;
  std::atomic<int> completed{0};

  REQUIRE_THROWS_AS(parallel_for_chunked(100, executor, [&completed](uint32_t i) {
      if (i == 42)
	throw std::runtime_error("replicate failed");
      completed.fetch_add(1);
    }, 10), std::runtime_error);

  // the other nine chunks finished, the failing one stopped after 40 and 41
  REQUIRE(completed.load() == 92);
}
