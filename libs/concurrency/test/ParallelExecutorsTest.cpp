#include <catch2/catch_test_macros.hpp>
#include "ParallelExecutors.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace concurrency;

namespace
{
  auto createIncrementTask(std::atomic<int>& counter) {
    return [&counter]() { counter.fetch_add(1, std::memory_order_relaxed); };
  }

  auto createThrowingTask(const std::string& message) {
    return [message]() { throw std::runtime_error(message); };
  }
}

TEST_CASE("SingleThreadExecutor operations", "[SingleThreadExecutor]")
{
  SingleThreadExecutor executor;
  
  SECTION("Task executes immediately")
  {
    std::atomic<bool> executed{false};
    auto future = executor.submit([&executed]() { executed.store(true); });
    
    REQUIRE(future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready);
    REQUIRE(executed.load());
  }
  
  SECTION("Multiple tasks execute in order")
  {
    std::vector<int> results;
    std::vector<std::future<void>> futures;
    
    for (int i = 0; i < 5; ++i) {
      futures.push_back(executor.submit([&results, i]() { 
        results.push_back(i); 
      }));
    }
    executor.waitAll(futures);
    REQUIRE(results == std::vector<int>{0, 1, 2, 3, 4});
  }

  SECTION("Exceptions are delivered through the future")
  {
    auto future = executor.submit(createThrowingTask("inline failure"));
    REQUIRE_THROWS_AS(future.get(), std::runtime_error);
  }
}

TEST_CASE("ThreadPoolExecutor operations", "[ThreadPoolExecutor]")
{
  SECTION("Compile-time and runtime thread counts")
  {
    ThreadPoolExecutor<3> fixed;
    REQUIRE(fixed.getNumThreads() == 3);

    ThreadPoolExecutor<> sized(5);
    REQUIRE(sized.getNumThreads() == 5);

    ThreadPoolExecutor<> automatic;
    REQUIRE(automatic.getNumThreads() >= 1);
  }

  SECTION("Many small tasks all run")
  {
    ThreadPoolExecutor<4> executor;
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 500; ++i)
      futures.push_back(executor.submit(createIncrementTask(counter)));

    executor.waitAll(futures);
    REQUIRE(counter.load() == 500);
  }

  SECTION("Work is spread over several threads")
  {
    ThreadPoolExecutor<4> executor;
    std::mutex idsMutex;
    std::set<std::thread::id> ids;
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 16; ++i)
      futures.push_back(executor.submit([&]() {
	std::this_thread::sleep_for(std::chrono::milliseconds(5));
	std::lock_guard<std::mutex> lock(idsMutex);
	ids.insert(std::this_thread::get_id());
      }));

    executor.waitAll(futures);
    REQUIRE(ids.size() > 1);
  }

  SECTION("waitAll rethrows after every task completed")
  {
    ThreadPoolExecutor<2> executor;
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    futures.push_back(executor.submit(createThrowingTask("pool failure")));
    for (int i = 0; i < 10; ++i)
      futures.push_back(executor.submit(createIncrementTask(counter)));

    REQUIRE_THROWS_AS(executor.waitAll(futures), std::runtime_error);
    REQUIRE(counter.load() == 10);
  }
}

TEST_CASE("StdAsyncExecutor runs tasks", "[StdAsyncExecutor]")
{
  StdAsyncExecutor executor;
  std::atomic<int> counter{0};
  std::vector<std::future<void>> futures;

  for (int i = 0; i < 4; ++i)
    futures.push_back(executor.submit(createIncrementTask(counter)));

  executor.waitAll(futures);
  REQUIRE(counter.load() == 4);
}

TEST_CASE("makeExecutor picks the policy from a thread count", "[ParallelExecutors]")
{
  auto inlineExec = makeExecutor(1);
  REQUIRE(dynamic_cast<SingleThreadExecutor*>(inlineExec.get()) != nullptr);

  auto pooled = makeExecutor(3);
  auto* pool = dynamic_cast<ThreadPoolExecutor<>*>(pooled.get());
  REQUIRE(pool != nullptr);
  REQUIRE(pool->getNumThreads() == 3);

  std::atomic<int> counter{0};
  std::vector<std::future<void>> futures;
  futures.push_back(pooled->submit(createIncrementTask(counter)));
  pooled->waitAll(futures);
  REQUIRE(counter.load() == 1);
}
