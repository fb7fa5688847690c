#pragma once

#include "IParallelExecutor.h"
#include <queue>
#include <future>
#include <thread>
#include <vector>
#include <functional>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <exception>
#include <memory>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies used to spread bootstrap replicates and per-strategy
 * validations across threads.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread. Deterministic,
 *    used by the unit tests and whenever numThreads == 1.
 *  - StdAsyncExecutor: one std::async task per submission. Suited to a handful of
 *    long-running strategy validations.
 *  - ThreadPoolExecutor<N>: fixed pool of N workers (N == 0 picks hardware
 *    concurrency). Used for the thousands of short bootstrap replicates.
 */
namespace concurrency
{
  /**
   * @brief Executes tasks synchronously on the calling thread.
   *
   * Exceptions thrown by the task are stored in the returned future, exactly as
   * the threaded executors do.
   */
  class SingleThreadExecutor : public IParallelExecutor {
  public:
    std::future<void> submit(std::function<void()> task) override {
      std::promise<void> prom;
      auto fut = prom.get_future();
      try {
	task();
	prom.set_value();
      } catch (...) {
	prom.set_exception(std::current_exception());
      }
      return fut;
    }
  };

  /**
   * @brief Executor policy using std::async for each task.
   *
   * StdAsyncExecutor implements IParallelExecutor by calling
   * std::async(std::launch::async, task) for every submitted task.
   *
   * Each submit may start a new thread, so keep the number of tasks small.
   */
  class StdAsyncExecutor : public IParallelExecutor {
  public:
    std::future<void> submit(std::function<void()> task) override {
      return std::async(std::launch::async, std::move(task));
    }
  };

  /**
   * @brief Fixed-size thread pool executor.
   * Tasks submitted are queued and executed by a pool of worker threads.
   * Template parameter N specifies the number of threads in the pool.
   *
   * If N == 0, at runtime we pick std::thread::hardware_concurrency()
   * (falling back to 2 if that returns 0). A non-zero count passed to the
   * constructor overrides N.
   */
  template <std::size_t N = 0>
  class ThreadPoolExecutor : public IParallelExecutor {
  public:
    // Explicitly delete copy and move
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;
    
    ThreadPoolExecutor() : ThreadPoolExecutor(0)
    {}

    explicit ThreadPoolExecutor(std::size_t requestedThreads) : stop_(false)
    {
      const std::size_t threads = requestedThreads > 0 ? requestedThreads : defaultThreadCount();

      try {
	for (std::size_t i = 0; i < threads; ++i) {
	  workers_.emplace_back([this] { workerLoop(); });
	}
      }
      catch (...) {
	{
	  std::lock_guard<std::mutex> lock(tasksMutex_);
	  stop_ = true;
	}
	condition_.notify_all();
	for (auto& w : workers_) if (w.joinable()) w.join();
	throw;
      }
    }

    std::size_t getNumThreads() const
    {
      return workers_.size();
    }

    void workerLoop()
    {
      for (;;) {
	std::function<void()> task;
	{
	  std::unique_lock<std::mutex> lock(tasksMutex_);
	  condition_.wait(lock, [this]{ return stop_ || !tasks_.empty(); });
	  if (stop_ && tasks_.empty()) return;
	  task = std::move(tasks_.front());
	  tasks_.pop();
	}
	task();
      }
    }

    ~ThreadPoolExecutor()
    {
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	stop_ = true;
      }
      condition_.notify_all();
      for (auto &worker : workers_) {
	if (worker.joinable())
	  worker.join();
      }
    }

    // override the pure virtual submit() from IParallelExecutor
    std::future<void> submit(std::function<void()> task) override
    {
      auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
      auto fut = packaged->get_future();
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	if (stop_)
	  throw std::runtime_error("enqueue on stopped ThreadPoolExecutor");
	tasks_.emplace([packaged]() { (*packaged)(); });
      }
      condition_.notify_one();
      return fut;
    }

  private:
    static std::size_t defaultThreadCount()
    {
      if (N > 0)
	return N;
      const unsigned hw = std::thread::hardware_concurrency();
      return hw ? hw : 2;
    }

    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        tasksMutex_;
    std::condition_variable           condition_;
    bool                              stop_;
  };

  /**
   * @brief Executor sized from configuration.
   *
   * One thread means inline execution; zero means one worker per hardware thread.
   */
  inline std::unique_ptr<IParallelExecutor> makeExecutor(std::size_t numThreads)
  {
    if (numThreads == 1)
      return std::make_unique<SingleThreadExecutor>();

    return std::make_unique<ThreadPoolExecutor<>>(numThreads);
  }
} // namespace concurrency
