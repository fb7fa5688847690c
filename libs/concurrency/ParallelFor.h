#pragma once

#include <cstdint>    // for uint32_t
#include <thread>     // for std::thread::hardware_concurrency()
#include <vector>     // for std::vector
#include <future>     // for std::future
#include <algorithm>  // for std::min

namespace concurrency {

  namespace detail {
    inline unsigned defaultTaskCount()
    {
      const unsigned hw = std::thread::hardware_concurrency();
      return hw ? hw : 2;
    }

    template<typename Executor, typename Body>
    void run_chunks(uint32_t total, uint32_t chunkSize, Executor& exec, Body& body)
    {
      std::vector<std::future<void>> futures;
      for (uint32_t start = 0; start < total; start += chunkSize)
	{
	  const uint32_t end = std::min(total, start + chunkSize);
	  futures.emplace_back(
			       exec.submit([&body, start, end]() {
				   for (uint32_t p = start; p < end; ++p) {
				     body(p);
				   }
				 })
			       );
	}
      exec.waitAll(futures);
    }
  }

  // Split [0…total) into at most T chunks (where T = hardware_concurrency),
  // submit each chunk to executor.submit, waitAll, and internally
  // loop p from chunk.start to chunk.end calling your body(p).
  template<typename Executor, typename Body>
  void parallel_for(uint32_t total, Executor& exec, Body body) {
    if (total == 0) return;

    const unsigned numTasks = detail::defaultTaskCount();
    const uint32_t chunkSize = (total + numTasks - 1) / numTasks; // ceil-divide
    detail::run_chunks(total, chunkSize, exec, body);
  }

  // Same contract as parallel_for, but the caller may fix the chunk size.
  // A hint of 0 oversubscribes by 4x so that uneven replicates balance out.
  template<typename Executor, typename Body>
  void parallel_for_chunked(uint32_t total, Executor& exec, Body body, uint32_t chunkSizeHint = 0) {
    if (total == 0) return;

    uint32_t chunkSize = chunkSizeHint;
    if (chunkSize == 0)
      {
	const uint32_t numTasks = detail::defaultTaskCount() * 4u;
	chunkSize = std::max<uint32_t>(1u, (total + numTasks - 1) / numTasks);
      }
    detail::run_chunks(total, chunkSize, exec, body);
  }

  template<typename Executor, typename Container, typename Body>
  void parallel_for_each(Executor& exec, const Container& container, Body body) {
    if (container.empty()) return;

    const uint32_t total = static_cast<uint32_t>(container.size());
    parallel_for(total, exec, [&container, &body](uint32_t p) { body(container[p]); });
  }
}
