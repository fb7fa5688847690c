#pragma once

#include <future>
#include <vector>
#include <functional>

namespace concurrency {

  class IParallelExecutor {
  public:
    virtual ~IParallelExecutor() = default;

    // Schedule a void() task; returns a std::future you can wait on.
    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Wait on every future; the first stored exception is rethrown after all complete.
    virtual void waitAll(std::vector<std::future<void>>& futures) {
      std::exception_ptr first;
      for (auto& f : futures) {
        try {
          f.get();
        }
        catch (const std::exception&) {
          if (!first)
            first = std::current_exception();
        }
      }
      if (first)
        std::rethrow_exception(first);
    }
  };
}
