// concurrency/IParallelExecutor.h
#pragma once
#include <exception>
#include <future>
#include <vector>
#include <functional>

namespace concurrency
{
  class IParallelExecutor {
  public:
    virtual ~IParallelExecutor() = default;

    // Schedule a void() task; returns a std::future you can wait on.
    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Number of tasks that may run at the same time.
    virtual std::size_t getNumWorkers() const = 0;

    // Wait for every future, then rethrow the first stored exception.
    // Waiting on all of them first keeps tasks from outliving the state
    // they captured by reference.
    virtual void waitAll(std::vector<std::future<void>>& futures) {
      std::exception_ptr first;
      for (auto& f : futures) {
	try {
	  f.get();
	}
	catch (...) {
	  if (!first)
	    first = std::current_exception();
	}
      }
      if (first)
	std::rethrow_exception(first);
    }
  };
}
