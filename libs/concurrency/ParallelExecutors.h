#pragma once

#include "IParallelExecutor.h"
#include <cstddef>
#include <future>
#include <thread>
#include <vector>
#include <functional>
#include <memory>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <exception>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies used to fan out per-instrument work.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread (deterministic, no concurrency).
 *  - StdAsyncExecutor: uses std::async(std::launch::async) to spawn tasks.
 *  - ThreadPoolExecutor: a fixed-size pool of worker threads, sized at construction.
 *
 * makeExecutor() picks one of these from a thread count taken from the
 * command line: 1 gives the single thread executor, 0 sizes a pool from
 * std::thread::hardware_concurrency().
 */
namespace concurrency
{
  inline std::size_t defaultNumThreads()
  {
    const unsigned hw = std::thread::hardware_concurrency();
    return hw ? hw : 2;
  }

  /**
   * @brief Executes tasks synchronously on the calling thread.
   *
   * Exceptions thrown by a task are stored in the returned future.
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

    std::size_t getNumWorkers() const override {
      return 1;
    }
  };

  /**
   * @brief Executor policy using std::async for each task.
   *
   * Each submit may start a new thread, so this suits a small number of
   * long-running tasks.
   */
  class StdAsyncExecutor : public IParallelExecutor {
  public:
    std::future<void> submit(std::function<void()> task) override {
      return std::async(std::launch::async, std::move(task));
    }

    std::size_t getNumWorkers() const override {
      return defaultNumThreads();
    }
  };

  /**
   * @brief Fixed-size thread pool executor.
   *
   * Tasks are queued and run by numThreads worker threads. A count of zero
   * uses defaultNumThreads().
   */
  class ThreadPoolExecutor : public IParallelExecutor {
  public:
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    explicit ThreadPoolExecutor(std::size_t numThreads = 0)
      : stop_(false)
    {
      const std::size_t threads = numThreads > 0 ? numThreads : defaultNumThreads();

      try {
	for (std::size_t i = 0; i < threads; ++i) {
	  workers_.emplace_back([this] { workerLoop(); });
	}
      }
      catch (...) {
	shutdown();
	throw;
      }
    }

    ~ThreadPoolExecutor()
    {
      shutdown();
    }

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

    std::size_t getNumWorkers() const override {
      return workers_.size();
    }

  private:
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

    void shutdown()
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

  private:
    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        tasksMutex_;
    std::condition_variable           condition_;
    bool                              stop_;
  };

  inline std::unique_ptr<IParallelExecutor> makeExecutor(std::size_t numThreads)
  {
    if (numThreads == 1)
      return std::make_unique<SingleThreadExecutor>();

    return std::make_unique<ThreadPoolExecutor>(numThreads);
  }
} // namespace concurrency
