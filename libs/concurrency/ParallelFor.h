#pragma once

#include <algorithm>
#include <cstdint>
#include <future>
#include <optional>
#include <vector>
#include "IParallelExecutor.h"

namespace concurrency {

  /**
   * @brief Run body(i) for every i in [0, total) on exec.
   *
   * The range is cut into one contiguous block per worker. Each block runs as
   * a single task and the call returns once every task has finished. body may
   * only write to state owned by its index.
   *
   * @throws the first exception raised by any body(i), after all blocks joined.
   */
  template<typename Executor, typename Body>
  void parallel_for(uint32_t total, Executor& exec, Body body)
  {
    if (total == 0)
      return;

    const uint32_t numBlocks = static_cast<uint32_t>(std::max<std::size_t>(exec.getNumWorkers(), 1));
    const uint32_t blockSize = (total / numBlocks) + ((total % numBlocks) ? 1 : 0);

    std::vector<std::future<void>> pending;
    pending.reserve(numBlocks);

    uint32_t first = 0;
    while (first < total)
      {
	const uint32_t last = std::min(total, first + blockSize);
	pending.push_back(exec.submit([first, last, body]() {
	      for (uint32_t i = first; i < last; ++i)
		body(i);
	    }));
	first = last;
      }

    exec.waitAll(pending);
  }

  /**
   * @brief Evaluate fn(i) for every i in [0, total) and keep each result in
   *        slot i.
   *
   * fn returns std::optional<Result>; an empty optional leaves its slot
   * empty. Slot order depends only on the index, so callers that rank the
   * slots get the same answer from every executor.
   */
  template<typename Result, typename Executor, typename Fn>
  std::vector<std::optional<Result>> parallel_evaluate(uint32_t total, Executor& exec, Fn fn)
  {
    std::vector<std::optional<Result>> slots(total);
    parallel_for(total, exec, [&slots, &fn](uint32_t i) {
	slots[i] = fn(i);
      });

    return slots;
  }
}
