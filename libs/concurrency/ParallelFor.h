#pragma once

#include <cstddef>    // for std::size_t
#include <thread>     // for std::thread::hardware_concurrency()
#include <vector>     // for std::vector
#include <future>     // for std::future
#include <algorithm>  // for std::min

#include "IParallelExecutor.h"

namespace concurrency {

  // Number of chunks parallel_for splits its range into.
  inline std::size_t defaultChunkCount()
  {
    const unsigned hw = std::thread::hardware_concurrency();
    return hw ? hw : 2;
  }

  // Split [0…total) into at most defaultChunkCount() contiguous chunks,
  // submit each chunk to exec.submit, waitAll, and inside each task
  // loop i from chunk start to chunk end calling body(i).
  template<typename Body>
  void parallel_for(std::size_t total, IParallelExecutor& exec, Body body)
  {
    if (total == 0) return;

    const std::size_t numTasks = defaultChunkCount();
    const std::size_t chunkSize = (total + numTasks - 1) / numTasks; // ceil-divide

    std::vector<std::future<void>> futures;
    for (std::size_t start = 0; start < total; start += chunkSize)
      {
	const std::size_t end = std::min(total, start + chunkSize);
	futures.emplace_back(
			     exec.submit([=]() {
				 for (std::size_t i = start; i < end; ++i) {
				   body(i);
				 }
			       })
			     );
      }
    exec.waitAll(futures);
  }
}
