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
 * @brief Executor policies used to spread independent per-file work.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread (deterministic, no concurrency).
 *  - StdAsyncExecutor: one std::async(std::launch::async) per task.
 *  - ThreadPoolExecutor<N>: a fixed-size pool with N worker threads.
 *
 * makeExecutor(threads) picks one of these from a thread count taken from
 * the command line or a configuration file.
 */
namespace concurrency
{
  /**
   * @brief Executes tasks synchronously on the calling thread.
   *
   * Useful for unit tests and for runs where the thread count is 1.
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
   */
  class StdAsyncExecutor : public IParallelExecutor {
  public:
    std::future<void> submit(std::function<void()> task) override {
      return std::async(std::launch::async, std::move(task));
    }
  };

  /**
   * @brief Pool executor whose size is chosen at runtime.
   *
   * If threads == 0 the pool uses std::thread::hardware_concurrency()
   * (falling back to 2 if that returns 0).
   */
  class DynamicThreadPoolExecutor : public IParallelExecutor {
  public:
    DynamicThreadPoolExecutor(const DynamicThreadPoolExecutor&) = delete;
    DynamicThreadPoolExecutor& operator=(const DynamicThreadPoolExecutor&) = delete;

    explicit DynamicThreadPoolExecutor(std::size_t threads) : stop_(false)
    {
      const std::size_t count =
	threads > 0 ? threads : (std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 2);

      try {
	for (std::size_t i = 0; i < count; ++i) {
	  workers_.emplace_back([this] { workerLoop(); });
	}
      }
      catch (...) {
	shutdown();
	throw;
      }
    }

    ~DynamicThreadPoolExecutor() override
    {
      shutdown();
    }

    std::size_t getNumThreads() const
    {
      return workers_.size();
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
      auto fut = packaged->get_future();
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	if (stop_)
	  throw std::runtime_error("enqueue on stopped thread pool executor");
	tasks_.emplace([packaged]() { (*packaged)(); });
      }
      condition_.notify_one();
      return fut;
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
	std::lock_guard<std::mutex> lock(tasksMutex_);
	stop_ = true;
      }
      condition_.notify_all();
      for (auto& w : workers_)
	if (w.joinable())
	  w.join();
    }

    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        tasksMutex_;
    std::condition_variable           condition_;
    bool                              stop_;
  };

  /**
   * @brief Fixed-size thread pool executor.
   * Template parameter N specifies the number of threads in the pool
   * (0 = hardware concurrency).
   */
  template <std::size_t N = 0>
  class ThreadPoolExecutor : public DynamicThreadPoolExecutor {
  public:
    ThreadPoolExecutor() : DynamicThreadPoolExecutor(N) {}
  };

  /**
   * @brief Build the executor matching a configured thread count.
   *
   * 1 runs inline, 0 sizes a pool to the hardware, anything else builds
   * a pool of exactly that many workers.
   */
  inline std::unique_ptr<IParallelExecutor> makeExecutor(std::size_t threads)
  {
    if (threads == 1)
      return std::make_unique<SingleThreadExecutor>();

    return std::make_unique<DynamicThreadPoolExecutor>(threads);
  }
} // namespace concurrency
