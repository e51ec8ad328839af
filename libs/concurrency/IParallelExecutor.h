// concurrency/IParallelExecutor.h
#pragma once

#include <exception>
#include <future>
#include <vector>
#include <functional>

namespace concurrency
{
  /**
   * @brief Abstract policy for running independent void() tasks.
   *
   * Callers submit work and collect the returned futures; waitAll() joins
   * them. Implementations decide where the task runs (inline, std::async,
   * a worker pool).
   */
  class IParallelExecutor
  {
  public:
    virtual ~IParallelExecutor() = default;

    // Schedule a void() task; returns a std::future you can wait on.
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Wait for every future, then rethrow the first stored exception.
     *
     * All futures are drained before rethrowing so that no task is still
     * running against caller-owned state when the exception propagates.
     */
    virtual void waitAll(std::vector<std::future<void>>& futures)
    {
      std::exception_ptr firstError;

      for (auto& f : futures)
	{
	  try
	    {
	      f.get();
	    }
	  catch (...)
	    {
	      if (!firstError)
		firstError = std::current_exception();
	    }
	}

      if (firstError)
	std::rethrow_exception(firstError);
    }
  };
}
