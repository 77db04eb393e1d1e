#pragma once

#include <cstddef>
#include <future>
#include <utility>
#include <vector>

namespace mptr
{
namespace Test
{

// Runs `func(threadIndex)` on `numThread` threads that are released at the same time and
// returns once all of them have finished, rethrowing the first exception thrown by any.
template <typename F>
void runConcurrently(std::size_t numThread, F func)
{
  std::promise<void> start;
  auto fut = start.get_future().share();
  std::vector<std::future<void>> ready;
  std::vector<std::future<void>> done;
  for(std::size_t i = 0; i < numThread; ++i)
  {
    std::promise<void> promise;
    ready.push_back(promise.get_future());
    done.push_back(std::async(std::launch::async, [p = std::move(promise), start = fut, &func, i]()mutable{
      p.set_value();
      start.wait();
      func(i);
    }));
  }
  for(auto& fut: ready)
  {
    fut.wait();
  }
  start.set_value();
  for(auto& fut: done)
  {
    fut.get();
  }
}

}
}
