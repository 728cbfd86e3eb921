#pragma once

#include "pending-future.hpp"

#include "voltwire/async/completion-queue.hpp"

#include <span>

namespace voltwire::client {

/**
 * @brief Block until every future in `futures` has resolved, in whatever order they resolve.
 *
 * Each future is marked consumed as it is seen, which removes it from its connection's
 * outstanding set. An error in one future does not stop the drain; the error stays in that
 * future. Null entries are ignored.
 *
 * @return The number of futures that had to be waited on.
 */
template <typename T>
std::size_t drain(std::span<const std::shared_ptr<PendingFuture<T>>> futures) {
  auto completions = std::make_shared<async::CompletionQueue<std::size_t>>();

  std::size_t waiting = 0;
  for (std::size_t i = 0; i < futures.size(); ++i) {
    const auto& future = futures[i];
    if (future == nullptr)
      continue;
    if (!future->is_active()) {
      future->mark_consumed();
      continue;
    }
    ++waiting;
    future->add_observer([completions, i]() { completions->push(i); });
  }

  for (auto remaining = waiting; remaining > 0; --remaining)
    futures[completions->pop()]->mark_consumed();

  return waiting;
}

template <typename T>
std::size_t drain(const std::vector<std::shared_ptr<PendingFuture<T>>>& futures) {
  return drain(std::span<const std::shared_ptr<PendingFuture<T>>>{futures});
}

} // namespace voltwire::client
