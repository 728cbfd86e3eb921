#pragma once

#include "stdinc.hpp"

#include "voltwire/async/handle-allocator.hpp"
#include "voltwire/net/status.hpp"
#include "voltwire/wire/response.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <vector>

namespace voltwire::client {

/**
 * @brief A one-shot result cell, created together with its handle.
 *
 * The network listener resolves it exactly once, with a value or with an error `Status`.
 * Once resolved, `get()` returns the same outcome every time without blocking.
 *
 * Resolving twice is a logic error: `resolve_*` is fatal, while `try_resolve_*` reports
 * `StatusCode::DUPLICATE_RESOLUTION` and leaves the first outcome in place.
 */
template <typename T> class PendingFuture final {
public:
  enum class State : int8_t { ACTIVE, RESOLVED_SUCCESS, RESOLVED_ERROR };

  using ValueType = T;
  using ResultType = tl::expected<T, net::Status>;
  using Observer = ofats::any_invocable<void()>;
  using ConsumerHook = ofats::any_invocable<void(Handle)>;

private:
  const Handle handle_;

  mutable std::mutex padlock_ = {};
  mutable std::condition_variable cv_ = {};
  std::atomic<State> state_ = State::ACTIVE;
  std::optional<ResultType> result_ = {}; // immutable once resolved
  std::vector<Observer> observers_ = {};
  ConsumerHook consumer_ = {};
  bool is_consumed_ = false;

  State load_state_() const { return state_.load(std::memory_order_acquire); }
  net::Status resolve_(ResultType result);

public:
  explicit PendingFuture(Handle handle) : handle_{handle} {}
  PendingFuture(const PendingFuture&) = delete;
  PendingFuture(PendingFuture&&) = delete;
  ~PendingFuture() = default;
  PendingFuture& operator=(const PendingFuture&) = delete;
  PendingFuture& operator=(PendingFuture&&) = delete;

  ///@{ getters
  Handle handle() const { return handle_; }
  State state() const { return load_state_(); }
  bool is_active() const { return load_state_() == State::ACTIVE; }
  bool is_success() const { return load_state_() == State::RESOLVED_SUCCESS; }
  bool is_error() const { return load_state_() == State::RESOLVED_ERROR; }
  bool is_consumed() const;
  ///@}

  ///@{ resolution
  void resolve_success(T value);
  void resolve_error(net::Status status);
  net::Status try_resolve_success(T value);
  net::Status try_resolve_error(net::Status status);
  ///@}

  ///@{ wait
  /**
   * @brief Block until resolved. Does not consume the future.
   */
  const ResultType& wait() const;

  /**
   * @return true iff the future resolved before `duration` elapsed
   */
  template <typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& duration) const;
  ///@}

  /**
   * @brief Block until resolved, then mark the future consumed.
   * The reference remains valid for the lifetime of the future.
   */
  const ResultType& get();

  /**
   * @brief Run `observer` once the future resolves: immediately (on this thread) if it is
   * already resolved, otherwise on the resolving thread, outside of any lock.
   */
  void add_observer(Observer observer);

  /**
   * @brief `hook` is called with the handle, at most once, the first time the future is
   * consumed by `get()` or by a drain.
   */
  void set_consumer(ConsumerHook hook);
  void mark_consumed();
};

using QueryFuture = PendingFuture<wire::Response>;
using ExecFuture = PendingFuture<wire::ExecResult>;
using QueryFuturePtr = std::shared_ptr<QueryFuture>;
using ExecFuturePtr = std::shared_ptr<ExecFuture>;

} // namespace voltwire::client

#include "impl/pending-future_impl.hpp"
