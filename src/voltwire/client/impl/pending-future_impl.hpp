#pragma once

namespace voltwire::client {

// -------------------------------------------------------------------------------------- resolve_

template <typename T> net::Status PendingFuture<T>::resolve_(ResultType result) {
  std::vector<Observer> observers;
  {
    std::lock_guard lock{padlock_};
    if (load_state_() != State::ACTIVE)
      return net::Status{net::StatusCode::DUPLICATE_RESOLUTION,
                         fmt::format("handle {} was already resolved", handle_)};
    const auto new_state = result.has_value() ? State::RESOLVED_SUCCESS : State::RESOLVED_ERROR;
    result_ = std::move(result);
    state_.store(new_state, std::memory_order_release);
    observers = std::move(observers_);
    observers_.clear();
  }
  cv_.notify_all();
  for (auto& observer : observers)
    if (observer)
      observer();
  return {};
}

// ------------------------------------------------------------------------------------ resolution

template <typename T> net::Status PendingFuture<T>::try_resolve_success(T value) {
  return resolve_(ResultType{std::move(value)});
}

template <typename T> net::Status PendingFuture<T>::try_resolve_error(net::Status status) {
  Expects(!status.ok());
  return resolve_(tl::make_unexpected(std::move(status)));
}

template <typename T> void PendingFuture<T>::resolve_success(T value) {
  if (auto status = try_resolve_success(std::move(value)); !status.ok())
    FATAL("{}", status.to_string());
}

template <typename T> void PendingFuture<T>::resolve_error(net::Status status) {
  if (auto result = try_resolve_error(std::move(status)); !result.ok())
    FATAL("{}", result.to_string());
}

// ------------------------------------------------------------------------------------------ wait

template <typename T> auto PendingFuture<T>::wait() const -> const ResultType& {
  if (is_active()) {
    std::unique_lock lock{padlock_};
    cv_.wait(lock, [this] { return load_state_() != State::ACTIVE; });
  }
  return *result_;
}

template <typename T>
template <typename Rep, typename Period>
bool PendingFuture<T>::wait_for(const std::chrono::duration<Rep, Period>& duration) const {
  if (!is_active())
    return true;
  std::unique_lock lock{padlock_};
  return cv_.wait_for(lock, duration, [this] { return load_state_() != State::ACTIVE; });
}

template <typename T> auto PendingFuture<T>::get() -> const ResultType& {
  const auto& result = wait();
  mark_consumed();
  return result;
}

// -------------------------------------------------------------------------------------- observers

template <typename T> void PendingFuture<T>::add_observer(Observer observer) {
  {
    std::lock_guard lock{padlock_};
    if (load_state_() == State::ACTIVE) {
      observers_.push_back(std::move(observer));
      return;
    }
  }
  if (observer)
    observer(); // already resolved
}

// -------------------------------------------------------------------------------------- consumer

template <typename T> bool PendingFuture<T>::is_consumed() const {
  std::lock_guard lock{padlock_};
  return is_consumed_;
}

template <typename T> void PendingFuture<T>::set_consumer(ConsumerHook hook) {
  std::lock_guard lock{padlock_};
  consumer_ = std::move(hook);
}

template <typename T> void PendingFuture<T>::mark_consumed() {
  ConsumerHook hook;
  {
    std::lock_guard lock{padlock_};
    if (is_consumed_)
      return;
    is_consumed_ = true;
    hook = std::move(consumer_);
  }
  if (hook)
    hook(handle_);
}

} // namespace voltwire::client
