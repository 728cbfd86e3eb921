#pragma once

#include "voltwire/wire/codec.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/system/error_code.hpp>

namespace voltwire::client {

namespace detail {
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

inline net::Status procedure_failed(const wire::Response& response) {
  return net::Status{net::StatusCode::PROCEDURE_FAILED,
                     response.status_string.value_or(std::string{str(response.status)}),
                     fmt::format("status={}, app-status={}", str(response.status),
                            int(response.app_status))};
}
} // namespace detail

// ---------------------------------------------------------------------------------- start/stop

template <typename Stream> void NetworkListener<Stream>::start() {
  Expects(!thread_.joinable());
  is_running_.store(true, std::memory_order_release);
  thread_ = std::thread{[this]() { run_(); }};
}

template <typename Stream> void NetworkListener<Stream>::stop() {
  if (!thread_.joinable())
    return;
  stop_requested_.store(true, std::memory_order_release);
  boost::system::error_code ec;
  stream_.shutdown(boost::asio::socket_base::shutdown_receive, ec);
  if (ec && ec != boost::asio::error::not_connected)
    LOG_DEBUG("shutdown(receive) failed: {}", ec.message());
  thread_.join();
}

// -------------------------------------------------------------------------------- registration

template <typename Stream> bool NetworkListener<Stream>::register_(Handle handle, PendingEntry entry) {
  std::lock_guard lock{padlock_};
  if (!is_accepting_)
    return false;
  const auto [ii, success] = pending_.emplace(handle, std::move(entry));
  if (!success)
    FATAL("handle {} registered twice", handle);
  return true;
}

template <typename Stream> bool NetworkListener<Stream>::register_query(QueryFuturePtr future) {
  Expects(future != nullptr);
  const auto handle = future->handle();
  return register_(handle, PendingEntry{std::move(future)});
}

template <typename Stream> bool NetworkListener<Stream>::register_exec(ExecFuturePtr future) {
  Expects(future != nullptr);
  const auto handle = future->handle();
  return register_(handle, PendingEntry{std::move(future)});
}

template <typename Stream> bool NetworkListener<Stream>::remove(Handle handle) {
  std::lock_guard lock{padlock_};
  return pending_.erase(handle) > 0;
}

template <typename Stream> std::size_t NetworkListener<Stream>::pending_count() const {
  std::lock_guard lock{padlock_};
  return pending_.size();
}

template <typename Stream> auto NetworkListener<Stream>::stats() const -> Stats {
  return Stats{delivered_.load(std::memory_order_relaxed),
               orphaned_.load(std::memory_order_relaxed)};
}

// ------------------------------------------------------------------------------------------ run_

template <typename Stream> void NetworkListener<Stream>::run_() {
  net::BufferType payload;
  net::Status exit_status;

  while (true) {
    const auto ec = net::read_frame(stream_, payload, max_frame_size_);
    if (!ec) {
      deliver_(payload);
      continue;
    }

    if (stop_requested_.load(std::memory_order_acquire)) {
      exit_status = net::Status{net::StatusCode::CONNECTION_LOST, "connection closed"};
    } else {
      WARN("network listener stopping: {}", ec.message());
      exit_status = net::Status{net::StatusCode::CONNECTION_LOST, "read failed", ec.message()};
    }
    break;
  }

  fail_all_(exit_status);
  is_running_.store(false, std::memory_order_release);
}

// -------------------------------------------------------------------------------------- deliver_

template <typename Stream>
void NetworkListener<Stream>::deliver_(std::span<const std::byte> payload) {
  const auto handle = wire::peek_handle(payload);
  if (!handle) {
    orphaned_.fetch_add(1, std::memory_order_relaxed);
    WARN("dropping frame of {} bytes, could not read handle: {}", payload.size(),
         handle.error().message());
    return;
  }

  std::optional<PendingEntry> entry;
  { // Take the registration, so that the handle is delivered exactly once
    std::lock_guard lock{padlock_};
    auto ii = pending_.find(*handle);
    if (ii != end(pending_)) {
      entry = std::move(ii->second);
      pending_.erase(ii);
    }
  }

  if (!entry) {
    orphaned_.fetch_add(1, std::memory_order_relaxed);
    WARN("dropping response for unregistered handle {}", *handle);
    return;
  }

  auto response = wire::deserialize_response(payload);
  std::visit(detail::overloaded{
                 [&response](const QueryFuturePtr& future) {
                   if (!response)
                     future->resolve_error(net::Status{net::StatusCode::PROTOCOL_ERROR,
                                                       "could not decode response",
                                                       response.error().message()});
                   else if (!response->ok())
                     future->resolve_error(detail::procedure_failed(*response));
                   else
                     future->resolve_success(std::move(*response));
                 },
                 [&response](const ExecFuturePtr& future) {
                   if (!response) {
                     future->resolve_error(net::Status{net::StatusCode::PROTOCOL_ERROR,
                                                       "could not decode response",
                                                       response.error().message()});
                   } else if (!response->ok()) {
                     future->resolve_error(detail::procedure_failed(*response));
                   } else if (auto result = wire::to_exec_result(*response); result) {
                     future->resolve_success(std::move(*result));
                   } else {
                     future->resolve_error(net::Status{net::StatusCode::PROTOCOL_ERROR,
                                                       "response is not a mutation count",
                                                       result.error().message()});
                   }
                 }},
             *entry);

  delivered_.fetch_add(1, std::memory_order_relaxed);
  TRACE("delivered handle {}, {} bytes", *handle, payload.size());
}

// ------------------------------------------------------------------------------------- fail_all_

template <typename Stream> void NetworkListener<Stream>::fail_all_(const net::Status& status) {
  std::unordered_map<Handle, PendingEntry> pending;
  {
    std::lock_guard lock{padlock_};
    is_accepting_ = false;
    pending.swap(pending_);
  }

  if (!pending.empty())
    INFO("resolving {} outstanding request(s) with {}", pending.size(), status.to_string());

  for (auto& [handle, entry] : pending)
    std::visit([&status](const auto& future) { future->resolve_error(status); }, entry);
}

} // namespace voltwire::client
