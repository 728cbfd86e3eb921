#pragma once

#include "pending-future.hpp"

#include "voltwire/net/framing.hpp"
#include "voltwire/net/status.hpp"

#include <atomic>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <variant>

namespace voltwire::client {

/**
 * @brief Sole reader of a connection's stream.
 *
 * A background thread reads frames, and routes each response to the future registered under
 * its handle. When the loop ends, for any reason, every future still registered is resolved
 * with `StatusCode::CONNECTION_LOST`, and further registrations are refused.
 *
 * `Stream` is a connected asio socket, used with blocking reads.
 */
template <typename Stream> class NetworkListener final {
public:
  using PendingEntry = std::variant<QueryFuturePtr, ExecFuturePtr>;

  struct Stats {
    uint64_t delivered{0}; //!< Responses routed to a future
    uint64_t orphaned{0};  //!< Responses with no registered future, dropped
  };

private:
  Stream& stream_;
  const uint32_t max_frame_size_;

  std::thread thread_ = {};
  std::atomic<bool> stop_requested_ = false;
  std::atomic<bool> is_running_ = false;

  mutable std::mutex padlock_ = {};
  std::unordered_map<Handle, PendingEntry> pending_ = {};
  bool is_accepting_ = true;

  std::atomic<uint64_t> delivered_ = 0;
  std::atomic<uint64_t> orphaned_ = 0;

  bool register_(Handle handle, PendingEntry entry);
  void run_();
  void deliver_(std::span<const std::byte> payload);
  void fail_all_(const net::Status& status);

public:
  explicit NetworkListener(Stream& stream,
                           uint32_t max_frame_size = net::k_default_max_frame_size)
      : stream_{stream}, max_frame_size_{max_frame_size} {}
  NetworkListener(const NetworkListener&) = delete;
  NetworkListener(NetworkListener&&) = delete;
  ~NetworkListener() { stop(); }
  NetworkListener& operator=(const NetworkListener&) = delete;
  NetworkListener& operator=(NetworkListener&&) = delete;

  /**
   * @brief Launch the read loop. Must be called at most once.
   */
  void start();

  /**
   * @brief Wake the read loop by shutting down the receive side of the stream, and block
   * until the loop has exited. Does not close the stream. Idempotent.
   */
  void stop();

  bool is_running() const { return is_running_.load(std::memory_order_acquire); }

  /**
   * @return false if the read loop has already ended, in which case the future would never
   *         be resolved.
   */
  bool register_query(QueryFuturePtr future);
  bool register_exec(ExecFuturePtr future);

  /**
   * @brief Drop a registration, for a request that could not be sent.
   * @return true iff `handle` was registered
   */
  bool remove(Handle handle);

  std::size_t pending_count() const;

  Stats stats() const;
};

} // namespace voltwire::client

#include "impl/network-listener_impl.hpp"
