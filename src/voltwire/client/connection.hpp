#pragma once

#include "pending-future.hpp"

#include "voltwire/async/handle-allocator.hpp"
#include "voltwire/net/framing.hpp"
#include "voltwire/net/status.hpp"
#include "voltwire/wire/codec.hpp"

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace voltwire::client {

/**
 * @brief A single open connection to a server.
 *
 * The connection is the only writer to its socket; a `NetworkListener` thread is the only
 * reader. Calls may be issued from any number of threads.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * auto handles = std::make_shared<async::HandleAllocator>();
 * auto conn = Connection::open({.host = "localhost", .handles = handles});
 * if (!conn) return conn.error();
 * auto future = conn->call_async("HELLOWORLD.select", {std::string{"French"}});
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
class Connection final {
public:
  struct Config {
    std::string host = "localhost";
    uint16_t port = 21212;
    std::string user = {};
    std::string password = {};
    std::shared_ptr<async::HandleAllocator> handles = {}; //!< Required, and shared
    uint32_t max_frame_size = net::k_default_max_frame_size;
  };

  using Args = std::vector<wire::Value>;

private:
  struct Pimpl;
  std::unique_ptr<Pimpl> pimpl_;

  explicit Connection(std::unique_ptr<Pimpl> pimpl);

public:
  Connection(const Connection&) = delete;
  Connection(Connection&&) noexcept;
  ~Connection();
  Connection& operator=(const Connection&) = delete;
  Connection& operator=(Connection&&) noexcept;

  /**
   * @brief Connect, login, and start the network listener.
   * Errors
   * + `CONNECT_ERROR` if resolution or connection fails, or `config.handles` is null
   * + `PROTOCOL_ERROR` if the login response could not be read or decoded
   * + `AUTHENTICATION_FAILED` if the server rejected the credentials
   */
  static tl::expected<Connection, net::Status> open(Config config);

  /**
   * @brief Stop the listener (resolving every outstanding future with `CONNECTION_LOST`), and
   * then close the socket. Returns `CONNECTION_CLOSED` if already closed.
   */
  net::Status close();

  bool is_open() const;

  ///@{ Blocking calls
  tl::expected<wire::Response, net::Status> call(std::string_view procedure,
                                                 const Args& args = {});
  tl::expected<wire::ExecResult, net::Status> exec(std::string_view procedure,
                                                   const Args& args = {});
  ///@}

  ///@{ Asynchronous calls
  /**
   * @brief Send the call, and return its future without waiting.
   * The future stays in the outstanding set until it is consumed by `get()` or a drain.
   * Send-time failures are returned here, and never through the future.
   */
  tl::expected<QueryFuturePtr, net::Status> call_async(std::string_view procedure,
                                                       const Args& args = {});
  tl::expected<ExecFuturePtr, net::Status> exec_async(std::string_view procedure,
                                                      const Args& args = {});
  ///@}

  ///@{ Fan-in
  void drain(std::span<const QueryFuturePtr> futures);

  /**
   * @brief Drains, and returns, the outstanding query futures.
   */
  std::vector<QueryFuturePtr> drain_all();

  /**
   * @brief Snapshot of the unconsumed async futures, ordered by handle.
   */
  std::vector<QueryFuturePtr> outstanding_queries() const;
  std::vector<ExecFuturePtr> outstanding_execs() const;
  ///@}

  ///@{ Session data, from the login response
  /**
   * @brief Default-constructed `LoginData` on a moved-from connection.
   */
  const wire::LoginData& login_data() const;
  int32_t host_id() const { return login_data().host_id; }
  int64_t connection_id() const { return login_data().connection_id; }
  int64_t cluster_start_timestamp() const { return login_data().cluster_start_timestamp; }
  std::string leader_address() const { return login_data().leader_address_string(); }
  std::string_view build_string() const { return login_data().build_string; }
  ///@}

  /**
   * @brief Number of responses dropped because no future was registered for their handle.
   */
  uint64_t orphaned_responses() const;
};

} // namespace voltwire::client
