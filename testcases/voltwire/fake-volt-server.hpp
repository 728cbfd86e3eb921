#pragma once

#include "stdinc.hpp"

#include "voltwire/net/buffer.hpp"
#include "voltwire/wire/codec.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace voltwire::testing {

// ------------------------------------------------------------------------------- server encoders

/**
 * @brief Appends a table, as the server would send it. Cells are written in column order;
 * a `Null` cell is written as the null sentinel of its column's type.
 */
void encode_table(net::BufferType& out, const wire::Table& table);

/**
 * @brief A complete response payload.
 */
net::BufferType encode_response(Handle handle, wire::ResponseStatus status,
                                const std::vector<wire::Table>& tables = {},
                                std::optional<std::string> status_string = std::nullopt);

net::BufferType encode_login_response(int8_t auth_code, const wire::LoginData& data);

/**
 * @brief A decoded invocation, as the server sees it.
 */
struct Invocation {
  std::string procedure{};
  Handle handle{0};
  std::vector<wire::Value> args{};
};

tl::expected<Invocation, error_code> decode_invocation(std::span<const std::byte> payload);

// --------------------------------------------------------------------------------- FakeVoltServer

/**
 * @brief A single-threaded server on an ephemeral localhost port, serving one connection at a
 * time. It keeps a HELLOWORLD table in memory, and understands:
 *
 * + `HELLOWORLD.insert(hello, world, dialect)`, returning a modified-tuples count of 1
 * + `HELLOWORLD.select(dialect)`, returning columns HELLO, WORLD, DIALECT
 * + `@NoReply`, which is never answered
 * + `@Orphan`, which is answered twice: first under an unregistered handle, then correctly
 *
 * Any other procedure is answered with `GRACEFUL_FAILURE`.
 */
class FakeVoltServer final {
public:
  struct Config {
    std::string user = {};
    std::string password = {};
    bool reject_login = false;
    std::size_t reverse_batch = 0; //!< If non-zero, responses are held and sent in reverse order
    bool stall_reads = false;      //!< After login, read nothing until dropped or stopped
    std::string build_string = "voltwire-fake-server";
  };

  struct Greeting {
    std::string hello;
    std::string world;
    std::string dialect;
  };

private:
  struct Pimpl;
  std::unique_ptr<Pimpl> pimpl_;

public:
  explicit FakeVoltServer(Config config = {});
  FakeVoltServer(const FakeVoltServer&) = delete;
  ~FakeVoltServer();
  FakeVoltServer& operator=(const FakeVoltServer&) = delete;

  uint16_t port() const;

  /**
   * @brief Abruptly drop the current connection, if any.
   */
  void disconnect();

  /**
   * @brief Drop the current connection with a TCP reset (linger 0).
   */
  void reset();

  void stop();

  std::size_t connections_accepted() const;
  std::size_t requests_received() const;
  std::vector<Handle> handles_received() const;
  std::vector<Greeting> greetings() const;
};

} // namespace voltwire::testing
