
#include "stdinc.hpp"

#include "voltwire/client.hpp"

#include "../fake-volt-server.hpp"

#include <catch2/catch_all.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

namespace voltwire::client::test {

using net::StatusCode;
using testing::FakeVoltServer;

static Connection::Config make_config(const FakeVoltServer& server,
                                      std::shared_ptr<async::HandleAllocator> handles) {
  Connection::Config config;
  config.host = "127.0.0.1";
  config.port = server.port();
  config.handles = std::move(handles);
  return config;
}

static Connection::Args greeting(std::string hello, std::string world, std::string dialect) {
  return {std::move(hello), std::move(world), std::move(dialect)};
}

/**
 * Issues 1 MiB calls from a background thread until one fails. Against a server that reads
 * nothing, the thread ends up blocked inside a write, holding the connection's write lock.
 */
struct StalledWriter {
  static constexpr std::size_t k_payload_size = 1024 * 1024;
  static constexpr std::size_t k_max_calls = 256;

  std::atomic<std::size_t> sent{0};
  std::atomic<bool> is_done{false};
  std::vector<QueryFuturePtr> futures{}; // read only after `thread` is joined
  net::Status last_error{};
  std::thread thread{};

  explicit StalledWriter(Connection& conn) {
    thread = std::thread{[this, &conn]() {
      const Connection::Args args{std::string(k_payload_size, 'x')};
      for (std::size_t i = 0; i < k_max_calls; ++i) {
        auto future = conn.call_async("@Bulk", args);
        if (!future) {
          last_error = future.error();
          break;
        }
        futures.push_back(std::move(*future));
        ++sent;
      }
      is_done = true;
    }};
  }

  ~StalledWriter() {
    if (thread.joinable())
      thread.join();
  }

  /**
   * @return true once no call has completed for 250ms, false if the thread finished instead
   */
  bool wait_until_blocked() {
    using namespace std::chrono_literals;
    auto last_sent = sent.load();
    auto quiet_since = std::chrono::steady_clock::now();
    while (!is_done.load()) {
      std::this_thread::sleep_for(10ms);
      const auto now = std::chrono::steady_clock::now();
      if (const auto current = sent.load(); current != last_sent) {
        last_sent = current;
        quiet_since = now;
      } else if (now - quiet_since > 250ms) {
        return true;
      }
    }
    return false;
  }
};

// ------------------------------------------------------------------------------------------ open

CATCH_TEST_CASE("ConnectionOpen", "[connection]") {
  auto handles = std::make_shared<async::HandleAllocator>();

  CATCH_SECTION("login") {
    FakeVoltServer server{{.user = "admin", .password = "secret", .build_string = "fake-11"}};
    auto config = make_config(server, handles);
    config.user = "admin";
    config.password = "secret";

    auto conn = Connection::open(config);
    CATCH_REQUIRE(conn.has_value());
    CATCH_REQUIRE(conn->is_open());
    CATCH_REQUIRE(conn->connection_id() == 1);
    CATCH_REQUIRE(conn->leader_address() == "127.0.0.1");
    CATCH_REQUIRE(conn->build_string() == "fake-11");
    CATCH_REQUIRE(conn->close().ok());
    CATCH_REQUIRE(!conn->is_open());
  }

  CATCH_SECTION("bad-password") {
    FakeVoltServer server{{.user = "admin", .password = "secret"}};
    auto config = make_config(server, handles);
    config.user = "admin";
    config.password = "guess";
    auto conn = Connection::open(config);
    CATCH_REQUIRE(!conn.has_value());
    CATCH_REQUIRE(conn.error().error_code() == StatusCode::AUTHENTICATION_FAILED);
  }

  CATCH_SECTION("rejected") {
    FakeVoltServer server{{.reject_login = true}};
    auto conn = Connection::open(make_config(server, handles));
    CATCH_REQUIRE(conn.error().error_code() == StatusCode::AUTHENTICATION_FAILED);
  }

  CATCH_SECTION("connect-error") {
    uint16_t port = 0;
    { // A port that nobody is listening on
      FakeVoltServer server;
      port = server.port();
    }
    Connection::Config config;
    config.host = "127.0.0.1";
    config.port = port;
    config.handles = handles;
    auto conn = Connection::open(config);
    CATCH_REQUIRE(conn.error().error_code() == StatusCode::CONNECT_ERROR);
  }

  CATCH_SECTION("no-handle-allocator") {
    FakeVoltServer server;
    auto conn = Connection::open(make_config(server, nullptr));
    CATCH_REQUIRE(conn.error().error_code() == StatusCode::CONNECT_ERROR);
  }
}

// ----------------------------------------------------------------------------------------- calls

CATCH_TEST_CASE("ConnectionCalls", "[connection]") {
  auto handles = std::make_shared<async::HandleAllocator>();
  FakeVoltServer server;
  auto conn = Connection::open(make_config(server, handles));
  CATCH_REQUIRE(conn.has_value());

  CATCH_SECTION("hello-world") {
    const std::vector<Connection::Args> rows{greeting("Hello", "World", "English"),
                                             greeting("Bonjour", "Monde", "French"),
                                             greeting("Hola", "Mundo", "Spanish"),
                                             greeting("Hej", "Verden", "Danish"),
                                             greeting("Ciao", "Mondo", "Italian")};
    for (const auto& row : rows)
      CATCH_REQUIRE(conn->call_async("HELLOWORLD.insert", row).has_value());
    auto select = conn->call_async("HELLOWORLD.select", {std::string{"French"}});
    CATCH_REQUIRE(select.has_value());

    const auto drained = conn->drain_all();
    CATCH_REQUIRE(drained.size() == 6);
    for (const auto& future : drained) {
      CATCH_REQUIRE(!future->is_active());
      CATCH_REQUIRE(future->get().has_value());
    }
    CATCH_REQUIRE(conn->outstanding_queries().empty());

    const auto& response = *(*select)->get();
    CATCH_REQUIRE(response.table_count() == 1);
    CATCH_REQUIRE(response.table(0).row_count() == 1);
    const auto row = response.table(0).row(0);
    CATCH_REQUIRE(row.get_string("HELLO") == std::optional<std::string>{"Bonjour"});
    CATCH_REQUIRE(row.get_string("WORLD") == std::optional<std::string>{"Monde"});
  }

  CATCH_SECTION("blocking-call") {
    auto insert = conn->exec("HELLOWORLD.insert", greeting("Hej", "Verden", "Danish"));
    CATCH_REQUIRE(insert.has_value());
    CATCH_REQUIRE(insert->rows_affected == 1);

    auto select = conn->call("HELLOWORLD.select", {std::string{"Danish"}});
    CATCH_REQUIRE(select.has_value());
    CATCH_REQUIRE(select->table(0).row_count() == 1);

    // Blocking calls are not tracked
    CATCH_REQUIRE(conn->outstanding_queries().empty());
    CATCH_REQUIRE(conn->outstanding_execs().empty());
  }

  CATCH_SECTION("procedure-failed") {
    auto result = conn->call("NoSuchProcedure");
    CATCH_REQUIRE(!result.has_value());
    CATCH_REQUIRE(result.error().error_code() == StatusCode::PROCEDURE_FAILED);
    CATCH_REQUIRE(result.error().error_message() == "Procedure NoSuchProcedure was not found");
  }

  CATCH_SECTION("outstanding") {
    auto a = conn->call_async("@NoReply");
    auto b = conn->call_async("@NoReply");
    auto c = conn->exec_async("@NoReply");
    CATCH_REQUIRE((a && b && c));

    const auto queries = conn->outstanding_queries();
    CATCH_REQUIRE(queries.size() == 2);
    CATCH_REQUIRE(queries[0] == *a);
    CATCH_REQUIRE(queries[1] == *b);
    CATCH_REQUIRE(conn->outstanding_execs().size() == 1);

    // Close resolves everything that is outstanding
    CATCH_REQUIRE(conn->close().ok());
    for (const auto& future : queries)
      CATCH_REQUIRE(future->get().error().error_code() == StatusCode::CONNECTION_LOST);
    CATCH_REQUIRE((*c)->get().error().error_code() == StatusCode::CONNECTION_LOST);
    CATCH_REQUIRE(conn->outstanding_queries().empty());
  }

  CATCH_SECTION("get-consumes") {
    auto future = conn->call_async("HELLOWORLD.select", {std::string{"Klingon"}});
    CATCH_REQUIRE(future.has_value());
    CATCH_REQUIRE((*future)->get().has_value());
    CATCH_REQUIRE(conn->outstanding_queries().empty());
  }

  CATCH_SECTION("orphan") {
    auto result = conn->call("@Orphan");
    CATCH_REQUIRE(result.has_value());
    CATCH_REQUIRE(conn->orphaned_responses() == 1);
  }

  CATCH_SECTION("closed-connection") {
    CATCH_REQUIRE(conn->close().ok());
    const auto received = server.requests_received();

    auto result = conn->call("HELLOWORLD.select", {std::string{"French"}});
    CATCH_REQUIRE(result.error().error_code() == StatusCode::CONNECTION_CLOSED);
    CATCH_REQUIRE(conn->call_async("@NoReply").error().error_code() ==
                  StatusCode::CONNECTION_CLOSED);
    CATCH_REQUIRE(conn->exec("@NoReply").error().error_code() == StatusCode::CONNECTION_CLOSED);
    CATCH_REQUIRE(conn->close().error_code() == StatusCode::CONNECTION_CLOSED);
    CATCH_REQUIRE(server.requests_received() == received);
  }

  CATCH_SECTION("server-drops") {
    auto future = conn->call_async("@NoReply");
    CATCH_REQUIRE(future.has_value());
    while (server.requests_received() == 0)
      std::this_thread::sleep_for(std::chrono::milliseconds{1});
    server.disconnect();

    const auto& result = (*future)->get();
    CATCH_REQUIRE(result.error().error_code() == StatusCode::CONNECTION_LOST);

    // The listener has ended; new calls fail synchronously
    auto again = conn->call_async("@NoReply");
    CATCH_REQUIRE(!again.has_value());
    CATCH_REQUIRE(again.error().error_code() == StatusCode::CONNECTION_LOST);
    CATCH_REQUIRE(conn->outstanding_queries().empty());
  }

  CATCH_SECTION("moved") {
    Connection moved = std::move(*conn);
    CATCH_REQUIRE(moved.is_open());
    CATCH_REQUIRE(!conn->is_open());
    CATCH_REQUIRE(conn->call("@NoReply").error().error_code() == StatusCode::CONNECTION_CLOSED);
    CATCH_REQUIRE(moved.exec("HELLOWORLD.insert", greeting("a", "b", "c")).has_value());

    // Session data stays with the live connection
    CATCH_REQUIRE(moved.build_string() == "voltwire-fake-server");
    CATCH_REQUIRE(conn->login_data() == wire::LoginData{});
    CATCH_REQUIRE(conn->connection_id() == 0);
    CATCH_REQUIRE(conn->build_string().empty());
    CATCH_REQUIRE(conn->close().error_code() == StatusCode::CONNECTION_CLOSED);
  }
}

// ----------------------------------------------------------------------------------- concurrency

CATCH_TEST_CASE("ConnectionConcurrency", "[connection]") {
  auto handles = std::make_shared<async::HandleAllocator>();

  CATCH_SECTION("reverse-order-responses") {
    constexpr std::size_t k_n_threads = 4;
    FakeVoltServer server{{.reverse_batch = k_n_threads}};
    auto conn = Connection::open(make_config(server, handles));
    CATCH_REQUIRE(conn.has_value());

    std::vector<ExecFuturePtr> futures(k_n_threads);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < k_n_threads; ++i)
      threads.emplace_back([&conn, &futures, i]() {
        auto future = conn->exec_async(
            "HELLOWORLD.insert", greeting(fmt::format("hello-{}", i), "world", "Test"));
        if (future)
          futures[i] = *future;
      });
    for (auto& thread : threads)
      thread.join();

    std::vector<Handle> seen;
    for (const auto& future : futures) {
      CATCH_REQUIRE(future != nullptr);
      const auto& result = future->get();
      CATCH_REQUIRE(result.has_value());
      CATCH_REQUIRE(result->handle == future->handle());
      seen.push_back(future->handle());
    }
    ranges::sort(seen);
    CATCH_REQUIRE(ranges::adjacent_find(seen) == end(seen));
    CATCH_REQUIRE(server.greetings().size() == k_n_threads);
  }

  CATCH_SECTION("sequential-connections") {
    FakeVoltServer server;
    std::vector<Handle> seen;
    for (auto i = 0; i < 3; ++i) {
      auto conn = Connection::open(make_config(server, handles));
      CATCH_REQUIRE(conn.has_value());
      for (auto j = 0; j < 2; ++j) {
        auto future = conn->exec_async("HELLOWORLD.insert", greeting("x", "y", "z"));
        CATCH_REQUIRE(future.has_value());
        seen.push_back((*future)->handle());
      }
      for (const auto& future : conn->outstanding_execs())
        CATCH_REQUIRE(future->get().has_value());
      CATCH_REQUIRE(conn->close().ok());
    }

    CATCH_REQUIRE(seen.size() == 6);
    CATCH_REQUIRE(ranges::adjacent_find(seen, std::greater_equal<>{}) == end(seen)); // increasing
    CATCH_REQUIRE(server.handles_received() == seen);
    CATCH_REQUIRE(server.connections_accepted() == 3);
  }

  CATCH_SECTION("close-wakes-a-blocked-writer") {
    FakeVoltServer server{{.stall_reads = true}};
    auto conn = Connection::open(make_config(server, handles));
    CATCH_REQUIRE(conn.has_value());

    StalledWriter writer{*conn};
    CATCH_REQUIRE(writer.wait_until_blocked());

    auto closing = std::async(std::launch::async, [&conn]() { return conn->close(); });
    CATCH_REQUIRE(closing.wait_for(std::chrono::seconds{5}) == std::future_status::ready);
    CATCH_REQUIRE(closing.get().ok());
    writer.thread.join();

    CATCH_REQUIRE(writer.last_error.error_code() == StatusCode::SEND_ERROR);
    CATCH_REQUIRE(!writer.futures.empty());
    for (const auto& future : writer.futures)
      CATCH_REQUIRE(future->get().error().error_code() == StatusCode::CONNECTION_LOST);
    CATCH_REQUIRE(conn->outstanding_queries().empty());
  }

  CATCH_SECTION("send-error-deregisters-the-handle") {
    FakeVoltServer server{{.stall_reads = true}};
    auto conn = Connection::open(make_config(server, handles));
    CATCH_REQUIRE(conn.has_value());

    StalledWriter writer{*conn};
    CATCH_REQUIRE(writer.wait_until_blocked());
    server.reset();
    writer.thread.join();

    // The write in progress fails synchronously, and its handle is forgotten
    CATCH_REQUIRE(writer.last_error.error_code() == StatusCode::SEND_ERROR);
    CATCH_REQUIRE(!writer.futures.empty());
    const auto failed_handle = handles->last();
    CATCH_REQUIRE(failed_handle == writer.futures.back()->handle() + 1);

    const auto outstanding = conn->outstanding_queries();
    CATCH_REQUIRE(outstanding.size() == writer.futures.size());
    CATCH_REQUIRE(ranges::none_of(outstanding, [failed_handle](const auto& future) {
      return future->handle() == failed_handle;
    }));

    // Requests that were sent before the reset are lost with the connection
    for (const auto& future : writer.futures)
      CATCH_REQUIRE(future->get().error().error_code() == StatusCode::CONNECTION_LOST);
    CATCH_REQUIRE(conn->outstanding_queries().empty());
    CATCH_REQUIRE(conn->call_async("@NoReply").error().error_code() ==
                  StatusCode::CONNECTION_LOST);
    CATCH_REQUIRE(conn->orphaned_responses() == 0);
  }

  CATCH_SECTION("send-failures-are-synchronous") {
    FakeVoltServer server;
    auto conn = Connection::open(make_config(server, handles));
    CATCH_REQUIRE(conn.has_value());

    std::atomic<bool> done = false;
    std::thread closer{[&]() {
      std::this_thread::sleep_for(std::chrono::milliseconds{5});
      server.disconnect();
      done = true;
    }};

    // Every call either succeeds, or fails immediately without leaving a trace
    std::vector<QueryFuturePtr> issued;
    while (!done.load() || issued.size() < 10) {
      auto future = conn->call_async("@NoReply");
      if (future) {
        issued.push_back(*future);
        continue;
      }
      const auto code = future.error().error_code();
      CATCH_REQUIRE((code == StatusCode::SEND_ERROR || code == StatusCode::CONNECTION_LOST));
      if (done.load())
        break;
    }
    closer.join();

    for (const auto& future : issued)
      CATCH_REQUIRE(future->get().error().error_code() == StatusCode::CONNECTION_LOST);
    CATCH_REQUIRE(conn->outstanding_queries().empty());
  }
}

} // namespace voltwire::client::test
