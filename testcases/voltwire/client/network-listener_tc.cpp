
#include "stdinc.hpp"

#include "voltwire/client/network-listener.hpp"

#include "../fake-volt-server.hpp"

#include <catch2/catch_all.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>

namespace voltwire::client::test {

namespace asio = boost::asio;
using Socket = asio::local::stream_protocol::socket;
using net::StatusCode;
using wire::ResponseStatus;

static void send(Socket& socket, const net::BufferType& payload) {
  CATCH_REQUIRE(!net::write_frame(socket, net::to_span_bytes(payload)));
}

static wire::Table count_table(int64_t count) {
  return wire::Table{
      0, {wire::Column{"modified_tuples", wire::WireType::BIGINT}}, {{wire::Value{count}}}};
}

CATCH_TEST_CASE("NetworkListener", "[network-listener]") {
  asio::io_context io_context;
  Socket client{io_context};
  Socket server{io_context};
  asio::local::connect_pair(client, server);

  NetworkListener<Socket> listener{client};
  listener.start();
  CATCH_REQUIRE(listener.is_running());

  CATCH_SECTION("reverse-order") {
    std::vector<QueryFuturePtr> futures;
    for (Handle handle = 1; handle <= 4; ++handle) {
      futures.push_back(std::make_shared<QueryFuture>(handle));
      CATCH_REQUIRE(listener.register_query(futures.back()));
    }
    CATCH_REQUIRE(listener.pending_count() == 4);

    for (Handle handle = 4; handle >= 1; --handle)
      send(server, testing::encode_response(handle, ResponseStatus::SUCCESS));

    for (const auto& future : futures) {
      const auto& result = future->get();
      CATCH_REQUIRE(result.has_value());
      CATCH_REQUIRE(result->handle == future->handle());
    }
    CATCH_REQUIRE(listener.pending_count() == 0);
    CATCH_REQUIRE(listener.stats().delivered == 4);
  }

  CATCH_SECTION("exec") {
    auto future = std::make_shared<ExecFuture>(10);
    CATCH_REQUIRE(listener.register_exec(future));
    send(server,
         testing::encode_response(10, ResponseStatus::SUCCESS, {count_table(2), count_table(3)}));
    const auto& result = future->get();
    CATCH_REQUIRE(result.has_value());
    CATCH_REQUIRE(result->rows_affected == 5);
  }

  CATCH_SECTION("procedure-failed") {
    auto future = std::make_shared<QueryFuture>(11);
    CATCH_REQUIRE(listener.register_query(future));
    send(server, testing::encode_response(11, ResponseStatus::USER_ABORT, {},
                                          std::string{"rolled back"}));
    const auto& result = future->get();
    CATCH_REQUIRE(!result.has_value());
    CATCH_REQUIRE(result.error().error_code() == StatusCode::PROCEDURE_FAILED);
    CATCH_REQUIRE(result.error().error_message() == "rolled back");
  }

  CATCH_SECTION("undecodable-response") {
    auto future = std::make_shared<QueryFuture>(12);
    CATCH_REQUIRE(listener.register_query(future));
    auto payload = testing::encode_response(12, ResponseStatus::SUCCESS, {count_table(1)});
    payload.resize(payload.size() - 3);
    send(server, payload);
    const auto& result = future->get();
    CATCH_REQUIRE(!result.has_value());
    CATCH_REQUIRE(result.error().error_code() == StatusCode::PROTOCOL_ERROR);
    CATCH_REQUIRE(listener.is_running()); // a bad payload does not end the loop
  }

  CATCH_SECTION("orphan") {
    auto future = std::make_shared<QueryFuture>(13);
    CATCH_REQUIRE(listener.register_query(future));
    send(server, testing::encode_response(99, ResponseStatus::SUCCESS));
    send(server, testing::encode_response(13, ResponseStatus::SUCCESS));
    CATCH_REQUIRE(future->get().has_value());
    CATCH_REQUIRE(listener.stats().orphaned == 1);
    CATCH_REQUIRE(listener.stats().delivered == 1);
  }

  CATCH_SECTION("removed-handle") {
    auto future = std::make_shared<QueryFuture>(14);
    auto sentinel = std::make_shared<QueryFuture>(15);
    CATCH_REQUIRE(listener.register_query(future));
    CATCH_REQUIRE(listener.register_query(sentinel));
    CATCH_REQUIRE(listener.remove(14));
    CATCH_REQUIRE(!listener.remove(14));

    send(server, testing::encode_response(14, ResponseStatus::SUCCESS));
    send(server, testing::encode_response(15, ResponseStatus::SUCCESS));
    CATCH_REQUIRE(sentinel->get().has_value());
    CATCH_REQUIRE(future->is_active());
    CATCH_REQUIRE(listener.stats().orphaned == 1);
  }

  CATCH_SECTION("peer-closed") {
    std::vector<ExecFuturePtr> futures;
    for (Handle handle = 20; handle < 23; ++handle) {
      futures.push_back(std::make_shared<ExecFuture>(handle));
      CATCH_REQUIRE(listener.register_exec(futures.back()));
    }
    server.close();

    for (const auto& future : futures) {
      const auto& result = future->get();
      CATCH_REQUIRE(!result.has_value());
      CATCH_REQUIRE(result.error().error_code() == StatusCode::CONNECTION_LOST);
    }
    CATCH_REQUIRE(!listener.register_exec(std::make_shared<ExecFuture>(23)));
  }

  CATCH_SECTION("stop") {
    auto future = std::make_shared<QueryFuture>(30);
    CATCH_REQUIRE(listener.register_query(future));
    listener.stop();
    CATCH_REQUIRE(!listener.is_running());
    CATCH_REQUIRE(!future->is_active());
    CATCH_REQUIRE(future->get().error().error_code() == StatusCode::CONNECTION_LOST);
    CATCH_REQUIRE(!listener.register_query(std::make_shared<QueryFuture>(31)));
    listener.stop(); // idempotent
  }

  listener.stop();
}

} // namespace voltwire::client::test
