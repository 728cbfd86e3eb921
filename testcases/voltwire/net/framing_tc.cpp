
#include "stdinc.hpp"

#include "voltwire/net/framing.hpp"

#include <catch2/catch_all.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/write.hpp>

namespace voltwire::net::test {

namespace asio = boost::asio;
using Socket = asio::local::stream_protocol::socket;

static BufferType bytes(std::initializer_list<int> values) {
  BufferType out;
  for (auto x : values)
    out.push_back(std::byte(x));
  return out;
}

static void write_raw(Socket& socket, const BufferType& buffer) {
  boost::system::error_code ec;
  asio::write(socket, asio::buffer(buffer.data(), buffer.size()), ec);
  CATCH_REQUIRE(!ec);
}

CATCH_TEST_CASE("Framing", "[framing]") {
  asio::io_context io_context;
  Socket client{io_context};
  Socket server{io_context};
  asio::local::connect_pair(client, server);

  CATCH_SECTION("frame-layout") {
    const auto payload = make_send_buffer("hello");
    CATCH_REQUIRE(!write_frame(client, to_span_bytes(payload)));

    BufferType header(k_frame_header_size);
    asio::read(server, asio::buffer(header.data(), header.size()));
    CATCH_REQUIRE(header == bytes({0, 0, 0, 5}));

    BufferType body(5);
    asio::read(server, asio::buffer(body.data(), body.size()));
    CATCH_REQUIRE(body == payload);
  }

  CATCH_SECTION("login-frame-layout") {
    const auto payload = make_send_buffer("abc");
    CATCH_REQUIRE(!write_login_frame(client, to_span_bytes(payload)));

    BufferType frame(k_frame_header_size + 2 + 3);
    asio::read(server, asio::buffer(frame.data(), frame.size()));
    CATCH_REQUIRE(frame == bytes({0, 0, 0, 5, 1, 1, 'a', 'b', 'c'}));
  }

  CATCH_SECTION("read-frames") {
    const auto first = make_send_buffer("first");
    const BufferType empty;
    CATCH_REQUIRE(!write_frame(client, to_span_bytes(first)));
    CATCH_REQUIRE(!write_frame(client, to_span_bytes(empty)));

    BufferType payload;
    CATCH_REQUIRE(!read_frame(server, payload));
    CATCH_REQUIRE(payload == first);
    CATCH_REQUIRE(!read_frame(server, payload));
    CATCH_REQUIRE(payload.empty());
  }

  CATCH_SECTION("clean-close") {
    client.close();
    BufferType payload;
    CATCH_REQUIRE(read_frame(server, payload) == make_error_code(ecode::stream_closed));
  }

  CATCH_SECTION("premature-eof") {
    write_raw(client, bytes({0, 0, 0, 10, 'x', 'y'}));
    client.close();
    BufferType payload;
    CATCH_REQUIRE(read_frame(server, payload) == make_error_code(ecode::premature_eof));
  }

  CATCH_SECTION("negative-length") {
    write_raw(client, bytes({0xff, 0xff, 0xff, 0xfe}));
    BufferType payload;
    CATCH_REQUIRE(read_frame(server, payload) == make_error_code(ecode::invalid_data));
  }

  CATCH_SECTION("too-large") {
    write_raw(client, bytes({0, 0, 1, 0}));
    BufferType payload;
    CATCH_REQUIRE(read_frame(server, payload, 255) == make_error_code(ecode::object_too_large));
  }

  CATCH_SECTION("header-codec") {
    std::array<std::byte, k_frame_header_size> header;
    CATCH_REQUIRE(encode_frame_header(header, 0x01020304));
    CATCH_REQUIRE(BufferType(header.begin(), header.end()) == bytes({1, 2, 3, 4}));
    uint32_t size = 0;
    CATCH_REQUIRE(!decode_frame_header(header, k_default_max_frame_size, size));
    CATCH_REQUIRE(size == 0x01020304u);
    CATCH_REQUIRE(!encode_frame_header(header, std::size_t(1) << 31));
  }
}

} // namespace voltwire::net::test
