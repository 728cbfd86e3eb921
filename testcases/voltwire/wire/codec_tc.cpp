
#include "stdinc.hpp"

#include "voltwire/wire.hpp"

#include "../fake-volt-server.hpp"

#include <catch2/catch_all.hpp>

#include <openssl/evp.h>

namespace voltwire::wire::test {

using net::BufferType;

static BufferType bytes(std::initializer_list<int> values) {
  BufferType out;
  for (auto x : values)
    out.push_back(std::byte(x));
  return out;
}

// ------------------------------------------------------------------------------------ primitives

CATCH_TEST_CASE("WirePrimitives", "[wire]") {
  CATCH_SECTION("big-endian") {
    BufferType out;
    write_i16(out, 0x0102);
    write_i32(out, -2);
    write_i64(out, 0x0102030405060708ll);
    CATCH_REQUIRE(out == bytes({1, 2, 0xff, 0xff, 0xff, 0xfe, 1, 2, 3, 4, 5, 6, 7, 8}));

    ByteReader in{out};
    int16_t a = 0;
    int32_t b = 0;
    int64_t c = 0;
    CATCH_REQUIRE(!read_i16(in, a));
    CATCH_REQUIRE(!read_i32(in, b));
    CATCH_REQUIRE(!read_i64(in, c));
    CATCH_REQUIRE(a == 0x0102);
    CATCH_REQUIRE(b == -2);
    CATCH_REQUIRE(c == 0x0102030405060708ll);
    CATCH_REQUIRE(in.empty());
  }

  CATCH_SECTION("strings") {
    BufferType out;
    CATCH_REQUIRE(!write_string(out, "ab"));
    write_null_string(out);
    CATCH_REQUIRE(out == bytes({0, 0, 0, 2, 'a', 'b', 0xff, 0xff, 0xff, 0xff}));

    ByteReader in{out};
    std::optional<std::string> s;
    CATCH_REQUIRE(!read_string(in, s));
    CATCH_REQUIRE(s == "ab");
    CATCH_REQUIRE(!read_string(in, s));
    CATCH_REQUIRE(!s.has_value());
  }

  CATCH_SECTION("underflow") {
    const auto out = bytes({0, 0, 0, 9, 'a'});
    ByteReader in{out};
    std::optional<std::string> s;
    CATCH_REQUIRE(read_string(in, s) == make_error_code(ecode::buffer_underflow));

    ByteReader short_in{std::span<const std::byte>{out}.subspan(0, 3)};
    int32_t x = 0;
    CATCH_REQUIRE(read_i32(short_in, x) == make_error_code(ecode::buffer_underflow));
  }

  CATCH_SECTION("float") {
    BufferType out;
    write_f64(out, 1.5);
    CATCH_REQUIRE(out == bytes({0x3f, 0xf8, 0, 0, 0, 0, 0, 0}));
    ByteReader in{out};
    double x = 0.0;
    CATCH_REQUIRE(!read_f64(in, x));
    CATCH_REQUIRE(x == 1.5);
  }
}

// ----------------------------------------------------------------------------------------- login

CATCH_TEST_CASE("LoginCodec", "[wire]") {
  CATCH_SECTION("login-message") {
    BufferType out;
    CATCH_REQUIRE(!serialize_login_message(out, "admin", "secret"));

    ByteReader in{out};
    std::string service, user;
    CATCH_REQUIRE(!read_string(in, service));
    CATCH_REQUIRE(!read_string(in, user));
    CATCH_REQUIRE(service == "database");
    CATCH_REQUIRE(user == "admin");
    CATCH_REQUIRE(in.remaining() == k_password_hash_size);

    std::array<unsigned char, 32> expected;
    unsigned int size = 0;
    CATCH_REQUIRE(EVP_Digest("secret", 6, expected.data(), &size, EVP_sha256(), nullptr) == 1);
    const auto hash = in.rest();
    CATCH_REQUIRE(std::equal(hash.begin(), hash.end(), expected.begin(), expected.end(),
                             [](std::byte a, unsigned char b) { return a == std::byte(b); }));
  }

  CATCH_SECTION("login-response") {
    LoginData data;
    data.version = 0;
    data.host_id = 3;
    data.connection_id = 77;
    data.cluster_start_timestamp = 1234567;
    data.leader_address = {10, 0, 0, 42};
    data.build_string = "volt-11.0";

    const auto payload = testing::encode_login_response(0, data);
    auto decoded = deserialize_login_response(payload);
    CATCH_REQUIRE(decoded.has_value());
    CATCH_REQUIRE(*decoded == data);
    CATCH_REQUIRE(decoded->leader_address_string() == "10.0.0.42");
  }

  CATCH_SECTION("login-rejected") {
    const auto payload = testing::encode_login_response(1, LoginData{});
    auto decoded = deserialize_login_response(payload);
    CATCH_REQUIRE(!decoded.has_value());
    CATCH_REQUIRE(decoded.error() == make_error_code(ecode::authentication_rejected));
  }

  CATCH_SECTION("login-truncated") {
    auto payload = testing::encode_login_response(0, LoginData{});
    payload.resize(payload.size() - 2);
    auto decoded = deserialize_login_response(payload);
    CATCH_REQUIRE(!decoded.has_value());
    CATCH_REQUIRE(decoded.error() == make_error_code(ecode::buffer_underflow));
  }
}

// ------------------------------------------------------------------------------------ invocation

CATCH_TEST_CASE("InvocationCodec", "[wire]") {
  CATCH_SECTION("layout") {
    BufferType out;
    const std::vector<Value> args{Null{}, int8_t{7}, std::string{"x"}};
    CATCH_REQUIRE(!serialize_statement(out, "P", 0x0a, args));
    CATCH_REQUIRE(out == bytes({0,                               // version
                                0, 0, 0, 1, 'P',                 // procedure
                                0, 0, 0, 0, 0, 0, 0, 0x0a,       // handle
                                0, 3,                            // parameter count
                                1,                               // null
                                3, 7,                            // tinyint
                                9, 0, 0, 0, 1, 'x'}));           // string
  }

  CATCH_SECTION("all-types") {
    BufferType out;
    const std::vector<Value> args{Null{},
                                  int8_t{-1},
                                  int16_t{300},
                                  int32_t{-70000},
                                  int64_t{1} << 40,
                                  2.25,
                                  std::string{"Bonjour"},
                                  Timestamp{1'600'000'000'000'000},
                                  Varbinary{std::byte{1}, std::byte{2}}};
    CATCH_REQUIRE(!serialize_statement(out, "HELLOWORLD.insert", 99, args));

    auto invocation = testing::decode_invocation(out);
    CATCH_REQUIRE(invocation.has_value());
    CATCH_REQUIRE(invocation->procedure == "HELLOWORLD.insert");
    CATCH_REQUIRE(invocation->handle == 99);
    CATCH_REQUIRE(invocation->args == args);
  }

  CATCH_SECTION("peek-handle") {
    const auto response = testing::encode_response(-5, ResponseStatus::SUCCESS);
    CATCH_REQUIRE(peek_handle(response) == Handle{-5});
    CATCH_REQUIRE(!peek_handle(bytes({0, 1, 2})).has_value());
  }

  CATCH_SECTION("value-types") {
    CATCH_REQUIRE(wire_type_of(Value{}) == WireType::NULL_TYPE);
    CATCH_REQUIRE(wire_type_of(Value{int16_t{1}}) == WireType::SMALLINT);
    CATCH_REQUIRE(wire_type_of(Value{Timestamp{}}) == WireType::TIMESTAMP);
    CATCH_REQUIRE(to_string(Value{std::string{"Hola"}}) == "'Hola'");
    CATCH_REQUIRE(to_string(Value{Varbinary{std::byte{0xab}, std::byte{0x01}}}) == "0xab01");
    CATCH_REQUIRE(to_string(Value{}) == "NULL");
  }
}

// -------------------------------------------------------------------------------------- response

CATCH_TEST_CASE("ResponseCodec", "[wire]") {
  const Table greetings{0,
                        {Column{"HELLO", WireType::STRING}, Column{"WORLD", WireType::STRING},
                         Column{"ID", WireType::INTEGER}, Column{"SCORE", WireType::FLOAT}},
                        {{std::string{"Bonjour"}, std::string{"Monde"}, int32_t{2}, 0.5},
                         {Null{}, std::string{"Mundo"}, Null{}, Null{}}}};

  CATCH_SECTION("tables") {
    const auto payload = testing::encode_response(42, ResponseStatus::SUCCESS, {greetings});
    auto response = deserialize_response(payload);
    CATCH_REQUIRE(response.has_value());
    CATCH_REQUIRE(response->handle == 42);
    CATCH_REQUIRE(response->ok());
    CATCH_REQUIRE(response->table_count() == 1);
    CATCH_REQUIRE(response->table(0) == greetings);

    const auto row = response->table(0).row(0);
    CATCH_REQUIRE(row.get_string("HELLO") == std::optional<std::string>{"Bonjour"});
    CATCH_REQUIRE(row.get_i64("ID") == std::optional<int64_t>{2});
    CATCH_REQUIRE(row.get_f64("SCORE") == std::optional<double>{0.5});
    CATCH_REQUIRE(row.get_i64("HELLO").error() == make_error_code(ecode::type_error));
    CATCH_REQUIRE(row.get("DIALECT").error() == make_error_code(ecode::column_not_found));
    CATCH_REQUIRE(row.get(9).error() == make_error_code(ecode::index_out_of_range));

    const auto nulls = response->table(0).row(1);
    CATCH_REQUIRE(nulls.get_string("HELLO") == std::optional<std::string>{});
    CATCH_REQUIRE(nulls.get_i64("ID") == std::optional<int64_t>{});
    CATCH_REQUIRE(nulls.get_f64("SCORE") == std::optional<double>{});
  }

  CATCH_SECTION("failure-status") {
    const auto payload = testing::encode_response(7, ResponseStatus::GRACEFUL_FAILURE, {},
                                                  std::string{"constraint violation"});
    auto response = deserialize_response(payload);
    CATCH_REQUIRE(response.has_value());
    CATCH_REQUIRE(!response->ok());
    CATCH_REQUIRE(response->status == ResponseStatus::GRACEFUL_FAILURE);
    CATCH_REQUIRE(response->status_string == "constraint violation");
    CATCH_REQUIRE(response->table_count() == 0);
  }

  CATCH_SECTION("exception-is-skipped") {
    BufferType payload;
    write_i8(payload, 0);
    write_i64(payload, 11);
    write_i8(payload, 0x40); // serialized exception present
    write_i8(payload, int8_t(ResponseStatus::SUCCESS));
    write_i8(payload, 0);
    write_i32(payload, 5);
    write_i32(payload, 3);
    write_raw(payload, bytes({1, 2, 3}));
    write_i16(payload, 0);

    auto response = deserialize_response(payload);
    CATCH_REQUIRE(response.has_value());
    CATCH_REQUIRE(response->handle == 11);
    CATCH_REQUIRE(response->cluster_round_trip == 5);
  }

  CATCH_SECTION("truncated-table") {
    auto payload = testing::encode_response(42, ResponseStatus::SUCCESS, {greetings});
    payload.resize(payload.size() - 1);
    CATCH_REQUIRE(deserialize_response(payload).error() ==
                  make_error_code(ecode::buffer_underflow));
  }

  CATCH_SECTION("unsupported-column") {
    BufferType payload;
    write_i8(payload, 0);
    write_i64(payload, 1);
    write_i8(payload, 0);
    write_i8(payload, int8_t(ResponseStatus::SUCCESS));
    write_i8(payload, 0);
    write_i32(payload, 0);
    write_i16(payload, 1);
    // table: metadata = status, 1 column, DECIMAL, name "D"; no rows
    write_i32(payload, 4 + 8 + 4);
    write_i32(payload, 8);
    write_i8(payload, 0);
    write_i16(payload, 1);
    write_i8(payload, int8_t(WireType::DECIMAL));
    CATCH_REQUIRE(!write_string(payload, ""));
    write_i32(payload, 0);

    CATCH_REQUIRE(deserialize_response(payload).error() ==
                  make_error_code(ecode::unsupported_type));
  }

  CATCH_SECTION("exec-result") {
    const Table counts{0, {Column{"modified_tuples", WireType::BIGINT}}, {{Value{int64_t{3}}}}};
    const Table empty{0, {Column{"modified_tuples", WireType::BIGINT}}, {}};
    const auto payload =
        testing::encode_response(5, ResponseStatus::SUCCESS, {counts, empty, counts});
    auto response = deserialize_response(payload);
    CATCH_REQUIRE(response.has_value());

    auto result = to_exec_result(*response);
    CATCH_REQUIRE(result.has_value());
    CATCH_REQUIRE(result->handle == 5);
    CATCH_REQUIRE(result->rows_affected == 6);

    Response not_counts;
    not_counts.tables.push_back(greetings);
    CATCH_REQUIRE(to_exec_result(not_counts).error() == make_error_code(ecode::type_error));
  }
}

} // namespace voltwire::wire::test
