#include "stdinc.hpp"

#include "codec.hpp"

#include <openssl/evp.h>

namespace voltwire::wire {

namespace {
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

constexpr uint8_t k_status_string_present = 0x20;
constexpr uint8_t k_exception_present = 0x40;
constexpr uint8_t k_app_status_string_present = 0x80;

constexpr int8_t k_invocation_version = 0;

error_code sha256(std::string_view data, std::array<std::byte, k_password_hash_size>& out) {
  unsigned int size = 0;
  if (EVP_Digest(data.data(), data.size(), reinterpret_cast<unsigned char*>(out.data()), &size,
                 EVP_sha256(), nullptr) != 1 ||
      size != out.size())
    return make_error_code(ecode::logic_error);
  return {};
}

// Sets `ec` on the first failure, and ignores all subsequent reads.
struct Reader {
  ByteReader in;
  error_code ec{};

  template <typename T> T read(error_code (*reader)(ByteReader&, T&)) {
    T x{};
    if (!ec)
      ec = reader(in, x);
    return x;
  }
};
} // namespace

// ------------------------------------------------------------------------------------- LoginData

std::string LoginData::leader_address_string() const {
  return fmt::format("{}.{}.{}.{}", leader_address[0], leader_address[1], leader_address[2],
                leader_address[3]);
}

// ----------------------------------------------------------------------------------------- login

error_code serialize_login_message(BufferType& out, std::string_view user,
                                   std::string_view password, std::string_view service) {
  std::array<std::byte, k_password_hash_size> hash;
  if (auto ec = sha256(password, hash); ec)
    return ec;
  if (auto ec = write_string(out, service); ec)
    return ec;
  if (auto ec = write_string(out, user); ec)
    return ec;
  write_raw(out, hash);
  return {};
}

expected<LoginData, error_code> deserialize_login_response(std::span<const std::byte> payload) {
  Reader r{ByteReader{payload}};
  LoginData data;
  data.version = r.read<int8_t>(read_i8);
  const auto auth_code = r.read<int8_t>(read_i8);
  if (!r.ec && auth_code != 0)
    return make_unexpected(make_error_code(ecode::authentication_rejected));

  data.host_id = r.read<int32_t>(read_i32);
  data.connection_id = r.read<int64_t>(read_i64);
  data.cluster_start_timestamp = r.read<int64_t>(read_i64);

  std::span<const std::byte> address;
  if (!r.ec)
    r.ec = r.in.take(data.leader_address.size(), address);
  if (!r.ec)
    ranges::transform(address, data.leader_address.begin(),
                      [](std::byte b) { return std::to_integer<uint8_t>(b); });

  if (!r.ec)
    r.ec = read_string(r.in, data.build_string);

  if (r.ec)
    return make_unexpected(r.ec);
  return data;
}

// ------------------------------------------------------------------------------------ invocation

error_code serialize_value(BufferType& out, const Value& value) {
  write_i8(out, int8_t(wire_type_of(value)));
  return std::visit(overloaded{[](const Null&) { return error_code{}; },
                               [&out](int8_t x) {
                                 write_i8(out, x);
                                 return error_code{};
                               },
                               [&out](int16_t x) {
                                 write_i16(out, x);
                                 return error_code{};
                               },
                               [&out](int32_t x) {
                                 write_i32(out, x);
                                 return error_code{};
                               },
                               [&out](int64_t x) {
                                 write_i64(out, x);
                                 return error_code{};
                               },
                               [&out](double x) {
                                 write_f64(out, x);
                                 return error_code{};
                               },
                               [&out](const std::string& x) { return write_string(out, x); },
                               [&out](const Timestamp& x) {
                                 write_i64(out, x.micros);
                                 return error_code{};
                               },
                               [&out](const Varbinary& x) { return write_bytes(out, x); }},
                    value);
}

error_code serialize_statement(BufferType& out, std::string_view procedure, Handle handle,
                               std::span<const Value> args) {
  if (args.size() > std::size_t(std::numeric_limits<int16_t>::max()))
    return make_error_code(ecode::argument_error);

  write_i8(out, k_invocation_version);
  if (auto ec = write_string(out, procedure); ec)
    return ec;
  write_i64(out, handle);
  write_i16(out, int16_t(args.size()));
  for (const auto& arg : args)
    if (auto ec = serialize_value(out, arg); ec)
      return ec;
  return {};
}

// -------------------------------------------------------------------------------------- response

expected<Handle, error_code> peek_handle(std::span<const std::byte> payload) {
  Reader r{ByteReader{payload}};
  r.read<int8_t>(read_i8);
  const auto handle = r.read<int64_t>(read_i64);
  if (r.ec)
    return make_unexpected(r.ec);
  return handle;
}

expected<Response, error_code> deserialize_response(std::span<const std::byte> payload) {
  Reader r{ByteReader{payload}};
  Response response;

  r.read<int8_t>(read_i8); // version
  response.handle = r.read<int64_t>(read_i64);
  const auto fields = uint8_t(r.read<int8_t>(read_i8));
  response.status = ResponseStatus(r.read<int8_t>(read_i8));
  if (!r.ec && (fields & k_status_string_present))
    r.ec = read_string(r.in, response.status_string);
  response.app_status = r.read<int8_t>(read_i8);
  if (!r.ec && (fields & k_app_status_string_present))
    r.ec = read_string(r.in, response.app_status_string);
  response.cluster_round_trip = r.read<int32_t>(read_i32);

  if (!r.ec && (fields & k_exception_present)) {
    const auto length = r.read<int32_t>(read_i32);
    if (!r.ec)
      r.ec = (length < 0) ? make_error_code(ecode::invalid_data) : r.in.skip(std::size_t(length));
  }

  const auto table_count = r.read<int16_t>(read_i16);
  if (!r.ec && table_count < 0)
    r.ec = make_error_code(ecode::invalid_data);
  if (r.ec)
    return make_unexpected(r.ec);

  response.tables.reserve(std::size_t(table_count));
  for (int16_t i = 0; i < table_count; ++i) {
    auto table = decode_table(r.in);
    if (!table)
      return make_unexpected(table.error());
    response.tables.push_back(std::move(*table));
  }
  return response;
}

expected<Value, error_code> decode_value(ByteReader& in, WireType type) {
  error_code ec;
  Value value;
  switch (type) {
  case WireType::NULL_TYPE:
    break;
  case WireType::TINYINT: {
    int8_t x = 0;
    ec = read_i8(in, x);
    if (x != k_null_tinyint)
      value = x;
  } break;
  case WireType::SMALLINT: {
    int16_t x = 0;
    ec = read_i16(in, x);
    if (x != k_null_smallint)
      value = x;
  } break;
  case WireType::INTEGER: {
    int32_t x = 0;
    ec = read_i32(in, x);
    if (x != k_null_integer)
      value = x;
  } break;
  case WireType::BIGINT: {
    int64_t x = 0;
    ec = read_i64(in, x);
    if (x != k_null_bigint)
      value = x;
  } break;
  case WireType::FLOAT: {
    double x = 0.0;
    ec = read_f64(in, x);
    if (x > k_null_float)
      value = x;
  } break;
  case WireType::STRING: {
    std::optional<std::string> x;
    ec = read_string(in, x);
    if (x)
      value = std::move(*x);
  } break;
  case WireType::TIMESTAMP: {
    int64_t x = 0;
    ec = read_i64(in, x);
    if (x != k_null_bigint)
      value = Timestamp{x};
  } break;
  case WireType::VARBINARY: {
    std::optional<Varbinary> x;
    ec = read_bytes(in, x);
    if (x)
      value = std::move(*x);
  } break;
  default:
    ec = make_error_code(ecode::unsupported_type);
  }

  if (ec)
    return make_unexpected(ec);
  return value;
}

expected<Table, error_code> decode_table(ByteReader& in) {
  int32_t total_length = 0;
  std::span<const std::byte> table_bytes;
  if (auto ec = read_i32(in, total_length); ec)
    return make_unexpected(ec);
  if (total_length < 0)
    return make_unexpected(make_error_code(ecode::invalid_data));
  if (auto ec = in.take(std::size_t(total_length), table_bytes); ec)
    return make_unexpected(ec);

  Reader r{ByteReader{table_bytes}};
  const auto metadata_length = r.read<int32_t>(read_i32);
  if (!r.ec && metadata_length < 0)
    r.ec = make_error_code(ecode::invalid_data);
  const auto metadata_start = r.in.position();

  const auto status = r.read<int8_t>(read_i8);
  const auto column_count = r.read<int16_t>(read_i16);
  if (!r.ec && column_count < 0)
    r.ec = make_error_code(ecode::invalid_data);
  if (r.ec)
    return make_unexpected(r.ec);

  std::vector<Column> columns(std::size_t(column_count));
  for (auto& column : columns) {
    column.type = WireType(r.read<int8_t>(read_i8));
    if (!r.ec && !is_supported(column.type))
      r.ec = make_error_code(ecode::unsupported_type);
  }
  for (auto& column : columns)
    if (!r.ec)
      r.ec = read_string(r.in, column.name);
  if (!r.ec && r.in.position() - metadata_start != std::size_t(metadata_length))
    r.ec = make_error_code(ecode::invalid_data);

  const auto row_count = r.read<int32_t>(read_i32);
  if (!r.ec && row_count < 0)
    r.ec = make_error_code(ecode::invalid_data);
  if (r.ec)
    return make_unexpected(r.ec);

  std::vector<std::vector<Value>> rows;
  rows.reserve(std::min<std::size_t>(std::size_t(row_count), r.in.remaining()));
  for (int32_t i = 0; i < row_count; ++i) {
    const auto row_length = r.read<int32_t>(read_i32);
    std::span<const std::byte> row_bytes;
    if (!r.ec)
      r.ec = (row_length < 0) ? make_error_code(ecode::invalid_data)
                              : r.in.take(std::size_t(row_length), row_bytes);
    if (r.ec)
      return make_unexpected(r.ec);

    ByteReader row_reader{row_bytes};
    auto& row = rows.emplace_back();
    row.reserve(columns.size());
    for (const auto& column : columns) {
      auto value = decode_value(row_reader, column.type);
      if (!value)
        return make_unexpected(value.error());
      row.push_back(std::move(*value));
    }
    if (!row_reader.empty())
      return make_unexpected(make_error_code(ecode::invalid_data));
  }

  return Table{status, std::move(columns), std::move(rows)};
}

} // namespace voltwire::wire
