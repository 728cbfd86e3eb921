#include "primitives.hpp"

#include <boost/endian/conversion.hpp>

#include <bit>
#include <cstring>
#include <limits>

namespace voltwire::wire {

using net::operator<<;

// --------------------------------------------------------------------------------------- helpers

template <typename T> static void write_intT(BufferType& out, T x) {
  boost::endian::native_to_big_inplace(x);
  const auto offset = out.size();
  out.resize(offset + sizeof(x));
  std::memcpy(&out[offset], &x, sizeof(x));
}

template <typename T> static error_code read_intT(ByteReader& in, T& x) {
  std::span<const std::byte> bytes;
  if (auto ec = in.take(sizeof(T), bytes); ec)
    return ec;
  std::memcpy(&x, bytes.data(), sizeof(T)); // unaligned
  boost::endian::big_to_native_inplace(x);
  return {};
}

static error_code write_length(BufferType& out, std::size_t size) {
  if (size > std::size_t(std::numeric_limits<int32_t>::max()))
    return make_error_code(ecode::object_too_large);
  write_intT(out, int32_t(size));
  return {};
}

template <typename Container>
static error_code read_length_prefixed(ByteReader& in, std::optional<Container>& x) {
  int32_t length = 0;
  if (auto ec = read_intT(in, length); ec)
    return ec;
  if (length == -1) {
    x.reset();
    return {};
  }
  if (length < 0)
    return make_error_code(ecode::invalid_data);

  std::span<const std::byte> bytes;
  if (auto ec = in.take(std::size_t(length), bytes); ec)
    return ec;
  const auto first = reinterpret_cast<const typename Container::value_type*>(bytes.data());
  x.emplace(first, first + bytes.size());
  return {};
}

// --------------------------------------------------------------------------------------- writers

void write_i8(BufferType& out, int8_t x) { out.push_back(std::byte(x)); }
void write_i16(BufferType& out, int16_t x) { write_intT(out, x); }
void write_i32(BufferType& out, int32_t x) { write_intT(out, x); }
void write_i64(BufferType& out, int64_t x) { write_intT(out, x); }
void write_f64(BufferType& out, double x) { write_intT(out, std::bit_cast<uint64_t>(x)); }

error_code write_string(BufferType& out, std::string_view x) {
  if (auto ec = write_length(out, x.size()); ec)
    return ec;
  out << x;
  return {};
}

error_code write_bytes(BufferType& out, std::span<const std::byte> x) {
  if (auto ec = write_length(out, x.size()); ec)
    return ec;
  write_raw(out, x);
  return {};
}

void write_null_string(BufferType& out) { write_intT(out, int32_t(-1)); }

void write_raw(BufferType& out, std::span<const std::byte> x) {
  out.insert(out.end(), x.begin(), x.end());
}

// --------------------------------------------------------------------------------------- readers

error_code read_i8(ByteReader& in, int8_t& x) {
  std::span<const std::byte> bytes;
  if (auto ec = in.take(1, bytes); ec)
    return ec;
  x = std::to_integer<int8_t>(bytes[0]);
  return {};
}

error_code read_i16(ByteReader& in, int16_t& x) { return read_intT(in, x); }
error_code read_i32(ByteReader& in, int32_t& x) { return read_intT(in, x); }
error_code read_i64(ByteReader& in, int64_t& x) { return read_intT(in, x); }

error_code read_f64(ByteReader& in, double& x) {
  uint64_t bits = 0;
  auto ec = read_intT(in, bits);
  if (!ec)
    x = std::bit_cast<double>(bits);
  return ec;
}

error_code read_string(ByteReader& in, std::optional<std::string>& x) {
  return read_length_prefixed(in, x);
}

error_code read_bytes(ByteReader& in, std::optional<std::vector<std::byte>>& x) {
  return read_length_prefixed(in, x);
}

error_code read_string(ByteReader& in, std::string& x) {
  std::optional<std::string> value;
  if (auto ec = read_string(in, value); ec)
    return ec;
  if (!value)
    return make_error_code(ecode::invalid_data);
  x = std::move(*value);
  return {};
}

} // namespace voltwire::wire
