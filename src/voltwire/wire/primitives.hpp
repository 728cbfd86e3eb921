#pragma once

#include "voltwire/net/buffer.hpp"
#include "voltwire/utils/error-codes.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

/**
 * Big-endian primitives of the client wire protocol. Writers append to a `BufferType`;
 * readers consume from a `ByteReader` and never read past its end.
 */

namespace voltwire::wire {
using net::BufferType;

/**
 * @brief Read cursor over a span of bytes.
 */
class ByteReader final {
private:
  std::span<const std::byte> data_{};
  std::size_t position_{0};

public:
  explicit ByteReader(std::span<const std::byte> data) noexcept : data_{data} {}

  std::size_t position() const noexcept { return position_; }
  std::size_t remaining() const noexcept { return data_.size() - position_; }
  bool empty() const noexcept { return remaining() == 0; }

  std::span<const std::byte> rest() const noexcept { return data_.subspan(position_); }

  /**
   * @brief Consume `size` bytes, returning a view of them in `out`.
   */
  error_code take(std::size_t size, std::span<const std::byte>& out) noexcept {
    if (size > remaining())
      return make_error_code(ecode::buffer_underflow);
    out = data_.subspan(position_, size);
    position_ += size;
    return {};
  }

  error_code skip(std::size_t size) noexcept {
    std::span<const std::byte> ignored;
    return take(size, ignored);
  }
};

// ------------------------------------------------------------------------------------- writers

void write_i8(BufferType& out, int8_t x);
void write_i16(BufferType& out, int16_t x);
void write_i32(BufferType& out, int32_t x);
void write_i64(BufferType& out, int64_t x);
void write_f64(BufferType& out, double x);

/// A 4 byte length followed by the bytes
error_code write_string(BufferType& out, std::string_view x);
error_code write_bytes(BufferType& out, std::span<const std::byte> x);
void write_null_string(BufferType& out);

/// No length prefix
void write_raw(BufferType& out, std::span<const std::byte> x);

// ------------------------------------------------------------------------------------- readers

error_code read_i8(ByteReader& in, int8_t& x);
error_code read_i16(ByteReader& in, int16_t& x);
error_code read_i32(ByteReader& in, int32_t& x);
error_code read_i64(ByteReader& in, int64_t& x);
error_code read_f64(ByteReader& in, double& x);

/// A length of -1 decodes to `std::nullopt`
error_code read_string(ByteReader& in, std::optional<std::string>& x);
error_code read_bytes(ByteReader& in, std::optional<std::vector<std::byte>>& x);

/// As above, but a null string is `ecode::invalid_data`
error_code read_string(ByteReader& in, std::string& x);

} // namespace voltwire::wire
