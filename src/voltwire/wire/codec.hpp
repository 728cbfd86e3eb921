#pragma once

#include "primitives.hpp"
#include "response.hpp"
#include "wire-types.hpp"

#include <tl/expected.hpp>

#include <array>
#include <span>
#include <string>
#include <string_view>

namespace voltwire::wire {

static constexpr std::string_view k_default_service = "database";
static constexpr std::size_t k_password_hash_size = 32; //!< SHA-256

/**
 * @brief The server's half of the handshake.
 */
struct LoginData {
  int8_t version{0};
  int32_t host_id{0};
  int64_t connection_id{0};
  int64_t cluster_start_timestamp{0}; //!< milliseconds since the epoch
  std::array<uint8_t, 4> leader_address{};
  std::string build_string{};

  std::string leader_address_string() const;

  bool operator==(const LoginData&) const = default;
};

// ----------------------------------------------------------------------------------------- login

/**
 * @brief Login payload: service, user, and the SHA-256 of the password.
 * The caller frames it with `net::write_login_frame`.
 */
error_code serialize_login_message(BufferType& out, std::string_view user,
                                   std::string_view password,
                                   std::string_view service = k_default_service);

/**
 * @brief Errors
 * + `ecode::authentication_rejected` if the server refused the credentials
 * + `ecode::buffer_underflow`/`ecode::invalid_data` if the payload is malformed
 */
tl::expected<LoginData, error_code> deserialize_login_response(std::span<const std::byte> payload);

// ------------------------------------------------------------------------------------ invocation

error_code serialize_value(BufferType& out, const Value& value);

/**
 * @brief Invocation payload for `procedure` with positional `args`.
 */
error_code serialize_statement(BufferType& out, std::string_view procedure, Handle handle,
                               std::span<const Value> args);

// -------------------------------------------------------------------------------------- response

/**
 * @brief Reads only the version byte and the handle.
 */
tl::expected<Handle, error_code> peek_handle(std::span<const std::byte> payload);

tl::expected<Response, error_code> deserialize_response(std::span<const std::byte> payload);

/**
 * @brief Decode one table, consuming its length-prefixed bytes from `in`.
 */
tl::expected<Table, error_code> decode_table(ByteReader& in);

/**
 * @brief Decode one cell of `type`, mapping null sentinels to `Null`.
 */
tl::expected<Value, error_code> decode_value(ByteReader& in, WireType type);

} // namespace voltwire::wire
