#pragma once

#include "buffer.hpp"

#include "voltwire/utils/error-codes.hpp"

#include <cstdint>
#include <span>
#include <system_error>

namespace voltwire::net {

/**
 * @brief A frame is a 4 byte big-endian length, followed by that many payload bytes.
 *
 * The length never counts itself. Login frames carry an extra protocol-version byte and
 * password-hash-version byte ahead of the payload, and these _are_ counted in the length.
 */
static constexpr std::size_t k_frame_header_size = sizeof(int32_t);

static constexpr uint32_t k_default_max_frame_size = 50u * 1024u * 1024u;

static constexpr uint8_t k_protocol_version = 1;      //!< Sent in the login frame
static constexpr uint8_t k_password_hash_version = 1; //!< 0 is SHA-1, 1 is SHA-256

/**
 * @brief Encode the frame header for a payload of `payload_size` bytes.
 * @return false iff the payload is too large to be framed.
 */
inline bool encode_frame_header(std::span<std::byte, k_frame_header_size> header,
                                std::size_t payload_size);

/**
 * @brief Decode a frame header, validating the length against `max_frame_size`.
 * Errors
 * + `ecode::invalid_data` if the length is negative
 * + `ecode::object_too_large` if the length exceeds `max_frame_size`
 */
inline std::error_code decode_frame_header(std::span<const std::byte, k_frame_header_size> header,
                                           uint32_t max_frame_size, uint32_t& payload_size);

/**
 * @brief Write `payload` as a single frame. The whole frame is handed to the stream in one
 * gather-write; callers must not write to the same stream concurrently.
 */
template <typename SyncWriteStream>
std::error_code write_frame(SyncWriteStream& stream, std::span<const std::byte> payload);

/**
 * @brief Write the login variant of a frame.
 */
template <typename SyncWriteStream>
std::error_code write_login_frame(SyncWriteStream& stream, std::span<const std::byte> payload,
                                  uint8_t protocol_version = k_protocol_version,
                                  uint8_t password_hash_version = k_password_hash_version);

/**
 * @brief Blocking read of exactly one frame into `payload` (which is resized to fit).
 * Errors
 * + `ecode::stream_closed` if the stream ended cleanly before the frame started
 * + `ecode::premature_eof` if the stream ended part way through a frame
 * + `ecode::invalid_data`/`ecode::object_too_large` for a malformed length
 * + Any other error reported by the stream
 */
template <typename SyncReadStream>
std::error_code read_frame(SyncReadStream& stream, BufferType& payload,
                           uint32_t max_frame_size = k_default_max_frame_size);

} // namespace voltwire::net

#include "impl/framing_impl.hpp"
