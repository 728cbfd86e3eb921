#pragma once

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/endian/conversion.hpp>

#include <array>
#include <limits>

namespace voltwire::net {

// ---------------------------------------------------------------------------------- frame header

inline bool encode_frame_header(std::span<std::byte, k_frame_header_size> header,
                                std::size_t payload_size) {
  if (payload_size > std::size_t(std::numeric_limits<int32_t>::max()))
    return false;
  const auto length = boost::endian::native_to_big(int32_t(payload_size));
  std::memcpy(header.data(), &length, sizeof(length));
  return true;
}

inline std::error_code decode_frame_header(std::span<const std::byte, k_frame_header_size> header,
                                           uint32_t max_frame_size, uint32_t& payload_size) {
  int32_t length = 0;
  std::memcpy(&length, header.data(), sizeof(length));
  boost::endian::big_to_native_inplace(length);
  if (length < 0)
    return make_error_code(ecode::invalid_data);
  if (uint32_t(length) > max_frame_size)
    return make_error_code(ecode::object_too_large);
  payload_size = uint32_t(length);
  return {};
}

// ----------------------------------------------------------------------------------- write frame

template <typename SyncWriteStream>
std::error_code write_frame(SyncWriteStream& stream, std::span<const std::byte> payload) {
  std::array<std::byte, k_frame_header_size> header;
  if (!encode_frame_header(header, payload.size()))
    return make_error_code(ecode::object_too_large);

  const std::array<boost::asio::const_buffer, 2> buffers{
      boost::asio::buffer(header.data(), header.size()),
      boost::asio::buffer(payload.data(), payload.size())};

  boost::system::error_code ec;
  boost::asio::write(stream, buffers, ec);
  return ec;
}

// ----------------------------------------------------------------------------- write login frame

template <typename SyncWriteStream>
std::error_code write_login_frame(SyncWriteStream& stream, std::span<const std::byte> payload,
                                  uint8_t protocol_version, uint8_t password_hash_version) {
  // The two version bytes are counted in the length
  std::array<std::byte, k_frame_header_size + 2> header;
  if (!encode_frame_header(std::span<std::byte, k_frame_header_size>{header.data(),
                                                                     k_frame_header_size},
                           payload.size() + 2))
    return make_error_code(ecode::object_too_large);
  header[k_frame_header_size + 0] = std::byte{protocol_version};
  header[k_frame_header_size + 1] = std::byte{password_hash_version};

  const std::array<boost::asio::const_buffer, 2> buffers{
      boost::asio::buffer(header.data(), header.size()),
      boost::asio::buffer(payload.data(), payload.size())};

  boost::system::error_code ec;
  boost::asio::write(stream, buffers, ec);
  return ec;
}

// ------------------------------------------------------------------------------------ read frame

template <typename SyncReadStream>
std::error_code read_frame(SyncReadStream& stream, BufferType& payload, uint32_t max_frame_size) {
  std::array<std::byte, k_frame_header_size> header;
  boost::system::error_code ec;

  boost::asio::read(stream, boost::asio::buffer(header.data(), header.size()), ec);
  if (ec == boost::asio::error::eof)
    return make_error_code(ecode::stream_closed);
  if (ec)
    return ec;

  uint32_t payload_size = 0;
  if (auto err = decode_frame_header(header, max_frame_size, payload_size); err)
    return err;

  payload.resize(payload_size);
  if (payload_size == 0)
    return {};

  boost::asio::read(stream, boost::asio::buffer(payload.data(), payload.size()), ec);
  if (ec == boost::asio::error::eof)
    return make_error_code(ecode::premature_eof);
  return ec;
}

} // namespace voltwire::net
