#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace voltwire::net {

/**
 * @brief Error taxonomy of the client api. `OK` is the only non-error.
 */
enum class StatusCode : int8_t {
  OK = 0,
  CONNECT_ERROR,         //!< Address resolution or dial failed
  PROTOCOL_ERROR,        //!< Malformed handshake or frame
  AUTHENTICATION_FAILED, //!< Server rejected the login
  CONNECTION_CLOSED,     //!< Operation attempted on a closed (or never opened) connection
  SEND_ERROR,            //!< Writing the request failed; the handle was deregistered
  CONNECTION_LOST,       //!< The network listener stopped before the response arrived
  DUPLICATE_RESOLUTION,  //!< A future was resolved twice: a logic error
  PROCEDURE_FAILED,      //!< The server answered with a non-success status
  SERIALIZATION_ERROR,   //!< Arguments could not be encoded
  IO_ERROR               //!< Unexpected stream error outside of a call
};

constexpr std::string_view str(StatusCode code) {
#define CASE(x)                                                                                    \
  case StatusCode::x:                                                                              \
    return #x
  switch (code) {
    CASE(OK);
    CASE(CONNECT_ERROR);
    CASE(PROTOCOL_ERROR);
    CASE(AUTHENTICATION_FAILED);
    CASE(CONNECTION_CLOSED);
    CASE(SEND_ERROR);
    CASE(CONNECTION_LOST);
    CASE(DUPLICATE_RESOLUTION);
    CASE(PROCEDURE_FAILED);
    CASE(SERIALIZATION_ERROR);
    CASE(IO_ERROR);
  }
#undef CASE
  return "<unknown case>";
}

class Status {
private:
  std::string error_message_{};
  std::string error_details_{};
  StatusCode status_code_{StatusCode::OK};

public:
  Status(StatusCode status_code = StatusCode::OK, std::string error_message = "",
         std::string error_details = "")
      : error_message_{std::move(error_message)}, error_details_{std::move(error_details)},
        status_code_{status_code} {}

  StatusCode error_code() const { return status_code_; }
  std::string_view error_message() const { return error_message_; }
  std::string_view error_details() const { return error_details_; }
  bool ok() const { return status_code_ == StatusCode::OK; }

  std::string to_string() const {
    std::string out{str(status_code_)};
    if (!error_message_.empty())
      out.append(": ").append(error_message_);
    if (!error_details_.empty())
      out.append(" (").append(error_details_).append(")");
    return out;
  }

  bool operator==(const Status& o) const {
    return (status_code_ == o.status_code_) && (error_message_ == o.error_message_) &&
           (error_details_ == o.error_details_);
  }
  bool operator!=(const Status& o) const { return !(*this == o); }
};

} // namespace voltwire::net
