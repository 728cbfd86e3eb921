#pragma once

#include "voltwire/async/handle-allocator.hpp"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace voltwire::wire {

/**
 * @brief Type codes as they appear on the wire, for parameters and for table columns.
 */
enum class WireType : int8_t {
  ARRAY = -99,
  NULL_TYPE = 1,
  TINYINT = 3,
  SMALLINT = 4,
  INTEGER = 5,
  BIGINT = 6,
  FLOAT = 8,
  STRING = 9,
  TIMESTAMP = 11,
  DECIMAL = 22,
  VARBINARY = 25
};

constexpr std::string_view str(WireType type) {
#define CASE(x)                                                                                    \
  case WireType::x:                                                                                \
    return #x
  switch (type) {
    CASE(ARRAY);
    CASE(NULL_TYPE);
    CASE(TINYINT);
    CASE(SMALLINT);
    CASE(INTEGER);
    CASE(BIGINT);
    CASE(FLOAT);
    CASE(STRING);
    CASE(TIMESTAMP);
    CASE(DECIMAL);
    CASE(VARBINARY);
  }
#undef CASE
  return "<unknown case>";
}

/**
 * @brief True for the types that we can encode as parameters and decode from tables.
 */
constexpr bool is_supported(WireType type) {
  switch (type) {
  case WireType::NULL_TYPE:
  case WireType::TINYINT:
  case WireType::SMALLINT:
  case WireType::INTEGER:
  case WireType::BIGINT:
  case WireType::FLOAT:
  case WireType::STRING:
  case WireType::TIMESTAMP:
  case WireType::VARBINARY:
    return true;
  default:
    return false;
  }
}

/**
 * @brief Procedure status codes in a response. Anything other than `SUCCESS` is a failure.
 */
enum class ResponseStatus : int8_t {
  SUCCESS = 1,
  USER_ABORT = -1,
  GRACEFUL_FAILURE = -2,
  UNEXPECTED_FAILURE = -3,
  CONNECTION_LOST = -4,
  SERVER_UNAVAILABLE = -5,
  CONNECTION_TIMEOUT = -6,
  RESPONSE_UNKNOWN = -7,
  TXN_RESTART = -8,
  OPERATIONAL_FAILURE = -9,
  UNINITIALIZED_APP_STATUS = -128
};

constexpr std::string_view str(ResponseStatus status) {
#define CASE(x)                                                                                    \
  case ResponseStatus::x:                                                                          \
    return #x
  switch (status) {
    CASE(SUCCESS);
    CASE(USER_ABORT);
    CASE(GRACEFUL_FAILURE);
    CASE(UNEXPECTED_FAILURE);
    CASE(CONNECTION_LOST);
    CASE(SERVER_UNAVAILABLE);
    CASE(CONNECTION_TIMEOUT);
    CASE(RESPONSE_UNKNOWN);
    CASE(TXN_RESTART);
    CASE(OPERATIONAL_FAILURE);
    CASE(UNINITIALIZED_APP_STATUS);
  }
#undef CASE
  return "<unknown case>";
}

// ------------------------------------------------------------------------------------------ Values

struct Null {
  bool operator==(const Null&) const = default;
};

/**
 * @brief Microseconds since the unix epoch.
 */
struct Timestamp {
  int64_t micros{0};
  auto operator<=>(const Timestamp&) const = default;
};

using Varbinary = std::vector<std::byte>;

/**
 * @brief A single parameter or table cell.
 */
using Value = std::variant<Null, int8_t, int16_t, int32_t, int64_t, double, std::string,
                           Timestamp, Varbinary>;

WireType wire_type_of(const Value& value);

inline bool is_null(const Value& value) { return std::holds_alternative<Null>(value); }

/**
 * @brief Human readable rendition, for logging and diagnostics.
 */
std::string to_string(const Value& value);

// ----------------------------------------------------------------------------- Null sentinels

static constexpr int8_t k_null_tinyint = std::numeric_limits<int8_t>::min();
static constexpr int16_t k_null_smallint = std::numeric_limits<int16_t>::min();
static constexpr int32_t k_null_integer = std::numeric_limits<int32_t>::min();
static constexpr int64_t k_null_bigint = std::numeric_limits<int64_t>::min();
static constexpr double k_null_float = -1.7E+308;
static constexpr int32_t k_null_string_length = -1;

} // namespace voltwire::wire
