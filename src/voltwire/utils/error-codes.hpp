#pragma once

#include <system_error>

/**
 * @defgroup error-codes Error Codes
 * @ingroup voltwire-utils
 *
 * Low level (wire codec, framing) error codes.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * // Not enough bytes left to decode an int64
 * return make_error_code(ecode::buffer_underflow);
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace voltwire
{
using std::error_code;

/**
 * @ingroup error-codes
 * @brief Complete set of voltwire error codes.
 */
enum class ecode : int {
   okay = 0,           //!< i.e., everything's okay.
   logic_error,        //!< Faulty logic in the program.
   buffer_underflow,   //!< Attempt to read beyond the end of a buffer.
   index_out_of_range, //!< Index error.
   argument_error,     //!< An invalid argument was supplied.
   type_error,         //!< Operation violates type system.

   stream_closed,    //!< The peer closed the stream on a message boundary.
   premature_eof,    //!< Stream encountered premature end-of-file.
   object_too_large, //!< Attempt to read/write an object that is too large.
   invalid_data,     //!< Input data (file/network/etc.) was invalid.
   unsupported_type, //!< A wire type-code that we cannot encode or decode.
   column_not_found, //!< No column with the requested name.

   authentication_rejected //!< The server refused the login credentials.
};
} // namespace voltwire

namespace std
{
template<> struct is_error_code_enum<voltwire::ecode> : true_type
{};
} // namespace std

namespace voltwire
{
error_code make_error_code(ecode);
} // namespace voltwire
