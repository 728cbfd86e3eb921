#include "error-codes.hpp"

#include <string>

namespace voltwire
{
namespace
{
   /**
    * @private
    */
   struct ECodeCategory : std::error_category
   {
      const char* name() const noexcept override;
      std::string message(int ev) const override;
   };

   /**
    * @private
    */
   const char* ECodeCategory::name() const noexcept { return "voltwire"; }

   /**
    * @private
    */
   std::string ECodeCategory::message(int e) const
   {
      switch(static_cast<ecode>(e)) {
      case ecode::okay: return "okay";
      case ecode::logic_error: return "logic error";
      case ecode::buffer_underflow: return "buffer underflow";
      case ecode::index_out_of_range: return "index out of range";
      case ecode::argument_error: return "argument error";
      case ecode::type_error: return "type error";
      case ecode::stream_closed: return "stream closed";
      case ecode::premature_eof: return "premature eof";
      case ecode::object_too_large: return "object too large";
      case ecode::invalid_data: return "invalid data";
      case ecode::unsupported_type: return "unsupported wire type";
      case ecode::column_not_found: return "column not found";
      case ecode::authentication_rejected: return "authentication rejected";
      }
      return "(unknown error)";
   }

   /**
    * @private
    */
   static const ECodeCategory ecode_category{};
} // namespace

/**
 * @ingroup error-codes
 * @brief Make an `ecode` `std::error_code`.
 */
error_code make_error_code(ecode e) { return {static_cast<int>(e), ecode_category}; }

} // namespace voltwire
