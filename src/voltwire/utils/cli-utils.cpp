#include "cli-utils.hpp"

#include <stdexcept>

#include "base-include.hpp"

namespace voltwire::cli
{
// ---------------------------------------------------------------- safe-arg-str
/**
 * @ingroup cli
 * @brief Get the argument after `i` from command line arguments `argc` and
 *        `argv`. `i` must be in the range `[0..argc)`. If `i+1 == argc`
 *        then an exception is thrown.
 *
 * Preconditions:
 * + `argc` and `argv` describe an array of `char *` "c" strings.
 * + `i >= 0` and `i < argc`
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc`, or if string is too long to
 *    allocate.
 * + `std::bad_alloc` if allocation fails.
 */
std::string safe_arg_str(int argc, char** argv, int& i)
{
   Expects(argc >= 0);
   Expects(i >= 0 && i < argc);
   string out = {};
   try {
      {
         string arg = argv[i];
         ++i;

         if(i >= argc) {
            auto msg = fmt::format("expected string after argument '{}'", arg);
            throw std::runtime_error(msg);
         }
      }

      out = std::string(argv[i]);
   } catch(std::length_error& e) {
      throw std::runtime_error("length error creating string");
   }

   return out;
}

// ---------------------------------------------------------------- safe-arg-int
/**
 * @ingroup cli
 * @brief Parse the argument (as an integer) after `i` from command line
 *        arguments `argc` and `argv`. If `i+1 == argc`, or the argument cannot
 *        be parsed as a (possibly negative) integer, then an exception is thrown.
 *
 * Postconditions:
 * + `i = i + 1`, i.e., ready to parse the next argument.
 *
 * Exceptions
 * + `std::runtime_error` if `i+1 >= argc` or if `argv[i+1]` cannot be
 *   parsed as an integer.
 */
int safe_arg_int(int argc, char** argv, int& i)
{
   Expects(argc >= 0);
   Expects(i >= 0 && i < argc);
   auto arg = argv[i];
   ++i;
   auto badness = (i >= argc);
   auto ret     = 0;

   if(!badness) {
      char* end     = nullptr;
      auto long_ret = strtol(argv[i], &end, 10);
      if(*end != '\0' or long_ret > std::numeric_limits<int>::max()
         or long_ret < std::numeric_limits<int>::lowest())
         badness = true;
      else
         ret = static_cast<int>(long_ret);
   }

   if(badness) {
      auto msg = fmt::format("expected integer after argument '{}'", arg);
      throw std::runtime_error(msg);
   }

   return ret;
}

// --------------------------------------------------------------- safe-arg-port
/**
 * @ingroup cli
 * @brief As `safe_arg_int`, but the value must be a valid tcp port, `[1..65535]`.
 */
uint16_t safe_arg_port(int argc, char** argv, int& i)
{
   const auto arg   = string{argv[i]};
   const auto value = safe_arg_int(argc, argv, i);
   if(value <= 0 || value > std::numeric_limits<uint16_t>::max())
      throw std::runtime_error(
          fmt::format("port after argument '{}' out of range: {}", arg, value));
   return static_cast<uint16_t>(value);
}

} // namespace voltwire::cli
