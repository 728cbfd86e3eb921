#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * @defgroup cli Command Line Utils
 * @ingroup voltwire-utils
 *
 * The `voltwire` method for parsing command-line arguments.
 */

namespace voltwire::cli
{
std::string safe_arg_str(int argc, char** argv, int& i);
int safe_arg_int(int argc, char** argv, int& i);
uint16_t safe_arg_port(int argc, char** argv, int& i);

} // namespace voltwire::cli
