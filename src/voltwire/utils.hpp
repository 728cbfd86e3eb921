#pragma once

/**
 * @defgroup voltwire Voltwire
 */

/**
 * @defgroup voltwire-utils Utilities
 * @ingroup voltwire
 */

#include "utils/base-include.hpp"

#include "utils/error-codes.hpp"

#include "utils/cli-utils.hpp"
