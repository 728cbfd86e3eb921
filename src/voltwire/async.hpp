#pragma once

/**
 * @defgroup async Async
 * @ingroup voltwire
 */

#include "async/completion-queue.hpp"
#include "async/handle-allocator.hpp"
