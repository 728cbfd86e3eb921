#pragma once

// Precompiled header for the library, the cli, and the testcases.

#include "voltwire/utils/base-include.hpp"
