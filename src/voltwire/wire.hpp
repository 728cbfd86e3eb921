#pragma once

#include "wire/codec.hpp"
#include "wire/primitives.hpp"
#include "wire/response.hpp"
#include "wire/table.hpp"
#include "wire/wire-types.hpp"
