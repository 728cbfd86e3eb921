#pragma once

#include "client/connection.hpp"
#include "client/drain.hpp"
#include "client/pending-future.hpp"
