#pragma once

/// @file gitshort.h
/// Umbrella header: include this to get the full gitshort C++ API.

#include "error.h"
#include "types.h"
#include "record.h"
#include "ids.h"
#include "resolver.h"
#include "store.h"
#include "publish.h"
#include "config.h"
#include "logging.h"
