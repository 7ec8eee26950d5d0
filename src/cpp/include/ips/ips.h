#pragma once

/// Umbrella header for the IPS patch library.

#include "ips/types.h"
#include "ips/io.h"
#include "ips/codec.h"
#include "ips/hunk.h"
#include "ips/patch.h"
