#pragma once

#include <cstdint>

namespace rw::projection {

/// Seconds since the Unix epoch.
using Timestamp = std::int64_t;

}
