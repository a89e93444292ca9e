#pragma once

#define FUSE_USE_VERSION 35

#include <fuse3/fuse.h>
#include <memory>

namespace rw::fuse {

class Bridge;

/// Routes every libfuse callback of getOperations() to bridge.
void bind(std::shared_ptr<Bridge> bridge);

fuse_operations getOperations();

}
