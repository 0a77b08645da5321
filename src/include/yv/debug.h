#pragma once

#include <cstdlib>

namespace yv {

// Tracing to stderr is enabled by setting YV_DEBUG in the environment.
// The lookup happens once per process.
inline bool debug_enabled() {
    static const bool enabled = std::getenv("YV_DEBUG") != nullptr;
    return enabled;
}

}  // namespace yv
