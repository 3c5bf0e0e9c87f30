#pragma once

#include "runtime_context.hpp"

namespace toolbridge {

// Generic tools that ship with the binary: echo, add, sleep and the runtime
// introspection tools (runtime_stats, health_report, reset_circuits,
// clear_cache).
void RegisterBuiltinTools(RuntimeContext& ctx);

}  // namespace toolbridge
