#include "lindos/debug.hpp"

#include <atomic>

#include "lindos/observability.hpp"

namespace lindos {

namespace {
std::atomic<bool> g_debug_enabled{false};
}

void set_debug_enabled(bool enabled) {
  g_debug_enabled.store(enabled, std::memory_order_relaxed);
  write_diagnostic_line(enabled ? "Debug logging enabled" : "Debug logging disabled");
}

bool debug_enabled() {
  return g_debug_enabled.load(std::memory_order_relaxed);
}

}  // namespace lindos
