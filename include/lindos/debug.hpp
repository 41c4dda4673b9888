#pragma once

// lindos/debug.hpp - Process-wide debug toggle.
//
// A single atomic flag, false at process start, never torn down. Any thread may
// flip it at any time. It gates diagnostic emission only: validation verdicts
// and envelope contents are identical whatever its value.
//
// Readers sample it once per call (at the call boundary), so a toggle racing
// with an in-flight process() affects at most that call's diagnostic record.

namespace lindos {

void set_debug_enabled(bool enabled);
bool debug_enabled();

}  // namespace lindos
