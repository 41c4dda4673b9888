#pragma once

// lindos/observability.hpp - Diagnostic records and engine statistics.
//
// DESIGN:
//   DiagnosticEvent is the observable unit. Every validate/process call at the
//   boundary produces one. emit_diagnostic() always folds it into the global
//   EngineStats; only while debug_enabled() is true is it also written out:
//     1. to the installed hook, if any (set_diagnostic_hook), otherwise
//     2. as one JSON line to the configured log file, otherwise
//     3. as one line on stderr, prefixed "[LINDOS DEBUG] ".
//
// PRIVACY INVARIANT:
//   A DiagnosticEvent never carries message text. It carries the input length
//   in bytes and a keyed fingerprint (hash.hpp) that correlates identical
//   messages inside one process only.
//
// CONCURRENCY:
//   EngineStats counters are relaxed atomics. Output writes are serialized by an
//   internal mutex so concurrent callers never interleave partial lines.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "lindos/types.hpp"

namespace lindos {

struct DiagnosticEvent {
  std::string operation;        // "validate" | "process"
  std::string correlation_id;   // message_fingerprint(), empty when debug is off
  std::string responder_id;     // process only
  size_t      input_bytes{0};
  int32_t     error_code{0};    // wire code of the outcome kind
  bool        ok{false};
  uint64_t    duration_ns{0};
  std::string detail;           // processing_failure diagnostic, never user text
};

std::string diagnostic_to_json(const DiagnosticEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two microsecond buckets
// ---------------------------------------------------------------------------
// Bucket i covers [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]; returns microseconds, 0.0 when empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;
  void reset();

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats - global aggregated counters
// ---------------------------------------------------------------------------
class EngineStats {
 public:
  // Slots 0..4 are the known codes, the last slot collects unknown(n).
  static constexpr size_t kOutcomeSlots = 6;

  void record(const DiagnosticEvent& ev);

  uint64_t outcomes_for(const ErrorKind& kind) const;
  std::string to_json() const;

  // Test support: zero every counter.
  void reset();

  std::atomic<uint64_t> total_validations{0};
  std::atomic<uint64_t> total_processed{0};
  std::atomic<uint64_t> successful{0};
  std::atomic<uint64_t> failed{0};
  std::atomic<uint64_t> diagnostics_written{0};

  LatencyHistogram process_latency;

 private:
  static size_t slot_for(int32_t code);
  std::array<std::atomic<uint64_t>, kOutcomeSlots> outcomes_{};
};

EngineStats& global_engine_stats();

// Fold the event into stats and, when debug is on, write it out. Callers that
// already sampled the debug flag at their call boundary pass it in so one call
// never sees two different values.
void emit_diagnostic(const DiagnosticEvent& ev);
void emit_diagnostic(const DiagnosticEvent& ev, bool debug);

// Write one free-form line to the current destination (file or stderr).
// Bypasses the debug gate and the hook; used for lifecycle notices.
void write_diagnostic_line(std::string_view line);

// Hooks run on the calling thread without the sink lock held; they must be
// safe for concurrent invocation.
using DiagnosticHook = void (*)(const DiagnosticEvent&);
void set_diagnostic_hook(DiagnosticHook hook);

// Empty path = stderr.
void set_diagnostic_log_path(const std::string& path);
std::string diagnostic_log_path();

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

}  // namespace lindos
