#include "lindos/observability.hpp"

#include <bit>
#include <cstdio>
#include <mutex>

#include "lindos/debug.hpp"
#include "lindos/jsonlite.hpp"

namespace lindos {

namespace {

inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

// Output destination. One mutex covers the path and every write, so lines from
// concurrent callers never interleave.
std::mutex g_sink_mu;
std::string g_log_path;
std::atomic<DiagnosticHook> g_hook{nullptr};

void write_line_locked(std::string_view line) {
  if (!g_log_path.empty()) {
    if (FILE* f = std::fopen(g_log_path.c_str(), "a")) {
      std::fwrite(line.data(), 1, line.size(), f);
      std::fputc('\n', f);
      std::fclose(f);
      return;
    }
    // Unwritable log file: fall through to stderr rather than lose the line.
  }
  std::fwrite(line.data(), 1, line.size(), stderr);
  std::fputc('\n', stderr);
}

}  // namespace

std::string diagnostic_to_json(const DiagnosticEvent& ev) {
  std::string out;
  out.reserve(192);
  out += "{\"op\":\"";
  out += jsonlite::escape(ev.operation);
  out += "\",\"id\":\"";
  out += ev.correlation_id;
  out += "\",\"bytes\":";
  out += std::to_string(ev.input_bytes);
  out += ",\"ok\":";
  out += ev.ok ? "true" : "false";
  out += ",\"code\":";
  out += std::to_string(ev.error_code);
  out += ",\"kind\":\"";
  out += to_string(error_kind_from_code(ev.error_code));
  out += "\",\"duration_ns\":";
  out += std::to_string(ev.duration_ns);
  if (!ev.responder_id.empty()) {
    out += ",\"responder\":\"";
    out += jsonlite::escape(ev.responder_id);
    out += "\"";
  }
  if (!ev.detail.empty()) {
    out += ",\"detail\":\"";
    out += jsonlite::escape(ev.detail);
    out += "\"";
  }
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(128);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += buf;
  out += ",\"p50_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += buf;
  out += ",\"p99_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.99));
  out += buf;
  out += '}';
  return out;
}

void LatencyHistogram::reset() {
  for (auto& b : buckets_) b.store(0, std::memory_order_relaxed);
  count_.store(0, std::memory_order_relaxed);
  sum_us_.store(0, std::memory_order_relaxed);
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

size_t EngineStats::slot_for(int32_t code) {
  if (code >= 0 && code < static_cast<int32_t>(kOutcomeSlots) - 1) {
    return static_cast<size_t>(code);
  }
  return kOutcomeSlots - 1;
}

void EngineStats::record(const DiagnosticEvent& ev) {
  if (ev.operation == "process") {
    total_processed.fetch_add(1, std::memory_order_relaxed);
    (ev.ok ? successful : failed).fetch_add(1, std::memory_order_relaxed);
    process_latency.record(ev.duration_ns);
  } else {
    total_validations.fetch_add(1, std::memory_order_relaxed);
  }
  outcomes_[slot_for(ev.error_code)].fetch_add(1, std::memory_order_relaxed);
}

uint64_t EngineStats::outcomes_for(const ErrorKind& kind) const {
  return outcomes_[slot_for(error_code_of(kind))].load(std::memory_order_relaxed);
}

std::string EngineStats::to_json() const {
  std::string out;
  out.reserve(512);
  out += "{\"total_validations\":";
  out += std::to_string(total_validations.load(std::memory_order_relaxed));
  out += ",\"total_processed\":";
  out += std::to_string(total_processed.load(std::memory_order_relaxed));
  out += ",\"successful\":";
  out += std::to_string(successful.load(std::memory_order_relaxed));
  out += ",\"failed\":";
  out += std::to_string(failed.load(std::memory_order_relaxed));
  out += ",\"diagnostics_written\":";
  out += std::to_string(diagnostics_written.load(std::memory_order_relaxed));
  out += ",\"outcomes\":{";
  for (size_t i = 0; i < kOutcomeSlots; ++i) {
    if (i) out += ',';
    out += '"';
    out += (i + 1 == kOutcomeSlots) ? std::string("unknown")
                                     : to_string(static_cast<ErrorCode>(i));
    out += "\":";
    out += std::to_string(outcomes_[i].load(std::memory_order_relaxed));
  }
  out += "},\"process_latency\":";
  out += process_latency.to_json();
  out += '}';
  return out;
}

void EngineStats::reset() {
  total_validations.store(0, std::memory_order_relaxed);
  total_processed.store(0, std::memory_order_relaxed);
  successful.store(0, std::memory_order_relaxed);
  failed.store(0, std::memory_order_relaxed);
  diagnostics_written.store(0, std::memory_order_relaxed);
  for (auto& o : outcomes_) o.store(0, std::memory_order_relaxed);
  process_latency.reset();
}

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

// ---------------------------------------------------------------------------
// Emission
// ---------------------------------------------------------------------------

void set_diagnostic_hook(DiagnosticHook hook) {
  g_hook.store(hook, std::memory_order_release);
}

void set_diagnostic_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  g_log_path = path;
}

std::string diagnostic_log_path() {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  return g_log_path;
}

void write_diagnostic_line(std::string_view line) {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  write_line_locked(line);
}

void emit_diagnostic(const DiagnosticEvent& ev) {
  emit_diagnostic(ev, debug_enabled());
}

void emit_diagnostic(const DiagnosticEvent& ev, bool debug) {
  global_engine_stats().record(ev);
  if (!debug) return;

  global_engine_stats().diagnostics_written.fetch_add(1, std::memory_order_relaxed);

  if (DiagnosticHook hook = g_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }

  const std::string line = "[LINDOS DEBUG] " + diagnostic_to_json(ev);
  std::lock_guard<std::mutex> lk(g_sink_mu);
  write_line_locked(line);
}

}  // namespace lindos
