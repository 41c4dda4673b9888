#pragma once

// lindos/boundary_heap.hpp - Ownership registry for memory handed across the C ABI.
//
// OWNERSHIP CONTRACT:
//   Every pointer the C ABI returns (envelope payloads, error messages, stats
//   JSON) is allocated here and recorded as live. It stays engine-owned until
//   the caller passes it back through lindos_release_string() or
//   lindos_release_result(); release() removes it from the live set and frees it.
//
//   Releasing a pointer that is not live (a second release, a pointer from
//   malloc/new, an interior pointer) is a protocol violation in the caller. It
//   is detected here and terminates the process via protocol_violation(). It is
//   never silently ignored: continuing would mean a double free was one code
//   change away.
//
//   release(nullptr) is a no-op. Failure envelopes legitimately carry no data.
//
// TEST HOOKS:
//   live_count() returns to its baseline after every allocate/release pair;
//   tests use it as the allocation counter.

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <unordered_set>

namespace lindos {

class BoundaryHeap {
 public:
  // Null-terminated copy of s. Returns nullptr only on allocation failure.
  char* allocate_string(std::string_view s);

  // Frees p. Terminates the process if p is non-null and not live.
  void release(char* p);

  bool owns(const void* p) const;
  std::size_t live_count() const;
  uint64_t total_allocations() const;
  uint64_t total_releases() const;

 private:
  mutable std::mutex mu_;
  std::unordered_set<const void*> live_;
  uint64_t total_allocations_{0};
  uint64_t total_releases_{0};
};

BoundaryHeap& boundary_heap();

// Report a caller-side contract breach and abort. Never returns.
[[noreturn]] void protocol_violation(const char* what, const void* ptr);

}  // namespace lindos
