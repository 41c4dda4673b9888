#include "lindos/boundary_heap.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <new>

namespace lindos {

char* BoundaryHeap::allocate_string(std::string_view s) {
  auto* p = static_cast<char*>(std::malloc(s.size() + 1));
  if (!p) return nullptr;
  if (!s.empty()) std::memcpy(p, s.data(), s.size());
  p[s.size()] = '\0';

  std::lock_guard<std::mutex> lk(mu_);
  try {
    live_.insert(p);
  } catch (const std::bad_alloc&) {
    std::free(p);  // registry growth failed; the caller sees an allocation failure
    return nullptr;
  }
  ++total_allocations_;
  return p;
}

void BoundaryHeap::release(char* p) {
  if (!p) return;
  bool was_live = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = live_.find(p);
    if (it != live_.end()) {
      live_.erase(it);
      ++total_releases_;
      was_live = true;
    }
  }
  if (!was_live) {
    protocol_violation("release of a pointer not owned by the boundary (double release?)", p);
  }
  std::free(p);
}

bool BoundaryHeap::owns(const void* p) const {
  std::lock_guard<std::mutex> lk(mu_);
  return live_.count(p) != 0;
}

std::size_t BoundaryHeap::live_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return live_.size();
}

uint64_t BoundaryHeap::total_allocations() const {
  std::lock_guard<std::mutex> lk(mu_);
  return total_allocations_;
}

uint64_t BoundaryHeap::total_releases() const {
  std::lock_guard<std::mutex> lk(mu_);
  return total_releases_;
}

BoundaryHeap& boundary_heap() {
  static BoundaryHeap inst;
  return inst;
}

void protocol_violation(const char* what, const void* ptr) {
  std::fprintf(stderr, "[lindos] FATAL protocol violation: %s (ptr=%p)\n", what, ptr);
  std::fflush(stderr);
  std::abort();
}

}  // namespace lindos
