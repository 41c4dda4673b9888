#pragma once

// lindos/version.hpp - Version manifest for every surface a foreign runtime sees.
//
// INVARIANT:
//   Constants are compile-time. A consumer compiled against one set of headers
//   checks lindos_abi_version() at load time and refuses to continue on mismatch.

#include <cstdint>
#include <string>

namespace lindos {
namespace version {

// ---------------------------------------------------------------------------
// ENGINE_ABI_VERSION
// Bump on any change to a c_api.h function signature or its ownership rules.
// ---------------------------------------------------------------------------
constexpr uint32_t ENGINE_ABI_VERSION = 1;

// ---------------------------------------------------------------------------
// ENVELOPE_LAYOUT_VERSION
// Layout of lindos_result_t: {bool success; int32_t error_code; char* data}.
// Reordering or adding fields requires a bump and an ABI bump.
// ---------------------------------------------------------------------------
constexpr uint32_t ENVELOPE_LAYOUT_VERSION = 1;

// ---------------------------------------------------------------------------
// DIAGNOSTIC_FORMAT_VERSION
// Field set of the "[LINDOS DEBUG] {json}" line (observability.hpp).
// ---------------------------------------------------------------------------
constexpr uint32_t DIAGNOSTIC_FORMAT_VERSION = 1;

struct VersionManifest {
  uint32_t engine_abi{ENGINE_ABI_VERSION};
  uint32_t envelope_layout{ENVELOPE_LAYOUT_VERSION};
  uint32_t diagnostic_format{DIAGNOSTIC_FORMAT_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& engine_semver = "");

std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;
  std::string description;
  uint32_t required_abi{ENGINE_ABI_VERSION};
  uint32_t actual_abi{ENGINE_ABI_VERSION};
};

CompatibilityResult check_compatibility(uint32_t caller_abi_version = ENGINE_ABI_VERSION);

}  // namespace version
}  // namespace lindos
