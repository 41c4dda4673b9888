#include "lindos/version.hpp"

#include <sstream>

#include "lindos/hash.hpp"

#ifndef LINDOS_VERSION
#define LINDOS_VERSION "0.3.0"
#endif

namespace lindos {
namespace version {

VersionManifest current_manifest(const std::string& engine_semver) {
  VersionManifest m;
  m.engine_semver   = engine_semver.empty() ? LINDOS_VERSION : engine_semver;
  m.hash_primitive  = "blake3-" + blake3_library_version();
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"engine_abi\":" << m.engine_abi
    << ",\"envelope_layout\":" << m.envelope_layout
    << ",\"diagnostic_format\":" << m.diagnostic_format
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_compatibility(uint32_t caller_abi_version) {
  CompatibilityResult r;
  if (caller_abi_version != ENGINE_ABI_VERSION) {
    r.ok          = false;
    r.error_code  = "abi_version_mismatch";
    r.description = "Caller ABI version " + std::to_string(caller_abi_version) +
                    " != engine ABI version " + std::to_string(ENGINE_ABI_VERSION) +
                    ". Rebuild the caller against the current lindos headers.";
    r.actual_abi  = caller_abi_version;
  }
  return r;
}

}  // namespace version
}  // namespace lindos
