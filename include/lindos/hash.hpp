#pragma once

// lindos/hash.hpp - BLAKE3 helpers for diagnostic correlation.
//
// message_fingerprint() is a keyed BLAKE3 hash under a random key drawn once per
// process. Two diagnostic records for the same message in the same process carry
// the same id; the id reveals nothing about the text outside that process, and
// it is truncated so it is useless as a content digest.

#include <cstddef>
#include <string>
#include <string_view>

namespace lindos {

constexpr size_t kFingerprintHexChars = 16;

std::string message_fingerprint(std::string_view message);

// Unkeyed BLAKE3-256, 64 lowercase hex chars.
std::string blake3_hex(std::string_view payload);

// Version string reported by the linked BLAKE3 library.
std::string blake3_library_version();

}  // namespace lindos
