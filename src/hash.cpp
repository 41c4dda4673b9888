#include "lindos/hash.hpp"

// BLAKE3 is the sole hash primitive. The key for fingerprints is drawn from
// std::random_device the first time a fingerprint is requested and then lives
// for the rest of the process.

#include <array>
#include <cstdint>
#include <random>

extern "C" {
#include <blake3.h>
}

namespace lindos {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

const std::array<uint8_t, BLAKE3_KEY_LEN>& process_key() {
  static const std::array<uint8_t, BLAKE3_KEY_LEN> key = [] {
    std::array<uint8_t, BLAKE3_KEY_LEN> k{};
    std::random_device rd;
    for (std::size_t i = 0; i < k.size(); i += 4) {
      const uint32_t word = rd();
      for (std::size_t b = 0; b < 4 && i + b < k.size(); ++b) {
        k[i + b] = static_cast<uint8_t>(word >> (8 * b));
      }
    }
    return k;
  }();
  return key;
}

}  // namespace

std::string message_fingerprint(std::string_view message) {
  blake3_hasher hasher;
  blake3_hasher_init_keyed(&hasher, process_key().data());
  blake3_hasher_update(&hasher, message.data(), message.size());
  std::array<unsigned char, kFingerprintHexChars / 2> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string blake3_library_version() {
  const char* v = blake3_version();
  return v ? std::string(v) : std::string("unknown");
}

}  // namespace lindos
