#include "lindos/text.hpp"

namespace lindos {

namespace {

constexpr char32_t kInvalid = 0xFFFFFFFF;

// Decode one scalar value starting at bytes[i]. On success advances i past
// the sequence. On malformed input returns kInvalid and leaves i unchanged.
char32_t decode_at(std::string_view bytes, std::size_t& i) {
  const auto b0 = static_cast<unsigned char>(bytes[i]);
  if (b0 < 0x80) {
    ++i;
    return b0;
  }

  std::size_t len = 0;
  char32_t cp = 0;
  char32_t min = 0;
  if ((b0 & 0xE0) == 0xC0) {
    len = 2; cp = b0 & 0x1F; min = 0x80;
  } else if ((b0 & 0xF0) == 0xE0) {
    len = 3; cp = b0 & 0x0F; min = 0x800;
  } else if ((b0 & 0xF8) == 0xF0) {
    len = 4; cp = b0 & 0x07; min = 0x10000;
  } else {
    return kInvalid;  // continuation byte or 0xF8..0xFF lead
  }

  if (i + len > bytes.size()) return kInvalid;
  for (std::size_t k = 1; k < len; ++k) {
    const auto bk = static_cast<unsigned char>(bytes[i + k]);
    if ((bk & 0xC0) != 0x80) return kInvalid;
    cp = (cp << 6) | (bk & 0x3F);
  }

  if (cp < min) return kInvalid;                      // overlong
  if (cp > 0x10FFFF) return kInvalid;                 // out of range
  if (cp >= 0xD800 && cp <= 0xDFFF) return kInvalid;  // surrogate
  i += len;
  return cp;
}

// Start offset of the code point that ends at `end` (exclusive).
std::size_t previous_start(std::string_view bytes, std::size_t end) {
  std::size_t start = end - 1;
  while (start > 0 && (static_cast<unsigned char>(bytes[start]) & 0xC0) == 0x80) {
    --start;
  }
  return start;
}

}  // namespace

bool is_valid_utf8(std::string_view bytes) {
  std::size_t i = 0;
  while (i < bytes.size()) {
    if (decode_at(bytes, i) == kInvalid) return false;
  }
  return true;
}

bool is_unicode_whitespace(char32_t cp) {
  if (cp >= 0x09 && cp <= 0x0D) return true;
  if (cp >= 0x2000 && cp <= 0x200A) return true;
  switch (cp) {
    case 0x20:
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return false;
  }
}

std::string_view trim_whitespace(std::string_view utf8) {
  if (!is_valid_utf8(utf8)) return utf8;

  std::size_t begin = 0;
  while (begin < utf8.size()) {
    std::size_t next = begin;
    if (!is_unicode_whitespace(decode_at(utf8, next))) break;
    begin = next;
  }

  std::size_t end = utf8.size();
  while (end > begin) {
    std::size_t start = previous_start(utf8, end);
    std::size_t probe = start;
    if (!is_unicode_whitespace(decode_at(utf8, probe))) break;
    end = start;
  }

  return utf8.substr(begin, end - begin);
}

}  // namespace lindos
