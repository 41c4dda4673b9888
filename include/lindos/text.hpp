#pragma once

// lindos/text.hpp - UTF-8 and whitespace rules shared by every validation path.
//
// INVARIANT:
//   The engine-side check (validate.cpp) and the consumer-side pre-check
//   (client.cpp) both call trim_whitespace() from this header. There is no
//   second definition of "whitespace" anywhere in the tree; a consumer that
//   short-circuits an empty message must reach the same verdict the engine
//   would have reached.
//
// WHITESPACE SET (Unicode White_Space property):
//   U+0009..U+000D, U+0020, U+0085, U+00A0, U+1680, U+2000..U+200A,
//   U+2028, U+2029, U+202F, U+205F, U+3000

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace lindos {

// Strict UTF-8: rejects overlong encodings, surrogates, code points above
// U+10FFFF, stray continuation bytes and truncated sequences.
bool is_valid_utf8(std::string_view bytes);

bool is_unicode_whitespace(char32_t cp);

// Returns the sub-view with leading and trailing whitespace removed.
// Input must be valid UTF-8; on invalid input the view is returned unchanged.
std::string_view trim_whitespace(std::string_view utf8);

}  // namespace lindos
