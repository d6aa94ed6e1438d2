#pragma once

#include <cstddef>
#include <cstdint>

namespace tether::util {

// Incremental UTF-8 decoding for byte streams that arrive in pieces.
inline constexpr size_t kUtf8Max = 4;

enum class Utf8State : uint8_t {
    Complete,    // one full code point decoded
    Incomplete,  // valid prefix, more bytes needed
    Invalid,     // no continuation can make these bytes valid
};

struct Utf8Decode {
    uint32_t  code_point{0};
    int       size{0};      // bytes consumed when Complete
    Utf8State state{Utf8State::Incomplete};
};

// Decode the first code point of s[0..len). Rejects overlong forms,
// surrogates and values above U+10FFFF as soon as the offending byte is seen.
[[nodiscard]] Utf8Decode decode_utf8(const char* s, size_t len);

// Does s[0..len) start with a complete (or definitely invalid) sequence?
[[nodiscard]] bool full_rune(const char* s, size_t len);

// Encode one code point. Returns byte count (0 for values outside Unicode).
int encode_utf8(uint32_t cp, char out[kUtf8Max]);

} // namespace tether::util
