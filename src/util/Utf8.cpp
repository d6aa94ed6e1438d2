#include "util/Utf8.hpp"

namespace tether::util {

// Expected sequence length for a lead byte, 0 if it can never start one.
static int sequence_length(uint8_t c) {
    if (c < 0x80) return 1;
    if (c < 0xC2) return 0;   // continuation byte or overlong 2-byte lead
    if (c < 0xE0) return 2;
    if (c < 0xF0) return 3;
    if (c < 0xF5) return 4;
    return 0;
}

// Valid range of the second byte; tighter than 80..BF for a few leads.
static bool second_byte_ok(uint8_t lead, uint8_t b) {
    switch (lead) {
        case 0xE0: return b >= 0xA0 && b <= 0xBF;  // overlong
        case 0xED: return b >= 0x80 && b <= 0x9F;  // surrogates
        case 0xF0: return b >= 0x90 && b <= 0xBF;  // overlong
        case 0xF4: return b >= 0x80 && b <= 0x8F;  // > U+10FFFF
        default:   return (b & 0xC0) == 0x80;
    }
}

Utf8Decode decode_utf8(const char* s, size_t len) {
    Utf8Decode d;
    if (len == 0) return d;
    auto c = (uint8_t)s[0];
    int need = sequence_length(c);
    if (need == 0) { d.state = Utf8State::Invalid; return d; }
    if (need == 1) { d.code_point = c; d.size = 1; d.state = Utf8State::Complete; return d; }

    size_t have = len < (size_t)need ? len : (size_t)need;
    for (size_t i = 1; i < have; ++i) {
        auto b = (uint8_t)s[i];
        bool ok = (i == 1) ? second_byte_ok(c, b) : (b & 0xC0) == 0x80;
        if (!ok) { d.state = Utf8State::Invalid; return d; }
    }
    if (have < (size_t)need) return d;

    uint32_t cp = 0;
    switch (need) {
        case 2: cp = (uint32_t)(c & 0x1F); break;
        case 3: cp = (uint32_t)(c & 0x0F); break;
        default: cp = (uint32_t)(c & 0x07); break;
    }
    for (int i = 1; i < need; ++i) cp = (cp << 6) | ((uint8_t)s[i] & 0x3F);
    d.code_point = cp;
    d.size = need;
    d.state = Utf8State::Complete;
    return d;
}

bool full_rune(const char* s, size_t len) {
    return decode_utf8(s, len).state != Utf8State::Incomplete;
}

int encode_utf8(uint32_t cp, char out[kUtf8Max]) {
    if (cp < 0x80)    { out[0] = (char)cp; return 1; }
    if (cp < 0x800)   { out[0] = (char)(0xC0 | (cp >> 6)); out[1] = (char)(0x80 | (cp & 0x3F)); return 2; }
    if (cp >= 0xD800 && cp <= 0xDFFF) return 0;
    if (cp < 0x10000) { out[0] = (char)(0xE0 | (cp >> 12)); out[1] = (char)(0x80 | ((cp >> 6) & 0x3F));
                        out[2] = (char)(0x80 | (cp & 0x3F)); return 3; }
    if (cp > 0x10FFFF) return 0;
    out[0] = (char)(0xF0 | (cp >> 18)); out[1] = (char)(0x80 | ((cp >> 12) & 0x3F));
    out[2] = (char)(0x80 | ((cp >> 6) & 0x3F)); out[3] = (char)(0x80 | (cp & 0x3F));
    return 4;
}

} // namespace tether::util
