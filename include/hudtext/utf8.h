#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace hudtext::utf8 {

// Decode one code point and advance ptr. A malformed or truncated sequence
// yields U+FFFD and advances past its first byte only.
char32_t decode(const uint8_t*& ptr, const uint8_t* end);

// Append the UTF-8 encoding of cp to out
void append(std::string& out, char32_t cp);

std::u32string toCodepoints(std::string_view text);
std::string fromCodepoints(std::u32string_view text);
std::string fromCodepoint(char32_t cp);

// Number of code points decode() yields for text
size_t length(std::string_view text);

inline bool isContinuationByte(uint8_t b) {
    return (b & 0xC0) == 0x80;
}

} // namespace hudtext::utf8
