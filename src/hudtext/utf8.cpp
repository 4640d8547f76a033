#include <hudtext/utf8.h>

namespace hudtext::utf8 {

char32_t decode(const uint8_t*& ptr, const uint8_t* end) {
    if (ptr >= end) return 0;

    const uint8_t lead = *ptr;
    char32_t codepoint = 0;
    int trailing = 0;
    if ((lead & 0x80) == 0) {
        ptr++;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        codepoint = lead & 0x1F;
        trailing = 1;
    } else if ((lead & 0xF0) == 0xE0) {
        codepoint = lead & 0x0F;
        trailing = 2;
    } else if ((lead & 0xF8) == 0xF0) {
        codepoint = lead & 0x07;
        trailing = 3;
    } else {
        ptr++;  // Stray continuation or invalid lead
        return 0xFFFD;
    }

    // A truncated sequence consumes only its lead byte so the bytes that
    // broke it are decoded on their own.
    const uint8_t* next = ptr + 1;
    for (int i = 0; i < trailing; ++i) {
        if (next >= end || !isContinuationByte(*next)) {
            ptr++;
            return 0xFFFD;
        }
        codepoint = (codepoint << 6) | (*next++ & 0x3F);
    }
    ptr = next;
    return codepoint;
}

void append(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::u32string toCodepoints(std::string_view text) {
    std::u32string out;
    out.reserve(text.size());
    const uint8_t* ptr = reinterpret_cast<const uint8_t*>(text.data());
    const uint8_t* end = ptr + text.size();
    while (ptr < end) {
        out += decode(ptr, end);
    }
    return out;
}

std::string fromCodepoints(std::u32string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t cp : text) {
        append(out, cp);
    }
    return out;
}

std::string fromCodepoint(char32_t cp) {
    std::string out;
    append(out, cp);
    return out;
}

size_t length(std::string_view text) {
    size_t count = 0;
    const uint8_t* ptr = reinterpret_cast<const uint8_t*>(text.data());
    const uint8_t* end = ptr + text.size();
    while (ptr < end) {
        decode(ptr, end);
        count++;
    }
    return count;
}

} // namespace hudtext::utf8
