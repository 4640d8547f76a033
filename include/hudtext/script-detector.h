#pragma once

#include <cstdint>

namespace hudtext {

// Script classification used for width lookup and break decisions
enum class ScriptType : uint8_t {
    Latin,
    Cjk,          // Chinese, Japanese Kanji
    Hiragana,
    Katakana,
    Korean,       // Hangul syllables and jamo
    Cyrillic,
    Numbers,      // ASCII digits
    Punctuation,  // ASCII space and punctuation
    Unsupported   // Arabic, Hebrew, Thai, emoji - not rendered by the glasses fonts
};

namespace script {

/**
 * Classify a single code point.
 *
 * Ranges are checked in priority order:
 *   CJK -> Hiragana -> Katakana -> Korean -> Cyrillic -> Numbers ->
 *   Punctuation -> {Arabic, Hebrew, Thai, Emoji} -> Latin (default)
 *
 * Total for every code point, including those outside the BMP.
 */
ScriptType detectScript(char32_t cp) noexcept;

// CJK ideographs and Japanese kana (break anywhere without a hyphen)
bool isCjkCharacter(char32_t cp) noexcept;

bool isKoreanCharacter(char32_t cp) noexcept;

// CJK, kana, Korean and Cyrillic render every character at one width
bool isUniformWidthScript(char32_t cp) noexcept;

bool isUnsupportedScript(char32_t cp) noexcept;

inline bool isBreakingSpace(char32_t cp) noexcept {
    return cp == U' ' || cp == U'\t';
}

/**
 * Whether breaking between two characters requires a visible hyphen.
 *
 * No hyphen when either side is CJK/kana, either side is whitespace, or the
 * preceding character is already a break mark (- – — / \ |).
 * Mid-word Latin breaks need one.
 */
bool needsHyphenForBreak(char32_t before, char32_t after) noexcept;

const char* scriptName(ScriptType type) noexcept;

} // namespace script
} // namespace hudtext
