#include <hudtext/script-detector.h>

#include <array>
#include <cstddef>
#include <utility>

namespace hudtext::script {

namespace {

using Range = std::pair<char32_t, char32_t>;

constexpr std::array<Range, 6> kCjkRanges = {{
    {0x4E00, 0x9FFF},    // CJK Unified Ideographs
    {0x3400, 0x4DBF},    // Extension A
    {0x20000, 0x2A6DF},  // Extension B
    {0x2A700, 0x2B73F},  // Extension C
    {0x2B740, 0x2B81F},  // Extension D
    {0xF900, 0xFAFF},    // Compatibility Ideographs
}};

constexpr std::array<Range, 1> kHiraganaRanges = {{
    {0x3040, 0x309F},
}};

constexpr std::array<Range, 2> kKatakanaRanges = {{
    {0x30A0, 0x30FF},  // Main block
    {0x31F0, 0x31FF},  // Phonetic Extensions
}};

constexpr std::array<Range, 5> kKoreanRanges = {{
    {0xAC00, 0xD7AF},  // Hangul Syllables
    {0x1100, 0x11FF},  // Hangul Jamo
    {0x3130, 0x318F},  // Compatibility Jamo
    {0xA960, 0xA97F},  // Jamo Extended-A
    {0xD7B0, 0xD7FF},  // Jamo Extended-B
}};

constexpr std::array<Range, 2> kCyrillicRanges = {{
    {0x0400, 0x04FF},
    {0x0500, 0x052F},  // Supplement
}};

constexpr std::array<Range, 1> kNumberRanges = {{
    {0x30, 0x39},
}};

constexpr std::array<Range, 4> kPunctuationRanges = {{
    {0x20, 0x2F},
    {0x3A, 0x40},
    {0x5B, 0x60},
    {0x7B, 0x7E},
}};

constexpr std::array<Range, 11> kUnsupportedRanges = {{
    {0x0600, 0x06FF},    // Arabic
    {0x0590, 0x05FF},    // Hebrew
    {0x0E00, 0x0E7F},    // Thai
    {0x1F600, 0x1F64F},  // Emoticons
    {0x1F300, 0x1F5FF},  // Misc Symbols and Pictographs
    {0x1F680, 0x1F6FF},  // Transport and Map
    {0x1F1E0, 0x1F1FF},  // Flags
    {0x2600, 0x26FF},    // Misc Symbols
    {0x2700, 0x27BF},    // Dingbats
    {0xFE00, 0xFE0F},    // Variation Selectors
    {0x1F900, 0x1F9FF},  // Supplemental Symbols
}};

template<std::size_t N>
bool inRanges(char32_t cp, const std::array<Range, N>& ranges) {
    for (const auto& [start, end] : ranges) {
        if (cp >= start && cp <= end) return true;
    }
    return false;
}

} // namespace

ScriptType detectScript(char32_t cp) noexcept {
    if (inRanges(cp, kCjkRanges)) return ScriptType::Cjk;
    if (inRanges(cp, kHiraganaRanges)) return ScriptType::Hiragana;
    if (inRanges(cp, kKatakanaRanges)) return ScriptType::Katakana;
    if (inRanges(cp, kKoreanRanges)) return ScriptType::Korean;
    if (inRanges(cp, kCyrillicRanges)) return ScriptType::Cyrillic;
    if (inRanges(cp, kNumberRanges)) return ScriptType::Numbers;
    if (inRanges(cp, kPunctuationRanges)) return ScriptType::Punctuation;
    if (inRanges(cp, kUnsupportedRanges)) return ScriptType::Unsupported;
    return ScriptType::Latin;
}

bool isCjkCharacter(char32_t cp) noexcept {
    auto type = detectScript(cp);
    return type == ScriptType::Cjk || type == ScriptType::Hiragana || type == ScriptType::Katakana;
}

bool isKoreanCharacter(char32_t cp) noexcept {
    return detectScript(cp) == ScriptType::Korean;
}

bool isUniformWidthScript(char32_t cp) noexcept {
    switch (detectScript(cp)) {
    case ScriptType::Cjk:
    case ScriptType::Hiragana:
    case ScriptType::Katakana:
    case ScriptType::Korean:
    case ScriptType::Cyrillic:
        return true;
    default:
        return false;
    }
}

bool isUnsupportedScript(char32_t cp) noexcept {
    return detectScript(cp) == ScriptType::Unsupported;
}

bool needsHyphenForBreak(char32_t before, char32_t after) noexcept {
    if (isCjkCharacter(before) || isCjkCharacter(after)) return false;
    if (isBreakingSpace(before) || isBreakingSpace(after)) return false;

    switch (before) {
    case U'-':
    case U'\u2013':  // en dash
    case U'\u2014':  // em dash
    case U'/':
    case U'\\':
    case U'|':
        return false;
    default:
        return true;
    }
}

const char* scriptName(ScriptType type) noexcept {
    switch (type) {
    case ScriptType::Latin: return "latin";
    case ScriptType::Cjk: return "cjk";
    case ScriptType::Hiragana: return "hiragana";
    case ScriptType::Katakana: return "katakana";
    case ScriptType::Korean: return "korean";
    case ScriptType::Cyrillic: return "cyrillic";
    case ScriptType::Numbers: return "numbers";
    case ScriptType::Punctuation: return "punctuation";
    case ScriptType::Unsupported: return "unsupported";
    }
    return "unknown";
}

} // namespace hudtext::script
