#include <hudtext/profiles.h>

namespace hudtext::profiles {

namespace {

// Z100 widths are measured in rendered pixels
std::unordered_map<char32_t, int> z100GlyphWidths() {
    return {
        {U' ', 5}, {U'!', 6}, {U'"', 9}, {U'#', 14}, {U'$', 12}, {U'%', 17}, {U'&', 15}, {U'\'', 5},
        {U'(', 6}, {U')', 6}, {U'*', 12}, {U'+', 12}, {U',', 6}, {U'-', 7}, {U'.', 6}, {U'/', 8},

        {U'0', 12}, {U'1', 12}, {U'2', 12}, {U'3', 12}, {U'4', 12},
        {U'5', 12}, {U'6', 12}, {U'7', 12}, {U'8', 12}, {U'9', 12},

        {U':', 6}, {U';', 6}, {U'<', 12}, {U'=', 12}, {U'>', 12}, {U'?', 9}, {U'@', 19},

        {U'A', 13}, {U'B', 14}, {U'C', 13}, {U'D', 15}, {U'E', 12}, {U'F', 11}, {U'G', 15},
        {U'H', 16}, {U'I', 7}, {U'J', 6}, {U'K', 13}, {U'L', 11}, {U'M', 19}, {U'N', 16},
        {U'O', 16}, {U'P', 13}, {U'Q', 16}, {U'R', 13}, {U'S', 12}, {U'T', 12}, {U'U', 15},
        {U'V', 13}, {U'W', 20}, {U'X', 12}, {U'Y', 12}, {U'Z', 12},

        {U'[', 7}, {U'\\', 8}, {U']', 7}, {U'^', 12}, {U'_', 9}, {U'`', 6},

        {U'a', 12}, {U'b', 13}, {U'c', 10}, {U'd', 13}, {U'e', 12}, {U'f', 7}, {U'g', 13},
        {U'h', 13}, {U'i', 5}, {U'j', 5}, {U'k', 11}, {U'l', 5}, {U'm', 20}, {U'n', 13},
        {U'o', 13}, {U'p', 13}, {U'q', 13}, {U'r', 9}, {U's', 10}, {U't', 8}, {U'u', 13},
        {U'v', 11}, {U'w', 17}, {U'x', 11}, {U'y', 11}, {U'z', 10},

        {U'{', 8}, {U'|', 12}, {U'}', 8}, {U'~', 12},
    };
}

DisplayProfile makeZ100Profile() {
    DisplayProfile p;
    p.id = "vuzix-z100";
    p.name = "Vuzix Z100";
    p.displayWidthPx = 390;
    p.maxLines = 7;
    p.maxPayloadBytes = 512;
    p.bleChunkSize = 180;

    p.fontMetrics.glyphWidths = z100GlyphWidths();
    p.fontMetrics.defaultGlyphWidth = 12;
    p.fontMetrics.renderFormula = [](int glyphUnits) { return glyphUnits; };
    p.fontMetrics.uniformScripts = {
        .cjk = 21,
        .hiragana = 21,
        .katakana = 21,
        .korean = 21,
        .cyrillic = 14,
    };
    p.fontMetrics.fallback.latinMaxWidth = 20;
    p.fontMetrics.fallback.unknownBehavior = UnknownBehavior::UseLatinMax;

    DisplayConstraints c;
    c.minCharsBeforeHyphen = 3;
    c.noStartChars = U".,!?:;)]}。，！？：；）】」";
    c.noEndChars = U"([{（【「";
    p.constraints = std::move(c);
    return p;
}

} // namespace

const DisplayProfile::Ptr& z100() {
    static const DisplayProfile::Ptr profile =
        std::make_shared<const DisplayProfile>(makeZ100Profile());
    return profile;
}

} // namespace hudtext::profiles
