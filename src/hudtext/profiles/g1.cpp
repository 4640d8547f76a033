#include "g1-font.h"
#include <hudtext/profiles.h>

namespace hudtext::profiles {

namespace {

// Glyph units from the G1 firmware font table
std::unordered_map<char32_t, int> g1GlyphWidths() {
    return {
        {U' ', 2}, {U'!', 1}, {U'"', 2}, {U'#', 6}, {U'$', 5}, {U'%', 6}, {U'&', 7}, {U'\'', 1},
        {U'(', 2}, {U')', 2}, {U'*', 3}, {U'+', 4}, {U',', 1}, {U'-', 4}, {U'.', 1}, {U'/', 3},

        {U'0', 5}, {U'1', 3}, {U'2', 5}, {U'3', 5}, {U'4', 5},
        {U'5', 5}, {U'6', 5}, {U'7', 5}, {U'8', 5}, {U'9', 5},

        {U':', 1}, {U';', 1}, {U'<', 4}, {U'=', 4}, {U'>', 4}, {U'?', 5}, {U'@', 7},

        {U'A', 6}, {U'B', 5}, {U'C', 5}, {U'D', 5}, {U'E', 4}, {U'F', 4}, {U'G', 5},
        {U'H', 5}, {U'I', 2}, {U'J', 3}, {U'K', 5}, {U'L', 4}, {U'M', 7}, {U'N', 5},
        {U'O', 5}, {U'P', 5}, {U'Q', 5}, {U'R', 5}, {U'S', 5}, {U'T', 5}, {U'U', 5},
        {U'V', 6}, {U'W', 7}, {U'X', 6}, {U'Y', 6}, {U'Z', 5},

        {U'[', 2}, {U'\\', 3}, {U']', 2}, {U'^', 4}, {U'_', 3}, {U'`', 2},

        {U'a', 5}, {U'b', 4}, {U'c', 4}, {U'd', 4}, {U'e', 4}, {U'f', 4}, {U'g', 4},
        {U'h', 4}, {U'i', 1}, {U'j', 2}, {U'k', 4}, {U'l', 1}, {U'm', 7}, {U'n', 4},
        {U'o', 4}, {U'p', 4}, {U'q', 4}, {U'r', 3}, {U's', 4}, {U't', 3}, {U'u', 5},
        {U'v', 5}, {U'w', 7}, {U'x', 5}, {U'y', 5}, {U'z', 4},

        {U'{', 3}, {U'|', 1}, {U'}', 3}, {U'~', 7},
    };
}

DisplayConstraints g1Constraints() {
    DisplayConstraints c;
    c.minCharsBeforeHyphen = 3;
    c.noStartChars = U".,!?:;)]}。，！？：；）】」";
    c.noEndChars = U"([{（【「";
    return c;
}

} // namespace

DisplayProfile makeG1Profile(std::string id, std::string name, int displayWidthPx) {
    DisplayProfile p;
    p.id = std::move(id);
    p.name = std::move(name);
    p.displayWidthPx = displayWidthPx;
    p.maxLines = 5;
    p.maxPayloadBytes = 390;
    p.bleChunkSize = 176;

    p.fontMetrics.glyphWidths = g1GlyphWidths();
    p.fontMetrics.defaultGlyphWidth = 7;
    p.fontMetrics.renderFormula = [](int glyphUnits) { return (glyphUnits + 1) * 2; };
    p.fontMetrics.uniformScripts = {
        .cjk = 18,
        .hiragana = 18,
        .katakana = 18,
        .korean = 24,
        .cyrillic = 18,
    };
    p.fontMetrics.fallback.latinMaxWidth = 16;
    p.fontMetrics.fallback.unknownBehavior = UnknownBehavior::UseLatinMax;

    p.constraints = g1Constraints();
    return p;
}

const DisplayProfile::Ptr& g1() {
    static const DisplayProfile::Ptr profile = std::make_shared<const DisplayProfile>(
        makeG1Profile("even-realities-g1", "Even Realities G1", 576));
    return profile;
}

const DisplayProfile::Ptr& g1Legacy() {
    static const DisplayProfile::Ptr profile = std::make_shared<const DisplayProfile>(
        makeG1Profile("even-realities-g1-legacy",
                      "Even Realities G1 (Legacy Client Compatibility)", 420));
    return profile;
}

} // namespace hudtext::profiles
