#pragma once

#include <hudtext/result.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace hudtext {

//-----------------------------------------------------------------------------
// FontMetrics - precomputed glyph widths for one hardware font
//-----------------------------------------------------------------------------

// Rendered widths in pixels for scripts where every character has one width.
// These are exact hardware values, not averages.
struct UniformScriptWidths {
    int cjk = 0;
    int hiragana = 0;
    int katakana = 0;
    int korean = 0;
    int cyrillic = 0;
};

enum class UnknownBehavior : uint8_t {
    UseLatinMax,  // measure at fallback.latinMaxWidth
    Filter        // drop unsupported-script characters before wrapping
};

struct FallbackConfig {
    // Widest known Latin glyph in rendered pixels. Never under-estimates.
    int latinMaxWidth = 0;
    UnknownBehavior unknownBehavior = UnknownBehavior::UseLatinMax;
};

struct FontMetrics {
    // Glyph units per code point, before renderFormula
    std::unordered_map<char32_t, int> glyphWidths;
    int defaultGlyphWidth = 0;
    // Glyph units -> rendered pixels. Pure and monotonic.
    std::function<int(int)> renderFormula;
    UniformScriptWidths uniformScripts;
    FallbackConfig fallback;
};

struct DisplayConstraints {
    size_t minCharsBeforeHyphen = 3;
    // Kinsoku: must not start a line
    std::u32string noStartChars;
    // Kinsoku: must not end a line
    std::u32string noEndChars;
};

//-----------------------------------------------------------------------------
// DisplayProfile - immutable hardware description of one glasses model
//-----------------------------------------------------------------------------
struct DisplayProfile {
    using Ptr = std::shared_ptr<const DisplayProfile>;

    std::string id;
    std::string name;

    int displayWidthPx = 0;
    std::optional<int> displayHeightPx;
    size_t maxLines = 0;

    // BLE limits
    size_t maxPayloadBytes = 0;
    size_t bleChunkSize = 0;

    FontMetrics fontMetrics;
    std::optional<DisplayConstraints> constraints;

    // Validates and freezes a profile. Misconfiguration is reported here
    // so that per-call operations never have to fail.
    static Result<Ptr> create(DisplayProfile profile) noexcept;

    Result<void> validate() const;

    size_t minCharsBeforeHyphen() const {
        return constraints ? constraints->minCharsBeforeHyphen : 3;
    }
};

} // namespace hudtext
