#pragma once

#include <hudtext/display-profile.h>
#include <hudtext/result.hpp>
#include <hudtext/script-detector.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hudtext {

//-----------------------------------------------------------------------------
// GlyphWidthCache - rendered pixel width per code point
//
// Write-once per key. Guarded so one measurer can be shared across threads;
// a lost race only recomputes the same value.
//-----------------------------------------------------------------------------
class GlyphWidthCache {
public:
    using Ptr = std::shared_ptr<GlyphWidthCache>;

    static Ptr create() { return std::make_shared<GlyphWidthCache>(); }

    std::optional<int> find(char32_t cp) const;
    void store(char32_t cp, int widthPx);
    void clear();
    size_t size() const;

private:
    mutable std::mutex _mutex;
    std::unordered_map<char32_t, int> _widths;
};

struct CharMeasurement {
    char32_t character = 0;
    int widthPx = 0;
    ScriptType script = ScriptType::Latin;
    // true when the width came from the glyph table, false for uniform/fallback
    bool fromGlyphMap = false;
};

struct TextMeasurement {
    std::string text;
    int totalWidthPx = 0;
    size_t charCount = 0;
    std::vector<CharMeasurement> chars;
};

//-----------------------------------------------------------------------------
// TextMeasurer - exact rendered widths for one display profile
//-----------------------------------------------------------------------------
class TextMeasurer {
public:
    using Ptr = std::shared_ptr<TextMeasurer>;

    /**
     * Create a measurer for a profile. The cache is pre-populated from the
     * profile's glyph table; pass a cache to share it between measurers of the
     * same profile, or nullptr for a private one.
     */
    static Result<Ptr> create(DisplayProfile::Ptr profile,
                              GlyphWidthCache::Ptr cache = nullptr) noexcept;

    ~TextMeasurer() = default;

    /**
     * Rendered width of one code point:
     *   1. glyph table -> renderFormula(units)
     *   2. uniform-width script -> the profile's exact script width
     *   3. unsupported script under UnknownBehavior::Filter -> 0
     *   4. anything else -> fallback.latinMaxWidth
     */
    int measureChar(char32_t cp) const;

    // Sum of measureChar over the text. No kerning.
    int measureText(std::string_view text) const;
    int measureText(std::u32string_view text) const;

    TextMeasurement measureTextDetailed(std::string_view text) const;

    // Code points from startIndex that fit in maxWidthPx
    size_t charsThatFit(std::string_view text, int maxWidthPx, size_t startIndex = 0) const;
    size_t charsThatFit(std::u32string_view text, int maxWidthPx, size_t startIndex = 0) const;

    bool fitsInWidth(std::string_view text, int maxWidthPx) const;

    // Pixel x of the code point at index
    int getPixelOffset(std::string_view text, size_t index) const;

    // Raw glyph units from the table, without renderFormula
    std::optional<int> getGlyphWidth(char32_t cp) const;

    static size_t getByteSize(std::string_view text) { return text.size(); }

    int getHyphenWidth() const { return measureChar(U'-'); }
    int getSpaceWidth() const { return measureChar(U' '); }

    ScriptType detectScript(char32_t cp) const { return script::detectScript(cp); }
    bool isUniformWidth(char32_t cp) const { return script::isUniformWidthScript(cp); }

    // True when unsupported-script characters are dropped before wrapping
    bool filtersUnsupported() const {
        return _profile->fontMetrics.fallback.unknownBehavior == UnknownBehavior::Filter;
    }

    // Strip unsupported-script code points when the profile filters them
    std::u32string filterUnsupported(std::u32string_view text) const;

    const DisplayProfile::Ptr& getProfile() const { return _profile; }
    int getDisplayWidth() const { return _profile->displayWidthPx; }
    size_t getMaxLines() const { return _profile->maxLines; }
    size_t getMaxPayloadBytes() const { return _profile->maxPayloadBytes; }

    // Drop everything computed since construction and re-seed from the glyph table
    void clearCache();
    size_t cacheSize() const { return _cache->size(); }

private:
    TextMeasurer(DisplayProfile::Ptr profile, GlyphWidthCache::Ptr cache)
        : _profile(std::move(profile)), _cache(std::move(cache)) {}

    Result<void> init();
    void seedCache();
    int computeCharWidth(char32_t cp) const;

    DisplayProfile::Ptr _profile;
    GlyphWidthCache::Ptr _cache;
};

} // namespace hudtext
