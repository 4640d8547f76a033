#include <hudtext/text-measurer.h>
#include <hudtext/utf8.h>
#include <ytrace/ytrace.hpp>

namespace hudtext {

//=============================================================================
// GlyphWidthCache
//=============================================================================

std::optional<int> GlyphWidthCache::find(char32_t cp) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _widths.find(cp);
    if (it == _widths.end()) return std::nullopt;
    return it->second;
}

void GlyphWidthCache::store(char32_t cp, int widthPx) {
    std::lock_guard<std::mutex> lock(_mutex);
    _widths.emplace(cp, widthPx);
}

void GlyphWidthCache::clear() {
    std::lock_guard<std::mutex> lock(_mutex);
    _widths.clear();
}

size_t GlyphWidthCache::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _widths.size();
}

//=============================================================================
// TextMeasurer
//=============================================================================

Result<TextMeasurer::Ptr> TextMeasurer::create(DisplayProfile::Ptr profile,
                                               GlyphWidthCache::Ptr cache) noexcept {
    if (!profile) {
        return Err<Ptr>("TextMeasurer: profile is null");
    }
    if (!cache) {
        cache = GlyphWidthCache::create();
    }
    auto measurer = Ptr(new TextMeasurer(std::move(profile), std::move(cache)));
    if (auto res = measurer->init(); !res) {
        return Err<Ptr>("Failed to init TextMeasurer", res);
    }
    return Ok(measurer);
}

Result<void> TextMeasurer::init() {
    if (auto res = _profile->validate(); !res) {
        yerror("TextMeasurer: {}", error_msg(res));
        return Err<void>("Invalid profile", res);
    }
    seedCache();
    ydebug("TextMeasurer::init: profile={} cached={}", _profile->id, _cache->size());
    return Ok();
}

void TextMeasurer::seedCache() {
    const auto& metrics = _profile->fontMetrics;
    for (const auto& [cp, units] : metrics.glyphWidths) {
        _cache->store(cp, metrics.renderFormula(units));
    }
}

int TextMeasurer::computeCharWidth(char32_t cp) const {
    const auto& metrics = _profile->fontMetrics;

    auto glyph = metrics.glyphWidths.find(cp);
    if (glyph != metrics.glyphWidths.end()) {
        return metrics.renderFormula(glyph->second);
    }

    const auto& uniform = metrics.uniformScripts;
    switch (script::detectScript(cp)) {
    case ScriptType::Cjk: return uniform.cjk;
    case ScriptType::Hiragana: return uniform.hiragana;
    case ScriptType::Katakana: return uniform.katakana;
    case ScriptType::Korean: return uniform.korean;
    case ScriptType::Cyrillic: return uniform.cyrillic;
    case ScriptType::Unsupported:
        if (metrics.fallback.unknownBehavior == UnknownBehavior::Filter) {
            return 0;
        }
        break;
    default:
        break;
    }
    return metrics.fallback.latinMaxWidth;
}

int TextMeasurer::measureChar(char32_t cp) const {
    if (auto cached = _cache->find(cp)) {
        return *cached;
    }
    int width = computeCharWidth(cp);
    _cache->store(cp, width);
    return width;
}

int TextMeasurer::measureText(std::string_view text) const {
    int total = 0;
    const uint8_t* ptr = reinterpret_cast<const uint8_t*>(text.data());
    const uint8_t* end = ptr + text.size();
    while (ptr < end) {
        total += measureChar(utf8::decode(ptr, end));
    }
    return total;
}

int TextMeasurer::measureText(std::u32string_view text) const {
    int total = 0;
    for (char32_t cp : text) {
        total += measureChar(cp);
    }
    return total;
}

TextMeasurement TextMeasurer::measureTextDetailed(std::string_view text) const {
    TextMeasurement result;
    result.text = std::string(text);

    const auto& glyphs = _profile->fontMetrics.glyphWidths;
    for (char32_t cp : utf8::toCodepoints(text)) {
        CharMeasurement m;
        m.character = cp;
        m.widthPx = measureChar(cp);
        m.script = script::detectScript(cp);
        m.fromGlyphMap = glyphs.contains(cp);
        result.totalWidthPx += m.widthPx;
        result.chars.push_back(m);
    }
    result.charCount = result.chars.size();
    return result;
}

size_t TextMeasurer::charsThatFit(std::u32string_view text, int maxWidthPx,
                                  size_t startIndex) const {
    if (startIndex >= text.size()) return 0;

    int width = 0;
    size_t count = 0;
    for (size_t i = startIndex; i < text.size(); ++i) {
        int w = measureChar(text[i]);
        if (width + w > maxWidthPx) break;
        width += w;
        count++;
    }
    return count;
}

size_t TextMeasurer::charsThatFit(std::string_view text, int maxWidthPx,
                                  size_t startIndex) const {
    return charsThatFit(utf8::toCodepoints(text), maxWidthPx, startIndex);
}

bool TextMeasurer::fitsInWidth(std::string_view text, int maxWidthPx) const {
    return measureText(text) <= maxWidthPx;
}

int TextMeasurer::getPixelOffset(std::string_view text, size_t index) const {
    int offset = 0;
    size_t i = 0;
    const uint8_t* ptr = reinterpret_cast<const uint8_t*>(text.data());
    const uint8_t* end = ptr + text.size();
    while (ptr < end && i < index) {
        offset += measureChar(utf8::decode(ptr, end));
        i++;
    }
    return offset;
}

std::optional<int> TextMeasurer::getGlyphWidth(char32_t cp) const {
    const auto& glyphs = _profile->fontMetrics.glyphWidths;
    auto it = glyphs.find(cp);
    if (it == glyphs.end()) return std::nullopt;
    return it->second;
}

std::u32string TextMeasurer::filterUnsupported(std::u32string_view text) const {
    if (!filtersUnsupported()) {
        return std::u32string(text);
    }
    std::u32string out;
    out.reserve(text.size());
    for (char32_t cp : text) {
        if (!script::isUnsupportedScript(cp)) out += cp;
    }
    if (out.size() != text.size()) {
        ydebug("TextMeasurer: filtered {} unsupported characters", text.size() - out.size());
    }
    return out;
}

void TextMeasurer::clearCache() {
    _cache->clear();
    seedCache();
}

} // namespace hudtext
