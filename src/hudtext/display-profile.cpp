#include <hudtext/display-profile.h>
#include <ytrace/ytrace.hpp>

namespace hudtext {

Result<void> DisplayProfile::validate() const {
    if (id.empty()) {
        return Err<void>("DisplayProfile: id is empty");
    }
    if (displayWidthPx <= 0) {
        return Err<void>("DisplayProfile " + id + ": displayWidthPx must be positive");
    }
    if (displayHeightPx && *displayHeightPx <= 0) {
        return Err<void>("DisplayProfile " + id + ": displayHeightPx must be positive");
    }
    if (maxLines == 0) {
        return Err<void>("DisplayProfile " + id + ": maxLines must be positive");
    }
    if (maxPayloadBytes == 0 || bleChunkSize == 0) {
        return Err<void>("DisplayProfile " + id + ": payload and chunk sizes must be positive");
    }
    if (!fontMetrics.renderFormula) {
        return Err<void>("DisplayProfile " + id + ": renderFormula is not set");
    }
    if (fontMetrics.fallback.latinMaxWidth <= 0) {
        return Err<void>("DisplayProfile " + id + ": fallback.latinMaxWidth must be positive");
    }

    const auto& u = fontMetrics.uniformScripts;
    if (u.cjk <= 0 || u.hiragana <= 0 || u.katakana <= 0 || u.korean <= 0 || u.cyrillic <= 0) {
        return Err<void>("DisplayProfile " + id + ": uniform script widths must be positive");
    }

    for (const auto& [cp, units] : fontMetrics.glyphWidths) {
        if (units < 0) {
            return Err<void>("DisplayProfile " + id + ": negative glyph width for U+" +
                             std::to_string(static_cast<uint32_t>(cp)));
        }
        if (fontMetrics.renderFormula(units) > fontMetrics.fallback.latinMaxWidth &&
            cp < 0x80) {
            ywarn("DisplayProfile {}: glyph U+{:04X} renders wider than latinMaxWidth {}",
                  id, static_cast<uint32_t>(cp), fontMetrics.fallback.latinMaxWidth);
        }
    }
    return Ok();
}

Result<DisplayProfile::Ptr> DisplayProfile::create(DisplayProfile profile) noexcept {
    if (auto res = profile.validate(); !res) {
        yerror("Invalid display profile: {}", error_msg(res));
        return Err<Ptr>("Failed to create DisplayProfile", res);
    }
    ydebug("DisplayProfile::create: {} ({}px x {} lines, {} glyphs)",
           profile.id, profile.displayWidthPx, profile.maxLines,
           profile.fontMetrics.glyphWidths.size());
    return Ok(Ptr(std::make_shared<const DisplayProfile>(std::move(profile))));
}

} // namespace hudtext
