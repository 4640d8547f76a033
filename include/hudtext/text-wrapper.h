#pragma once

#include <hudtext/result.hpp>
#include <hudtext/text-measurer.h>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hudtext {

enum class BreakMode : uint8_t {
    Character,          // break anywhere, hyphenate mid-word for full lines
    CharacterNoHyphen,  // break anywhere, never insert a hyphen (live captions)
    Word,               // break at spaces, hyphenate only words wider than a line
    StrictWord          // break at spaces only, over-wide words overflow
};

const char* breakModeName(BreakMode mode) noexcept;
Result<BreakMode> parseBreakMode(std::string_view name);

// No line or byte limit
constexpr size_t kUnlimited = std::numeric_limits<size_t>::max();

// Partial override. Unset fields fall back to the wrapper defaults, which in
// turn fall back to the profile.
struct WrapOptions {
    std::optional<int> maxWidthPx;
    std::optional<size_t> maxLines;
    std::optional<size_t> maxBytes;
    std::optional<BreakMode> breakMode;
    std::optional<char32_t> hyphenChar;
    std::optional<size_t> minCharsBeforeHyphen;
    std::optional<bool> trimLines;
    std::optional<bool> preserveNewlines;
    // Keep kinsoku characters off line starts/ends in the character modes
    std::optional<bool> applyKinsoku;
};

// Fully resolved options
struct WrapSettings {
    int maxWidthPx = 0;
    size_t maxLines = 0;
    size_t maxBytes = 0;
    BreakMode breakMode = BreakMode::CharacterNoHyphen;
    char32_t hyphenChar = U'-';
    size_t minCharsBeforeHyphen = 3;
    bool trimLines = true;
    bool preserveNewlines = true;
    bool applyKinsoku = false;

    WrapSettings patched(const WrapOptions& options) const;
};

struct LineMetrics {
    std::string text;
    int widthPx = 0;
    size_t bytes = 0;
    int utilizationPercent = 0;
    bool endsWithHyphen = false;
    // First line of a paragraph that followed an explicit '\n'
    bool fromExplicitNewline = false;
};

struct WrapResult {
    std::vector<std::string> lines;
    bool truncated = false;
    int maxLineWidthPx = 0;
    size_t totalBytes = 0;
    std::vector<LineMetrics> lineMetrics;
    std::string originalText;
    BreakMode breakMode = BreakMode::CharacterNoHyphen;
};

//-----------------------------------------------------------------------------
// TextWrapper - splits text into display lines within width/line/byte budgets
//
// Immutable after creation. A different break mode means a different wrapper
// (withBreakMode), or a per-call WrapOptions::breakMode.
//-----------------------------------------------------------------------------
class TextWrapper {
public:
    using Ptr = std::shared_ptr<TextWrapper>;

    static Result<Ptr> create(TextMeasurer::Ptr measurer,
                              const WrapOptions& defaults = {}) noexcept;

    ~TextWrapper() = default;

    /**
     * Wrap text into display lines.
     *
     * Paragraphs (split on '\n' when preserveNewlines) are wrapped one at a
     * time and their lines accumulated until maxLines or maxBytes would be
     * exceeded, which sets truncated. Each line costs its UTF-8 size plus one
     * newline byte while below maxLines.
     *
     * Every line fits maxWidthPx except in StrictWord mode, where a single
     * unbreakable word may overflow, and for a single character that is wider
     * than maxWidthPx on its own.
     */
    WrapResult wrap(std::string_view text, const WrapOptions& options = {}) const;

    std::vector<std::string> wrapToLines(std::string_view text,
                                         const WrapOptions& options = {}) const;

    // Wider than one line, or contains an explicit newline
    bool needsWrap(std::string_view text, std::optional<int> maxWidthPx = std::nullopt) const;

    const WrapSettings& getOptions() const { return _defaults; }
    const TextMeasurer::Ptr& getMeasurer() const { return _measurer; }

    // Same measurer and defaults, different break mode
    Ptr withBreakMode(BreakMode mode) const;

private:
    TextWrapper(TextMeasurer::Ptr measurer, WrapSettings defaults)
        : _measurer(std::move(measurer)), _defaults(std::move(defaults)) {}

    std::vector<std::u32string> wrapParagraph(std::u32string_view paragraph,
                                              const WrapSettings& opts) const;

    std::vector<std::u32string> wrapCharacters(std::u32string_view text,
                                               const WrapSettings& opts,
                                               bool useHyphen) const;

    std::vector<std::u32string> wrapWords(std::u32string_view text,
                                          const WrapSettings& opts,
                                          bool allowHyphen) const;

    struct Backoff {
        std::u32string head;
        size_t carried = 0;
        // Backoff exposed a space: break there without a hyphen
        bool atSpace = false;
    };

    Backoff backoffForHyphen(std::u32string_view line, int lineWidth,
                             const WrapSettings& opts) const;

    size_t kinsokuCarry(std::u32string_view line, char32_t next,
                        const WrapSettings& opts) const;

    WrapResult emptyResult(std::string_view text, const WrapSettings& opts) const;

    TextMeasurer::Ptr _measurer;
    WrapSettings _defaults;
};

} // namespace hudtext
