#include <hudtext/text-wrapper.h>
#include <hudtext/utf8.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cmath>

namespace hudtext {

namespace {

// Whitespace removed by trimLines
bool isTrimSpace(char32_t cp) {
    switch (cp) {
    case U' ': case U'\t': case U'\n': case U'\r': case U'\v': case U'\f':
    case 0x00A0: case 0x1680: case 0x2028: case 0x2029: case 0x202F:
    case 0x205F: case 0x3000: case 0xFEFF:
        return true;
    default:
        return cp >= 0x2000 && cp <= 0x200A;
    }
}

std::u32string_view trim(std::u32string_view text) {
    size_t start = 0;
    while (start < text.size() && isTrimSpace(text[start])) start++;
    size_t end = text.size();
    while (end > start && isTrimSpace(text[end - 1])) end--;
    return text.substr(start, end - start);
}

void trimEnd(std::u32string& text) {
    while (!text.empty() && isTrimSpace(text.back())) text.pop_back();
}

std::vector<std::u32string_view> splitParagraphs(std::u32string_view text) {
    std::vector<std::u32string_view> paragraphs;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(U'\n', start);
        if (pos == std::u32string_view::npos) {
            paragraphs.push_back(text.substr(start));
            break;
        }
        paragraphs.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return paragraphs;
}

struct Token {
    std::u32string text;
    // Separated from the previous token by whitespace in the source
    bool spaceBefore = false;
};

// Words split on spaces/tabs; every CJK or kana character is its own token
std::vector<Token> splitIntoWords(std::u32string_view text) {
    std::vector<Token> tokens;
    std::u32string word;
    bool wordSpaceBefore = false;
    bool spaceSeen = false;

    auto flush = [&] {
        if (!word.empty()) {
            tokens.push_back({std::move(word), wordSpaceBefore});
            word.clear();
        }
    };

    for (char32_t cp : text) {
        if (script::isBreakingSpace(cp)) {
            flush();
            spaceSeen = true;
        } else if (script::isCjkCharacter(cp)) {
            flush();
            tokens.push_back({std::u32string(1, cp), spaceSeen});
            spaceSeen = false;
        } else {
            if (word.empty()) {
                wordSpaceBefore = spaceSeen;
                spaceSeen = false;
            }
            word += cp;
        }
    }
    flush();
    return tokens;
}

} // namespace

//=============================================================================
// Break modes
//=============================================================================

const char* breakModeName(BreakMode mode) noexcept {
    switch (mode) {
    case BreakMode::Character: return "character";
    case BreakMode::CharacterNoHyphen: return "character-no-hyphen";
    case BreakMode::Word: return "word";
    case BreakMode::StrictWord: return "strict-word";
    }
    return "unknown";
}

Result<BreakMode> parseBreakMode(std::string_view name) {
    if (name == "character") return Ok(BreakMode::Character);
    if (name == "character-no-hyphen") return Ok(BreakMode::CharacterNoHyphen);
    if (name == "word") return Ok(BreakMode::Word);
    if (name == "strict-word") return Ok(BreakMode::StrictWord);
    return Err<BreakMode>("Unknown break mode: " + std::string(name));
}

WrapSettings WrapSettings::patched(const WrapOptions& options) const {
    WrapSettings out = *this;
    if (options.maxWidthPx) out.maxWidthPx = *options.maxWidthPx;
    if (options.maxLines) out.maxLines = *options.maxLines;
    if (options.maxBytes) out.maxBytes = *options.maxBytes;
    if (options.breakMode) out.breakMode = *options.breakMode;
    if (options.hyphenChar) out.hyphenChar = *options.hyphenChar;
    if (options.minCharsBeforeHyphen) out.minCharsBeforeHyphen = *options.minCharsBeforeHyphen;
    if (options.trimLines) out.trimLines = *options.trimLines;
    if (options.preserveNewlines) out.preserveNewlines = *options.preserveNewlines;
    if (options.applyKinsoku) out.applyKinsoku = *options.applyKinsoku;
    return out;
}

//=============================================================================
// TextWrapper
//=============================================================================

Result<TextWrapper::Ptr> TextWrapper::create(TextMeasurer::Ptr measurer,
                                             const WrapOptions& defaults) noexcept {
    if (!measurer) {
        return Err<Ptr>("TextWrapper: measurer is null");
    }

    const auto& profile = *measurer->getProfile();
    WrapSettings base;
    base.maxWidthPx = profile.displayWidthPx;
    base.maxLines = profile.maxLines;
    base.maxBytes = profile.maxPayloadBytes;
    base.minCharsBeforeHyphen = profile.minCharsBeforeHyphen();

    WrapSettings settings = base.patched(defaults);
    if (settings.maxWidthPx <= 0) {
        return Err<Ptr>("TextWrapper: maxWidthPx must be positive");
    }
    if (settings.hyphenChar == 0) {
        return Err<Ptr>("TextWrapper: hyphenChar must not be NUL");
    }

    ydebug("TextWrapper::create: profile={} mode={} width={} lines={} bytes={}",
           profile.id, breakModeName(settings.breakMode), settings.maxWidthPx,
           settings.maxLines, settings.maxBytes);
    return Ok(Ptr(new TextWrapper(std::move(measurer), settings)));
}

TextWrapper::Ptr TextWrapper::withBreakMode(BreakMode mode) const {
    WrapSettings settings = _defaults;
    settings.breakMode = mode;
    return Ptr(new TextWrapper(_measurer, settings));
}

WrapResult TextWrapper::wrap(std::string_view text, const WrapOptions& options) const {
    const WrapSettings opts = _defaults.patched(options);

    if (text.empty()) {
        return emptyResult(text, opts);
    }

    const std::u32string input = _measurer->filterUnsupported(utf8::toCodepoints(text));
    if (input.empty()) {
        return emptyResult(text, opts);
    }

    std::vector<std::u32string_view> paragraphs;
    if (opts.preserveNewlines) {
        paragraphs = splitParagraphs(input);
    } else {
        paragraphs.push_back(input);
    }

    WrapResult result;
    result.originalText = std::string(text);
    result.breakMode = opts.breakMode;

    for (size_t pIndex = 0; pIndex < paragraphs.size() && !result.truncated; ++pIndex) {
        const auto paragraphLines = wrapParagraph(paragraphs[pIndex], opts);

        for (size_t lIndex = 0; lIndex < paragraphLines.size(); ++lIndex) {
            if (result.lines.size() >= opts.maxLines) {
                result.truncated = true;
                break;
            }

            std::string line = utf8::fromCodepoints(paragraphLines[lIndex]);
            const size_t lineBytes = line.size();
            if (result.totalBytes > opts.maxBytes ||
                lineBytes > opts.maxBytes - result.totalBytes) {
                result.truncated = true;
                break;
            }

            LineMetrics metrics;
            metrics.widthPx = _measurer->measureText(paragraphLines[lIndex]);
            metrics.bytes = lineBytes;
            metrics.utilizationPercent = opts.maxWidthPx > 0
                ? static_cast<int>(std::lround(metrics.widthPx * 100.0 / opts.maxWidthPx))
                : 0;
            metrics.endsWithHyphen = !paragraphLines[lIndex].empty() &&
                                     paragraphLines[lIndex].back() == opts.hyphenChar &&
                                     lIndex + 1 < paragraphLines.size();
            metrics.fromExplicitNewline = pIndex > 0 && lIndex == 0;
            metrics.text = line;

            result.maxLineWidthPx = std::max(result.maxLineWidthPx, metrics.widthPx);
            result.lines.push_back(std::move(line));
            result.lineMetrics.push_back(std::move(metrics));
            result.totalBytes += lineBytes;

            if (result.lines.size() < opts.maxLines) {
                result.totalBytes += 1;  // '\n'
            }
        }
    }

    if (result.truncated) {
        ydebug("TextWrapper::wrap: truncated at {} lines, {} bytes (limits {} / {})",
               result.lines.size(), result.totalBytes, opts.maxLines, opts.maxBytes);
    }
    return result;
}

std::vector<std::string> TextWrapper::wrapToLines(std::string_view text,
                                                  const WrapOptions& options) const {
    return wrap(text, options).lines;
}

bool TextWrapper::needsWrap(std::string_view text, std::optional<int> maxWidthPx) const {
    const int width = maxWidthPx.value_or(_defaults.maxWidthPx);
    return text.find('\n') != std::string_view::npos || _measurer->measureText(text) > width;
}

WrapResult TextWrapper::emptyResult(std::string_view text, const WrapSettings& opts) const {
    WrapResult result;
    result.originalText = std::string(text);
    result.breakMode = opts.breakMode;
    if (opts.maxLines > 0) {
        result.lines.emplace_back();
        result.lineMetrics.emplace_back();
    }
    return result;
}

std::vector<std::u32string> TextWrapper::wrapParagraph(std::u32string_view paragraph,
                                                       const WrapSettings& opts) const {
    const std::u32string_view text = opts.trimLines ? trim(paragraph) : paragraph;
    if (text.empty()) {
        return {std::u32string()};
    }

    if (_measurer->measureText(text) <= opts.maxWidthPx) {
        return {std::u32string(text)};
    }

    switch (opts.breakMode) {
    case BreakMode::Character:
        return wrapCharacters(text, opts, true);
    case BreakMode::CharacterNoHyphen:
        return wrapCharacters(text, opts, false);
    case BreakMode::Word:
        return wrapWords(text, opts, true);
    case BreakMode::StrictWord:
        return wrapWords(text, opts, false);
    }
    return wrapCharacters(text, opts, false);
}

//-----------------------------------------------------------------------------
// Character modes
//
// `line` always holds text[lineStart, i). Characters taken back from a line
// (hyphen backoff, kinsoku) are re-fed by moving i back, so the next line is
// built with the same fit checks as the first.
//-----------------------------------------------------------------------------
std::vector<std::u32string> TextWrapper::wrapCharacters(std::u32string_view text,
                                                        const WrapSettings& opts,
                                                        bool useHyphen) const {
    std::vector<std::u32string> lines;
    const int hyphenWidth = _measurer->measureChar(opts.hyphenChar);

    auto emit = [&](std::u32string line) {
        if (opts.trimLines) trimEnd(line);
        if (!line.empty()) lines.push_back(std::move(line));
    };

    std::u32string line;
    int width = 0;
    size_t i = 0;

    while (i < text.size()) {
        const char32_t c = text[i];
        const int charWidth = _measurer->measureChar(c);

        if (width + charWidth <= opts.maxWidthPx) {
            line += c;
            width += charWidth;
            ++i;
            continue;
        }

        if (line.empty()) {
            // Wider than a whole line on its own
            lines.emplace_back(1, c);
            ++i;
            continue;
        }

        const bool hyphenate = useHyphen &&
                               line.size() >= opts.minCharsBeforeHyphen &&
                               script::needsHyphenForBreak(line.back(), c);

        if (hyphenate) {
            Backoff backoff = backoffForHyphen(line, width, opts);
            if (backoff.atSpace) {
                emit(std::move(backoff.head));
            } else if (_measurer->measureText(backoff.head) + hyphenWidth <= opts.maxWidthPx) {
                backoff.head += opts.hyphenChar;
                lines.push_back(std::move(backoff.head));
            } else {
                // Even the shortest allowed head leaves no room for the hyphen
                emit(std::move(backoff.head));
            }
            i -= backoff.carried;
        } else {
            const size_t carry = (opts.applyKinsoku && !script::isBreakingSpace(c))
                ? kinsokuCarry(line, c, opts)
                : 0;
            emit(line.substr(0, line.size() - carry));
            i -= carry;
            if (carry == 0 && script::isBreakingSpace(c)) {
                ++i;  // a space at the break point is dropped, not carried
            }
        }

        line.clear();
        width = 0;
    }

    if (!line.empty()) {
        if (opts.trimLines) {
            line = std::u32string(trim(line));
        }
        if (!line.empty()) lines.push_back(std::move(line));
    }

    if (lines.empty()) lines.emplace_back();
    return lines;
}

/**
 * Remove trailing characters until line + hyphen fits, keeping at least
 * max(minCharsBeforeHyphen, 1) characters.
 *
 * Uncovering a space means a word boundary lies inside the overflow: the
 * line ends at that space with no hyphen and only the removed characters
 * carry forward.
 */
TextWrapper::Backoff TextWrapper::backoffForHyphen(std::u32string_view line, int lineWidth,
                                                   const WrapSettings& opts) const {
    Backoff result;
    result.head = std::u32string(line);

    const int hyphenWidth = _measurer->measureChar(opts.hyphenChar);
    const size_t keep = std::max<size_t>(opts.minCharsBeforeHyphen, 1);
    int width = lineWidth;

    while (width + hyphenWidth > opts.maxWidthPx && result.head.size() > keep) {
        width -= _measurer->measureChar(result.head.back());
        result.head.pop_back();
        result.carried++;

        if (!result.head.empty() && script::isBreakingSpace(result.head.back())) {
            trimEnd(result.head);
            result.atSpace = true;
            return result;
        }
    }
    return result;
}

/**
 * Characters to move from the end of `line` to the next line so that the
 * next line does not start with a no-start character and this line does not
 * end with a no-end character. Zero when that cannot be achieved with the
 * carried run (plus `next`) fitting on one line and one character left behind.
 */
size_t TextWrapper::kinsokuCarry(std::u32string_view line, char32_t next,
                                 const WrapSettings& opts) const {
    const auto& constraints = _measurer->getProfile()->constraints;
    if (!constraints || line.size() < 2) return 0;

    auto noStart = [&](char32_t cp) {
        return constraints->noStartChars.find(cp) != std::u32string::npos;
    };
    auto noEnd = [&](char32_t cp) {
        return constraints->noEndChars.find(cp) != std::u32string::npos;
    };
    auto violates = [&](size_t carry) {
        const char32_t start = carry == 0 ? next : line[line.size() - carry];
        const char32_t end = line[line.size() - carry - 1];
        return noStart(start) || noEnd(end);
    };

    size_t carry = 0;
    int carriedWidth = _measurer->measureChar(next);
    while (carry + 1 < line.size() && violates(carry)) {
        carriedWidth += _measurer->measureChar(line[line.size() - carry - 1]);
        if (carriedWidth > opts.maxWidthPx) return 0;
        ++carry;
    }
    return violates(carry) ? 0 : carry;
}

//-----------------------------------------------------------------------------
// Word modes
//-----------------------------------------------------------------------------
std::vector<std::u32string> TextWrapper::wrapWords(std::u32string_view text,
                                                   const WrapSettings& opts,
                                                   bool allowHyphen) const {
    std::vector<std::u32string> lines;
    const int spaceWidth = _measurer->getSpaceWidth();

    WrapSettings wordOpts = opts;
    wordOpts.applyKinsoku = false;

    auto emit = [&](std::u32string line) {
        if (opts.trimLines) line = std::u32string(trim(line));
        if (!line.empty()) lines.push_back(std::move(line));
    };

    std::u32string line;
    int width = 0;

    for (auto& token : splitIntoWords(text)) {
        const int wordWidth = _measurer->measureText(token.text);
        const bool needsSpace = !line.empty() && token.spaceBefore;
        const int total = width + (needsSpace ? spaceWidth : 0) + wordWidth;

        if (total <= opts.maxWidthPx) {
            if (needsSpace) {
                line += U' ';
                width += spaceWidth;
            }
            line += token.text;
            width += wordWidth;
            continue;
        }

        if (!line.empty()) {
            emit(std::move(line));
            line.clear();
            width = 0;
        }

        if (wordWidth > opts.maxWidthPx && allowHyphen) {
            auto pieces = wrapCharacters(token.text, wordOpts, true);
            for (size_t p = 0; p + 1 < pieces.size(); ++p) {
                lines.push_back(std::move(pieces[p]));
            }
            line = std::move(pieces.back());
            width = _measurer->measureText(line);
        } else {
            // StrictWord: an over-wide word sits alone and overflows
            line = std::move(token.text);
            width = wordWidth;
        }
    }

    if (!line.empty()) emit(std::move(line));

    if (lines.empty()) lines.emplace_back();
    return lines;
}

} // namespace hudtext
