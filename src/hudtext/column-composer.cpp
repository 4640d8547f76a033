#include <hudtext/column-composer.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>

namespace hudtext {

namespace {

constexpr std::string_view kEnSpace = "\xE2\x80\x82";  // U+2002

// En-spaces left behind by native wrappers break the pixel math
std::string stripEnSpaces(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t found = text.find(kEnSpace, pos);
        if (found == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, found - pos));
        pos = found + kEnSpace.size();
    }
    return out;
}

std::vector<std::string> padLines(std::vector<std::string> lines, size_t count) {
    lines.resize(count);
    return lines;
}

} // namespace

Result<ColumnComposer::Ptr> ColumnComposer::create(TextMeasurer::Ptr measurer,
                                                   BreakMode breakMode) noexcept {
    if (!measurer) {
        return Err<Ptr>("ColumnComposer: measurer is null");
    }

    WrapOptions defaults;
    defaults.breakMode = breakMode;
    auto wrapperRes = TextWrapper::create(measurer, defaults);
    if (!wrapperRes) {
        return Err<Ptr>("Failed to create wrapper for ColumnComposer", wrapperRes);
    }

    auto composer = Ptr(new ColumnComposer(measurer, *wrapperRes));
    composer->_spaceWidthPx = measurer->getSpaceWidth();
    if (composer->_spaceWidthPx <= 0) {
        return Err<Ptr>("ColumnComposer: profile has no usable space width");
    }
    return Ok(composer);
}

ColumnConfig ColumnComposer::getDefaultColumnConfig() const {
    const int displayWidth = _measurer->getDisplayWidth();
    const int rightStart = static_cast<int>(displayWidth * 0.55);

    ColumnConfig config;
    config.leftColumnWidthPx = static_cast<int>(displayWidth * 0.5);
    config.rightColumnStartPx = rightStart;
    config.rightColumnWidthPx = displayWidth - rightStart;
    config.maxLines = _measurer->getMaxLines();
    config.leftMarginSpaces = 0;
    return config;
}

ColumnConfig ColumnComposer::getColumnConfig(const ColumnOverrides& overrides) const {
    ColumnConfig config = getDefaultColumnConfig();
    if (overrides.leftColumnWidthPx) config.leftColumnWidthPx = *overrides.leftColumnWidthPx;
    if (overrides.rightColumnStartPx) config.rightColumnStartPx = *overrides.rightColumnStartPx;
    if (overrides.rightColumnWidthPx) config.rightColumnWidthPx = *overrides.rightColumnWidthPx;
    if (overrides.maxLines) config.maxLines = *overrides.maxLines;
    if (overrides.leftMarginSpaces) config.leftMarginSpaces = *overrides.leftMarginSpaces;
    return config;
}

void ColumnComposer::setBreakMode(BreakMode mode) {
    _wrapper = _wrapper->withBreakMode(mode);
}

ComposeResult ColumnComposer::composeDoubleTextWall(std::string_view leftText,
                                                    std::string_view rightText,
                                                    const ComposeOptions& options) const {
    ComposeResult result;
    result.config = getColumnConfig(options.columns);
    const ColumnConfig& config = result.config;

    WrapOptions leftOptions;
    leftOptions.maxWidthPx = config.leftColumnWidthPx;
    leftOptions.maxLines = config.maxLines;
    leftOptions.breakMode = options.breakMode;

    WrapOptions rightOptions;
    rightOptions.maxWidthPx = config.rightColumnWidthPx;
    rightOptions.maxLines = config.maxLines;
    rightOptions.breakMode = options.breakMode;

    auto left = _wrapper->wrap(leftText, leftOptions);
    auto right = _wrapper->wrap(rightText, rightOptions);
    if (left.truncated || right.truncated) {
        ydebug("ColumnComposer: column truncated (left={} right={})",
               left.truncated, right.truncated);
    }

    result.leftLines = padLines(std::move(left.lines), config.maxLines);
    result.rightLines = padLines(std::move(right.lines), config.maxLines);
    result.composedText = mergeColumns(result.leftLines, result.rightLines, config);
    return result;
}

size_t ColumnComposer::spacesForAlignment(int currentPx, int targetPx) const {
    const int pixelsNeeded = targetPx - currentPx;
    if (pixelsNeeded <= 0) {
        return 1;
    }
    const size_t spaces = static_cast<size_t>((pixelsNeeded + _spaceWidthPx - 1) / _spaceWidthPx);
    return std::min(spaces, kMaxPadSpaces);
}

std::string ColumnComposer::mergeColumns(const std::vector<std::string>& leftLines,
                                         const std::vector<std::string>& rightLines,
                                         const ColumnConfig& config) const {
    std::string out;
    for (size_t i = 0; i < config.maxLines; ++i) {
        const std::string left = stripEnSpaces(i < leftLines.size() ? leftLines[i] : "");
        const std::string right = stripEnSpaces(i < rightLines.size() ? rightLines[i] : "");

        const size_t spaces = spacesForAlignment(_measurer->measureText(left),
                                                 config.rightColumnStartPx);

        if (i > 0) out += '\n';
        out.append(config.leftMarginSpaces, ' ');
        out += left;
        out.append(spaces, ' ');
        out += right;
    }
    return out;
}

} // namespace hudtext
