#pragma once

#include <hudtext/result.hpp>
#include <hudtext/text-measurer.h>
#include <hudtext/text-wrapper.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hudtext {

// Geometry of a two-column layout
struct ColumnConfig {
    int leftColumnWidthPx = 0;
    // Pixel x where the right column text begins
    int rightColumnStartPx = 0;
    int rightColumnWidthPx = 0;
    size_t maxLines = 0;
    // Spaces prepended to every row
    size_t leftMarginSpaces = 0;
};

struct ColumnOverrides {
    std::optional<int> leftColumnWidthPx;
    std::optional<int> rightColumnStartPx;
    std::optional<int> rightColumnWidthPx;
    std::optional<size_t> maxLines;
    std::optional<size_t> leftMarginSpaces;
};

struct ComposeOptions {
    std::optional<BreakMode> breakMode;
    ColumnOverrides columns;
};

struct ComposeResult {
    // Rows joined with '\n', ready for the glasses to split and render
    std::string composedText;
    // Per-column lines, padded to maxLines
    std::vector<std::string> leftLines;
    std::vector<std::string> rightLines;
    ColumnConfig config;
};

//-----------------------------------------------------------------------------
// ColumnComposer - double text wall
//
// Wraps two texts independently and merges them row by row, padding each
// left cell with enough spaces to put the right cell at rightColumnStartPx,
// counted in measured pixels rather than characters.
//-----------------------------------------------------------------------------
class ColumnComposer {
public:
    using Ptr = std::shared_ptr<ColumnComposer>;

    static constexpr size_t kMaxPadSpaces = 100;

    static Result<Ptr> create(TextMeasurer::Ptr measurer,
                              BreakMode breakMode = BreakMode::CharacterNoHyphen) noexcept;

    ~ColumnComposer() = default;

    ComposeResult composeDoubleTextWall(std::string_view leftText, std::string_view rightText,
                                        const ComposeOptions& options = {}) const;

    // Left 50% of the display, right column from 55% to the edge
    ColumnConfig getDefaultColumnConfig() const;
    ColumnConfig getColumnConfig(const ColumnOverrides& overrides) const;

    void setBreakMode(BreakMode mode);
    BreakMode getBreakMode() const { return _wrapper->getOptions().breakMode; }

    // Spaces that move x from currentPx to at least targetPx (1..kMaxPadSpaces)
    size_t spacesForAlignment(int currentPx, int targetPx) const;

private:
    ColumnComposer(TextMeasurer::Ptr measurer, TextWrapper::Ptr wrapper)
        : _measurer(std::move(measurer)), _wrapper(std::move(wrapper)) {}

    std::string mergeColumns(const std::vector<std::string>& leftLines,
                             const std::vector<std::string>& rightLines,
                             const ColumnConfig& config) const;

    TextMeasurer::Ptr _measurer;
    TextWrapper::Ptr _wrapper;
    int _spaceWidthPx = 0;
};

} // namespace hudtext
