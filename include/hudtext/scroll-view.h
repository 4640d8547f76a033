#pragma once

#include <hudtext/result.hpp>
#include <hudtext/text-measurer.h>
#include <hudtext/text-wrapper.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hudtext {

struct ScrollPosition {
    // Index of the first visible line
    size_t offset = 0;
    size_t totalLines = 0;
    size_t visibleLines = 0;
    size_t maxOffset = 0;
    bool atTop = true;
    bool atBottom = true;
    // 0-100; 100 when there is nothing to scroll
    int scrollPercent = 100;
};

struct ScrollViewport {
    // Exactly visibleLines entries, padded with empty strings
    std::vector<std::string> lines;
    ScrollPosition position;
    bool contentTruncated = false;
};

// Where scrollToLine places the target line
enum class ScrollAnchor : uint8_t { Top, Center, Bottom };

//-----------------------------------------------------------------------------
// ScrollView - line-by-line viewport over wrapped text
//
// Content is wrapped with no line or byte limit. The offset is always within
// [0, max(0, totalLines - viewportSize)]. Not synchronized; one per consumer.
//-----------------------------------------------------------------------------
class ScrollView {
public:
    using Ptr = std::shared_ptr<ScrollView>;

    // viewportSize defaults to the profile's maxLines
    static Result<Ptr> create(TextMeasurer::Ptr measurer, TextWrapper::Ptr wrapper,
                              std::optional<size_t> viewportSize = std::nullopt) noexcept;

    ~ScrollView() = default;

    // Replace content and scroll to the top. options.maxLines/maxBytes are ignored.
    void setContent(std::string_view text, const WrapOptions& options = {});

    /**
     * Append wrapped lines. With autoScroll, a view that was at the bottom
     * before the append follows the new content; a view the user scrolled up
     * stays where it is.
     */
    void appendContent(std::string_view text, const WrapOptions& options = {},
                       bool autoScroll = true);

    ScrollViewport getViewport() const;
    ScrollPosition getPosition() const;

    void scrollTo(int64_t offset);
    void scrollDown(size_t lines = 1);
    void scrollUp(size_t lines = 1);
    void pageDown();
    void pageUp();
    void scrollToTop();
    void scrollToBottom();
    // Rounded share of maxOffset; percent is clamped to 0-100
    void scrollToPercent(double percent);
    void scrollToLine(size_t lineIndex, ScrollAnchor anchor = ScrollAnchor::Top);

    bool isAtTop() const { return _offset == 0; }
    bool isAtBottom() const { return _offset >= maxOffset(); }
    bool isScrollable() const { return _lines.size() > _viewportSize; }

    const std::vector<std::string>& getAllLines() const { return _lines; }
    size_t getTotalLines() const { return _lines.size(); }
    size_t getViewportSize() const { return _viewportSize; }

    void clear();

    const TextMeasurer::Ptr& getMeasurer() const { return _measurer; }
    const TextWrapper::Ptr& getWrapper() const { return _wrapper; }

private:
    ScrollView(TextMeasurer::Ptr measurer, TextWrapper::Ptr wrapper, size_t viewportSize)
        : _measurer(std::move(measurer)), _wrapper(std::move(wrapper)),
          _viewportSize(viewportSize) {}

    WrapResult wrapUnbounded(std::string_view text, const WrapOptions& options) const;
    size_t maxOffset() const;

    TextMeasurer::Ptr _measurer;
    TextWrapper::Ptr _wrapper;
    size_t _viewportSize;

    std::vector<std::string> _lines;
    size_t _offset = 0;
    bool _truncated = false;
};

} // namespace hudtext
