#include <hudtext/scroll-view.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cmath>

namespace hudtext {

Result<ScrollView::Ptr> ScrollView::create(TextMeasurer::Ptr measurer, TextWrapper::Ptr wrapper,
                                           std::optional<size_t> viewportSize) noexcept {
    if (!measurer || !wrapper) {
        return Err<Ptr>("ScrollView: measurer and wrapper are required");
    }
    const size_t size = viewportSize.value_or(measurer->getMaxLines());
    if (size == 0) {
        return Err<Ptr>("ScrollView: viewport size must be positive");
    }
    ydebug("ScrollView::create: profile={} viewport={}", measurer->getProfile()->id, size);
    return Ok(Ptr(new ScrollView(std::move(measurer), std::move(wrapper), size)));
}

WrapResult ScrollView::wrapUnbounded(std::string_view text, const WrapOptions& options) const {
    WrapOptions unbounded = options;
    unbounded.maxLines = kUnlimited;
    unbounded.maxBytes = kUnlimited;
    return _wrapper->wrap(text, unbounded);
}

size_t ScrollView::maxOffset() const {
    return _lines.size() > _viewportSize ? _lines.size() - _viewportSize : 0;
}

void ScrollView::setContent(std::string_view text, const WrapOptions& options) {
    auto result = wrapUnbounded(text, options);
    _lines = std::move(result.lines);
    _truncated = result.truncated;
    _offset = 0;
}

void ScrollView::appendContent(std::string_view text, const WrapOptions& options,
                               bool autoScroll) {
    const bool wasAtBottom = isAtBottom();

    auto result = wrapUnbounded(text, options);
    _lines.insert(_lines.end(), std::make_move_iterator(result.lines.begin()),
                  std::make_move_iterator(result.lines.end()));
    _truncated = _truncated || result.truncated;

    if (autoScroll && wasAtBottom) {
        scrollToBottom();
    }
}

ScrollViewport ScrollView::getViewport() const {
    ScrollViewport viewport;
    const size_t end = std::min(_offset + _viewportSize, _lines.size());
    if (_offset < end) {
        viewport.lines.assign(_lines.begin() + static_cast<std::ptrdiff_t>(_offset),
                              _lines.begin() + static_cast<std::ptrdiff_t>(end));
    }
    viewport.lines.resize(_viewportSize);
    viewport.position = getPosition();
    viewport.contentTruncated = _truncated;
    return viewport;
}

ScrollPosition ScrollView::getPosition() const {
    ScrollPosition pos;
    pos.offset = _offset;
    pos.totalLines = _lines.size();
    pos.visibleLines = _viewportSize;
    pos.maxOffset = maxOffset();
    pos.atTop = _offset == 0;
    pos.atBottom = _offset >= pos.maxOffset;
    pos.scrollPercent = pos.maxOffset > 0
        ? static_cast<int>(std::lround(static_cast<double>(_offset) * 100.0 /
                                       static_cast<double>(pos.maxOffset)))
        : 100;
    return pos;
}

void ScrollView::scrollTo(int64_t offset) {
    if (offset <= 0) {
        _offset = 0;
        return;
    }
    _offset = std::min(static_cast<size_t>(offset), maxOffset());
}

void ScrollView::scrollDown(size_t lines) {
    const size_t max = maxOffset();
    _offset = lines >= max - std::min(_offset, max) ? max : _offset + lines;
}

void ScrollView::scrollUp(size_t lines) {
    _offset = lines >= _offset ? 0 : _offset - lines;
}

void ScrollView::pageDown() {
    scrollDown(_viewportSize);
}

void ScrollView::pageUp() {
    scrollUp(_viewportSize);
}

void ScrollView::scrollToTop() {
    _offset = 0;
}

void ScrollView::scrollToBottom() {
    _offset = maxOffset();
}

void ScrollView::scrollToPercent(double percent) {
    percent = std::clamp(percent, 0.0, 100.0);
    scrollTo(static_cast<int64_t>(std::lround(percent / 100.0 * static_cast<double>(maxOffset()))));
}

void ScrollView::scrollToLine(size_t lineIndex, ScrollAnchor anchor) {
    const auto index = static_cast<int64_t>(lineIndex);
    const auto viewport = static_cast<int64_t>(_viewportSize);
    switch (anchor) {
    case ScrollAnchor::Top:
        scrollTo(index);
        break;
    case ScrollAnchor::Center:
        scrollTo(index - viewport / 2);
        break;
    case ScrollAnchor::Bottom:
        scrollTo(index - viewport + 1);
        break;
    }
}

void ScrollView::clear() {
    _lines.clear();
    _offset = 0;
    _truncated = false;
}

} // namespace hudtext
