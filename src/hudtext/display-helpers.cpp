#include <hudtext/display-helpers.h>
#include <hudtext/utf8.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cmath>

namespace hudtext {

Result<DisplayHelpers::Ptr> DisplayHelpers::create(TextMeasurer::Ptr measurer,
                                                   TextWrapper::Ptr wrapper) noexcept {
    if (!measurer || !wrapper) {
        return Err<Ptr>("DisplayHelpers: measurer and wrapper are required");
    }
    if (wrapper->getMeasurer() != measurer) {
        ywarn("DisplayHelpers: wrapper uses a different measurer (profile {})",
              wrapper->getMeasurer()->getProfile()->id);
    }
    return Ok(Ptr(new DisplayHelpers(std::move(measurer), std::move(wrapper))));
}

std::vector<std::string> DisplayHelpers::truncateToLines(const std::vector<std::string>& lines,
                                                         size_t maxLines, bool fromEnd) const {
    if (lines.size() <= maxLines) {
        return lines;
    }
    if (fromEnd) {
        return {lines.end() - static_cast<std::ptrdiff_t>(maxLines), lines.end()};
    }
    return {lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(maxLines)};
}

TruncateResult DisplayHelpers::truncateWithEllipsis(std::string_view text,
                                                    std::optional<int> maxWidthPx,
                                                    std::string_view ellipsis) const {
    const int width = maxWidthPx.value_or(_measurer->getDisplayWidth());
    const std::u32string chars = utf8::toCodepoints(text);

    TruncateResult result;
    result.originalLength = chars.size();

    const int textWidth = _measurer->measureText(std::u32string_view(chars));
    if (textWidth <= width) {
        result.text = std::string(text);
        result.widthPx = textWidth;
        result.truncatedLength = chars.size();
        return result;
    }

    const int targetWidth = width - _measurer->measureText(ellipsis);

    std::u32string kept;
    int keptWidth = 0;
    for (char32_t cp : chars) {
        const int w = _measurer->measureChar(cp);
        if (keptWidth + w > targetWidth) break;
        kept += cp;
        keptWidth += w;
    }
    while (!kept.empty() && (kept.back() == U' ' || kept.back() == U'\t' || kept.back() == U'\n')) {
        kept.pop_back();
    }

    result.text = utf8::fromCodepoints(kept);
    result.text += ellipsis;
    result.wasTruncated = true;
    result.widthPx = _measurer->measureText(result.text);
    result.truncatedLength = kept.size();
    return result;
}

size_t DisplayHelpers::estimateLineCount(std::string_view text,
                                         std::optional<int> maxWidthPx) const {
    if (text.empty()) return 1;

    const int width = std::max(1, maxWidthPx.value_or(_measurer->getDisplayWidth()));
    const int textWidth = _measurer->measureText(text);
    const size_t newlines = static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
    const size_t wrapped = static_cast<size_t>((textWidth + width - 1) / width);
    return wrapped + newlines;
}

std::vector<std::string> DisplayHelpers::fitToScreen(std::string_view text,
                                                     const WrapOptions& options) const {
    return truncateToLines(_wrapper->wrap(text, options).lines, _measurer->getMaxLines());
}

std::vector<Page> DisplayHelpers::paginate(std::string_view text,
                                           const WrapOptions& options) const {
    WrapOptions unbounded = options;
    unbounded.maxLines = kUnlimited;
    unbounded.maxBytes = kUnlimited;
    const auto all = _wrapper->wrap(text, unbounded).lines;

    const size_t linesPerPage = std::max<size_t>(1, options.maxLines.value_or(_measurer->getMaxLines()));

    std::vector<Page> pages;
    const size_t totalPages = (all.size() + linesPerPage - 1) / linesPerPage;
    for (size_t start = 0; start < all.size(); start += linesPerPage) {
        const size_t end = std::min(start + linesPerPage, all.size());
        Page page;
        page.lines.assign(all.begin() + static_cast<std::ptrdiff_t>(start),
                          all.begin() + static_cast<std::ptrdiff_t>(end));
        page.pageNumber = start / linesPerPage + 1;
        page.totalPages = totalPages;
        page.isFirst = page.pageNumber == 1;
        page.isLast = page.pageNumber == totalPages;
        pages.push_back(std::move(page));
    }

    if (pages.empty()) {
        Page page;
        page.lines.emplace_back();
        pages.push_back(std::move(page));
    }
    return pages;
}

bool DisplayHelpers::exceedsByteLimit(std::string_view text, std::optional<size_t> maxBytes) const {
    return calculateByteSize(text) > maxBytes.value_or(_measurer->getMaxPayloadBytes());
}

std::vector<Chunk> DisplayHelpers::splitIntoChunks(std::string_view text,
                                                   std::optional<size_t> chunkSize) const {
    const size_t size = std::max<size_t>(1, chunkSize.value_or(getProfile()->bleChunkSize));
    const size_t length = text.size();
    auto byteAt = [&](size_t i) { return static_cast<uint8_t>(text[i]); };

    std::vector<Chunk> chunks;
    if (length <= size) {
        chunks.push_back({std::string(text), 0, 1, length});
        return chunks;
    }

    size_t offset = 0;
    while (offset < length) {
        size_t end = std::min(offset + size, length);

        if (end < length) {
            while (end > offset && utf8::isContinuationByte(byteAt(end))) {
                end--;
            }
            if (end == offset) {
                // One character larger than the chunk: send it whole
                end = offset + 1;
                while (end < length && utf8::isContinuationByte(byteAt(end))) end++;
            } else {
                for (size_t i = end - 1; i > offset + size / 2; --i) {
                    if (byteAt(i) == ' ' || byteAt(i) == '\n') {
                        end = i + 1;
                        break;
                    }
                }
            }
        }

        chunks.push_back({std::string(text.substr(offset, end - offset)), chunks.size(), 0,
                          end - offset});
        offset = end;
    }

    for (auto& chunk : chunks) {
        chunk.totalChunks = chunks.size();
    }
    ydebug("splitIntoChunks: {} bytes -> {} chunks of <= {}", length, chunks.size(), size);
    return chunks;
}

UtilizationStats DisplayHelpers::calculateUtilization(const WrapResult& result) const {
    UtilizationStats stats;
    if (result.lines.empty() || result.lineMetrics.empty()) {
        return stats;
    }

    const int displayWidth = _measurer->getDisplayWidth();
    int total = 0;
    stats.minUtilization = 100;
    for (const auto& metrics : result.lineMetrics) {
        total += metrics.utilizationPercent;
        stats.minUtilization = std::min(stats.minUtilization, metrics.utilizationPercent);
        stats.maxUtilization = std::max(stats.maxUtilization, metrics.utilizationPercent);
        stats.totalWastedPx += displayWidth - metrics.widthPx;
    }
    stats.averageUtilization = static_cast<int>(
        std::lround(static_cast<double>(total) / static_cast<double>(result.lineMetrics.size())));
    return stats;
}

std::vector<std::string> DisplayHelpers::padToLineCount(const std::vector<std::string>& lines,
                                                        size_t targetCount, bool padAtEnd) const {
    if (lines.size() >= targetCount) {
        return truncateToLines(lines, targetCount);
    }
    std::vector<std::string> out;
    out.reserve(targetCount);
    const size_t padding = targetCount - lines.size();
    if (!padAtEnd) out.resize(padding);
    out.insert(out.end(), lines.begin(), lines.end());
    if (padAtEnd) out.resize(targetCount);
    return out;
}

std::string DisplayHelpers::joinLines(const std::vector<std::string>& lines) const {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

} // namespace hudtext
