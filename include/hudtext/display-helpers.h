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

struct TruncateResult {
    std::string text;
    bool wasTruncated = false;
    int widthPx = 0;
    // Lengths in code points; truncatedLength excludes the ellipsis
    size_t originalLength = 0;
    size_t truncatedLength = 0;
};

struct Page {
    std::vector<std::string> lines;
    // 1-based
    size_t pageNumber = 1;
    size_t totalPages = 1;
    bool isFirst = true;
    bool isLast = true;
};

// One BLE write. Never splits a UTF-8 sequence.
struct Chunk {
    std::string text;
    size_t index = 0;
    size_t totalChunks = 0;
    size_t bytes = 0;
};

struct UtilizationStats {
    int averageUtilization = 0;
    int minUtilization = 0;
    int maxUtilization = 0;
    int totalWastedPx = 0;
};

//-----------------------------------------------------------------------------
// DisplayHelpers - truncation, pagination and BLE chunking on top of the
// measurer and wrapper. Holds no state of its own.
//-----------------------------------------------------------------------------
class DisplayHelpers {
public:
    using Ptr = std::shared_ptr<DisplayHelpers>;

    static Result<Ptr> create(TextMeasurer::Ptr measurer, TextWrapper::Ptr wrapper) noexcept;

    ~DisplayHelpers() = default;

    // Keep the first (or, fromEnd, the last) maxLines lines
    std::vector<std::string> truncateToLines(const std::vector<std::string>& lines,
                                             size_t maxLines, bool fromEnd = false) const;

    TruncateResult truncateWithEllipsis(std::string_view text,
                                        std::optional<int> maxWidthPx = std::nullopt,
                                        std::string_view ellipsis = "...") const;

    // ceil(width / maxWidth) + number of '\n'. No wrapping pass.
    size_t estimateLineCount(std::string_view text,
                             std::optional<int> maxWidthPx = std::nullopt) const;

    // Wrap and keep at most the profile's line count
    std::vector<std::string> fitToScreen(std::string_view text,
                                         const WrapOptions& options = {}) const;

    /**
     * Wrap with no line or byte limit and cut into pages of
     * options.maxLines (or the profile's maxLines) lines.
     * Always returns at least one page.
     */
    std::vector<Page> paginate(std::string_view text, const WrapOptions& options = {}) const;

    size_t calculateByteSize(std::string_view text) const { return text.size(); }
    bool exceedsByteLimit(std::string_view text,
                          std::optional<size_t> maxBytes = std::nullopt) const;

    /**
     * Split text into chunks of at most chunkSize bytes (profile bleChunkSize
     * by default). Cuts back off to a UTF-8 lead byte, then to just after the
     * last space or newline in the back half of the window. A run with no
     * whitespace gets a hard cut at the character boundary.
     */
    std::vector<Chunk> splitIntoChunks(std::string_view text,
                                       std::optional<size_t> chunkSize = std::nullopt) const;

    // Min/avg/max utilization and wasted pixels against the display width
    UtilizationStats calculateUtilization(const WrapResult& result) const;

    // Pad with empty lines (at the end, or at the start) or cut to targetCount
    std::vector<std::string> padToLineCount(const std::vector<std::string>& lines,
                                            size_t targetCount, bool padAtEnd = true) const;

    std::string joinLines(const std::vector<std::string>& lines) const;

    const TextMeasurer::Ptr& getMeasurer() const { return _measurer; }
    const TextWrapper::Ptr& getWrapper() const { return _wrapper; }
    const DisplayProfile::Ptr& getProfile() const { return _measurer->getProfile(); }

private:
    DisplayHelpers(TextMeasurer::Ptr measurer, TextWrapper::Ptr wrapper)
        : _measurer(std::move(measurer)), _wrapper(std::move(wrapper)) {}

    TextMeasurer::Ptr _measurer;
    TextWrapper::Ptr _wrapper;
};

} // namespace hudtext
