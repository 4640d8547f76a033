//=============================================================================
// DisplayHelpers Tests
//
// Ellipsis truncation, pagination and UTF-8 safe BLE chunking.
//=============================================================================

#include <boost/ut.hpp>
#include <hudtext/toolkit.h>
#include <hudtext/utf8.h>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace hudtext;

namespace {

DisplayToolkit g1Toolkit() {
    auto res = createG1Toolkit();
    return res ? *res : DisplayToolkit{};
}

// Re-encoding reproduces the bytes only for complete sequences
bool isWholeUtf8(const std::string& text) {
    if (!text.empty() && utf8::isContinuationByte(static_cast<uint8_t>(text.front()))) {
        return false;
    }
    return utf8::fromCodepoints(utf8::toCodepoints(text)) == text;
}

std::string repeat(const std::string& s, int n) {
    std::string out;
    for (int i = 0; i < n; ++i) out += s;
    return out;
}

} // namespace

suite truncate_tests = [] {
    "ellipsis replaces the overflow"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        // 50 - "..."(12) leaves 38px: H12 e10 l4 l4 = 30, o would make 40
        auto result = tk.helpers->truncateWithEllipsis("Hello world", 50);
        expect(result.text == std::string("Hell..."));
        expect(result.wasTruncated);
        expect(result.originalLength == 11_u);
        expect(result.truncatedLength == 4_u);
        expect(result.widthPx <= 50_i);
    };

    "trailing whitespace is dropped before the ellipsis"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        auto result = tk.helpers->truncateWithEllipsis("Hi there", 36);
        expect(result.text == std::string("Hi..."));
        expect(result.truncatedLength == 2_u);
    };

    "text that fits is unchanged"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        auto result = tk.helpers->truncateWithEllipsis("Hi");
        expect(result.text == std::string("Hi"));
        expect(!result.wasTruncated);
        expect(result.widthPx == 16_i);
    };

    "truncateToLines"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        const std::vector<std::string> lines{"a", "b", "c", "d"};
        expect(tk.helpers->truncateToLines(lines, 2) == std::vector<std::string>{"a", "b"});
        expect(tk.helpers->truncateToLines(lines, 2, true) == std::vector<std::string>{"c", "d"});
        expect(tk.helpers->truncateToLines(lines, 10) == lines);
    };

    "fitToScreen keeps the profile line count"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        WrapOptions options;
        options.maxLines = 10;
        auto lines = tk.helpers->fitToScreen("1\n2\n3\n4\n5\n6\n7\n8", options);
        expect(lines.size() == 5_u);
        expect(lines.front() == std::string("1"));
    };
};

suite estimate_tests = [] {
    "estimateLineCount"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        expect(tk.helpers->estimateLineCount("") == 1_u);
        expect(tk.helpers->estimateLineCount("Hi") == 1_u);
        // a = 12px, 60px over 25px
        expect(tk.helpers->estimateLineCount("aaaaa", 25) == 3_u);
        expect(tk.helpers->estimateLineCount("a\na") == 2_u);
    };
};

suite paginate_tests = [] {
    "pages of the profile line count"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        auto pages = tk.helpers->paginate("1\n2\n3\n4\n5\n6\n7");
        expect((pages.size() == 2_u) >> fatal);
        expect(pages[0].lines.size() == 5_u);
        expect(pages[1].lines == std::vector<std::string>{"6", "7"});
        expect(pages[0].pageNumber == 1_u);
        expect(pages[1].pageNumber == 2_u);
        expect(pages[0].totalPages == 2_u);
        expect(pages[0].isFirst && !pages[0].isLast);
        expect(!pages[1].isFirst && pages[1].isLast);
    };

    "custom page size"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        WrapOptions options;
        options.maxLines = 3;
        auto pages = tk.helpers->paginate("1\n2\n3\n4\n5\n6\n7", options);
        expect(pages.size() == 3_u);
        expect(pages.back().lines == std::vector<std::string>{"7"});
    };

    "long text is not truncated"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        const std::string text = repeat("line\n", 40) + "end";
        auto pages = tk.helpers->paginate(text);
        expect(pages.size() == 9_u);
        expect(pages.back().lines.back() == std::string("end"));
    };

    "empty text is one page"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        auto pages = tk.helpers->paginate("");
        expect((pages.size() == 1_u) >> fatal);
        expect(pages[0].isFirst && pages[0].isLast);
    };
};

suite chunk_tests = [] {
    "short text is one chunk"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        auto chunks = tk.helpers->splitIntoChunks("hello");
        expect((chunks.size() == 1_u) >> fatal);
        expect(chunks[0].text == std::string("hello"));
        expect(chunks[0].totalChunks == 1_u);
        expect(chunks[0].bytes == 5_u);
    };

    "chunks end after whitespace"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        const std::string text = repeat("word ", 100);
        auto chunks = tk.helpers->splitIntoChunks(text);
        expect((chunks.size() == 3_u) >> fatal);

        std::string joined;
        size_t total = 0;
        for (size_t i = 0; i < chunks.size(); ++i) {
            expect(chunks[i].bytes <= 176_u);
            expect(chunks[i].index == i);
            expect(chunks[i].totalChunks == chunks.size());
            if (i + 1 < chunks.size()) {
                expect(chunks[i].text.back() == ' ');
            }
            joined += chunks[i].text;
            total += chunks[i].bytes;
        }
        expect(joined == text);
        expect(total == text.size());
    };

    "multi-byte characters are never split"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        const std::string text = repeat("中", 100);
        auto chunks = tk.helpers->splitIntoChunks(text);
        expect((chunks.size() == 2_u) >> fatal);
        expect(chunks[0].bytes == 174_u);

        std::string joined;
        for (const auto& chunk : chunks) {
            expect(isWholeUtf8(chunk.text));
            joined += chunk.text;
        }
        expect(joined == text);
    };

    "mixed scripts with a small chunk size"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        const std::string text = "Привет 中文 한국어 héllo 😀 world";
        for (size_t size : {5u, 7u, 16u, 33u}) {
            auto chunks = tk.helpers->splitIntoChunks(text, size);
            std::string joined;
            for (const auto& chunk : chunks) {
                expect(chunk.bytes <= size);
                expect(isWholeUtf8(chunk.text));
                joined += chunk.text;
            }
            expect(joined == text);
        }
    };

    "a character larger than the chunk is sent whole"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        auto chunks = tk.helpers->splitIntoChunks("中中", 2);
        expect((chunks.size() == 2_u) >> fatal);
        expect(chunks[0].text == std::string("中"));
        expect(chunks[1].text == std::string("中"));
    };

    "byte limits"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        expect(tk.helpers->calculateByteSize("中a") == 4_u);
        expect(!tk.helpers->exceedsByteLimit(std::string(390, 'a')));
        expect(tk.helpers->exceedsByteLimit(std::string(391, 'a')));
        expect(tk.helpers->exceedsByteLimit("abc", 2));
    };
};

suite utilization_tests = [] {
    "stats over line metrics"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        WrapResult result;
        result.lines = {"a", "b"};
        LineMetrics half;
        half.widthPx = 288;
        half.utilizationPercent = 50;
        LineMetrics full;
        full.widthPx = 576;
        full.utilizationPercent = 100;
        result.lineMetrics = {half, full};

        auto stats = tk.helpers->calculateUtilization(result);
        expect(stats.averageUtilization == 75_i);
        expect(stats.minUtilization == 50_i);
        expect(stats.maxUtilization == 100_i);
        expect(stats.totalWastedPx == 288_i);
    };

    "empty result"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        auto stats = tk.helpers->calculateUtilization(WrapResult{});
        expect(stats.averageUtilization == 0_i);
        expect(stats.totalWastedPx == 0_i);
    };
};

suite line_padding_tests = [] {
    "pad and cut"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        const std::vector<std::string> one{"a"};
        expect(tk.helpers->padToLineCount(one, 3) == std::vector<std::string>{"a", "", ""});
        expect(tk.helpers->padToLineCount(one, 3, false) == std::vector<std::string>{"", "", "a"});
        expect(tk.helpers->padToLineCount({"a", "b", "c"}, 2) ==
               std::vector<std::string>{"a", "b"});
    };

    "joinLines"_test = [] {
        auto tk = g1Toolkit();
        expect((tk.helpers != nullptr) >> fatal);
        expect(tk.helpers->joinLines({"a", "b"}) == std::string("a\nb"));
        expect(tk.helpers->joinLines({}).empty());
    };
};
