//=============================================================================
// ColumnComposer Tests
//
// Pixel-aligned two-column layout on the G1 (space = 6px).
//=============================================================================

#include <boost/ut.hpp>
#include <hudtext/column-composer.h>
#include <hudtext/profiles.h>
#include <hudtext/text-measurer.h>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace hudtext;

namespace {

TextMeasurer::Ptr g1Measurer() {
    auto res = TextMeasurer::create(profiles::g1());
    return res ? *res : nullptr;
}

ColumnComposer::Ptr g1Composer(BreakMode mode = BreakMode::CharacterNoHyphen) {
    auto res = ColumnComposer::create(g1Measurer(), mode);
    return res ? *res : nullptr;
}

std::vector<std::string> splitRows(const std::string& text) {
    std::vector<std::string> rows;
    size_t start = 0;
    while (true) {
        size_t pos = text.find('\n', start);
        if (pos == std::string::npos) {
            rows.push_back(text.substr(start));
            break;
        }
        rows.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return rows;
}

} // namespace

suite column_config_tests = [] {
    "default geometry"_test = [] {
        auto c = g1Composer();
        expect((c != nullptr) >> fatal);
        auto config = c->getDefaultColumnConfig();
        expect(config.leftColumnWidthPx == 288_i);
        expect(config.rightColumnStartPx == 316_i);
        expect(config.rightColumnWidthPx == 260_i);
        expect(config.maxLines == 5_u);
        expect(config.leftMarginSpaces == 0_u);
    };

    "overrides replace single fields"_test = [] {
        auto c = g1Composer();
        expect((c != nullptr) >> fatal);
        ColumnOverrides overrides;
        overrides.rightColumnStartPx = 317;
        overrides.maxLines = 3;
        auto config = c->getColumnConfig(overrides);
        expect(config.rightColumnStartPx == 317_i);
        expect(config.maxLines == 3_u);
        expect(config.leftColumnWidthPx == 288_i);
    };

    "break mode"_test = [] {
        auto c = g1Composer(BreakMode::Word);
        expect((c != nullptr) >> fatal);
        expect(c->getBreakMode() == BreakMode::Word);
        c->setBreakMode(BreakMode::Character);
        expect(c->getBreakMode() == BreakMode::Character);
    };

    "null measurer is an error"_test = [] {
        expect(!ColumnComposer::create(nullptr).has_value());
    };
};

suite alignment_tests = [] {
    "spaces round up"_test = [] {
        auto c = g1Composer();
        expect((c != nullptr) >> fatal);
        expect(c->spacesForAlignment(16, 316) == 50_u);
        expect(c->spacesForAlignment(16, 317) == 51_u);
        expect(c->spacesForAlignment(0, 316) == 53_u);
    };

    "at least one space, at most the cap"_test = [] {
        auto c = g1Composer();
        expect((c != nullptr) >> fatal);
        expect(c->spacesForAlignment(316, 316) == 1_u);
        expect(c->spacesForAlignment(400, 316) == 1_u);
        expect(c->spacesForAlignment(0, 10000) == ColumnComposer::kMaxPadSpaces);
    };
};

suite compose_tests = [] {
    "Hi and Bye on the default layout"_test = [] {
        auto c = g1Composer();
        expect((c != nullptr) >> fatal);
        auto result = c->composeDoubleTextWall("Hi", "Bye");
        auto rows = splitRows(result.composedText);
        expect((rows.size() == 5_u) >> fatal);
        // measureText("Hi") = 16, ceil((316 - 16) / 6) = 50
        expect(rows[0] == "Hi" + std::string(50, ' ') + "Bye");
        // empty rows still carry the padding: ceil(316 / 6) = 53
        expect(rows[1] == std::string(53, ' '));

        expect(result.leftLines.size() == 5_u);
        expect(result.rightLines.size() == 5_u);
        expect(result.leftLines[0] == std::string("Hi"));
        expect(result.rightLines[0] == std::string("Bye"));
    };

    "explicit right column start"_test = [] {
        auto c = g1Composer();
        expect((c != nullptr) >> fatal);
        ComposeOptions options;
        options.columns.rightColumnStartPx = 317;
        auto result = c->composeDoubleTextWall("Hi", "Bye", options);
        auto rows = splitRows(result.composedText);
        expect(!rows.empty() >> fatal);
        expect(rows[0] == "Hi" + std::string(51, ' ') + "Bye");
    };

    "right text starts at or past the column"_test = [] {
        auto m = g1Measurer();
        auto c = g1Composer(BreakMode::Word);
        expect((m != nullptr && c != nullptr) >> fatal);
        auto result = c->composeDoubleTextWall(
            "Speaker one talks about a long topic that wraps",
            "Translation of what was said appears here");
        auto rows = splitRows(result.composedText);
        expect((rows.size() == result.config.maxLines) >> fatal);
        for (size_t i = 0; i < rows.size(); ++i) {
            const std::string& right = result.rightLines[i];
            expect((rows[i].size() >= right.size()) >> fatal);
            expect(rows[i].compare(rows[i].size() - right.size(), right.size(), right) == 0);
            const std::string prefix = rows[i].substr(0, rows[i].size() - right.size());
            expect(m->measureText(prefix) >= result.config.rightColumnStartPx);
        }
    };

    "left column stays within its width"_test = [] {
        auto m = g1Measurer();
        auto c = g1Composer();
        expect((m != nullptr && c != nullptr) >> fatal);
        auto result = c->composeDoubleTextWall(
            "A rather long left column text that must wrap several times", "R");
        for (const auto& line : result.leftLines) {
            expect(m->measureText(line) <= result.config.leftColumnWidthPx);
        }
    };

    "composition is deterministic"_test = [] {
        auto c = g1Composer();
        expect((c != nullptr) >> fatal);
        auto a = c->composeDoubleTextWall("left side", "right side");
        auto b = c->composeDoubleTextWall("left side", "right side");
        expect(a.composedText == b.composedText);
    };

    "en-spaces are stripped before measuring"_test = [] {
        auto c = g1Composer();
        expect((c != nullptr) >> fatal);
        auto result = c->composeDoubleTextWall("A\xE2\x80\x82" "B", "C");
        auto rows = splitRows(result.composedText);
        expect(!rows.empty() >> fatal);
        expect(rows[0].rfind("AB ", 0) == 0_u);
        expect(rows[0].find("\xE2\x80\x82") == std::string::npos);
    };

    "left margin"_test = [] {
        auto c = g1Composer();
        expect((c != nullptr) >> fatal);
        ComposeOptions options;
        options.columns.leftMarginSpaces = 2;
        auto result = c->composeDoubleTextWall("Hi", "Bye", options);
        expect(result.composedText.rfind("  Hi ", 0) == 0_u);
    };

    "fewer rows on request"_test = [] {
        auto c = g1Composer();
        expect((c != nullptr) >> fatal);
        ComposeOptions options;
        options.columns.maxLines = 2;
        auto result = c->composeDoubleTextWall("a\nb\nc", "x");
        auto limited = c->composeDoubleTextWall("a\nb\nc", "x", options);
        expect(splitRows(result.composedText).size() == 5_u);
        expect(splitRows(limited.composedText).size() == 2_u);
    };
};
