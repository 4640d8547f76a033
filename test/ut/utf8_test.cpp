//=============================================================================
// UTF-8 Tests
//
// Decoding of well-formed and malformed input, and the effect of malformed
// bytes on measuring and wrapping.
//=============================================================================

#include <boost/ut.hpp>
#include <hudtext/profiles.h>
#include <hudtext/text-measurer.h>
#include <hudtext/text-wrapper.h>
#include <hudtext/utf8.h>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace hudtext;

namespace {

const std::string kReplacement = "\xEF\xBF\xBD";

} // namespace

suite utf8_decode_tests = [] {
    "well-formed sequences"_test = [] {
        expect(utf8::toCodepoints("a\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80") ==
               std::u32string{U'a', U'é', U'中', U'\U0001F600'});
        expect(utf8::length("a\xC3\xA9\xE4\xB8\xAD") == 3_u);
    };

    "truncated lead byte keeps the ASCII after it"_test = [] {
        expect(utf8::toCodepoints("\xC3" "ABC") ==
               std::u32string{U'\uFFFD', U'A', U'B', U'C'});
        expect(utf8::toCodepoints("ok\xE4" "xy") ==
               std::u32string{U'o', U'k', U'\uFFFD', U'x', U'y'});
        expect(utf8::toCodepoints("\xF0\x9F" "z") == std::u32string{U'\uFFFD', U'\uFFFD', U'z'});
    };

    "lead byte at the end of input"_test = [] {
        expect(utf8::toCodepoints("ab\xE4\xB8") == std::u32string{U'a', U'b', U'\uFFFD', U'\uFFFD'});
    };

    "stray continuation byte"_test = [] {
        expect(utf8::toCodepoints("a\x80" "b") == std::u32string{U'a', U'\uFFFD', U'b'});
        expect(utf8::length("a\x80" "b") == 3_u);
    };

    "decode advances one byte on a malformed sequence"_test = [] {
        const std::string text = "\xE4" "A";
        const uint8_t* ptr = reinterpret_cast<const uint8_t*>(text.data());
        const uint8_t* end = ptr + text.size();
        expect(utf8::decode(ptr, end) == U'\uFFFD');
        expect(*ptr == uint8_t('A'));
        expect(utf8::decode(ptr, end) == U'A');
        expect(ptr == end);
    };
};

suite utf8_layout_tests = [] {
    "malformed bytes measure as replacement characters"_test = [] {
        auto res = TextMeasurer::create(profiles::g1());
        expect(res.has_value() >> fatal);
        auto m = *res;
        expect(m->measureText("\xC3" "ABC") ==
               m->measureChar(U'\uFFFD') + m->measureText("ABC"));
    };

    "wrapping keeps the text after a malformed byte"_test = [] {
        auto res = TextMeasurer::create(profiles::g1());
        expect(res.has_value() >> fatal);
        auto w = TextWrapper::create(*res);
        expect(w.has_value() >> fatal);
        expect((*w)->wrap("\xC3" "ABC").lines == std::vector<std::string>{kReplacement + "ABC"});
        expect((*w)->wrap("ok\xE4" "xy").lines == std::vector<std::string>{"ok" + kReplacement + "xy"});
    };
};
