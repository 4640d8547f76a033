//=============================================================================
// ScrollView Tests
//=============================================================================

#include <boost/ut.hpp>
#include <hudtext/scroll-view.h>
#include <hudtext/toolkit.h>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace hudtext;

namespace {

ScrollView::Ptr makeView(std::optional<size_t> viewport = 3) {
    auto tk = createG1Toolkit();
    if (!tk) return nullptr;
    auto res = ScrollView::create(tk->measurer, tk->wrapper, viewport);
    return res ? *res : nullptr;
}

const char* kTenLines = "1\n2\n3\n4\n5\n6\n7\n8\n9\n10";

} // namespace

suite scroll_creation_tests = [] {
    "viewport defaults to the profile line count"_test = [] {
        auto view = makeView(std::nullopt);
        expect((view != nullptr) >> fatal);
        expect(view->getViewportSize() == 5_u);
    };

    "zero viewport is an error"_test = [] {
        auto tk = createG1Toolkit();
        expect(tk.has_value() >> fatal);
        expect(!ScrollView::create(tk->measurer, tk->wrapper, 0).has_value());
        expect(!ScrollView::create(nullptr, tk->wrapper).has_value());
    };
};

suite scroll_navigation_tests = [] {
    "content is wrapped without a line limit"_test = [] {
        auto view = makeView();
        expect((view != nullptr) >> fatal);
        view->setContent(kTenLines);
        expect(view->getTotalLines() == 10_u);
        expect(view->isScrollable());
        expect(view->isAtTop());
        expect(!view->isAtBottom());

        auto viewport = view->getViewport();
        expect(viewport.lines == std::vector<std::string>{"1", "2", "3"});
        expect(viewport.position.maxOffset == 7_u);
        expect(viewport.position.scrollPercent == 0_i);
        expect(!viewport.contentTruncated);
    };

    "scroll by lines and pages"_test = [] {
        auto view = makeView();
        expect((view != nullptr) >> fatal);
        view->setContent(kTenLines);

        view->scrollDown(2);
        expect(view->getViewport().lines == std::vector<std::string>{"3", "4", "5"});
        view->scrollUp();
        expect(view->getPosition().offset == 1_u);
        view->pageDown();
        expect(view->getPosition().offset == 4_u);
        view->pageDown();
        view->pageDown();
        expect(view->getPosition().offset == 7_u);
        expect(view->isAtBottom());
        view->pageUp();
        expect(view->getPosition().offset == 4_u);
        view->scrollUp(100);
        expect(view->isAtTop());
    };

    "scrollTo clamps"_test = [] {
        auto view = makeView();
        expect((view != nullptr) >> fatal);
        view->setContent(kTenLines);
        view->scrollTo(100);
        expect(view->getPosition().offset == 7_u);
        expect(view->getPosition().scrollPercent == 100_i);
        view->scrollTo(-5);
        expect(view->getPosition().offset == 0_u);
        view->scrollToBottom();
        expect(view->getViewport().lines == std::vector<std::string>{"8", "9", "10"});
        view->scrollToTop();
        expect(view->isAtTop());
    };

    "scroll to percent"_test = [] {
        auto view = makeView();
        expect((view != nullptr) >> fatal);
        view->setContent(kTenLines);
        view->scrollToPercent(50);
        expect(view->getPosition().offset == 4_u);  // round(3.5)
        view->scrollToPercent(250);
        expect(view->isAtBottom());
        view->scrollToPercent(-10);
        expect(view->isAtTop());
    };

    "scroll to line with an anchor"_test = [] {
        auto view = makeView();
        expect((view != nullptr) >> fatal);
        view->setContent(kTenLines);
        view->scrollToLine(5);
        expect(view->getPosition().offset == 5_u);
        view->scrollToLine(5, ScrollAnchor::Center);
        expect(view->getPosition().offset == 4_u);
        view->scrollToLine(5, ScrollAnchor::Bottom);
        expect(view->getPosition().offset == 3_u);
        view->scrollToLine(9);
        expect(view->getPosition().offset == 7_u);
        view->scrollToLine(0, ScrollAnchor::Bottom);
        expect(view->getPosition().offset == 0_u);
    };

    "short content is padded"_test = [] {
        auto view = makeView();
        expect((view != nullptr) >> fatal);
        view->setContent("only");
        auto viewport = view->getViewport();
        expect(viewport.lines == std::vector<std::string>{"only", "", ""});
        expect(viewport.position.scrollPercent == 100_i);
        expect(view->isAtTop() && view->isAtBottom());
        expect(!view->isScrollable());
        view->scrollDown(3);
        expect(view->getPosition().offset == 0_u);
    };
};

suite scroll_append_tests = [] {
    "a view at the bottom follows new content"_test = [] {
        auto view = makeView();
        expect((view != nullptr) >> fatal);
        view->setContent(kTenLines);
        view->scrollToBottom();

        view->appendContent("11\n12");
        expect(view->getTotalLines() == 12_u);
        expect(view->isAtBottom());
        expect(view->getViewport().lines == std::vector<std::string>{"10", "11", "12"});

        view->scrollUp();
        expect(!view->isAtBottom());
        expect(view->getPosition().offset == 8_u);
    };

    "a view scrolled up stays put"_test = [] {
        auto view = makeView();
        expect((view != nullptr) >> fatal);
        view->setContent(kTenLines);
        view->scrollTo(2);
        view->appendContent("11");
        expect(view->getPosition().offset == 2_u);
        expect(view->getTotalLines() == 11_u);
    };

    "auto scroll can be turned off"_test = [] {
        auto view = makeView();
        expect((view != nullptr) >> fatal);
        view->setContent(kTenLines);
        view->scrollToBottom();
        view->appendContent("11", {}, false);
        expect(view->getPosition().offset == 7_u);
        expect(!view->isAtBottom());
    };

    "setContent resets to the top"_test = [] {
        auto view = makeView();
        expect((view != nullptr) >> fatal);
        view->setContent(kTenLines);
        view->scrollToBottom();
        view->setContent("a\nb\nc\nd");
        expect(view->isAtTop());
        expect(view->getTotalLines() == 4_u);
    };

    "clear"_test = [] {
        auto view = makeView();
        expect((view != nullptr) >> fatal);
        view->setContent(kTenLines);
        view->scrollDown(4);
        view->clear();
        expect(view->getTotalLines() == 0_u);
        expect(view->getAllLines().empty());
        expect(view->getViewport().lines == std::vector<std::string>{"", "", ""});
        expect(view->isAtTop());
    };
};
