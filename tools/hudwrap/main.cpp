#include <hudtext/config.h>
#include <hudtext/profiles.h>
#include <hudtext/toolkit.h>
#include <hudtext/utf8.h>

#include <args.hxx>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>

#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using namespace hudtext;

// ──────────────────────────────────────────────────────────────────────────────
// Input
// ──────────────────────────────────────────────────────────────────────────────

static std::string readStdin() {
    std::string text{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

static std::string joinWords(const std::vector<std::string>& words) {
    std::string out;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) out += ' ';
        out += words[i];
    }
    return out;
}

// ──────────────────────────────────────────────────────────────────────────────
// Modes
// ──────────────────────────────────────────────────────────────────────────────

static void printWrap(const WrapResult& result, bool stats) {
    for (const auto& metrics : result.lineMetrics) {
        if (stats) {
            std::cout << "[" << metrics.widthPx << "px " << metrics.utilizationPercent << "% "
                      << metrics.bytes << "B] ";
        }
        std::cout << metrics.text << "\n";
    }
    if (stats) {
        std::cout << "# mode=" << breakModeName(result.breakMode)
                  << " lines=" << result.lines.size()
                  << " bytes=" << result.totalBytes
                  << " max=" << result.maxLineWidthPx << "px"
                  << " truncated=" << (result.truncated ? "yes" : "no") << "\n";
    }
}

static int runCompose(const DisplayToolkit& toolkit, const Config& config,
                      std::optional<BreakMode> breakMode,
                      const std::string& left, const std::string& right) {
    auto overrides = config.columnOverrides();
    if (!overrides) {
        std::cerr << "hudwrap: " << error_msg(overrides) << "\n";
        return 1;
    }
    ComposeOptions options;
    options.breakMode = breakMode;
    options.columns = *overrides;
    auto result = toolkit.composer->composeDoubleTextWall(left, right, options);
    std::cout << result.composedText << "\n";
    return 0;
}

static void printChunks(const std::vector<Chunk>& chunks) {
    for (const auto& chunk : chunks) {
        std::cout << "#" << chunk.index + 1 << "/" << chunk.totalChunks
                  << " (" << chunk.bytes << "B): " << chunk.text << "\n";
    }
}

static void printPages(const std::vector<Page>& pages) {
    for (const auto& page : pages) {
        std::cout << "--- page " << page.pageNumber << "/" << page.totalPages << " ---\n";
        for (const auto& line : page.lines) {
            std::cout << line << "\n";
        }
    }
}

// ──────────────────────────────────────────────────────────────────────────────
// Main
// ──────────────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    args::ArgumentParser parser("hudwrap", "Wrap, compose and chunk text for smart-glasses displays.");
    parser.Prog("hudwrap");

    args::Flag helpFlag(parser, "help", "Show this help", {'h', "help"});
    args::ValueFlag<std::string> modeFlag(parser, "mode",
        "wrap | compose | chunk | paginate | truncate | measure (default: wrap)", {'m', "mode"}, "wrap");
    args::ValueFlag<std::string> profileFlag(parser, "id",
        "Display profile (even-realities-g1, even-realities-g1-legacy, vuzix-z100, mentra-nex)",
        {'p', "profile"});
    args::ValueFlag<std::string> configFlag(parser, "file", "Config file (YAML)", {'c', "config"});
    args::ValueFlag<std::string> breakModeFlag(parser, "mode",
        "character | character-no-hyphen | word | strict-word", {'b', "break-mode"});
    args::ValueFlag<int> widthFlag(parser, "px", "Maximum line width in pixels", {'w', "width"});
    args::ValueFlag<int> linesFlag(parser, "n", "Maximum lines (page size for paginate)", {'l', "lines"});
    args::ValueFlag<std::string> rightFlag(parser, "text", "Right column text for compose", {'r', "right"});
    args::Flag kinsokuFlag(parser, "kinsoku", "Apply CJK line start/end rules", {'k', "kinsoku"});
    args::Flag statsFlag(parser, "stats", "Print per-line metrics", {'s', "stats"});
    args::Flag verboseFlag(parser, "verbose", "Debug logging", {'v', "verbose"});

    args::PositionalList<std::string> words(parser, "text", "Text to process (default: stdin)");

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Error& e) {
        std::cerr << e.what() << "\n";
        std::cerr << parser;
        return 1;
    }

    if (helpFlag) {
        std::cout << parser;
        return 0;
    }

    spdlog::set_level(verboseFlag ? spdlog::level::debug : spdlog::level::warn);
    spdlog::cfg::load_env_levels();

    YAML::Node overrides(YAML::NodeType::Map);
    if (profileFlag) overrides["profile"] = args::get(profileFlag);
    if (breakModeFlag) overrides["wrap"]["break-mode"] = args::get(breakModeFlag);
    if (widthFlag) overrides["wrap"]["max-width-px"] = args::get(widthFlag);
    if (linesFlag) overrides["wrap"]["max-lines"] = args::get(linesFlag);
    if (kinsokuFlag) overrides["wrap"]["kinsoku"] = true;

    auto configRes = Config::create(configFlag ? args::get(configFlag) : "", overrides);
    if (!configRes) {
        std::cerr << "hudwrap: " << error_msg(configRes) << "\n";
        return 1;
    }
    auto config = *configRes;

    auto profile = profiles::findProfile(config->profileId());
    if (!profile) {
        std::cerr << "hudwrap: " << error_msg(profile) << "\n";
        return 1;
    }

    auto wrapOptions = config->wrapOptions();
    if (!wrapOptions) {
        std::cerr << "hudwrap: " << error_msg(wrapOptions) << "\n";
        return 1;
    }

    auto toolkitRes = createDisplayToolkit(*profile, *wrapOptions);
    if (!toolkitRes) {
        std::cerr << "hudwrap: " << error_msg(toolkitRes) << "\n";
        return 1;
    }
    const DisplayToolkit& toolkit = *toolkitRes;

    const std::string text = words ? joinWords(args::get(words)) : readStdin();
    const std::string mode = args::get(modeFlag);
    ydebug("hudwrap: mode={} profile={} input={} bytes", mode, toolkit.profile->id, text.size());

    if (mode == "wrap") {
        printWrap(toolkit.wrapper->wrap(text), statsFlag);
    } else if (mode == "compose") {
        const std::string right = rightFlag ? args::get(rightFlag) : "";
        return runCompose(toolkit, *config, wrapOptions->breakMode, text, right);
    } else if (mode == "chunk") {
        printChunks(toolkit.helpers->splitIntoChunks(text));
    } else if (mode == "paginate") {
        WrapOptions pageOptions;
        pageOptions.maxLines = wrapOptions->maxLines;
        printPages(toolkit.helpers->paginate(text, pageOptions));
    } else if (mode == "truncate") {
        auto result = toolkit.helpers->truncateWithEllipsis(text, wrapOptions->maxWidthPx);
        std::cout << result.text << "\n";
        if (statsFlag) {
            std::cout << "# " << result.widthPx << "px truncated="
                      << (result.wasTruncated ? "yes" : "no") << "\n";
        }
    } else if (mode == "measure") {
        std::cout << toolkit.measurer->measureText(text) << "px "
                  << TextMeasurer::getByteSize(text) << "B "
                  << utf8::length(text) << " chars\n";
    } else {
        std::cerr << "hudwrap: unknown mode '" << mode << "'\n";
        std::cerr << parser;
        return 1;
    }
    return 0;
}
