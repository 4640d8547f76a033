#include <hudtext/config.h>
#include <hudtext/profiles.h>
#include <hudtext/utf8.h>
#include <ytrace/ytrace.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace hudtext {

namespace {

// "wrap.break-mode" -> {"wrap", "break-mode"}. '/' is accepted as well.
std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::string part;
    for (char c : path) {
        if (c == '.' || c == '/') {
            if (!part.empty()) parts.push_back(std::move(part));
            part.clear();
        } else {
            part += c;
        }
    }
    if (!part.empty()) parts.push_back(std::move(part));
    return parts;
}

// Const lookups never insert into the tree
YAML::Node findNode(const YAML::Node& node, const std::vector<std::string>& parts, size_t idx) {
    if (idx == parts.size()) return node;
    if (!node.IsMap()) return YAML::Node();
    const YAML::Node child = node[parts[idx]];
    if (!child) return YAML::Node();
    return findNode(child, parts, idx + 1);
}

void setPath(YAML::Node node, const std::vector<std::string>& parts, size_t idx,
             const YAML::Node& value) {
    const std::string& key = parts[idx];
    if (idx + 1 == parts.size()) {
        node[key] = value;
        return;
    }
    if (!node[key] || !node[key].IsMap()) {
        node[key] = YAML::Node(YAML::NodeType::Map);
    }
    setPath(node[key], parts, idx + 1, value);
}

template<typename T>
Result<std::optional<T>> nonNegative(const Config& config, const char* key) {
    if (!config.has(key)) return Ok(std::optional<T>());
    auto value = config.get<long long>(key);
    if (!value || *value < 0) {
        return Err<std::optional<T>>(std::string("Config: ") + key + " must be a non-negative integer");
    }
    if (static_cast<unsigned long long>(*value) >
        static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
        return Err<std::optional<T>>(std::string("Config: ") + key + " is out of range");
    }
    return Ok(std::optional<T>(static_cast<T>(*value)));
}

} // namespace

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<void> Config::init() noexcept {
    _config = YAML::Node(YAML::NodeType::Map);
    loadDefaults();

    if (!_configPath.empty()) {
        if (auto res = loadFile(_configPath); !res) {
            yerror("Failed to load config file {}: {}", _configPath, error_msg(res));
            return res;
        }
        yinfo("Loaded config from: {}", _configPath);
    } else {
        auto xdgPath = getXDGConfigPath();
        std::error_code ec;
        if (std::filesystem::exists(xdgPath, ec)) {
            if (auto res = loadFile(xdgPath.string()); !res) {
                ywarn("Failed to load config file {}: {}", xdgPath.string(), error_msg(res));
            } else {
                yinfo("Loaded config from: {}", xdgPath.string());
            }
        }
    }

    applyEnvOverrides();

    if (_cmdOverrides && _cmdOverrides.IsMap()) {
        mergeNodes(_config, _cmdOverrides);
    }
    return Ok();
}

void Config::loadDefaults() {
    set(KEY_PROFILE, profiles::g1()->id);
    set(KEY_WRAP_BREAK_MODE, breakModeName(BreakMode::CharacterNoHyphen));
    set(KEY_WRAP_HYPHEN_CHAR, "-");
    set(KEY_WRAP_MIN_CHARS_BEFORE_HYPHEN, "3");
    set(KEY_WRAP_TRIM_LINES, "true");
    set(KEY_WRAP_PRESERVE_NEWLINES, "true");
    set(KEY_WRAP_KINSOKU, "false");
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err<void>("Cannot open config file: " + path);
        }
        YAML::Node fileConfig = YAML::Load(file);
        if (fileConfig && fileConfig.IsMap()) {
            mergeNodes(_config, fileConfig);
        } else if (fileConfig && !fileConfig.IsNull()) {
            return Err<void>("Config file is not a mapping: " + path);
        }
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

void Config::applyEnvOverrides() {
    for (const auto& key : knownKeys()) {
        const std::string envVar = pathToEnvVar(key);
        const char* val = std::getenv(envVar.c_str());
        if (val) {
            set(key, val);
            ydebug("Config override from env: {}={}", envVar, val);
        }
    }
}

void Config::mergeNodes(YAML::Node& target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        if (value.IsMap() && target[key] && target[key].IsMap()) {
            YAML::Node child = target[key];
            mergeNodes(child, value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

YAML::Node Config::getNode(const std::string& path) const {
    return findNode(_config, splitPath(path), 0);
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

void Config::set(const std::string& path, const std::string& value) {
    auto parts = splitPath(path);
    if (parts.empty()) return;
    setPath(_config, parts, 0, YAML::Node(value));
}

const std::vector<std::string>& Config::knownKeys() {
    static const std::vector<std::string> keys = {
        KEY_PROFILE,
        KEY_WRAP_BREAK_MODE,
        KEY_WRAP_HYPHEN_CHAR,
        KEY_WRAP_MIN_CHARS_BEFORE_HYPHEN,
        KEY_WRAP_TRIM_LINES,
        KEY_WRAP_PRESERVE_NEWLINES,
        KEY_WRAP_KINSOKU,
        KEY_WRAP_MAX_WIDTH_PX,
        KEY_WRAP_MAX_LINES,
        KEY_WRAP_MAX_BYTES,
        KEY_COLUMNS_LEFT_WIDTH_PX,
        KEY_COLUMNS_RIGHT_START_PX,
        KEY_COLUMNS_RIGHT_WIDTH_PX,
        KEY_COLUMNS_MAX_LINES,
        KEY_COLUMNS_LEFT_MARGIN_SPACES,
        KEY_SCROLL_VIEWPORT_LINES,
    };
    return keys;
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '/' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }
    return configDir / "hudtext" / "config.yaml";
}

//-----------------------------------------------------------------------------
// Typed views
//-----------------------------------------------------------------------------

std::string Config::profileId() const {
    return get<std::string>(KEY_PROFILE, profiles::g1()->id);
}

std::optional<size_t> Config::viewportLines() const {
    auto lines = get<long long>(KEY_SCROLL_VIEWPORT_LINES);
    if (!lines || *lines <= 0) return std::nullopt;
    return static_cast<size_t>(*lines);
}

Result<WrapOptions> Config::wrapOptions() const {
    WrapOptions options;

    if (auto mode = get<std::string>(KEY_WRAP_BREAK_MODE)) {
        auto parsed = parseBreakMode(*mode);
        if (!parsed) {
            return Err<WrapOptions>(std::string("Config: invalid ") + KEY_WRAP_BREAK_MODE, parsed);
        }
        options.breakMode = *parsed;
    }

    if (auto hyphen = get<std::string>(KEY_WRAP_HYPHEN_CHAR)) {
        const std::u32string cps = utf8::toCodepoints(*hyphen);
        if (cps.size() != 1) {
            return Err<WrapOptions>(std::string("Config: ") + KEY_WRAP_HYPHEN_CHAR +
                                    " must be a single character");
        }
        options.hyphenChar = cps.front();
    }

    for (auto [key, field] : {std::pair{KEY_WRAP_TRIM_LINES, &WrapOptions::trimLines},
                              std::pair{KEY_WRAP_PRESERVE_NEWLINES, &WrapOptions::preserveNewlines},
                              std::pair{KEY_WRAP_KINSOKU, &WrapOptions::applyKinsoku}}) {
        if (!has(key)) continue;
        auto value = get<bool>(key);
        if (!value) {
            return Err<WrapOptions>(std::string("Config: ") + key + " must be true or false");
        }
        options.*field = *value;
    }

    auto minChars = nonNegative<size_t>(*this, KEY_WRAP_MIN_CHARS_BEFORE_HYPHEN);
    if (!minChars) return Err<WrapOptions>("Config: invalid wrap options", minChars);
    options.minCharsBeforeHyphen = *minChars;

    auto width = nonNegative<int>(*this, KEY_WRAP_MAX_WIDTH_PX);
    if (!width) return Err<WrapOptions>("Config: invalid wrap options", width);
    if (*width && **width == 0) {
        return Err<WrapOptions>(std::string("Config: ") + KEY_WRAP_MAX_WIDTH_PX + " must be positive");
    }
    options.maxWidthPx = *width;

    auto lines = nonNegative<size_t>(*this, KEY_WRAP_MAX_LINES);
    if (!lines) return Err<WrapOptions>("Config: invalid wrap options", lines);
    options.maxLines = *lines;

    auto bytes = nonNegative<size_t>(*this, KEY_WRAP_MAX_BYTES);
    if (!bytes) return Err<WrapOptions>("Config: invalid wrap options", bytes);
    options.maxBytes = *bytes;

    return Ok(options);
}

Result<ColumnOverrides> Config::columnOverrides() const {
    ColumnOverrides overrides;

    auto leftWidth = nonNegative<int>(*this, KEY_COLUMNS_LEFT_WIDTH_PX);
    if (!leftWidth) return Err<ColumnOverrides>("Config: invalid columns", leftWidth);
    overrides.leftColumnWidthPx = *leftWidth;

    auto rightStart = nonNegative<int>(*this, KEY_COLUMNS_RIGHT_START_PX);
    if (!rightStart) return Err<ColumnOverrides>("Config: invalid columns", rightStart);
    overrides.rightColumnStartPx = *rightStart;

    auto rightWidth = nonNegative<int>(*this, KEY_COLUMNS_RIGHT_WIDTH_PX);
    if (!rightWidth) return Err<ColumnOverrides>("Config: invalid columns", rightWidth);
    overrides.rightColumnWidthPx = *rightWidth;

    auto maxLines = nonNegative<size_t>(*this, KEY_COLUMNS_MAX_LINES);
    if (!maxLines) return Err<ColumnOverrides>("Config: invalid columns", maxLines);
    overrides.maxLines = *maxLines;

    auto margin = nonNegative<size_t>(*this, KEY_COLUMNS_LEFT_MARGIN_SPACES);
    if (!margin) return Err<ColumnOverrides>("Config: invalid columns", margin);
    overrides.leftMarginSpaces = *margin;

    return Ok(overrides);
}

} // namespace hudtext
