#pragma once

#include <hudtext/column-composer.h>
#include <hudtext/result.hpp>
#include <hudtext/text-wrapper.h>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hudtext {

//-----------------------------------------------------------------------------
// Config - layered settings for the command-line tools
//
// Built-in defaults < YAML file < HUDTEXT_* environment < command line.
// The library itself never reads configuration; Config turns settings into
// WrapOptions / ColumnOverrides patches.
//-----------------------------------------------------------------------------
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // An empty configPath means $XDG_CONFIG_HOME/hudtext/config.yaml, if present
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g. "wrap.break-mode").
    // nullopt if the key is missing or does not convert to T.
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    // Set a scalar by dotted path, creating intermediate maps
    void set(const std::string& path, const std::string& value);

    const YAML::Node& root() const { return _config; }

    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "HUDTEXT_";

    static constexpr const char* KEY_PROFILE = "profile";
    static constexpr const char* KEY_WRAP_BREAK_MODE = "wrap.break-mode";
    static constexpr const char* KEY_WRAP_HYPHEN_CHAR = "wrap.hyphen-char";
    static constexpr const char* KEY_WRAP_MIN_CHARS_BEFORE_HYPHEN = "wrap.min-chars-before-hyphen";
    static constexpr const char* KEY_WRAP_TRIM_LINES = "wrap.trim-lines";
    static constexpr const char* KEY_WRAP_PRESERVE_NEWLINES = "wrap.preserve-newlines";
    static constexpr const char* KEY_WRAP_KINSOKU = "wrap.kinsoku";
    static constexpr const char* KEY_WRAP_MAX_WIDTH_PX = "wrap.max-width-px";
    static constexpr const char* KEY_WRAP_MAX_LINES = "wrap.max-lines";
    static constexpr const char* KEY_WRAP_MAX_BYTES = "wrap.max-bytes";
    static constexpr const char* KEY_COLUMNS_LEFT_WIDTH_PX = "columns.left-width-px";
    static constexpr const char* KEY_COLUMNS_RIGHT_START_PX = "columns.right-start-px";
    static constexpr const char* KEY_COLUMNS_RIGHT_WIDTH_PX = "columns.right-width-px";
    static constexpr const char* KEY_COLUMNS_MAX_LINES = "columns.max-lines";
    static constexpr const char* KEY_COLUMNS_LEFT_MARGIN_SPACES = "columns.left-margin-spaces";
    static constexpr const char* KEY_SCROLL_VIEWPORT_LINES = "scroll.viewport-lines";

    // Every key that can be overridden from the environment
    static const std::vector<std::string>& knownKeys();

    // Convert dotted path to env var name ("wrap.break-mode" -> "HUDTEXT_WRAP_BREAK_MODE")
    static std::string pathToEnvVar(const std::string& path);

    std::string profileId() const;
    Result<WrapOptions> wrapOptions() const;
    Result<ColumnOverrides> columnOverrides() const;
    std::optional<size_t> viewportLines() const;

private:
    Config(std::string configPath, const YAML::Node& cmdOverrides) noexcept
        : _configPath(std::move(configPath)), _cmdOverrides(cmdOverrides) {}

    Result<void> init() noexcept;
    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides();

    YAML::Node getNode(const std::string& path) const;

    static void mergeNodes(YAML::Node& target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    YAML::Node _cmdOverrides;
};

// Template implementations
template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace hudtext
