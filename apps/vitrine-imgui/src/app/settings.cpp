#include "settings.hpp"

#include <fmt/format.h>
#include <fmt/std.h>

#include <algorithm>
#include <cerrno>
#include <concepts>
#include <fstream>

using namespace std::literals;

namespace app {

template <typename T>
concept arithmetic_type = std::integral<T> || std::floating_point<T>;

// Increment this version when making breaking changes to the settings file structure.
//
// Change history:
// v1:
// - Initial format
inline constexpr int kConfigVersion = 1;

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // settings

    struct settings {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Settings";
    };

} // namespace grp

// -------------------------------------------------------------------------------------------------
// Enum parsers

static void Parse(toml::node_view<toml::node> &node, Settings::GUI::ConfigTab &value) {
    value = Settings::GUI::ConfigTab::About;
    if (auto opt = node.value<std::string>()) {
        if (*opt == "About"s) {
            value = Settings::GUI::ConfigTab::About;
        } else if (*opt == "Messages"s) {
            value = Settings::GUI::ConfigTab::Messages;
        } else if (*opt == "Parameters"s) {
            value = Settings::GUI::ConfigTab::Parameters;
        } else if (*opt == "Performance"s) {
            value = Settings::GUI::ConfigTab::Performance;
        }
    }
}

static void Parse(toml::node_view<toml::node> &node, Settings::GUI::Theme &value) {
    value = Settings::GUI::Theme::Dark;
    if (auto opt = node.value<std::string>()) {
        if (*opt == "Dark"s) {
            value = Settings::GUI::Theme::Dark;
        } else if (*opt == "Light"s) {
            value = Settings::GUI::Theme::Light;
        }
    }
}

static void ParseLevel(toml::node_view<toml::node> &node, devlog::Level &value) {
    if (auto opt = node.value<std::string>()) {
        if (auto level = devlog::ParseLevel(*opt)) {
            value = *level;
        }
    }
}

// -------------------------------------------------------------------------------------------------
// Enum-to-string converters

static const char *ToTOML(const Settings::GUI::ConfigTab value) {
    switch (value) {
    default: [[fallthrough]];
    case Settings::GUI::ConfigTab::About: return "About";
    case Settings::GUI::ConfigTab::Messages: return "Messages";
    case Settings::GUI::ConfigTab::Parameters: return "Parameters";
    case Settings::GUI::ConfigTab::Performance: return "Performance";
    }
}

static const char *ToTOML(const Settings::GUI::Theme value) {
    switch (value) {
    default: [[fallthrough]];
    case Settings::GUI::Theme::Dark: return "Dark";
    case Settings::GUI::Theme::Light: return "Light";
    }
}

// -------------------------------------------------------------------------------------------------
// Parsers

template <typename T>
static void Parse(toml::node_view<toml::node> &node, T &value) {
    if (auto opt = node.value<T>()) {
        value = *opt;
    }
}

template <typename T>
static void Parse(toml::node_view<toml::node> &node, const char *name, T &value) {
    toml::node_view view{node[name]};
    Parse(view, value);
}

template <arithmetic_type T>
static void Parse(toml::node_view<toml::node> &node, const char *name, T &value, T defaultValue, T minValue,
                  T maxValue) {
    toml::node_view view{node[name]};
    value = defaultValue;
    Parse(view, value);
    value = std::clamp<T>(value, minValue, maxValue);
}

// -------------------------------------------------------------------------------------------------
// Results

std::string SettingsLoadResult::string() const {
    switch (type) {
    case Type::Success: return "Success";
    case Type::TOMLParseError: {
        const auto &error = std::get<toml::parse_error>(value);
        return fmt::format("TOML parse error at line {}, column {}: {}", error.source().begin.line,
                           error.source().begin.column, error.description());
    }
    case Type::UnsupportedConfigVersion:
        return fmt::format("Unsupported configuration version {}; expected {} or lower", std::get<int>(value),
                           kConfigVersion);
    }
    return "Unknown error";
}

std::string SettingsSaveResult::string() const {
    switch (type) {
    case Type::Success: return "Success";
    case Type::FilesystemError: return fmt::format("Filesystem error: {}", error.message());
    }
    return "Unknown error";
}

// -------------------------------------------------------------------------------------------------
// Settings

Settings::Settings() {
    ResetToDefaults();
}

void Settings::ResetToDefaults() {
    window.width = 1280;
    window.height = 800;

    gui.sidebarWidth = 260.0f;
    gui.configPaneHeight = 280.0f;
    gui.configTab = GUI::ConfigTab::About;
    gui.theme = GUI::Theme::Dark;
    gui.devLogLevel = devlog::level::info;

    performance.showIndicatorBadges = true;
}

SettingsLoadResult Settings::Load(const std::filesystem::path &path) {
    // Use defaults if configuration file does not exist
    if (!std::filesystem::is_regular_file(path)) {
        ResetToDefaults();
        this->path = path;
        return SettingsLoadResult::Success();
    }

    auto parseResult = toml::parse_file(path.string());
    if (parseResult.failed()) {
        return SettingsLoadResult::TOMLParseError(parseResult.error());
    }
    auto &data = parseResult.table();

    ResetToDefaults();

    int configVersion = 0;
    if (auto opt = data["ConfigVersion"].value<int>()) {
        configVersion = *opt;
    }
    if (configVersion > kConfigVersion) {
        return SettingsLoadResult::UnsupportedConfigVersion(configVersion);
    }

    if (auto tblWindow = data["Window"]) {
        Parse(tblWindow, "Width", window.width, 1280u, 640u, 16384u);
        Parse(tblWindow, "Height", window.height, 800u, 480u, 16384u);
    }

    if (auto tblGUI = data["GUI"]) {
        Parse(tblGUI, "SidebarWidth", gui.sidebarWidth, 260.0f, 160.0f, 800.0f);
        Parse(tblGUI, "ConfigPaneHeight", gui.configPaneHeight, 280.0f, 120.0f, 1200.0f);
        Parse(tblGUI, "ConfigTab", gui.configTab);
        Parse(tblGUI, "Theme", gui.theme);
        toml::node_view levelView{tblGUI["DevLogLevel"]};
        ParseLevel(levelView, gui.devLogLevel);
    }

    if (auto tblPerformance = data["Performance"]) {
        Parse(tblPerformance, "ShowIndicatorBadges", performance.showIndicatorBadges);
    }

    this->path = path;
    m_dirty = false;
    devlog::debug<grp::settings>("Loaded settings from {}", path);
    return SettingsLoadResult::Success();
}

SettingsSaveResult Settings::Save() {
    if (path.empty()) {
        path = kSettingsFile;
    }

    // clang-format off
    auto tbl = toml::table{{
        {"ConfigVersion", kConfigVersion},

        {"Window", toml::table{{
            {"Width", window.width},
            {"Height", window.height},
        }}},

        {"GUI", toml::table{{
            {"SidebarWidth", gui.sidebarWidth},
            {"ConfigPaneHeight", gui.configPaneHeight},
            {"ConfigTab", ToTOML(gui.configTab)},
            {"Theme", ToTOML(gui.theme)},
            {"DevLogLevel", devlog::LevelName(gui.devLogLevel)},
        }}},

        {"Performance", toml::table{{
            {"ShowIndicatorBadges", performance.showIndicatorBadges},
        }}},
    }};
    // clang-format on

    std::ofstream out{path, std::ios::binary | std::ios::trunc};
    out << tbl;
    if (!out) {
        std::error_code error{errno, std::generic_category()};
        return SettingsSaveResult::FilesystemError(error);
    }

    m_dirty = false;
    devlog::debug<grp::settings>("Saved settings to {}", path);
    return SettingsSaveResult::Success();
}

void Settings::SaveIfDirty() {
    if (!m_dirty) {
        return;
    }
    if (auto result = Save(); !result) {
        devlog::warn<grp::settings>("Failed to save settings: {}", result.string());
    }
    m_dirty = false;
}

} // namespace app
