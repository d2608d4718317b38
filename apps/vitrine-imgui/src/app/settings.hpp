#pragma once

#include <vitrine/util/dev_log.hpp>

#include <vitrine/core/types.hpp>

#include <toml++/toml.hpp>

#include <filesystem>
#include <string>
#include <system_error>
#include <variant>

namespace app {

inline constexpr const char *kSettingsFile = "vitrine.toml";

struct SettingsLoadResult {
    enum class Type { Success, TOMLParseError, UnsupportedConfigVersion };

    Type type = Type::Success;
    std::variant<std::monostate, toml::parse_error, int> value;

    static SettingsLoadResult Success() {
        return {};
    }

    static SettingsLoadResult TOMLParseError(const toml::parse_error &error) {
        return {Type::TOMLParseError, error};
    }

    static SettingsLoadResult UnsupportedConfigVersion(int version) {
        return {Type::UnsupportedConfigVersion, version};
    }

    explicit operator bool() const {
        return type == Type::Success;
    }

    std::string string() const;
};

struct SettingsSaveResult {
    enum class Type { Success, FilesystemError };

    Type type = Type::Success;
    std::error_code error;

    static SettingsSaveResult Success() {
        return {};
    }

    static SettingsSaveResult FilesystemError(std::error_code error) {
        return {Type::FilesystemError, error};
    }

    explicit operator bool() const {
        return type == Type::Success;
    }

    std::string string() const;
};

/// @brief Host application settings, persisted as TOML.
struct Settings {
    Settings();

    void ResetToDefaults();

    SettingsLoadResult Load(const std::filesystem::path &path);
    SettingsSaveResult Save();

    /// @brief Marks the settings as modified if `value` is true.
    /// @return `value`, so that it can wrap ImGui widget calls
    bool MakeDirty(bool value = true) {
        m_dirty |= value;
        return value;
    }

    [[nodiscard]] bool IsDirty() const {
        return m_dirty;
    }

    /// @brief Saves the settings if they were modified since the last save.
    void SaveIfDirty();

    std::filesystem::path path;

    struct Window {
        uint32 width;
        uint32 height;
    } window;

    struct GUI {
        enum class ConfigTab { About, Messages, Parameters, Performance };
        enum class Theme { Dark, Light };

        float sidebarWidth;
        float configPaneHeight;
        ConfigTab configTab;
        Theme theme;
        devlog::Level devLogLevel;
    } gui;

    struct Performance {
        bool showIndicatorBadges;
    } performance;

private:
    bool m_dirty = false;
};

} // namespace app
