#pragma once

#include "settings.hpp"
#include "shared_context.hpp"

#include "ui/views/config_pane_view.hpp"
#include "ui/views/preview_area_view.hpp"
#include "ui/views/preview_list_view.hpp"

#include <filesystem>

namespace app {

class App {
public:
    App();

    /// @brief Runs the application until the window is closed.
    /// @param[in] settingsPath the settings file to load and save
    /// @return the process exit code
    int Run(const std::filesystem::path &settingsPath);

private:
    Settings m_settings;
    SharedContext m_context;

    ui::PreviewListView m_previewListView;
    ui::PreviewAreaView m_previewAreaView;
    ui::ConfigPaneView m_configPaneView;

    void LoadSettings(const std::filesystem::path &path);

    void ApplyTheme() const;
    void RescaleUI(float displayScale);

    void HandleShortcuts();

    void DrawMainWindow();
    void DrawMenuBar();

    /// @brief Dispatches the messages queued during the frame and queues the messages produced by their tasks.
    void ProcessMessages();
};

} // namespace app
