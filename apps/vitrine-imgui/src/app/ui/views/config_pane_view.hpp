#pragma once

#include <app/shared_context.hpp>

#include "config/about_view.hpp"
#include "config/messages_view.hpp"
#include "config/parameters_view.hpp"
#include "config/performance_view.hpp"

namespace app::ui {

/// @brief Tabbed pane with details and controls of the selected preview.
class ConfigPaneView {
public:
    ConfigPaneView(SharedContext &context);

    void Display();

private:
    SharedContext &m_context;

    // Set until the tab stored in the settings has been opened
    bool m_restoreTab = true;

    AboutView m_aboutView;
    MessagesView m_messagesView;
    ParametersView m_parametersView;
    PerformanceView m_performanceView;

    bool BeginTab(const char *label, Settings::GUI::ConfigTab tab);
};

} // namespace app::ui
