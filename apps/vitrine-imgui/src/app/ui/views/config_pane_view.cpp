#include "config_pane_view.hpp"

using namespace vitrine;

namespace app::ui {

ConfigPaneView::ConfigPaneView(SharedContext &context)
    : m_context(context)
    , m_aboutView(context)
    , m_messagesView(context)
    , m_parametersView(context)
    , m_performanceView(context) {}

void ConfigPaneView::Display() {
    const auto *preview = m_context.registry.Current();
    if (preview == nullptr) {
        ImGui::TextDisabled("No preview selected");
        return;
    }

    using ConfigTab = Settings::GUI::ConfigTab;

    if (ImGui::BeginTabBar("##config_tabs")) {
        if (BeginTab("About", ConfigTab::About)) {
            m_aboutView.Display(*preview);
            ImGui::EndTabItem();
        }
        if (BeginTab("Messages", ConfigTab::Messages)) {
            m_messagesView.Display(*preview);
            ImGui::EndTabItem();
        }
        if (BeginTab("Parameters", ConfigTab::Parameters)) {
            m_parametersView.Display(*preview);
            ImGui::EndTabItem();
        }
        if (BeginTab("Performance", ConfigTab::Performance)) {
            m_performanceView.Display(*preview);
            ImGui::EndTabItem();
        }
        ImGui::EndTabBar();
    }
}

bool ConfigPaneView::BeginTab(const char *label, Settings::GUI::ConfigTab tab) {
    auto &settings = m_context.settings;
    const ImGuiTabItemFlags flags =
        m_restoreTab && settings.gui.configTab == tab ? ImGuiTabItemFlags_SetSelected : ImGuiTabItemFlags_None;
    if (!ImGui::BeginTabItem(label, nullptr, flags)) {
        return false;
    }
    if (m_restoreTab) {
        m_restoreTab = settings.gui.configTab != tab;
    } else if (settings.gui.configTab != tab) {
        settings.gui.configTab = tab;
        settings.MakeDirty();
    }
    return true;
}

} // namespace app::ui
