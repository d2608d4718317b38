#include "app.hpp"

#include "demo/demo_previews.hpp"

#include <vitrine/message/message.hpp>

#include <vitrine/util/dev_log.hpp>

#include <SDL3/SDL.h>

#include <imgui_impl_sdl3.h>
#include <imgui_impl_sdlrenderer3.h>

#include <cmath>
#include <string_view>
#include <utility>

using namespace vitrine;

namespace app {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // base
    //   messages

    struct base {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "App";
    };

    struct messages : public base {
        static constexpr devlog::Level level = devlog::level::trace;
        static constexpr std::string_view name = "App-Messages";
    };

} // namespace grp

App::App()
    : m_context(m_settings)
    , m_previewListView(m_context)
    , m_previewAreaView(m_context)
    , m_configPaneView(m_context) {}

int App::Run(const std::filesystem::path &settingsPath) {
    LoadSettings(settingsPath);
    devlog::SetMinimumLevel(m_settings.gui.devLogLevel);

    demo::RegisterDemoPreviews(m_context.registry);
    devlog::info<grp::base>("Registered {} previews", m_context.registry.Size());

    // ---------------------------------
    // Initialize SDL subsystems

    if (!SDL_Init(SDL_INIT_VIDEO)) {
        devlog::error<grp::base>("Unable to initialize SDL: {}", SDL_GetError());
        return 1;
    }

    SDL_Window *window =
        SDL_CreateWindow("Vitrine", static_cast<int>(m_settings.window.width),
                         static_cast<int>(m_settings.window.height), SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY);
    if (window == nullptr) {
        devlog::error<grp::base>("Unable to create window: {}", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_Renderer *renderer = SDL_CreateRenderer(window, nullptr);
    if (renderer == nullptr) {
        devlog::error<grp::base>("Unable to create renderer: {}", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    if (!SDL_SetRenderVSync(renderer, 1)) {
        devlog::warn<grp::base>("Unable to enable vertical synchronization: {}", SDL_GetError());
    }

    // ---------------------------------
    // Initialize ImGui

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();

    ImGuiIO &io = ImGui::GetIO();
    io.IniFilename = nullptr;
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    RescaleUI(SDL_GetWindowDisplayScale(window));

    ImGui_ImplSDL3_InitForSDLRenderer(window, renderer);
    ImGui_ImplSDLRenderer3_Init(renderer);

    // ---------------------------------
    // Main loop

    bool running = true;
    while (running) {
        SDL_Event event{};
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            switch (event.type) {
            case SDL_EVENT_QUIT: running = false; break;
            case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                if (event.window.windowID == SDL_GetWindowID(window)) {
                    running = false;
                }
                break;
            case SDL_EVENT_WINDOW_RESIZED:
                m_settings.window.width = static_cast<uint32>(event.window.data1);
                m_settings.window.height = static_cast<uint32>(event.window.data2);
                m_settings.MakeDirty();
                break;
            case SDL_EVENT_WINDOW_DISPLAY_SCALE_CHANGED: RescaleUI(SDL_GetWindowDisplayScale(window)); break;
            default: break;
            }
        }

        if (SDL_GetWindowFlags(window) & SDL_WINDOW_MINIMIZED) {
            SDL_Delay(10);
            continue;
        }

        ImGui_ImplSDLRenderer3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        HandleShortcuts();
        DrawMainWindow();

        ImGui::Render();
        SDL_SetRenderScale(renderer, io.DisplayFramebufferScale.x, io.DisplayFramebufferScale.y);
        const ImVec4 clearColor = ImGui::GetStyle().Colors[ImGuiCol_WindowBg];
        SDL_SetRenderDrawColorFloat(renderer, clearColor.x, clearColor.y, clearColor.z, 1.0f);
        SDL_RenderClear(renderer);
        ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), renderer);
        SDL_RenderPresent(renderer);

        ProcessMessages();
    }

    // ---------------------------------
    // Cleanup

    ImGui_ImplSDLRenderer3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();

    m_settings.SaveIfDirty();

    return 0;
}

void App::LoadSettings(const std::filesystem::path &path) {
    if (auto result = m_settings.Load(path); !result) {
        devlog::warn<grp::base>("Failed to load settings from {}: {}", path.string(), result.string());
        devlog::warn<grp::base>("Using default settings");
        m_settings.ResetToDefaults();
        m_settings.path = path;
    }
}

void App::ApplyTheme() const {
    switch (m_settings.gui.theme) {
    case Settings::GUI::Theme::Dark: ImGui::StyleColorsDark(); break;
    case Settings::GUI::Theme::Light: ImGui::StyleColorsLight(); break;
    }
}

void App::RescaleUI(float displayScale) {
    if (displayScale <= 0.0f) {
        displayScale = 1.0f;
    }
    m_context.displayScale = displayScale;

    ImGuiStyle &style = ImGui::GetStyle();
    style = ImGuiStyle{};
    ApplyTheme();
    style.ScaleAllSizes(displayScale);
    style.FontScaleDpi = displayScale;

    devlog::debug<grp::base>("Display scale set to {:.2f}", displayScale);
}

void App::HandleShortcuts() {
    const ImGuiIO &io = ImGui::GetIO();
    if (!io.WantTextInput && ImGui::IsKeyPressed(ImGuiKey_Slash, false)) {
        m_context.focusSearch = true;
    }
    if (ImGui::IsKeyChordPressed(ImGuiMod_Ctrl | ImGuiKey_R)) {
        m_context.EnqueueMessage(msg::ResetPreview{});
    }
}

void App::DrawMainWindow() {
    const ImGuiViewport *viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                   ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus |
                                   ImGuiWindowFlags_MenuBar;

    ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 0.0f);
    const bool open = ImGui::Begin("##main", nullptr, flags);
    ImGui::PopStyleVar();
    if (!open) {
        ImGui::End();
        return;
    }

    DrawMenuBar();

    auto &gui = m_settings.gui;
    const float scale = m_context.displayScale;

    // Sidebar
    if (ImGui::BeginChild("##sidebar", ImVec2(gui.sidebarWidth * scale, 0.0f),
                          ImGuiChildFlags_Borders | ImGuiChildFlags_ResizeX)) {
        m_previewListView.Display();
    }
    ImGui::EndChild();
    if (const float width = ImGui::GetItemRectSize().x / scale; std::abs(width - gui.sidebarWidth) >= 1.0f) {
        gui.sidebarWidth = width;
        m_settings.MakeDirty();
    }

    ImGui::SameLine();

    // Preview area above the config pane
    ImGui::BeginGroup();
    const float availHeight = ImGui::GetContentRegionAvail().y;
    if (ImGui::BeginChild("##preview_area", ImVec2(0.0f, availHeight - gui.configPaneHeight * scale),
                          ImGuiChildFlags_Borders | ImGuiChildFlags_ResizeY)) {
        m_previewAreaView.Display();
    }
    ImGui::EndChild();
    if (const float height = (availHeight - ImGui::GetItemRectSize().y) / scale;
        std::abs(height - gui.configPaneHeight) >= 1.0f) {
        gui.configPaneHeight = height;
        m_settings.MakeDirty();
    }

    if (ImGui::BeginChild("##config_pane", ImVec2(0.0f, 0.0f), ImGuiChildFlags_Borders)) {
        m_configPaneView.Display();
    }
    ImGui::EndChild();
    ImGui::EndGroup();

    ImGui::End();
}

void App::DrawMenuBar() {
    if (!ImGui::BeginMenuBar()) {
        return;
    }

    if (ImGui::BeginMenu("Preview")) {
        const bool hasPreview = m_context.registry.Current() != nullptr;
        if (ImGui::MenuItem("Reset", "Ctrl+R", false, hasPreview)) {
            m_context.EnqueueMessage(msg::ResetPreview{});
        }
        if (ImGui::MenuItem("Reset parameters", nullptr, false, hasPreview)) {
            m_context.EnqueueMessage(msg::ResetParams{});
        }
        if (ImGui::MenuItem("Search", "/")) {
            m_context.focusSearch = true;
        }
        ImGui::EndMenu();
    }

    if (ImGui::BeginMenu("View")) {
        auto &gui = m_settings.gui;
        if (ImGui::MenuItem("Dark theme", nullptr, gui.theme == Settings::GUI::Theme::Dark)) {
            gui.theme = Settings::GUI::Theme::Dark;
            m_settings.MakeDirty();
            ApplyTheme();
        }
        if (ImGui::MenuItem("Light theme", nullptr, gui.theme == Settings::GUI::Theme::Light)) {
            gui.theme = Settings::GUI::Theme::Light;
            m_settings.MakeDirty();
            ApplyTheme();
        }
        ImGui::Separator();
        m_settings.MakeDirty(
            ImGui::MenuItem("Performance badges", nullptr, &m_settings.performance.showIndicatorBadges));
        ImGui::Separator();
        if (ImGui::BeginMenu("Log level")) {
            for (devlog::Level level = devlog::level::trace; level <= devlog::level::off; ++level) {
                if (ImGui::MenuItem(devlog::LevelName(level), nullptr, gui.devLogLevel == level)) {
                    gui.devLogLevel = level;
                    devlog::SetMinimumLevel(level);
                    m_settings.MakeDirty();
                }
            }
            ImGui::EndMenu();
        }
        ImGui::EndMenu();
    }

    ImGui::EndMenuBar();
}

void App::ProcessMessages() {
    for (const Message &message : m_context.TakeMessages()) {
        devlog::trace<grp::messages>("Dispatching {}", DescribeMessage(message));
        const Task<Message> task = m_context.registry.Update(message);
        for (Message &produced : task.Run()) {
            m_context.EnqueueMessage(std::move(produced));
        }
    }
}

} // namespace app
