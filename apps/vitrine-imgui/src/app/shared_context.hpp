#pragma once

#include "settings.hpp"

#include <vitrine/registry/registry.hpp>

#include <vitrine/message/message.hpp>

#include <imgui.h>

#include <utility>
#include <vector>

namespace app {

/// @brief State shared between the application and its views.
struct SharedContext {
    explicit SharedContext(Settings &settings)
        : settings(settings) {}

    Settings &settings;
    vitrine::registry::Registry registry;

    float displayScale = 1.0f;

    /// @brief Set to move keyboard focus to the search box on the next frame.
    bool focusSearch = false;

    struct Colors {
        ImVec4 healthy{0.30f, 0.78f, 0.40f, 1.00f};
        ImVec4 degraded{0.95f, 0.70f, 0.20f, 1.00f};
        ImVec4 severe{0.92f, 0.30f, 0.28f, 1.00f};
        ImVec4 unknown{0.55f, 0.55f, 0.58f, 1.00f};
        ImVec4 notice{0.90f, 0.75f, 0.35f, 1.00f};
    } colors;

    /// @brief Queues a message for dispatch after the current frame.
    void EnqueueMessage(vitrine::Message message) {
        m_pendingMessages.push_back(std::move(message));
    }

    /// @brief Retrieves and clears every queued message.
    std::vector<vitrine::Message> TakeMessages() {
        return std::exchange(m_pendingMessages, {});
    }

private:
    std::vector<vitrine::Message> m_pendingMessages;
};

} // namespace app
