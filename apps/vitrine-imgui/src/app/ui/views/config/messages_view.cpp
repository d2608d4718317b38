#include "messages_view.hpp"

#include <app/ui/widgets/common_widgets.hpp>

using namespace vitrine;

namespace app::ui {

MessagesView::MessagesView(SharedContext &context)
    : m_context(context) {}

void MessagesView::Display(const preview::Preview &preview) {
    if (const auto timeline = preview.GetTimeline()) {
        DisplayTimeline(*timeline);
    } else {
        if (ImGui::Button("Reset")) {
            m_context.EnqueueMessage(msg::ResetPreview{});
        }
        widgets::ExplanationTooltip("This preview has no state to rewind.\n"
                                    "Resetting clears its message log and performance samples.",
                                    m_context.displayScale);
    }

    ImGui::Separator();
    DisplayTraces(preview);
}

void MessagesView::DisplayTimeline(const preview::Timeline &timeline) {
    int position = static_cast<int>(timeline.position);
    ImGui::SetNextItemWidth(ImGui::GetContentRegionAvail().x * 0.5f);
    if (ImGui::SliderInt("##timeline", &position, 0, static_cast<int>(timeline.count), "Message %d",
                         ImGuiSliderFlags_AlwaysClamp)) {
        m_context.EnqueueMessage(msg::TimeTravel{static_cast<uint32>(position)});
    }

    ImGui::SameLine();
    ImGui::BeginDisabled(timeline.IsLive());
    if (ImGui::Button("Jump to present")) {
        m_context.EnqueueMessage(msg::JumpToPresent{});
    }
    ImGui::EndDisabled();

    ImGui::SameLine();
    if (ImGui::Button("Reset")) {
        m_context.EnqueueMessage(msg::ResetPreview{});
    }

    if (!timeline.IsLive()) {
        ImGui::TextColored(m_context.colors.notice,
                           "Viewing a past state. Interactions are ignored until you jump to the present.");
    }
}

void MessagesView::DisplayTraces(const preview::Preview &preview) {
    const auto traces = preview.VisibleMessages();
    ImGui::Text("%zu of %zu messages", traces.size(), preview.MessageCount());

    if (traces.empty()) {
        return;
    }

    if (ImGui::BeginTable("##messages", 2,
                          ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersInnerV | ImGuiTableFlags_ScrollY)) {
        ImGui::TableSetupScrollFreeze(0, 1);
        ImGui::TableSetupColumn("#", ImGuiTableColumnFlags_WidthFixed);
        ImGui::TableSetupColumn("Message", ImGuiTableColumnFlags_WidthStretch);
        ImGui::TableHeadersRow();

        ImGuiListClipper clipper;
        clipper.Begin(static_cast<int>(traces.size()));
        while (clipper.Step()) {
            for (int row = clipper.DisplayStart; row < clipper.DisplayEnd; ++row) {
                ImGui::TableNextRow();
                ImGui::TableNextColumn();
                ImGui::TextDisabled("%d", row + 1);
                ImGui::TableNextColumn();
                ImGui::TextUnformatted(traces[row].c_str());
            }
        }

        ImGui::EndTable();
    }
}

} // namespace app::ui
