#include "about_view.hpp"

using namespace vitrine;

namespace app::ui {

AboutView::AboutView(SharedContext &context)
    : m_context(context) {}

void AboutView::Display(const preview::Preview &preview) {
    const auto &metadata = preview.GetMetadata();

    ImGui::SeparatorText(metadata.label.c_str());

    ImGui::PushTextWrapPos(0.0f);
    if (metadata.description) {
        ImGui::TextUnformatted(metadata.description->c_str());
    } else {
        ImGui::TextDisabled("No description");
    }
    ImGui::PopTextWrapPos();

    ImGui::Spacing();

    if (ImGui::BeginTable("##about", 2, ImGuiTableFlags_SizingFixedFit)) {
        ImGui::TableNextRow();
        ImGui::TableNextColumn();
        ImGui::TextUnformatted("Group");
        ImGui::TableNextColumn();
        if (metadata.group) {
            ImGui::TextUnformatted(metadata.group->c_str());
        } else {
            ImGui::TextDisabled("-");
        }

        ImGui::TableNextRow();
        ImGui::TableNextColumn();
        ImGui::TextUnformatted("Tags");
        ImGui::TableNextColumn();
        if (metadata.tags.empty()) {
            ImGui::TextDisabled("-");
        }
        for (usize i = 0; i < metadata.tags.size(); ++i) {
            if (i > 0) {
                ImGui::SameLine();
            }
            ImGui::TextColored(m_context.colors.notice, "#%s", metadata.tags[i].c_str());
        }

        ImGui::TableNextRow();
        ImGui::TableNextColumn();
        ImGui::TextUnformatted("Time travel");
        ImGui::TableNextColumn();
        ImGui::TextUnformatted(preview.GetTimeline() ? "Yes" : "No");

        ImGui::TableNextRow();
        ImGui::TableNextColumn();
        ImGui::TextUnformatted("Parameters");
        ImGui::TableNextColumn();
        ImGui::Text("%zu", preview.Params().size());

        ImGui::EndTable();
    }
}

} // namespace app::ui
