#include "preview_area_view.hpp"

#include <app/ui/widgets/common_widgets.hpp>

#include <utility>

using namespace vitrine;

namespace app::ui {

PreviewAreaView::PreviewAreaView(SharedContext &context)
    : m_context(context) {}

void PreviewAreaView::Display() {
    auto &registry = m_context.registry;
    const auto *preview = registry.Current();
    if (preview == nullptr) {
        ImGui::TextDisabled("No preview selected");
        return;
    }

    DisplayHeader(*preview);
    ImGui::Separator();

    if (ImGui::BeginChild("##preview_contents")) {
        ImGui::PushID(static_cast<int>(*registry.SelectedIndex()));
        preview->View().Draw([&](Message message) { m_context.EnqueueMessage(std::move(message)); });
        ImGui::PopID();
    }
    ImGui::EndChild();
}

void PreviewAreaView::DisplayHeader(const preview::Preview &preview) {
    const auto &metadata = preview.GetMetadata();

    ImGui::AlignTextToFramePadding();
    ImGui::TextUnformatted(metadata.label.c_str());
    if (const auto *performance = preview.GetPerformance();
        performance != nullptr && m_context.settings.performance.showIndicatorBadges) {
        ImGui::SameLine();
        widgets::IndicatorBadge(m_context, performance->OverallIndicator());
    }
    if (const auto timeline = preview.GetTimeline(); timeline && !timeline->IsLive()) {
        ImGui::SameLine();
        ImGui::TextColored(m_context.colors.notice, "Viewing message %u of %u", timeline->position, timeline->count);
    }
}

} // namespace app::ui
