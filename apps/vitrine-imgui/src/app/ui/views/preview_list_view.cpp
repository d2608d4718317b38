#include "preview_list_view.hpp"

#include <app/ui/widgets/common_widgets.hpp>

#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace vitrine;

namespace app::ui {

PreviewListView::PreviewListView(SharedContext &context)
    : m_context(context) {}

void PreviewListView::Display() {
    auto &registry = m_context.registry;

    ImGui::AlignTextToFramePadding();
    ImGui::TextUnformatted("Previews");
    ImGui::SameLine();
    widgets::CountBadge(m_context, registry.Size());

    if (m_context.focusSearch) {
        ImGui::SetKeyboardFocusHere();
        m_context.focusSearch = false;
    }
    ImGui::SetNextItemWidth(-FLT_MIN);
    ImGui::InputTextWithHint("##search", "Search (press /)", m_search.data(), m_search.size());

    ImGui::Separator();

    const std::vector<usize> matches = registry.Filter(m_search.data());
    if (matches.empty()) {
        ImGui::TextDisabled(registry.IsEmpty() ? "No previews registered" : "No previews match the search");
        return;
    }

    // Ungrouped previews come first, then groups in order of first appearance
    std::vector<usize> ungrouped;
    std::vector<std::pair<std::string_view, std::vector<usize>>> groups;
    for (usize index : matches) {
        const auto &group = registry.At(index).GetMetadata().group;
        if (!group) {
            ungrouped.push_back(index);
            continue;
        }
        auto it = std::find_if(groups.begin(), groups.end(), [&](const auto &entry) { return entry.first == *group; });
        if (it == groups.end()) {
            groups.emplace_back(*group, std::vector<usize>{});
            it = std::prev(groups.end());
        }
        it->second.push_back(index);
    }

    if (ImGui::BeginChild("##preview_list")) {
        for (usize index : ungrouped) {
            DisplayEntry(index);
        }
        for (const auto &[name, indices] : groups) {
            ImGui::SeparatorText(std::string{name}.c_str());
            for (usize index : indices) {
                DisplayEntry(index);
            }
        }
    }
    ImGui::EndChild();
}

void PreviewListView::DisplayEntry(usize index) {
    auto &registry = m_context.registry;
    const auto &preview = registry.At(index);
    const auto &metadata = preview.GetMetadata();
    const bool selected = registry.SelectedIndex() == index;

    ImGui::PushID(static_cast<int>(index));
    if (ImGui::Selectable(metadata.label.c_str(), selected) && !selected) {
        m_context.EnqueueMessage(msg::SelectPreview{index});
    }
    if (metadata.description && ImGui::BeginItemTooltip()) {
        ImGui::PushTextWrapPos(350.0f * m_context.displayScale);
        ImGui::TextUnformatted(metadata.description->c_str());
        ImGui::PopTextWrapPos();
        ImGui::EndTooltip();
    }
    if (m_context.settings.performance.showIndicatorBadges) {
        if (const auto *performance = preview.GetPerformance()) {
            widgets::IndicatorDot(m_context, performance->OverallIndicator());
        }
    }
    ImGui::PopID();
}

} // namespace app::ui
