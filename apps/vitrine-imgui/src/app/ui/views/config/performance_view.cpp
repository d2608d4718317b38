#include "performance_view.hpp"

#include <app/ui/widgets/common_widgets.hpp>

#include <fmt/format.h>

#include <string>

using namespace vitrine;

namespace app::ui {

PerformanceView::PerformanceView(SharedContext &context)
    : m_context(context) {}

void PerformanceView::Display(const preview::Preview &preview) {
    const auto *performance = preview.GetPerformance();
    if (performance == nullptr) {
        ImGui::TextDisabled("This preview does not record performance samples");
        return;
    }

    ImGui::AlignTextToFramePadding();
    ImGui::TextUnformatted("Overall");
    ImGui::SameLine();
    widgets::IndicatorBadge(m_context, performance->OverallIndicator());
    widgets::ExplanationTooltip("Calls are rated by their 90th percentile duration and by the share of calls slower "
                                "than one frame at 120 Hz (8.33 ms).\n\n"
                                "Healthy: p90 up to 4 ms and under 1% slow calls.\n"
                                "Degraded: p90 up to 8 ms and under 5% slow calls.\n"
                                "Severe: anything slower.",
                                m_context.displayScale);

    DisplayStats("View", performance->ViewStats());
    DisplayStats("Update", performance->UpdateStats());
}

void PerformanceView::DisplayStats(const char *name, const preview::Stats &stats) {
    ImGui::PushID(name);

    ImGui::SeparatorText(name);
    widgets::IndicatorBadge(m_context, stats.GetIndicator());

    if (ImGui::BeginTable("##stats", 2, ImGuiTableFlags_SizingFixedFit | ImGuiTableFlags_RowBg)) {
        auto row = [](const char *label, const std::string &value) {
            ImGui::TableNextRow();
            ImGui::TableNextColumn();
            ImGui::TextUnformatted(label);
            ImGui::TableNextColumn();
            ImGui::TextUnformatted(value.c_str());
        };

        row("Calls", fmt::format("{}", stats.count));
        row("Last", preview::FormatDuration(stats.last));
        row("Average", preview::FormatDuration(stats.avg));
        row("Min", preview::FormatDuration(stats.min));
        row("Max", preview::FormatDuration(stats.max));
        row("p50", preview::FormatDuration(stats.p50));
        row("p90", preview::FormatDuration(stats.p90));
        row("p99", preview::FormatDuration(stats.p99));
        row("Slow calls", fmt::format("{} ({:.1f}%)", stats.slowCallCount, stats.SlowCallPercentage()));

        ImGui::EndTable();
    }

    ImGui::PopID();
}

} // namespace app::ui
