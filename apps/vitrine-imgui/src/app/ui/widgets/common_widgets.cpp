#include "common_widgets.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <string>

using namespace vitrine;

namespace app::ui::widgets {

void ExplanationTooltip(const char *explanation, float displayScale) {
    ImGui::SameLine();
    ImGui::TextDisabled("(?)");
    if (ImGui::BeginItemTooltip()) {
        ImGui::PushTextWrapPos(450.0f * displayScale);
        ImGui::TextUnformatted(explanation);
        ImGui::PopTextWrapPos();
        ImGui::EndTooltip();
    }
}

ImVec4 IndicatorColor(SharedContext &ctx, preview::Indicator indicator) {
    switch (indicator) {
    case preview::Indicator::Healthy: return ctx.colors.healthy;
    case preview::Indicator::Degraded: return ctx.colors.degraded;
    case preview::Indicator::Severe: return ctx.colors.severe;
    default: return ctx.colors.unknown;
    }
}

void IndicatorBadge(SharedContext &ctx, preview::Indicator indicator) {
    const ImVec4 color = IndicatorColor(ctx, indicator);
    const char *label = preview::IndicatorName(indicator);

    const ImVec2 textSize = ImGui::CalcTextSize(label);
    const ImVec2 padding{6.0f * ctx.displayScale, 1.0f * ctx.displayScale};
    const ImVec2 pos = ImGui::GetCursorScreenPos();
    const ImVec2 size{textSize.x + padding.x * 2.0f, textSize.y + padding.y * 2.0f};

    auto *drawList = ImGui::GetWindowDrawList();
    drawList->AddRectFilled(pos, ImVec2(pos.x + size.x, pos.y + size.y),
                            ImGui::GetColorU32(ImVec4(color.x, color.y, color.z, 0.25f)), size.y * 0.5f);
    drawList->AddRect(pos, ImVec2(pos.x + size.x, pos.y + size.y), ImGui::GetColorU32(color), size.y * 0.5f);
    drawList->AddText(ImVec2(pos.x + padding.x, pos.y + padding.y), ImGui::GetColorU32(color), label);
    ImGui::Dummy(size);
}

void IndicatorDot(SharedContext &ctx, preview::Indicator indicator) {
    const float radius = ImGui::GetTextLineHeight() * 0.25f;
    const ImVec2 itemMin = ImGui::GetItemRectMin();
    const ImVec2 itemMax = ImGui::GetItemRectMax();
    const ImVec2 center{itemMax.x - radius * 2.0f, (itemMin.y + itemMax.y) * 0.5f};
    ImGui::GetWindowDrawList()->AddCircleFilled(center, radius, ImGui::GetColorU32(IndicatorColor(ctx, indicator)));
}

void CountBadge(SharedContext &ctx, usize value) {
    const std::string label = fmt::format("{}", value);
    const ImVec2 textSize = ImGui::CalcTextSize(label.c_str());
    const float padding = 4.0f * ctx.displayScale;
    const ImVec2 pos = ImGui::GetCursorScreenPos();
    const ImVec2 size{std::max(textSize.x + padding * 2.0f, textSize.y + padding), textSize.y};

    auto *drawList = ImGui::GetWindowDrawList();
    drawList->AddRectFilled(pos, ImVec2(pos.x + size.x, pos.y + size.y), ImGui::GetColorU32(ImGuiCol_FrameBg),
                            size.y * 0.5f);
    drawList->AddText(ImVec2(pos.x + (size.x - textSize.x) * 0.5f, pos.y), ImGui::GetColorU32(ImGuiCol_Text),
                      label.c_str());
    ImGui::Dummy(size);
}

} // namespace app::ui::widgets
