#include "parameters_view.hpp"

#include <app/ui/widgets/common_widgets.hpp>

using namespace vitrine;

namespace app::ui {

ParametersView::ParametersView(SharedContext &context)
    : m_context(context) {}

void ParametersView::Display(const preview::Preview &preview) {
    const auto params = preview.Params();
    if (params.empty()) {
        ImGui::TextDisabled("This preview has no parameters");
        return;
    }

    if (m_bufferOwner != &preview || m_buffers.size() != params.size()) {
        m_bufferOwner = &preview;
        m_buffers.assign(params.size(), {});
    }

    if (ImGui::Button("Undo")) {
        m_context.EnqueueMessage(msg::ResetParams{});
    }
    widgets::ExplanationTooltip("Restores every parameter to its initial value.", m_context.displayScale);

    ImGui::Separator();

    ImGui::PushItemWidth(ImGui::GetContentRegionAvail().x * 0.6f);
    for (usize i = 0; i < params.size(); ++i) {
        ImGui::PushID(static_cast<int>(i));
        widgets::params::ParamEditor(m_context, i, params[i], m_buffers[i]);
        ImGui::PopID();
    }
    ImGui::PopItemWidth();
}

} // namespace app::ui
