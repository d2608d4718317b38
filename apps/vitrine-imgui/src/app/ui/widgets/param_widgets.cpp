#include "param_widgets.hpp"

#include "common_widgets.hpp"

#include <vitrine/message/message.hpp>

#include <imgui.h>
#include <imgui_stdlib.h>

#include <fmt/format.h>

#include <string_view>

using namespace vitrine;

namespace app::ui::widgets {

namespace params {

    namespace {

        void SyncBuffer(EditBuffer &buffer, std::string_view value) {
            if (buffer.editing) {
                return;
            }
            buffer.text.assign(value);
        }

    } // namespace

    void BoolEditor(SharedContext &ctx, usize index, const dynamic::Param &param, bool value) {
        if (ImGui::Checkbox(param.name.c_str(), &value)) {
            ctx.EnqueueMessage(msg::ChangeParam{index, dynamic::Value::Bool(value)});
        }
    }

    void TextEditor(SharedContext &ctx, usize index, const dynamic::Param &param, const std::string &value,
                    EditBuffer &buffer) {
        SyncBuffer(buffer, value);
        if (ImGui::InputText(param.name.c_str(), &buffer.text)) {
            ctx.EnqueueMessage(msg::ChangeParam{index, dynamic::Value::Text(buffer.text)});
        }
        buffer.editing = ImGui::IsItemActive();
    }

    void NumberEditor(SharedContext &ctx, usize index, const dynamic::Param &param, sint32 value,
                      EditBuffer &buffer) {
        SyncBuffer(buffer, fmt::format("{}", value));
        ImGui::InputText(param.name.c_str(), &buffer.text);
        buffer.editing = ImGui::IsItemActive();
        if (ImGui::IsItemDeactivatedAfterEdit()) {
            ctx.EnqueueMessage(ParseNumberInput(index, buffer.text));
        }
        widgets::ExplanationTooltip("Press Enter or leave the field to apply.\n"
                                    "Text that is not a whole number is discarded.",
                                    ctx.displayScale);
    }

    void SelectEditor(SharedContext &ctx, usize index, const dynamic::Param &param,
                      const dynamic::SelectValue &value) {
        const char *preview = value.selected < value.options.size() ? value.options[value.selected].c_str() : "";
        if (ImGui::BeginCombo(param.name.c_str(), preview)) {
            for (usize i = 0; i < value.options.size(); ++i) {
                const bool selected = i == value.selected;
                ImGui::PushID(static_cast<int>(i));
                if (ImGui::Selectable(value.options[i].c_str(), selected) && !selected) {
                    ctx.EnqueueMessage(msg::ChangeParam{index, dynamic::Value::Select(i, value.options)});
                }
                if (selected) {
                    ImGui::SetItemDefaultFocus();
                }
                ImGui::PopID();
            }
            ImGui::EndCombo();
        }
    }

    void SliderEditor(SharedContext &ctx, usize index, const dynamic::Param &param,
                      const dynamic::SliderValue &value) {
        float current = value.current;
        if (ImGui::SliderFloat(param.name.c_str(), &current, value.min, value.max, "%.2f",
                               ImGuiSliderFlags_AlwaysClamp)) {
            ctx.EnqueueMessage(msg::ChangeParam{index, dynamic::Value::Slider(current, value.min, value.max)});
        }
    }

    void ColorEditor(SharedContext &ctx, usize index, const dynamic::Param &param, const dynamic::Rgba &value) {
        float color[4] = {value.r, value.g, value.b, value.a};
        if (ImGui::ColorEdit4(param.name.c_str(), color, ImGuiColorEditFlags_AlphaBar)) {
            ctx.EnqueueMessage(msg::ChangeParam{
                index, dynamic::Value::Color({.r = color[0], .g = color[1], .b = color[2], .a = color[3]})});
        }
    }

    void ParamEditor(SharedContext &ctx, usize index, const dynamic::Param &param, EditBuffer &buffer) {
        const auto &value = param.value;
        switch (value.Kind()) {
        case dynamic::ValueKind::Bool: BoolEditor(ctx, index, param, *value.Get<bool>()); break;
        case dynamic::ValueKind::Text: TextEditor(ctx, index, param, *value.Get<std::string>(), buffer); break;
        case dynamic::ValueKind::Int32: NumberEditor(ctx, index, param, *value.Get<sint32>(), buffer); break;
        case dynamic::ValueKind::Select: SelectEditor(ctx, index, param, *value.Get<dynamic::SelectValue>()); break;
        case dynamic::ValueKind::Slider: SliderEditor(ctx, index, param, *value.Get<dynamic::SliderValue>()); break;
        case dynamic::ValueKind::Color: ColorEditor(ctx, index, param, *value.Get<dynamic::Rgba>()); break;
        }
    }

} // namespace params

} // namespace app::ui::widgets
