#pragma once

#include <app/shared_context.hpp>

#include <vitrine/dynamic/value.hpp>

#include <string>

namespace app::ui::widgets {

namespace params {

    /// @brief Edit buffer of a text or numeric parameter field.
    ///
    /// The buffer follows the parameter value while the field is not being edited.
    struct EditBuffer {
        std::string text;
        bool editing = false;
    };

    void BoolEditor(SharedContext &ctx, usize index, const vitrine::dynamic::Param &param, bool value);
    void TextEditor(SharedContext &ctx, usize index, const vitrine::dynamic::Param &param, const std::string &value,
                    EditBuffer &buffer);
    void NumberEditor(SharedContext &ctx, usize index, const vitrine::dynamic::Param &param, sint32 value,
                      EditBuffer &buffer);
    void SelectEditor(SharedContext &ctx, usize index, const vitrine::dynamic::Param &param,
                      const vitrine::dynamic::SelectValue &value);
    void SliderEditor(SharedContext &ctx, usize index, const vitrine::dynamic::Param &param,
                      const vitrine::dynamic::SliderValue &value);
    void ColorEditor(SharedContext &ctx, usize index, const vitrine::dynamic::Param &param,
                     const vitrine::dynamic::Rgba &value);

    /// @brief Draws the editor matching the kind of the parameter value.
    void ParamEditor(SharedContext &ctx, usize index, const vitrine::dynamic::Param &param, EditBuffer &buffer);

} // namespace params

} // namespace app::ui::widgets
