#pragma once

#include <app/shared_context.hpp>

namespace app::ui {

/// @brief Draws the header and contents of the selected preview.
class PreviewAreaView {
public:
    PreviewAreaView(SharedContext &context);

    void Display();

private:
    SharedContext &m_context;

    void DisplayHeader(const vitrine::preview::Preview &preview);
};

} // namespace app::ui
