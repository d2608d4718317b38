#pragma once

#include <app/shared_context.hpp>

#include <app/ui/widgets/param_widgets.hpp>

#include <vector>

namespace app::ui {

class ParametersView {
public:
    ParametersView(SharedContext &context);

    void Display(const vitrine::preview::Preview &preview);

private:
    SharedContext &m_context;

    // Edit buffers of the parameters of the preview last displayed
    const vitrine::preview::Preview *m_bufferOwner = nullptr;
    std::vector<widgets::params::EditBuffer> m_buffers;
};

} // namespace app::ui
