#pragma once

#include <app/shared_context.hpp>

namespace app::ui {

class AboutView {
public:
    AboutView(SharedContext &context);

    void Display(const vitrine::preview::Preview &preview);

private:
    SharedContext &m_context;
};

} // namespace app::ui
