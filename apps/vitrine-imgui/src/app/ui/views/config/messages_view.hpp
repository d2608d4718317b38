#pragma once

#include <app/shared_context.hpp>

namespace app::ui {

class MessagesView {
public:
    MessagesView(SharedContext &context);

    void Display(const vitrine::preview::Preview &preview);

private:
    SharedContext &m_context;

    void DisplayTimeline(const vitrine::preview::Timeline &timeline);
    void DisplayTraces(const vitrine::preview::Preview &preview);
};

} // namespace app::ui
