#pragma once

#include <app/shared_context.hpp>

namespace app::ui {

class PerformanceView {
public:
    PerformanceView(SharedContext &context);

    void Display(const vitrine::preview::Preview &preview);

private:
    SharedContext &m_context;

    void DisplayStats(const char *name, const vitrine::preview::Stats &stats);
};

} // namespace app::ui
