#pragma once

#include <app/shared_context.hpp>

#include <array>

namespace app::ui {

/// @brief Sidebar listing the registered previews, filtered by a search box and grouped by metadata group.
class PreviewListView {
public:
    PreviewListView(SharedContext &context);

    void Display();

private:
    SharedContext &m_context;
    std::array<char, 256> m_search{};

    void DisplayEntry(usize index);
};

} // namespace app::ui
