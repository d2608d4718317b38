#pragma once

#include <app/shared_context.hpp>

#include <vitrine/preview/performance.hpp>

#include <imgui.h>

namespace app::ui::widgets {

void ExplanationTooltip(const char *explanation, float displayScale);

/// @brief Returns the color used to display the indicator.
ImVec4 IndicatorColor(SharedContext &ctx, vitrine::preview::Indicator indicator);

/// @brief Draws a small colored badge with the indicator name.
void IndicatorBadge(SharedContext &ctx, vitrine::preview::Indicator indicator);

/// @brief Draws a colored dot at the right edge of the last item, sized to the text height.
void IndicatorDot(SharedContext &ctx, vitrine::preview::Indicator indicator);

/// @brief Draws a small badge with a number, used to enumerate list entries.
void CountBadge(SharedContext &ctx, usize value);

} // namespace app::ui::widgets
