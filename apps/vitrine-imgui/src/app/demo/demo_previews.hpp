#pragma once

#include <vitrine/registry/registry.hpp>

namespace app::demo {

/// @brief Registers the previews shown when the application starts.
void RegisterDemoPreviews(vitrine::registry::Registry &registry);

} // namespace app::demo
