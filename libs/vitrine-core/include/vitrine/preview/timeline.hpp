#pragma once

/**
@file
@brief Defines `vitrine::preview::Timeline`, a read-only view of a history's position.
*/

#include <vitrine/core/types.hpp>

#include <algorithm>

namespace vitrine::preview {

/// @brief The current position within a history of `count` messages.
///
/// Position 0 is the initial state; position `count` is the live state.
struct Timeline {
    Timeline() = default;

    Timeline(uint32 position, uint32 count)
        : position(std::min(position, count))
        , count(count) {}

    uint32 position = 0;
    uint32 count = 0;

    [[nodiscard]] bool IsLive() const {
        return position == count;
    }

    bool operator==(const Timeline &) const = default;
};

} // namespace vitrine::preview
