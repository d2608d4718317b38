#pragma once

/**
@file
@brief Defines `vitrine::preview::Preview`, the uniform interface of every preview held by the registry.
*/

#include <vitrine/preview/metadata.hpp>
#include <vitrine/preview/performance.hpp>
#include <vitrine/preview/timeline.hpp>

#include <vitrine/dynamic/value.hpp>
#include <vitrine/message/message.hpp>
#include <vitrine/runtime/element.hpp>
#include <vitrine/runtime/task.hpp>

#include <vitrine/util/dev_log.hpp>

#include <vitrine/core/types.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace vitrine::preview {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // preview
    //   replay

    struct preview {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Preview";
    };

    struct replay : public preview {
        static constexpr std::string_view name = "Preview-Replay";
    };

} // namespace grp

/// @brief A previewable component with its own private state and message type.
///
/// The host only deals in `vitrine::Message`. Implementations recover their own message type from
/// `msg::Component` envelopes and wrap the messages their views emit back into envelopes.
class Preview {
public:
    virtual ~Preview() = default;

    [[nodiscard]] virtual const Metadata &GetMetadata() const = 0;

    /// @brief Handles a message dispatched by the host.
    /// @return the work the host should perform on behalf of the preview
    virtual Task<Message> Update(const Message &message) = 0;

    /// @brief Renders the preview.
    [[nodiscard]] virtual Element<Message> View() const = 0;

    /// @brief Number of messages recorded in the preview's history.
    [[nodiscard]] virtual usize MessageCount() const = 0;

    /// @brief Traces of the messages whose effect is reflected by the displayed state.
    [[nodiscard]] virtual std::span<const std::string> VisibleMessages() const = 0;

    /// @brief The history position, if the preview supports time travel.
    [[nodiscard]] virtual std::optional<Timeline> GetTimeline() const {
        return std::nullopt;
    }

    /// @brief The adjustable parameters of the preview, in declaration order.
    [[nodiscard]] virtual std::span<const dynamic::Param> Params() const {
        return {};
    }

    /// @brief Performance samples, if the preview tracks them.
    [[nodiscard]] virtual const Performance *GetPerformance() const {
        return nullptr;
    }
};

} // namespace vitrine::preview
