#pragma once

/**
@file
@brief Defines `vitrine::Message`, the uniform message dispatched by the host into previews.
*/

#include <vitrine/message/any_message.hpp>

#include <vitrine/dynamic/value.hpp>

#include <vitrine/core/types.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace vitrine {

namespace msg {

    /// @brief Does nothing. Produced by malformed interactive input.
    struct Noop {};

    /// @brief Selects the preview at `index` in the registry.
    struct SelectPreview {
        usize index;
    };

    /// @brief Reboots the selected preview and clears its history and performance samples.
    struct ResetPreview {};

    /// @brief Applies `value` to the parameter at `index`.
    struct ChangeParam {
        usize index;
        dynamic::Value value;
    };

    /// @brief Restores every parameter to its initial value.
    struct ResetParams {};

    /// @brief Rewinds the selected preview to the state after `position` messages.
    struct TimeTravel {
        uint32 position;
    };

    /// @brief Replays the whole history and returns to the live edge.
    struct JumpToPresent {};

    /// @brief A message emitted by a preview's component.
    struct Component {
        AnyMessage message;
    };

} // namespace msg

using Message = std::variant<msg::Noop, msg::SelectPreview, msg::ResetPreview, msg::ChangeParam, msg::ResetParams,
                             msg::TimeTravel, msg::JumpToPresent, msg::Component>;

/// @brief Wraps a component message into the uniform message type.
template <message_type TMessage>
Message MakeComponentMessage(TMessage message) {
    return msg::Component{AnyMessage{std::move(message)}};
}

/// @brief Converts freeform numeric text typed into a number parameter field.
/// @param[in] index the parameter index
/// @param[in] text the text to parse as a base-10 32-bit integer; surrounding whitespace is ignored
/// @return `msg::ChangeParam` with an `Int32` value, or `msg::Noop` if the text is not a valid number
Message ParseNumberInput(usize index, std::string_view text);

/// @brief Formats the message for logs.
std::string DescribeMessage(const Message &message);

} // namespace vitrine
