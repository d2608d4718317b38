#pragma once

/**
@file
@brief Defines `vitrine::Element`, an immediate-mode renderable that reports the messages it emits.
*/

#include <functional>
#include <type_traits>
#include <utility>
#include <vector>

namespace vitrine {

/// @brief A renderable produced by a view function.
///
/// The draw function issues toolkit calls for one frame and reports every message the user triggered through the
/// `Emit` callback. An element borrows whatever its draw function captures, so it must be drawn before the object it
/// was created from is modified or destroyed.
///
/// @tparam TMessage the type of the messages emitted while drawing
template <typename TMessage>
class Element {
public:
    using MessageType = TMessage;
    using Emit = std::function<void(TMessage)>;
    using DrawFn = std::function<void(const Emit &emit)>;

    Element() = default;

    explicit Element(DrawFn draw)
        : m_draw(std::move(draw)) {}

    /// @brief Draws the element, forwarding emitted messages to `emit`.
    void Draw(const Emit &emit) const {
        if (m_draw) {
            m_draw(emit);
        }
    }

    /// @brief Draws the element and returns every message emitted during the draw.
    std::vector<TMessage> Collect() const {
        std::vector<TMessage> messages;
        Draw([&](TMessage message) { messages.push_back(std::move(message)); });
        return messages;
    }

    [[nodiscard]] bool IsEmpty() const {
        return !static_cast<bool>(m_draw);
    }

    /// @brief Creates an element that draws this element and converts each emitted message with `fn`.
    template <typename TFn>
    [[nodiscard]] auto Map(TFn fn) const -> Element<std::invoke_result_t<TFn &, TMessage>> {
        using TResult = std::invoke_result_t<TFn &, TMessage>;
        if (!m_draw) {
            return {};
        }
        return Element<TResult>{
            [draw = m_draw, fn = std::move(fn)](const typename Element<TResult>::Emit &emit) mutable {
                draw([&](TMessage message) { emit(fn(std::move(message))); });
            }};
    }

private:
    DrawFn m_draw;
};

} // namespace vitrine
