#pragma once

/**
@file
@brief Defines `vitrine::preview::StatefulSession`, the state, history and replay machinery shared by stateful
previews.
*/

#include <vitrine/preview/history.hpp>
#include <vitrine/preview/performance.hpp>
#include <vitrine/preview/preview.hpp>

#include <vitrine/message/message.hpp>
#include <vitrine/runtime/task.hpp>

#include <vitrine/util/dev_log.hpp>

#include <concepts>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

namespace vitrine::preview {

namespace detail {

    template <typename>
    inline constexpr bool kAlwaysFalse = false;

    /// @brief Invokes a component update function and converts its result into a task.
    ///
    /// The function may return `void`, `Task<TMessage>`, `TMessage` or `std::optional<TMessage>`.
    template <typename TMessage, typename TFn, typename TState>
    Task<TMessage> InvokeUpdate(TFn &fn, TState &state, const TMessage &message) {
        using TResult = std::invoke_result_t<TFn &, TState &, const TMessage &>;
        if constexpr (std::is_void_v<TResult>) {
            std::invoke(fn, state, message);
            return Task<TMessage>::None();
        } else if constexpr (std::same_as<TResult, Task<TMessage>>) {
            return std::invoke(fn, state, message);
        } else if constexpr (std::convertible_to<TResult, std::optional<TMessage>>) {
            std::optional<TMessage> result = std::invoke(fn, state, message);
            return result ? Task<TMessage>::Done(std::move(*result)) : Task<TMessage>::None();
        } else {
            static_assert(kAlwaysFalse<TResult>, "update functions must return void, a message or a task");
        }
    }

    template <typename TState, typename TMessage, typename TFn>
    std::function<Task<TMessage>(TState &, const TMessage &)> AdaptUpdate(TFn fn) {
        return [fn = std::move(fn)](TState &state, const TMessage &message) mutable {
            return InvokeUpdate<TMessage>(fn, state, message);
        };
    }

} // namespace detail

/// @brief Owns a component's state together with its history, and re-derives the state on time travel.
///
/// Time travel never mutates the state in reverse. Rewinding or returning to the present reboots the state and folds
/// the applicable history prefix through the update function again, discarding the tasks those calls return and
/// without recording performance samples.
///
/// @tparam TState the component state
/// @tparam TMessage the component message type
template <typename TState, message_type TMessage>
class StatefulSession {
public:
    using BootFn = std::function<TState()>;
    using UpdateFn = std::function<Task<TMessage>(TState &, const TMessage &)>;

    StatefulSession(BootFn boot, UpdateFn update)
        : m_boot(std::move(boot))
        , m_update(std::move(update))
        , m_state(m_boot()) {}

    /// @brief Applies a component message emitted by the live view.
    ///
    /// Messages arriving while historical or holding a foreign type are dropped.
    ///
    /// @return the task returned by the update function, rewrapped into uniform messages
    Task<Message> Dispatch(const msg::Component &component, std::string_view label) {
        if (!m_history.IsLive()) {
            devlog::debug<grp::preview>("{}: ignoring {} while viewing position {} of {}", label, component.message,
                                        m_history.Position(), m_history.Size());
            return Task<Message>::None();
        }

        const TMessage *message = component.message.TryGet<TMessage>();
        if (message == nullptr) {
            devlog::debug<grp::preview>("{}: dropping message of foreign type {}", label,
                                        component.message.TypeName());
            return Task<Message>::None();
        }

        m_history.Record(*message);
        Task<TMessage> task = m_performance.RecordUpdate([&] { return m_update(m_state, *message); });
        return task.Map(&MakeComponentMessage<TMessage>);
    }

    /// @brief Reboots the state and clears history and performance samples.
    void Reset() {
        m_state = m_boot();
        m_history.Reset();
        m_performance.Reset();
    }

    /// @brief Rewinds to the state after the first `position` messages. Out of range positions are ignored.
    void TimeTravel(usize position, std::string_view label) {
        if (!m_history.Rewind(position)) {
            devlog::debug<grp::replay>("{}: ignoring time travel to {} beyond {} messages", label, position,
                                       m_history.Size());
            return;
        }
        devlog::debug<grp::replay>("{}: replaying {} of {} messages", label, position, m_history.Size());
        Replay(m_history.AppliedMessages());
    }

    /// @brief Returns to the live edge by replaying every recorded message. Does nothing if already live.
    void JumpToPresent(std::string_view label) {
        if (m_history.IsLive()) {
            return;
        }
        devlog::debug<grp::replay>("{}: replaying all {} messages", label, m_history.Size());
        Replay(m_history.ReplayToPresent());
    }

    /// @brief Re-derives the state at the current position, e.g. after the boot function changed its inputs.
    void Rebuild() {
        Replay(m_history.AppliedMessages());
    }

    [[nodiscard]] const TState &GetState() const {
        return m_state;
    }

    [[nodiscard]] const History<TMessage> &GetHistory() const {
        return m_history;
    }

    [[nodiscard]] const Performance &GetPerformance() const {
        return m_performance;
    }

private:
    BootFn m_boot;
    UpdateFn m_update;
    TState m_state;
    History<TMessage> m_history;
    Performance m_performance;

    void Replay(std::span<const TMessage> messages) {
        m_state = m_boot();
        for (const TMessage &message : messages) {
            // Replayed calls are a pure fold over the state; their tasks are never issued again
            [[maybe_unused]] Task<TMessage> discarded = m_update(m_state, message);
        }
    }
};

} // namespace vitrine::preview
