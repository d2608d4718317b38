#pragma once

/**
@file
@brief Defines `vitrine::Task`, the outgoing work returned from update calls.
*/

#include <vitrine/core/types.hpp>

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace vitrine {

/// @brief A batch of deferred actions, each producing at most one message.
///
/// Update functions never block; any work they want done is described by a task which the host runs after the
/// update returns. Messages produced by the task re-enter the host as ordinary messages.
///
/// @tparam TMessage the type of the messages produced by the task
template <typename TMessage>
class Task {
public:
    using Action = std::function<std::optional<TMessage>()>;

    Task() = default;

    /// @brief A task that does nothing.
    static Task None() {
        return {};
    }

    /// @brief A task that produces `message`.
    static Task Done(TMessage message) {
        Task task{};
        task.m_actions.push_back([message = std::move(message)]() -> std::optional<TMessage> { return message; });
        return task;
    }

    /// @brief A task that runs `fn`.
    ///
    /// `fn` may return `void`, a `TMessage` or a `std::optional<TMessage>`.
    template <typename TFn>
    static Task Perform(TFn fn) {
        Task task{};
        task.m_actions.push_back([fn = std::move(fn)]() mutable -> std::optional<TMessage> {
            if constexpr (std::is_void_v<std::invoke_result_t<TFn &>>) {
                fn();
                return std::nullopt;
            } else {
                return fn();
            }
        });
        return task;
    }

    /// @brief A task that runs all given tasks in order.
    static Task Batch(std::vector<Task> tasks) {
        Task task{};
        for (auto &other : tasks) {
            for (auto &action : other.m_actions) {
                task.m_actions.push_back(std::move(action));
            }
        }
        return task;
    }

    /// @brief Creates a task that runs this task and converts each produced message with `fn`.
    template <typename TFn>
    [[nodiscard]] auto Map(TFn fn) const -> Task<std::invoke_result_t<TFn &, TMessage>> {
        using TResult = std::invoke_result_t<TFn &, TMessage>;
        Task<TResult> mapped{};
        for (const auto &action : m_actions) {
            mapped.Push([action, fn]() mutable -> std::optional<TResult> {
                if (auto message = action()) {
                    return fn(std::move(*message));
                }
                return std::nullopt;
            });
        }
        return mapped;
    }

    /// @brief Appends an action to the task.
    void Push(Action action) {
        m_actions.push_back(std::move(action));
    }

    [[nodiscard]] bool IsNone() const {
        return m_actions.empty();
    }

    [[nodiscard]] usize Size() const {
        return m_actions.size();
    }

    /// @brief Runs every action in order and returns the messages they produced.
    std::vector<TMessage> Run() const {
        std::vector<TMessage> messages;
        for (const auto &action : m_actions) {
            if (auto message = action()) {
                messages.push_back(std::move(*message));
            }
        }
        return messages;
    }

private:
    std::vector<Action> m_actions;
};

} // namespace vitrine
