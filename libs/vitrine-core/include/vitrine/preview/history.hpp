#pragma once

/**
@file
@brief Defines `vitrine::preview::History`, the append-only log of messages emitted by a preview.
*/

#include <vitrine/preview/timeline.hpp>

#include <vitrine/message/any_message.hpp>

#include <vitrine/core/types.hpp>

#include <fmt/format.h>

#include <span>
#include <string>
#include <utility>
#include <vector>

namespace vitrine::preview {

/// @brief A log of messages and their traces, indexed by a position.
///
/// The history is *live* when the position equals the number of recorded messages; otherwise it is *historical* and
/// the displayed state reflects the first `Position()` messages only.
///
/// Messages can only be recorded while live. Time travel never rewrites the log: rewinding moves the position back,
/// and the owner re-derives its state by replaying `AppliedMessages()` from a freshly booted state.
///
/// @tparam TMessage the message type
template <message_type TMessage>
class History {
public:
    /// @brief Appends a message and its trace, staying live.
    ///
    /// Must only be called while live. Callers filter out messages arriving while historical.
    void Record(TMessage message) {
        m_traces.push_back(fmt::format("{}", message));
        m_messages.push_back(std::move(message));
        m_position = m_messages.size();
    }

    /// @brief Moves the position to `position`.
    /// @return `true` if the position was valid and applied, `false` if it was out of range and ignored
    bool Rewind(usize position) {
        if (position > m_messages.size()) {
            return false;
        }
        m_position = position;
        return true;
    }

    /// @brief Moves the position to the live edge.
    /// @return the messages to replay from a freshly booted state, which is now every recorded message
    std::span<const TMessage> ReplayToPresent() {
        m_position = m_messages.size();
        return AppliedMessages();
    }

    /// @brief Clears every message and returns to position 0.
    void Reset() {
        m_messages.clear();
        m_traces.clear();
        m_position = 0;
    }

    [[nodiscard]] bool IsLive() const {
        return m_position == m_messages.size();
    }

    [[nodiscard]] usize Position() const {
        return m_position;
    }

    [[nodiscard]] usize Size() const {
        return m_messages.size();
    }

    [[nodiscard]] bool IsEmpty() const {
        return m_messages.empty();
    }

    [[nodiscard]] std::span<const TMessage> Messages() const {
        return m_messages;
    }

    [[nodiscard]] std::span<const std::string> Traces() const {
        return m_traces;
    }

    /// @brief The messages whose effect is reflected by the current position.
    [[nodiscard]] std::span<const TMessage> AppliedMessages() const {
        return std::span<const TMessage>{m_messages}.first(m_position);
    }

    /// @brief The traces of the messages whose effect is reflected by the current position.
    [[nodiscard]] std::span<const std::string> VisibleTraces() const {
        return std::span<const std::string>{m_traces}.first(m_position);
    }

    [[nodiscard]] Timeline GetTimeline() const {
        return Timeline{static_cast<uint32>(m_position), static_cast<uint32>(m_messages.size())};
    }

private:
    std::vector<TMessage> m_messages;
    std::vector<std::string> m_traces;
    usize m_position = 0;
};

} // namespace vitrine::preview
