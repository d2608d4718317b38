#pragma once

/**
@file
@brief Defines `vitrine::preview::Stateful`, a preview of a component with state, an update function and history.
*/

#include <vitrine/preview/metadata.hpp>
#include <vitrine/preview/preview.hpp>
#include <vitrine/preview/session.hpp>

#include <vitrine/message/message.hpp>
#include <vitrine/runtime/element.hpp>
#include <vitrine/runtime/task.hpp>

#include <vitrine/util/dev_log.hpp>

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

namespace vitrine::preview {

/// @brief A preview of a component following the boot/update/view cycle.
///
/// Every applied message is recorded. The timeline can be moved back to any earlier position, in which case the state
/// is re-derived by replaying the history prefix from a freshly booted state.
///
/// @tparam TState the component state
/// @tparam TMessage the component message type
template <typename TState, message_type TMessage>
class Stateful final : public Preview {
public:
    using Session = StatefulSession<TState, TMessage>;
    using ViewFn = std::function<Element<TMessage>(const TState &)>;

    Stateful(Metadata metadata, typename Session::BootFn boot, typename Session::UpdateFn update, ViewFn view)
        : m_metadata(std::move(metadata))
        , m_session(std::move(boot), std::move(update))
        , m_view(std::move(view)) {}

    [[nodiscard]] const Metadata &GetMetadata() const override {
        return m_metadata;
    }

    Task<Message> Update(const Message &message) override {
        const std::string_view label = m_metadata.label;
        if (const auto *component = std::get_if<msg::Component>(&message)) {
            return m_session.Dispatch(*component, label);
        } else if (std::holds_alternative<msg::ResetPreview>(message)) {
            devlog::debug<grp::preview>("{}: reset", label);
            m_session.Reset();
        } else if (const auto *timeTravel = std::get_if<msg::TimeTravel>(&message)) {
            m_session.TimeTravel(timeTravel->position, label);
        } else if (std::holds_alternative<msg::JumpToPresent>(message)) {
            m_session.JumpToPresent(label);
        }
        return Task<Message>::None();
    }

    [[nodiscard]] Element<Message> View() const override {
        return Element<Message>{[this](const Element<Message>::Emit &emit) {
            m_session.GetPerformance().RecordView(
                [&] { m_view(m_session.GetState()).Map(&MakeComponentMessage<TMessage>).Draw(emit); });
        }};
    }

    [[nodiscard]] usize MessageCount() const override {
        return m_session.GetHistory().Size();
    }

    [[nodiscard]] std::span<const std::string> VisibleMessages() const override {
        return m_session.GetHistory().VisibleTraces();
    }

    [[nodiscard]] std::optional<Timeline> GetTimeline() const override {
        return m_session.GetHistory().GetTimeline();
    }

    [[nodiscard]] const Performance *GetPerformance() const override {
        return &m_session.GetPerformance();
    }

    [[nodiscard]] const TState &GetState() const {
        return m_session.GetState();
    }

    [[nodiscard]] const History<TMessage> &GetHistory() const {
        return m_session.GetHistory();
    }

private:
    Metadata m_metadata;
    Session m_session;
    ViewFn m_view;
};

/// @brief Creates a stateful preview.
///
/// The state type is deduced from `boot` and the message type from the `Element` returned by `view`. `update` receives
/// the state by mutable reference and may return `void`, a message, an optional message or a `Task`.
template <typename TBoot, typename TUpdate, typename TView>
auto CreateStateful(Metadata metadata, TBoot boot, TUpdate update, TView view) {
    using TState = std::invoke_result_t<TBoot &>;
    using TMessage = typename std::invoke_result_t<TView &, const TState &>::MessageType;
    using TPreview = Stateful<TState, TMessage>;
    return std::make_unique<TPreview>(std::move(metadata), std::move(boot),
                                      detail::AdaptUpdate<TState, TMessage>(std::move(update)), std::move(view));
}

} // namespace vitrine::preview
