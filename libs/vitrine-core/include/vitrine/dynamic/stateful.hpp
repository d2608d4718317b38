#pragma once

/**
@file
@brief Defines `vitrine::dynamic::Stateful`, a stateful preview whose boot and view functions read adjustable
parameters.
*/

#include <vitrine/dynamic/extract_params.hpp>
#include <vitrine/dynamic/param_set.hpp>

#include <vitrine/preview/metadata.hpp>
#include <vitrine/preview/preview.hpp>
#include <vitrine/preview/session.hpp>

#include <vitrine/message/message.hpp>
#include <vitrine/runtime/element.hpp>
#include <vitrine/runtime/task.hpp>

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

namespace vitrine::dynamic {

/// @brief A stateful preview with adjustable parameters.
///
/// The state is booted from the current parameter values, so resetting the preview keeps the parameter selection.
/// Changing a parameter re-derives the state by booting with the new values and replaying the history up to the
/// current position; the history itself is kept.
template <extractable_params TParams, typename TState, message_type TMessage>
class Stateful final : public preview::Preview {
public:
    using Values = ParamValues<TParams>;
    using Session = preview::StatefulSession<TState, TMessage>;
    using BootFn = std::function<TState(const Values &)>;
    using ViewFn = std::function<Element<TMessage>(const TState &, const Values &)>;

    Stateful(preview::Metadata metadata, TParams params, BootFn boot, typename Session::UpdateFn update, ViewFn view)
        : m_metadata(std::move(metadata))
        , m_params(std::move(params))
        , m_boot(std::move(boot))
        , m_session([this] { return m_boot(m_params.GetValues()); }, std::move(update))
        , m_view(std::move(view)) {}

    // The session's boot function refers to this object
    Stateful(const Stateful &) = delete;
    Stateful &operator=(const Stateful &) = delete;

    [[nodiscard]] const preview::Metadata &GetMetadata() const override {
        return m_metadata;
    }

    Task<Message> Update(const Message &message) override {
        const std::string_view label = m_metadata.label;
        if (const auto *component = std::get_if<msg::Component>(&message)) {
            return m_session.Dispatch(*component, label);
        } else if (const auto *change = std::get_if<msg::ChangeParam>(&message)) {
            if (m_params.Change(change->index, change->value, label)) {
                m_session.Rebuild();
            }
        } else if (std::holds_alternative<msg::ResetParams>(message)) {
            m_params.Reset(label);
            m_session.Rebuild();
        } else if (std::holds_alternative<msg::ResetPreview>(message)) {
            devlog::debug<preview::grp::preview>("{}: reset", label);
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
            m_session.GetPerformance().RecordView([&] {
                m_view(m_session.GetState(), m_params.GetValues()).Map(&MakeComponentMessage<TMessage>).Draw(emit);
            });
        }};
    }

    [[nodiscard]] usize MessageCount() const override {
        return m_session.GetHistory().Size();
    }

    [[nodiscard]] std::span<const std::string> VisibleMessages() const override {
        return m_session.GetHistory().VisibleTraces();
    }

    [[nodiscard]] std::optional<preview::Timeline> GetTimeline() const override {
        return m_session.GetHistory().GetTimeline();
    }

    [[nodiscard]] std::span<const Param> Params() const override {
        return m_params.Params();
    }

    [[nodiscard]] const preview::Performance *GetPerformance() const override {
        return &m_session.GetPerformance();
    }

    [[nodiscard]] const TState &GetState() const {
        return m_session.GetState();
    }

    [[nodiscard]] const Values &GetValues() const {
        return m_params.GetValues();
    }

    [[nodiscard]] const preview::History<TMessage> &GetHistory() const {
        return m_session.GetHistory();
    }

private:
    preview::Metadata m_metadata;
    ParamSet<TParams> m_params;
    BootFn m_boot;
    Session m_session;
    ViewFn m_view;
};

/// @brief Creates a stateful preview with adjustable parameters.
///
/// `boot` receives the extracted parameter values and returns the initial state. `view` receives the state and the
/// values. `update` follows the same rules as for `preview::CreateStateful`.
template <extractable_params TParams, typename TBoot, typename TUpdate, typename TView>
auto CreateStateful(preview::Metadata metadata, TParams params, TBoot boot, TUpdate update, TView view) {
    using TValues = ParamValues<TParams>;
    using TState = std::invoke_result_t<TBoot &, const TValues &>;
    using TMessage = typename std::invoke_result_t<TView &, const TState &, const TValues &>::MessageType;
    using TPreview = Stateful<TParams, TState, TMessage>;
    return std::make_unique<TPreview>(std::move(metadata), std::move(params), std::move(boot),
                                      preview::detail::AdaptUpdate<TState, TMessage>(std::move(update)),
                                      std::move(view));
}

} // namespace vitrine::dynamic
