#pragma once

/**
@file
@brief Defines `vitrine::dynamic::Stateless`, a stateless preview whose view reads adjustable parameters.
*/

#include <vitrine/dynamic/extract_params.hpp>
#include <vitrine/dynamic/param_set.hpp>

#include <vitrine/preview/history.hpp>
#include <vitrine/preview/metadata.hpp>
#include <vitrine/preview/performance.hpp>
#include <vitrine/preview/preview.hpp>

#include <vitrine/message/message.hpp>
#include <vitrine/runtime/element.hpp>

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

namespace vitrine::dynamic {

/// @brief A stateless preview rendering the current parameter values.
///
/// Parameter changes take effect on the next view call. Emitted messages are recorded for display only.
template <extractable_params TParams, message_type TMessage>
class Stateless final : public preview::Preview {
public:
    using Values = ParamValues<TParams>;
    using ViewFn = std::function<Element<TMessage>(const Values &)>;

    Stateless(preview::Metadata metadata, TParams params, ViewFn view)
        : m_metadata(std::move(metadata))
        , m_params(std::move(params))
        , m_view(std::move(view)) {}

    [[nodiscard]] const preview::Metadata &GetMetadata() const override {
        return m_metadata;
    }

    Task<Message> Update(const Message &message) override {
        if (const auto *change = std::get_if<msg::ChangeParam>(&message)) {
            m_params.Change(change->index, change->value, m_metadata.label);
        } else if (std::holds_alternative<msg::ResetParams>(message)) {
            m_params.Reset(m_metadata.label);
        } else if (const auto *component = std::get_if<msg::Component>(&message)) {
            if (const TMessage *typed = component->message.TryGet<TMessage>()) {
                m_history.Record(*typed);
            } else {
                devlog::debug<preview::grp::preview>("{}: dropping message of foreign type {}", m_metadata.label,
                                                     component->message.TypeName());
            }
        } else if (std::holds_alternative<msg::ResetPreview>(message)) {
            devlog::debug<preview::grp::preview>("{}: reset", m_metadata.label);
            m_history.Reset();
            m_performance.Reset();
        }
        return Task<Message>::None();
    }

    [[nodiscard]] Element<Message> View() const override {
        return Element<Message>{[this](const Element<Message>::Emit &emit) {
            m_performance.RecordView(
                [&] { m_view(m_params.GetValues()).Map(&MakeComponentMessage<TMessage>).Draw(emit); });
        }};
    }

    [[nodiscard]] usize MessageCount() const override {
        return m_history.Size();
    }

    [[nodiscard]] std::span<const std::string> VisibleMessages() const override {
        return m_history.VisibleTraces();
    }

    [[nodiscard]] std::span<const Param> Params() const override {
        return m_params.Params();
    }

    [[nodiscard]] const preview::Performance *GetPerformance() const override {
        return &m_performance;
    }

    [[nodiscard]] const Values &GetValues() const {
        return m_params.GetValues();
    }

private:
    preview::Metadata m_metadata;
    ParamSet<TParams> m_params;
    ViewFn m_view;
    preview::History<TMessage> m_history;
    preview::Performance m_performance;
};

/// @brief Creates a stateless preview whose view receives the extracted parameter values.
template <extractable_params TParams, typename TView>
auto CreateStateless(preview::Metadata metadata, TParams params, TView view) {
    using TValues = ParamValues<TParams>;
    using TMessage = typename std::invoke_result_t<TView &, const TValues &>::MessageType;
    return std::make_unique<Stateless<TParams, TMessage>>(std::move(metadata), std::move(params), std::move(view));
}

} // namespace vitrine::dynamic
