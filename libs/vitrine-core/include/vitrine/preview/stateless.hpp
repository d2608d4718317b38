#pragma once

/**
@file
@brief Defines `vitrine::preview::Stateless`, a preview of a pure view over fixed data.
*/

#include <vitrine/preview/history.hpp>
#include <vitrine/preview/metadata.hpp>
#include <vitrine/preview/performance.hpp>
#include <vitrine/preview/preview.hpp>

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

/// @brief A preview without state. The view is a pure function of the data it was created with.
///
/// Emitted messages are recorded for display only; they never change what is rendered, so the preview is always live
/// and has no timeline.
///
/// @tparam TData the data passed to the view function
/// @tparam TMessage the message type emitted by the view
template <typename TData, message_type TMessage>
class Stateless final : public Preview {
public:
    using ViewFn = std::function<Element<TMessage>(const TData &)>;

    Stateless(Metadata metadata, TData data, ViewFn view)
        : m_metadata(std::move(metadata))
        , m_data(std::move(data))
        , m_view(std::move(view)) {}

    [[nodiscard]] const Metadata &GetMetadata() const override {
        return m_metadata;
    }

    Task<Message> Update(const Message &message) override {
        if (const auto *component = std::get_if<msg::Component>(&message)) {
            if (const TMessage *typed = component->message.TryGet<TMessage>()) {
                m_history.Record(*typed);
            } else {
                devlog::debug<grp::preview>("{}: dropping message of foreign type {}", m_metadata.label,
                                            component->message.TypeName());
            }
        } else if (std::holds_alternative<msg::ResetPreview>(message)) {
            devlog::debug<grp::preview>("{}: reset", m_metadata.label);
            m_history.Reset();
            m_performance.Reset();
        }
        return Task<Message>::None();
    }

    [[nodiscard]] Element<Message> View() const override {
        return Element<Message>{[this](const Element<Message>::Emit &emit) {
            m_performance.RecordView([&] { m_view(m_data).Map(&MakeComponentMessage<TMessage>).Draw(emit); });
        }};
    }

    [[nodiscard]] usize MessageCount() const override {
        return m_history.Size();
    }

    [[nodiscard]] std::span<const std::string> VisibleMessages() const override {
        return m_history.VisibleTraces();
    }

    [[nodiscard]] const Performance *GetPerformance() const override {
        return &m_performance;
    }

    [[nodiscard]] const TData &GetData() const {
        return m_data;
    }

private:
    Metadata m_metadata;
    TData m_data;
    ViewFn m_view;
    History<TMessage> m_history;
    Performance m_performance;
};

/// @brief Creates a stateless preview from a view function taking no arguments.
///
/// The message type is deduced from the `Element` returned by `view`.
template <typename TView>
auto CreateStateless(Metadata metadata, TView view) {
    using TMessage = typename std::invoke_result_t<TView &>::MessageType;
    using TPreview = Stateless<std::monostate, TMessage>;
    return std::make_unique<TPreview>(std::move(metadata), std::monostate{},
                                      [view = std::move(view)](const std::monostate &) mutable { return view(); });
}

/// @brief Creates a stateless preview rendering `data` through `view`.
template <typename TData, typename TView>
auto CreateStatelessWith(Metadata metadata, TData data, TView view) {
    using TMessage = typename std::invoke_result_t<TView &, const TData &>::MessageType;
    using TPreview = Stateless<TData, TMessage>;
    return std::make_unique<TPreview>(std::move(metadata), std::move(data), std::move(view));
}

} // namespace vitrine::preview
