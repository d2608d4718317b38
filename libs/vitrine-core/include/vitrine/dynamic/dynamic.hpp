#pragma once

/**
@file
@brief Defines `vitrine::dynamic::Dynamic`, a preview regenerated from adjustable parameters.
*/

#include <vitrine/dynamic/extract_params.hpp>
#include <vitrine/dynamic/param_set.hpp>

#include <vitrine/preview/preview.hpp>

#include <vitrine/message/message.hpp>

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace vitrine::dynamic {

/// @brief Wraps any preview generated from a parameter set.
///
/// Parameter changes regenerate the inner preview from scratch, discarding its state and history. Every other message
/// is forwarded to the inner preview.
///
/// @tparam TParams the parameter set, a single adapter or a tuple of adapters
template <extractable_params TParams>
class Dynamic final : public preview::Preview {
public:
    using Values = ParamValues<TParams>;
    using GenerateFn = std::function<std::unique_ptr<preview::Preview>(const Values &)>;

    Dynamic(TParams params, GenerateFn generate)
        : m_params(std::move(params))
        , m_generate(std::move(generate))
        , m_preview(m_generate(m_params.GetValues())) {}

    [[nodiscard]] const preview::Metadata &GetMetadata() const override {
        return m_preview->GetMetadata();
    }

    Task<Message> Update(const Message &message) override {
        if (const auto *change = std::get_if<msg::ChangeParam>(&message)) {
            const std::string label = m_preview->GetMetadata().label;
            if (m_params.Change(change->index, change->value, label)) {
                Regenerate();
            }
            return Task<Message>::None();
        }
        if (std::holds_alternative<msg::ResetParams>(message)) {
            const std::string label = m_preview->GetMetadata().label;
            m_params.Reset(label);
            Regenerate();
            return Task<Message>::None();
        }
        return m_preview->Update(message);
    }

    [[nodiscard]] Element<Message> View() const override {
        return m_preview->View();
    }

    [[nodiscard]] usize MessageCount() const override {
        return m_preview->MessageCount();
    }

    [[nodiscard]] std::span<const std::string> VisibleMessages() const override {
        return m_preview->VisibleMessages();
    }

    [[nodiscard]] std::optional<preview::Timeline> GetTimeline() const override {
        return m_preview->GetTimeline();
    }

    [[nodiscard]] std::span<const Param> Params() const override {
        return m_params.Params();
    }

    [[nodiscard]] const preview::Performance *GetPerformance() const override {
        return m_preview->GetPerformance();
    }

    [[nodiscard]] const Values &GetValues() const {
        return m_params.GetValues();
    }

    [[nodiscard]] const preview::Preview &Inner() const {
        return *m_preview;
    }

private:
    ParamSet<TParams> m_params;
    GenerateFn m_generate;
    std::unique_ptr<preview::Preview> m_preview;

    void Regenerate() {
        m_preview = m_generate(m_params.GetValues());
    }
};

/// @brief Creates a dynamic preview.
///
/// `generate` receives the extracted parameter values and returns the preview to display, typically created with
/// `preview::CreateStateless` or `preview::CreateStateful`.
template <extractable_params TParams, typename TGenerate>
auto CreateDynamic(TParams params, TGenerate generate) {
    using TValues = ParamValues<TParams>;
    return std::make_unique<Dynamic<TParams>>(
        std::move(params), [generate = std::move(generate)](const TValues &values) mutable {
            return std::unique_ptr<preview::Preview>{generate(values)};
        });
}

} // namespace vitrine::dynamic
