#pragma once

/**
@file
@brief Defines `vitrine::AnyMessage`, the type-erased envelope carrying one component message.
*/

#include <vitrine/core/types.hpp>

#include <fmt/format.h>

#include <concepts>
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace vitrine {

class AnyMessage;

/// @brief Requirements for component message types.
///
/// Messages must be copyable, since history replays them, and formattable with fmt, since the formatted text is the
/// trace shown to the user.
template <typename T>
concept message_type = std::copy_constructible<T> && fmt::is_formattable<T>::value;

/// @brief A clonable, printable box holding exactly one message of any `message_type`.
///
/// The original type can be recovered with `TryGet<T>()`, which returns `nullptr` on a type mismatch. No conversion
/// between types is ever attempted.
///
/// Copies clone the concrete payload. An envelope is only ever nested inside another through `Wrap`; copying an
/// envelope never adds a level.
class AnyMessage {
public:
    /// @brief Boxes the given message.
    template <typename T>
        requires(!std::same_as<std::remove_cvref_t<T>, AnyMessage>) && message_type<T>
    explicit AnyMessage(T value)
        : m_payload(std::make_unique<Payload<T>>(std::move(value))) {}

    AnyMessage(const AnyMessage &other)
        : m_payload(other.m_payload != nullptr ? other.m_payload->Clone() : nullptr) {}

    AnyMessage(AnyMessage &&other) noexcept = default;

    AnyMessage &operator=(const AnyMessage &other) {
        if (this != &other) {
            m_payload = other.m_payload != nullptr ? other.m_payload->Clone() : nullptr;
        }
        return *this;
    }

    AnyMessage &operator=(AnyMessage &&other) noexcept = default;

    /// @brief Creates an envelope whose payload is the given envelope.
    static AnyMessage Wrap(AnyMessage inner) {
        return AnyMessage{std::make_unique<Payload<AnyMessage>>(std::move(inner))};
    }

    /// @brief Recovers the payload as `T`.
    /// @return a pointer to the payload, or `nullptr` if the payload is not exactly a `T`
    template <typename T>
    [[nodiscard]] const T *TryGet() const {
        if (m_payload == nullptr || m_payload->Type() != typeid(T)) {
            return nullptr;
        }
        return &static_cast<const Payload<T> *>(m_payload.get())->value;
    }

    template <typename T>
    [[nodiscard]] bool Is() const {
        return TryGet<T>() != nullptr;
    }

    /// @brief Whether this envelope holds a payload. Only moved-from envelopes are empty.
    [[nodiscard]] bool HasValue() const {
        return m_payload != nullptr;
    }

    /// @brief The formatted payload.
    [[nodiscard]] std::string Debug() const {
        return m_payload != nullptr ? m_payload->Debug() : std::string{"<empty>"};
    }

    /// @brief The implementation-defined name of the payload type.
    [[nodiscard]] const char *TypeName() const {
        return m_payload != nullptr ? m_payload->Type().name() : "<empty>";
    }

    /// @brief Number of envelope levels down to the concrete payload. A plain message has depth 1.
    [[nodiscard]] usize Depth() const {
        return m_payload != nullptr ? m_payload->Depth() : 0;
    }

private:
    struct PayloadBase {
        virtual ~PayloadBase() = default;

        virtual std::unique_ptr<PayloadBase> Clone() const = 0;
        virtual const std::type_info &Type() const = 0;
        virtual std::string Debug() const = 0;
        virtual usize Depth() const = 0;
    };

    template <typename T>
    struct Payload final : PayloadBase {
        explicit Payload(T value)
            : value(std::move(value)) {}

        std::unique_ptr<PayloadBase> Clone() const override {
            if constexpr (std::same_as<T, AnyMessage>) {
                // Clone the nested envelope's concrete payload directly instead of boxing the envelope again.
                auto inner = value.m_payload != nullptr ? value.m_payload->Clone() : nullptr;
                return std::make_unique<Payload<AnyMessage>>(AnyMessage{std::move(inner)});
            } else {
                return std::make_unique<Payload<T>>(value);
            }
        }

        const std::type_info &Type() const override {
            return typeid(T);
        }

        std::string Debug() const override {
            if constexpr (std::same_as<T, AnyMessage>) {
                return value.Debug();
            } else {
                return fmt::format("{}", value);
            }
        }

        usize Depth() const override {
            if constexpr (std::same_as<T, AnyMessage>) {
                return 1 + value.Depth();
            } else {
                return 1;
            }
        }

        T value;
    };

    explicit AnyMessage(std::unique_ptr<PayloadBase> payload)
        : m_payload(std::move(payload)) {}

    std::unique_ptr<PayloadBase> m_payload;
};

} // namespace vitrine

template <>
struct fmt::formatter<vitrine::AnyMessage> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const vitrine::AnyMessage &message, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(message.Debug(), ctx);
    }
};
