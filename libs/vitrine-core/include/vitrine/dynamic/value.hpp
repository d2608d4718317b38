#pragma once

/**
@file
@brief Defines `vitrine::dynamic::Value` and `vitrine::dynamic::Param`, the display/edit form of adjustable parameters.
*/

#include <vitrine/core/types.hpp>

#include <fmt/format.h>

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace vitrine::dynamic {

/// @brief An RGBA color with each component in [0, 1].
struct Rgba {
    float32 r = 0.0f;
    float32 g = 0.0f;
    float32 b = 0.0f;
    float32 a = 1.0f;

    bool operator==(const Rgba &) const = default;
};

/// @brief A selection among a list of option labels.
struct SelectValue {
    usize selected = 0;
    std::vector<std::string> options;

    bool operator==(const SelectValue &) const = default;
};

/// @brief A number within an inclusive range.
struct SliderValue {
    float32 current = 0.0f;
    float32 min = 0.0f;
    float32 max = 1.0f;

    bool operator==(const SliderValue &) const = default;
};

enum class ValueKind : uint8 { Bool, Text, Int32, Select, Slider, Color };

/// @brief Returns a human-readable name for the value kind.
const char *ValueKindName(ValueKind kind);

/// @brief A closed tagged union of every adjustable parameter value.
///
/// Values carry no invariants of their own; the owning parameter adapter decides whether and how to apply one.
class Value {
public:
    static Value Bool(bool value);
    static Value Text(std::string value);
    static Value Int32(sint32 value);
    static Value Select(usize selected, std::vector<std::string> options = {});
    static Value Slider(float32 current, float32 min, float32 max);
    static Value Color(Rgba color);

    [[nodiscard]] ValueKind Kind() const {
        return static_cast<ValueKind>(m_storage.index());
    }

    /// @brief Retrieves the payload if it is of type `T`.
    ///
    /// Valid types are `bool`, `std::string`, `sint32`, `SelectValue`, `SliderValue` and `Rgba`.
    template <typename T>
    [[nodiscard]] const T *Get() const {
        return std::get_if<T>(&m_storage);
    }

    bool operator==(const Value &) const = default;

private:
    using Storage = std::variant<bool, std::string, sint32, SelectValue, SliderValue, Rgba>;

    explicit Value(Storage storage)
        : m_storage(std::move(storage)) {}

    Storage m_storage;
};

/// @brief A named parameter value as displayed and edited in the UI.
struct Param {
    std::string name;
    Value value;

    bool operator==(const Param &) const = default;
};

} // namespace vitrine::dynamic

template <>
struct fmt::formatter<vitrine::dynamic::Value> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const vitrine::dynamic::Value &value, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(Describe(value), ctx);
    }

    static std::string Describe(const vitrine::dynamic::Value &value);
};
