#pragma once

/**
@file
@brief Defines the typed parameter adapters that back the parameters of dynamic previews.

Each adapter owns the typed source of truth for one parameter. It can be listed as a `Param` for display, updated from
a `Value` edited in the UI and read as a typed value.

Values of the wrong kind are ignored by `Apply`. Adapters never fail at runtime; constructing one with contradictory
arguments throws `std::invalid_argument`.
*/

#include <vitrine/dynamic/value.hpp>

#include <vitrine/core/types.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <concepts>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace vitrine::dynamic {

/// @brief Requirements of a single parameter adapter.
template <typename T>
concept dynamic_param = std::copy_constructible<T> && requires(T &param, const T &cparam, const Value &value) {
    typename T::ValueType;
    { cparam.Name() } -> std::convertible_to<std::string_view>;
    { cparam.ToParam() } -> std::same_as<Param>;
    { param.Apply(value) };
    { cparam.GetValue() } -> std::convertible_to<typename T::ValueType>;
};

// -----------------------------------------------------------------------------

class TextParam {
public:
    using ValueType = std::string;

    TextParam(std::string name, std::string value);

    [[nodiscard]] const std::string &Name() const {
        return m_name;
    }

    [[nodiscard]] Param ToParam() const;

    /// @brief Applies a `Text` value. Other kinds are ignored.
    void Apply(const Value &value);

    [[nodiscard]] const std::string &GetValue() const {
        return m_value;
    }

private:
    std::string m_name;
    std::string m_value;
};

class NumberParam {
public:
    using ValueType = sint32;

    NumberParam(std::string name, sint32 value);

    [[nodiscard]] const std::string &Name() const {
        return m_name;
    }

    [[nodiscard]] Param ToParam() const;

    /// @brief Applies an `Int32` value. Other kinds are ignored.
    void Apply(const Value &value);

    [[nodiscard]] sint32 GetValue() const {
        return m_value;
    }

private:
    std::string m_name;
    sint32 m_value;
};

class BoolParam {
public:
    using ValueType = bool;

    BoolParam(std::string name, bool value);

    [[nodiscard]] const std::string &Name() const {
        return m_name;
    }

    [[nodiscard]] Param ToParam() const;

    /// @brief Applies a `Bool` value. Other kinds are ignored.
    void Apply(const Value &value);

    [[nodiscard]] bool GetValue() const {
        return m_value;
    }

private:
    std::string m_name;
    bool m_value;
};

/// @brief A number constrained to an inclusive range.
///
/// The current value is clamped into the range on construction and on every update. The range itself is fixed; the
/// range carried by incoming values is ignored. NaN is not a position in the range: a NaN default starts at the minimum
/// and NaN updates are ignored.
class SliderParam {
public:
    using ValueType = float32;

    /// @throws std::invalid_argument if `min > max`
    SliderParam(std::string name, float32 min, float32 max, float32 value);

    [[nodiscard]] const std::string &Name() const {
        return m_name;
    }

    [[nodiscard]] Param ToParam() const;

    /// @brief Applies a `Slider` value, clamping it into range. Other kinds are ignored.
    void Apply(const Value &value);

    [[nodiscard]] float32 GetValue() const {
        return m_value;
    }

    [[nodiscard]] float32 Min() const {
        return m_min;
    }

    [[nodiscard]] float32 Max() const {
        return m_max;
    }

private:
    std::string m_name;
    float32 m_min;
    float32 m_max;
    float32 m_value;
};

/// @brief An RGBA color. Components are clamped into [0, 1].
class ColorParam {
public:
    using ValueType = Rgba;

    ColorParam(std::string name, Rgba value);

    [[nodiscard]] const std::string &Name() const {
        return m_name;
    }

    [[nodiscard]] Param ToParam() const;

    /// @brief Applies a `Color` value. Other kinds are ignored.
    void Apply(const Value &value);

    [[nodiscard]] Rgba GetValue() const {
        return m_value;
    }

private:
    std::string m_name;
    Rgba m_value;
};

/// @brief Clamps every component of the color into [0, 1]. NaN components become 0.
Rgba ClampColor(Rgba color);

/// @brief A choice among a fixed list of options.
///
/// Options are displayed by their fmt-formatted labels. Updates select by index; out of range indices are ignored,
/// as are the option labels carried by incoming values.
///
/// @tparam T the option type
template <typename T>
    requires std::copy_constructible<T> && std::equality_comparable<T> && fmt::is_formattable<T>::value
class SelectParam {
public:
    using ValueType = T;

    /// @throws std::invalid_argument if `value` is not among `options`
    SelectParam(std::string name, std::vector<T> options, const T &value)
        : m_name(std::move(name))
        , m_options(std::move(options)) {
        auto it = std::find(m_options.begin(), m_options.end(), value);
        if (it == m_options.end()) {
            throw std::invalid_argument(
                fmt::format("select parameter \"{}\": default value {} is not among the options", m_name, value));
        }
        m_selected = static_cast<usize>(std::distance(m_options.begin(), it));

        m_labels.reserve(m_options.size());
        for (const T &option : m_options) {
            m_labels.push_back(fmt::format("{}", option));
        }
    }

    [[nodiscard]] const std::string &Name() const {
        return m_name;
    }

    [[nodiscard]] Param ToParam() const {
        return Param{m_name, Value::Select(m_selected, m_labels)};
    }

    /// @brief Applies a `Select` value whose index is within range. Other values are ignored.
    void Apply(const Value &value) {
        if (const auto *select = value.Get<SelectValue>(); select != nullptr && select->selected < m_options.size()) {
            m_selected = select->selected;
        }
    }

    [[nodiscard]] const T &GetValue() const {
        return m_options[m_selected];
    }

    [[nodiscard]] usize SelectedIndex() const {
        return m_selected;
    }

    [[nodiscard]] const std::vector<T> &Options() const {
        return m_options;
    }

private:
    std::string m_name;
    std::vector<T> m_options;
    std::vector<std::string> m_labels;
    usize m_selected = 0;
};

// -----------------------------------------------------------------------------
// Factories

TextParam MakeText(std::string name, std::string value);
NumberParam MakeNumber(std::string name, sint32 value);
BoolParam MakeBoolean(std::string name, bool value);

/// @throws std::invalid_argument if `min > max`
SliderParam MakeSlider(std::string name, float32 min, float32 max, float32 value);

ColorParam MakeColor(std::string name, Rgba value);

/// @throws std::invalid_argument if `value` is not among `options`
template <typename T>
    requires(!std::is_pointer_v<T>)
SelectParam<T> MakeSelect(std::string name, std::vector<T> options, const std::type_identity_t<T> &value) {
    return SelectParam<T>{std::move(name), std::move(options), value};
}

/// @brief Creates a select parameter over strings.
/// @throws std::invalid_argument if `value` is not among `options`
SelectParam<std::string> MakeSelect(std::string name, std::vector<std::string> options, std::string value);

} // namespace vitrine::dynamic
