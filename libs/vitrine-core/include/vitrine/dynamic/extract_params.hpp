#pragma once

/**
@file
@brief Defines `vitrine::dynamic::ExtractParams`, which generalizes parameter handling over a single adapter or a tuple
of adapters.
*/

#include <vitrine/dynamic/param.hpp>
#include <vitrine/dynamic/value.hpp>

#include <vitrine/core/types.hpp>

#include <concepts>
#include <tuple>
#include <utility>
#include <vector>

namespace vitrine::dynamic {

/// @brief The largest number of adapters in a parameter tuple.
inline constexpr usize kMaxParamArity = 8;

/// @brief Lists, updates and extracts the values of a parameter set.
///
/// Specialized for single adapters and for `std::tuple`s of 2 to `kMaxParamArity` adapters. Parameters are indexed
/// in declaration order.
template <typename T>
struct ExtractParams;

template <dynamic_param T>
struct ExtractParams<T> {
    using Values = typename T::ValueType;

    static constexpr usize kArity = 1;

    static std::vector<Param> ToParams(const T &param) {
        return {param.ToParam()};
    }

    /// @brief Applies `value` to the adapter at `index`.
    /// @return `false` if `index` is out of range
    static bool UpdateAt(T &param, usize index, const Value &value) {
        if (index != 0) {
            return false;
        }
        param.Apply(value);
        return true;
    }

    static Values Extract(const T &param) {
        return param.GetValue();
    }
};

template <dynamic_param... Ts>
struct ExtractParams<std::tuple<Ts...>> {
    static_assert(sizeof...(Ts) >= 2, "use a single parameter instead of a one-element tuple");
    static_assert(sizeof...(Ts) <= kMaxParamArity, "parameter tuples hold at most 8 parameters");

    using Values = std::tuple<typename Ts::ValueType...>;

    static constexpr usize kArity = sizeof...(Ts);

    static std::vector<Param> ToParams(const std::tuple<Ts...> &params) {
        return std::apply([](const Ts &...param) { return std::vector<Param>{param.ToParam()...}; }, params);
    }

    /// @brief Applies `value` to the adapter at `index` only.
    /// @return `false` if `index` is out of range
    static bool UpdateAt(std::tuple<Ts...> &params, usize index, const Value &value) {
        return [&]<usize... Is>(std::index_sequence<Is...>) {
            return ((index == Is ? (std::get<Is>(params).Apply(value), true) : false) || ...);
        }(std::index_sequence_for<Ts...>{});
    }

    static Values Extract(const std::tuple<Ts...> &params) {
        return std::apply([](const Ts &...param) { return Values{param.GetValue()...}; }, params);
    }
};

template <typename T>
concept extractable_params =
    std::copy_constructible<T> && requires(T &params, const T &cparams, usize index, const Value &value) {
        typename ExtractParams<T>::Values;
        { ExtractParams<T>::kArity } -> std::convertible_to<usize>;
        { ExtractParams<T>::ToParams(cparams) } -> std::same_as<std::vector<Param>>;
        { ExtractParams<T>::UpdateAt(params, index, value) } -> std::same_as<bool>;
        { ExtractParams<T>::Extract(cparams) } -> std::same_as<typename ExtractParams<T>::Values>;
    };

/// @brief The typed values extracted from the parameter set `T`.
template <extractable_params T>
using ParamValues = typename ExtractParams<T>::Values;

} // namespace vitrine::dynamic
