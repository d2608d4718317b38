#pragma once

/**
@file
@brief Defines `vitrine::dynamic::ParamSet`, the parameter bookkeeping shared by every dynamic preview.
*/

#include <vitrine/dynamic/extract_params.hpp>
#include <vitrine/dynamic/value.hpp>

#include <vitrine/util/dev_log.hpp>

#include <vitrine/core/types.hpp>

#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace vitrine::dynamic {

namespace grp {

    struct params {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Dynamic-Params";
    };

} // namespace grp

/// @brief Owns a parameter set along with its display list and extracted values.
///
/// The cached list and values are recomputed after every change, so they always reflect the adapters.
template <extractable_params TParams>
class ParamSet {
public:
    using Values = ParamValues<TParams>;

    explicit ParamSet(TParams params)
        : m_initial(params)
        , m_params(std::move(params))
        , m_cachedParams(ExtractParams<TParams>::ToParams(m_params))
        , m_cachedValues(ExtractParams<TParams>::Extract(m_params)) {}

    /// @brief Applies `value` to the parameter at `index`.
    ///
    /// Out of range indices and values whose kind does not match the parameter are ignored.
    ///
    /// @return `true` if the value was applied
    bool Change(usize index, const Value &value, std::string_view label) {
        if (index >= m_cachedParams.size()) {
            devlog::debug<grp::params>("{}: ignoring change of parameter {} out of {}", label, index,
                                       m_cachedParams.size());
            return false;
        }
        const Param &current = m_cachedParams[index];
        if (current.value.Kind() != value.Kind()) {
            devlog::debug<grp::params>("{}: ignoring {} for parameter \"{}\" of kind {}", label, value, current.name,
                                       ValueKindName(current.value.Kind()));
            return false;
        }

        ExtractParams<TParams>::UpdateAt(m_params, index, value);
        Refresh();
        devlog::debug<grp::params>("{}: parameter \"{}\" set to {}", label, m_cachedParams[index].name,
                                   m_cachedParams[index].value);
        return true;
    }

    /// @brief Restores the parameters the set was created with.
    void Reset(std::string_view label) {
        devlog::debug<grp::params>("{}: restoring initial parameters", label);
        m_params = m_initial;
        Refresh();
    }

    [[nodiscard]] std::span<const Param> Params() const {
        return m_cachedParams;
    }

    [[nodiscard]] const Values &GetValues() const {
        return m_cachedValues;
    }

    [[nodiscard]] const TParams &GetAdapters() const {
        return m_params;
    }

private:
    TParams m_initial;
    TParams m_params;
    std::vector<Param> m_cachedParams;
    Values m_cachedValues;

    void Refresh() {
        m_cachedParams = ExtractParams<TParams>::ToParams(m_params);
        m_cachedValues = ExtractParams<TParams>::Extract(m_params);
    }
};

} // namespace vitrine::dynamic
