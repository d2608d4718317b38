#pragma once

/**
@file
@brief Defines `vitrine::registry::Registry`, the collection of previews displayed by the host.
*/

#include <vitrine/preview/preview.hpp>

#include <vitrine/message/message.hpp>
#include <vitrine/runtime/task.hpp>

#include <vitrine/core/types.hpp>

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace vitrine::registry {

/// @brief Holds every registered preview and routes messages to the selected one.
///
/// The first preview added becomes selected. The selection only changes through `Select` or a
/// `msg::SelectPreview` message; out of range selections are ignored.
class Registry {
public:
    /// @brief Registers a preview.
    /// @return the index of the new preview
    usize Add(std::unique_ptr<preview::Preview> preview);

    /// @brief Selects the preview at `index`.
    /// @return `false` if `index` is out of range, in which case the selection is unchanged
    bool Select(usize index);

    [[nodiscard]] std::optional<usize> SelectedIndex() const {
        return m_selected;
    }

    /// @brief The selected preview, or `nullptr` if the registry is empty.
    [[nodiscard]] preview::Preview *Current();
    [[nodiscard]] const preview::Preview *Current() const;

    /// @brief Handles selection and no-op messages and forwards every other message to the selected preview.
    Task<Message> Update(const Message &message);

    /// @brief Lists the indices of previews whose metadata matches `query`, in registration order.
    [[nodiscard]] std::vector<usize> Filter(std::string_view query) const;

    [[nodiscard]] usize Size() const {
        return m_previews.size();
    }

    [[nodiscard]] bool IsEmpty() const {
        return m_previews.empty();
    }

    [[nodiscard]] preview::Preview &At(usize index) {
        return *m_previews.at(index);
    }

    [[nodiscard]] const preview::Preview &At(usize index) const {
        return *m_previews.at(index);
    }

private:
    std::vector<std::unique_ptr<preview::Preview>> m_previews;
    std::optional<usize> m_selected;
};

} // namespace vitrine::registry
