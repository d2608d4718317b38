#include <vitrine/registry/registry.hpp>

#include <vitrine/util/dev_log.hpp>

#include <utility>
#include <variant>

namespace vitrine::registry {

namespace grp {

    struct registry {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Registry";
    };

} // namespace grp

usize Registry::Add(std::unique_ptr<preview::Preview> preview) {
    const usize index = m_previews.size();
    devlog::debug<grp::registry>("Registered preview {} \"{}\"", index, preview->GetMetadata().label);
    m_previews.push_back(std::move(preview));
    if (!m_selected) {
        m_selected = index;
    }
    return index;
}

bool Registry::Select(usize index) {
    if (index >= m_previews.size()) {
        devlog::debug<grp::registry>("Ignoring selection of preview {} out of {}", index, m_previews.size());
        return false;
    }
    if (m_selected != index) {
        devlog::debug<grp::registry>("Selected preview {} \"{}\"", index, m_previews[index]->GetMetadata().label);
    }
    m_selected = index;
    return true;
}

preview::Preview *Registry::Current() {
    return m_selected ? m_previews[*m_selected].get() : nullptr;
}

const preview::Preview *Registry::Current() const {
    return m_selected ? m_previews[*m_selected].get() : nullptr;
}

Task<Message> Registry::Update(const Message &message) {
    if (const auto *select = std::get_if<msg::SelectPreview>(&message)) {
        Select(select->index);
        return Task<Message>::None();
    }
    if (std::holds_alternative<msg::Noop>(message)) {
        return Task<Message>::None();
    }

    preview::Preview *current = Current();
    if (current == nullptr) {
        devlog::debug<grp::registry>("No preview selected; dropping {}", DescribeMessage(message));
        return Task<Message>::None();
    }
    return current->Update(message);
}

std::vector<usize> Registry::Filter(std::string_view query) const {
    std::vector<usize> indices;
    for (usize i = 0; i < m_previews.size(); ++i) {
        if (m_previews[i]->GetMetadata().Matches(query)) {
            indices.push_back(i);
        }
    }
    return indices;
}

} // namespace vitrine::registry
