#pragma once

/**
@file
@brief Defines `vitrine::preview::Metadata`, the descriptive information attached to a preview.
*/

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vitrine::preview {

/// @brief Label, description, group and tags of a preview.
///
/// Setters can be chained:
///
/// ```cpp
/// Metadata("Counter").Description("Counts button presses").Group("Buttons").Tags({"counter", "stateful"})
/// ```
struct Metadata {
    Metadata() = default;

    Metadata(std::string label)
        : label(std::move(label)) {}

    Metadata(const char *label)
        : label(label) {}

    std::string label;
    std::optional<std::string> description;
    std::optional<std::string> group;
    std::vector<std::string> tags;

    Metadata &Description(std::string value) {
        description = std::move(value);
        return *this;
    }

    Metadata &Group(std::string value) {
        group = std::move(value);
        return *this;
    }

    Metadata &Tags(std::vector<std::string> values) {
        tags = std::move(values);
        return *this;
    }

    /// @brief Checks whether the search `query` matches this metadata.
    ///
    /// Matching is a case-insensitive substring search over the label, description, group and tags. An empty or
    /// whitespace-only query matches everything.
    [[nodiscard]] bool Matches(std::string_view query) const;

    bool operator==(const Metadata &) const = default;
};

} // namespace vitrine::preview
