#include <vitrine/preview/metadata.hpp>

#include <algorithm>
#include <cctype>

namespace vitrine::preview {

namespace {

    std::string ToLower(std::string_view text) {
        std::string result{text};
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        return result;
    }

    std::string_view Trim(std::string_view text) {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
            text.remove_prefix(1);
        }
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
            text.remove_suffix(1);
        }
        return text;
    }

    bool Contains(std::string_view haystack, std::string_view loweredNeedle) {
        return ToLower(haystack).find(loweredNeedle) != std::string::npos;
    }

} // namespace

bool Metadata::Matches(std::string_view query) const {
    const std::string needle = ToLower(Trim(query));
    if (needle.empty()) {
        return true;
    }

    if (Contains(label, needle)) {
        return true;
    }
    if (description && Contains(*description, needle)) {
        return true;
    }
    if (group && Contains(*group, needle)) {
        return true;
    }
    return std::any_of(tags.begin(), tags.end(), [&](const std::string &tag) { return Contains(tag, needle); });
}

} // namespace vitrine::preview
