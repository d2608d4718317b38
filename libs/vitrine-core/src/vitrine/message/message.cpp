#include <vitrine/message/message.hpp>

#include <charconv>

namespace vitrine {

namespace {

    template <typename... Ts>
    struct Overloaded : Ts... {
        using Ts::operator()...;
    };

    std::string_view TrimWhitespace(std::string_view text) {
        constexpr std::string_view kWhitespace = " \t\r\n";
        const auto begin = text.find_first_not_of(kWhitespace);
        if (begin == std::string_view::npos) {
            return {};
        }
        const auto end = text.find_last_not_of(kWhitespace);
        return text.substr(begin, end - begin + 1);
    }

} // namespace

Message ParseNumberInput(usize index, std::string_view text) {
    text = TrimWhitespace(text);
    if (text.empty()) {
        return msg::Noop{};
    }
    // from_chars rejects a leading '+'
    if (text.size() > 1 && text[0] == '+' && text[1] >= '0' && text[1] <= '9') {
        text.remove_prefix(1);
    }

    sint32 number = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return msg::Noop{};
    }
    return msg::ChangeParam{index, dynamic::Value::Int32(number)};
}

std::string DescribeMessage(const Message &message) {
    return std::visit(
        Overloaded{
            [](const msg::Noop &) -> std::string { return "Noop"; },
            [](const msg::SelectPreview &m) -> std::string { return fmt::format("SelectPreview({})", m.index); },
            [](const msg::ResetPreview &) -> std::string { return "ResetPreview"; },
            [](const msg::ChangeParam &m) -> std::string {
                return fmt::format("ChangeParam({}, {})", m.index, m.value);
            },
            [](const msg::ResetParams &) -> std::string { return "ResetParams"; },
            [](const msg::TimeTravel &m) -> std::string { return fmt::format("TimeTravel({})", m.position); },
            [](const msg::JumpToPresent &) -> std::string { return "JumpToPresent"; },
            [](const msg::Component &m) -> std::string { return fmt::format("Component({})", m.message); },
        },
        message);
}

} // namespace vitrine
