#include <catch2/catch_test_macros.hpp>

#include <vitrine/message/message.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

using namespace vitrine;

namespace message {

namespace {

    // Returns the parsed number, or nothing if the input produced a no-op
    std::optional<sint32> Parse(std::string_view text, usize index = 0) {
        const Message result = ParseNumberInput(index, text);
        if (std::holds_alternative<msg::Noop>(result)) {
            return std::nullopt;
        }
        const auto &change = std::get<msg::ChangeParam>(result);
        REQUIRE(change.index == index);
        REQUIRE(change.value.Kind() == dynamic::ValueKind::Int32);
        return *change.value.Get<sint32>();
    }

} // namespace

TEST_CASE("ParseNumberInput accepts base-10 integers", "[message][number-input]") {
    CHECK(Parse("42") == 42);
    CHECK(Parse("-7") == -7);
    CHECK(Parse("+5") == 5);
    CHECK(Parse("0") == 0);
    CHECK(Parse("  123\t") == 123);
    CHECK(Parse("2147483647") == 2147483647);
    CHECK(Parse("-2147483648") == -2147483647 - 1);
    CHECK(Parse("8", 3) == 8);
}

TEST_CASE("ParseNumberInput maps malformed input to a no-op", "[message][number-input]") {
    CHECK_FALSE(Parse("").has_value());
    CHECK_FALSE(Parse("   ").has_value());
    CHECK_FALSE(Parse("abc").has_value());
    CHECK_FALSE(Parse("12abc").has_value());
    CHECK_FALSE(Parse("1.5").has_value());
    CHECK_FALSE(Parse("+").has_value());
    CHECK_FALSE(Parse("-").has_value());
    CHECK_FALSE(Parse("+-5").has_value());
    CHECK_FALSE(Parse("1 2").has_value());
    CHECK_FALSE(Parse("2147483648").has_value());
    CHECK_FALSE(Parse("-2147483649").has_value());
}

TEST_CASE("DescribeMessage names every message", "[message][describe]") {
    CHECK(DescribeMessage(msg::Noop{}) == "Noop");
    CHECK(DescribeMessage(msg::SelectPreview{2}) == "SelectPreview(2)");
    CHECK(DescribeMessage(msg::ResetPreview{}) == "ResetPreview");
    CHECK(DescribeMessage(msg::ChangeParam{1, dynamic::Value::Int32(9)}) == "ChangeParam(1, Int32(9))");
    CHECK(DescribeMessage(msg::ResetParams{}) == "ResetParams");
    CHECK(DescribeMessage(msg::TimeTravel{4}) == "TimeTravel(4)");
    CHECK(DescribeMessage(msg::JumpToPresent{}) == "JumpToPresent");
    CHECK(DescribeMessage(MakeComponentMessage(std::string{"clicked"})) == "Component(clicked)");
}

TEST_CASE("MakeComponentMessage wraps into a component envelope", "[message]") {
    const Message message = MakeComponentMessage(17);
    const auto *component = std::get_if<msg::Component>(&message);
    REQUIRE(component != nullptr);
    REQUIRE(component->message.TryGet<int>() != nullptr);
    CHECK(*component->message.TryGet<int>() == 17);
}

} // namespace message
