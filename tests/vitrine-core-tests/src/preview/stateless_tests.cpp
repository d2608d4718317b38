#include <catch2/catch_test_macros.hpp>

#include <vitrine/preview/stateless.hpp>

#include <string>
#include <variant>
#include <vector>

using namespace vitrine;
using namespace vitrine::preview;

namespace preview_stateless {

namespace {

    auto MakeButton() {
        return CreateStateless(Metadata("Button").Group("Buttons"), [] {
            return Element<std::string>{[](const Element<std::string>::Emit &emit) { emit("pressed"); }};
        });
    }

} // namespace

TEST_CASE("Stateless previews render their view", "[preview][stateless]") {
    auto preview = MakeButton();
    CHECK(preview->GetMetadata().label == "Button");
    CHECK(preview->GetMetadata().group == "Buttons");

    const std::vector<Message> emitted = preview->View().Collect();
    REQUIRE(emitted.size() == 1);
    const auto *component = std::get_if<msg::Component>(&emitted[0]);
    REQUIRE(component != nullptr);
    REQUIRE(component->message.TryGet<std::string>() != nullptr);
    CHECK(*component->message.TryGet<std::string>() == "pressed");
}

TEST_CASE("Stateless previews record messages for display only", "[preview][stateless]") {
    auto preview = MakeButton();
    for (const Message &message : preview->View().Collect()) {
        CHECK(preview->Update(message).IsNone());
    }
    preview->Update(MakeComponentMessage(42));

    CHECK(preview->MessageCount() == 1);
    REQUIRE(preview->VisibleMessages().size() == 1);
    CHECK(preview->VisibleMessages()[0] == "pressed");
    CHECK_FALSE(preview->GetTimeline().has_value());
    CHECK(preview->Params().empty());
}

TEST_CASE("Stateless previews ignore time travel", "[preview][stateless]") {
    auto preview = MakeButton();
    preview->Update(MakeComponentMessage(std::string{"pressed"}));
    preview->Update(msg::TimeTravel{0});
    CHECK(preview->VisibleMessages().size() == 1);
}

TEST_CASE("Stateless previews reset their history and samples", "[preview][stateless]") {
    auto preview = MakeButton();
    preview->Update(MakeComponentMessage(std::string{"pressed"}));
    preview->View().Collect();
    REQUIRE(preview->GetPerformance() != nullptr);
    CHECK(preview->GetPerformance()->ViewCount() == 1);
    CHECK(preview->GetPerformance()->UpdateCount() == 0);

    preview->Update(msg::ResetPreview{});
    CHECK(preview->MessageCount() == 0);
    CHECK(preview->GetPerformance()->ViewCount() == 0);
}

TEST_CASE("Stateless previews render the data they were created with", "[preview][stateless]") {
    auto preview = CreateStatelessWith("Label", std::string{"Hello"}, [](const std::string &text) {
        return Element<std::string>{[text](const Element<std::string>::Emit &emit) { emit(text + "!"); }};
    });
    CHECK(preview->GetData() == "Hello");

    const std::vector<Message> emitted = preview->View().Collect();
    REQUIRE(emitted.size() == 1);
    CHECK(*std::get<msg::Component>(emitted[0]).message.TryGet<std::string>() == "Hello!");
}

} // namespace preview_stateless
