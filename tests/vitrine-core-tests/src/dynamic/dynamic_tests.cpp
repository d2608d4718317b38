#include <catch2/catch_test_macros.hpp>

#include <vitrine/dynamic/dynamic.hpp>
#include <vitrine/dynamic/stateful.hpp>
#include <vitrine/dynamic/stateless.hpp>

#include <vitrine/preview/stateful.hpp>
#include <vitrine/preview/stateless.hpp>

#include <fmt/format.h>

#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace dynamic_preview {

struct Tick {
    int amount;
};

} // namespace dynamic_preview

template <>
struct fmt::formatter<dynamic_preview::Tick> : fmt::formatter<std::string_view> {
    auto format(const dynamic_preview::Tick &tick, format_context &ctx) const {
        return fmt::format_to(ctx.out(), "Tick({})", tick.amount);
    }
};

using namespace vitrine;

namespace dynamic_preview {

namespace {

    std::string FirstEmitted(const preview::Preview &preview) {
        const std::vector<Message> emitted = preview.View().Collect();
        REQUIRE(emitted.size() == 1);
        const auto *text = std::get<msg::Component>(emitted[0]).message.TryGet<std::string>();
        REQUIRE(text != nullptr);
        return *text;
    }

    Element<std::string> EmitText(std::string text) {
        return Element<std::string>{[text = std::move(text)](const Element<std::string>::Emit &emit) { emit(text); }};
    }

    auto MakeLabel() {
        return dynamic::CreateDynamic(dynamic::MakeText("Content", "Editable"), [](const std::string &content) {
            return preview::CreateStatelessWith(preview::Metadata("Label").Group("Text"), content, EmitText);
        });
    }

    auto MakeAdjustableCounter() {
        return dynamic::CreateStateful(
            "Adjustable counter", std::tuple{dynamic::MakeNumber("Start", 10), dynamic::MakeNumber("Step", 1)},
            [](const std::tuple<sint32, sint32> &values) { return std::get<0>(values); },
            [](int &count, const Tick &tick) { count += tick.amount; },
            [](const int &, const std::tuple<sint32, sint32> &values) {
                return Element<Tick>{
                    [step = std::get<1>(values)](const Element<Tick>::Emit &emit) { emit(Tick{step}); }};
            });
    }

} // namespace

TEST_CASE("Dynamic previews expose the inner preview", "[dynamic]") {
    auto preview = MakeLabel();
    CHECK(preview->GetMetadata().label == "Label");
    CHECK(preview->GetMetadata().group == "Text");
    REQUIRE(preview->Params().size() == 1);
    CHECK(preview->Params()[0] == dynamic::Param{"Content", dynamic::Value::Text("Editable")});
    CHECK(FirstEmitted(*preview) == "Editable");
}

TEST_CASE("Dynamic previews regenerate on parameter changes", "[dynamic]") {
    auto preview = MakeLabel();
    preview->Update(MakeComponentMessage(std::string{"clicked"}));
    REQUIRE(preview->MessageCount() == 1);

    CHECK(preview->Update(msg::ChangeParam{0, dynamic::Value::Text("Changed")}).IsNone());
    CHECK(preview->GetValues() == "Changed");
    CHECK(preview->Params()[0].value == dynamic::Value::Text("Changed"));
    CHECK(FirstEmitted(*preview) == "Changed");
    CHECK(preview->MessageCount() == 0);
}

TEST_CASE("Dynamic previews ignore mismatched parameter values", "[dynamic]") {
    auto preview = MakeLabel();
    preview->Update(MakeComponentMessage(std::string{"clicked"}));

    preview->Update(msg::ChangeParam{0, dynamic::Value::Int32(3)});
    preview->Update(msg::ChangeParam{4, dynamic::Value::Text("Out of range")});
    CHECK(preview->GetValues() == "Editable");
    CHECK(preview->MessageCount() == 1);
}

TEST_CASE("Dynamic previews restore initial parameters", "[dynamic]") {
    auto preview = MakeLabel();
    preview->Update(msg::ChangeParam{0, dynamic::Value::Text("Changed")});
    preview->Update(msg::ResetParams{});
    CHECK(preview->GetValues() == "Editable");
    CHECK(FirstEmitted(*preview) == "Editable");
}

TEST_CASE("Dynamic previews forward other messages", "[dynamic]") {
    auto preview = dynamic::CreateDynamic(dynamic::MakeNumber("Start", 3), [](sint32 start) {
        return preview::CreateStateful(
            "Counter", [start] { return start; }, [](int &count, const Tick &tick) { count += tick.amount; },
            [](const int &) { return Element<Tick>{}; });
    });

    preview->Update(MakeComponentMessage(Tick{2}));
    preview->Update(MakeComponentMessage(Tick{5}));
    REQUIRE(preview->GetTimeline() == preview::Timeline{2, 2});

    preview->Update(msg::TimeTravel{1});
    CHECK(preview->GetTimeline() == preview::Timeline{1, 2});
    CHECK(preview->VisibleMessages().size() == 1);
    REQUIRE(preview->GetPerformance() != nullptr);
    CHECK(preview->GetPerformance()->UpdateCount() == 2);
}

TEST_CASE("Dynamic stateless previews render current values", "[dynamic][stateless]") {
    auto preview = dynamic::CreateStateless(
        preview::Metadata("Greeting").Tags({"text"}),
        std::tuple{dynamic::MakeText("Name", "World"), dynamic::MakeBoolean("Shout", false)},
        [](const std::tuple<std::string, bool> &values) {
            const auto &[name, shout] = values;
            return EmitText(fmt::format("Hello, {}{}", name, shout ? "!" : "."));
        });

    CHECK(FirstEmitted(*preview) == "Hello, World.");
    REQUIRE(preview->Params().size() == 2);

    preview->Update(msg::ChangeParam{1, dynamic::Value::Bool(true)});
    preview->Update(msg::ChangeParam{0, dynamic::Value::Text("Vitrine")});
    CHECK(FirstEmitted(*preview) == "Hello, Vitrine!");

    preview->Update(MakeComponentMessage(std::string{"hover"}));
    CHECK(preview->MessageCount() == 1);
    CHECK_FALSE(preview->GetTimeline().has_value());

    preview->Update(msg::ResetParams{});
    CHECK(FirstEmitted(*preview) == "Hello, World.");
    CHECK(preview->MessageCount() == 1);
}

TEST_CASE("Dynamic stateful previews boot from parameters", "[dynamic][stateful]") {
    auto preview = MakeAdjustableCounter();
    CHECK(preview->GetState() == 10);

    for (const Message &message : preview->View().Collect()) {
        preview->Update(message);
    }
    CHECK(preview->GetState() == 11);

    preview->Update(msg::ChangeParam{1, dynamic::Value::Int32(5)});
    CHECK(preview->GetState() == 11);
    for (const Message &message : preview->View().Collect()) {
        preview->Update(message);
    }
    CHECK(preview->GetState() == 16);
    CHECK(preview->MessageCount() == 2);
}

TEST_CASE("Dynamic stateful previews replay history after parameter changes", "[dynamic][stateful]") {
    auto preview = MakeAdjustableCounter();
    preview->Update(MakeComponentMessage(Tick{1}));
    preview->Update(MakeComponentMessage(Tick{2}));
    preview->Update(MakeComponentMessage(Tick{3}));
    REQUIRE(preview->GetState() == 16);

    preview->Update(msg::ChangeParam{0, dynamic::Value::Int32(100)});
    CHECK(preview->GetState() == 106);
    CHECK(preview->MessageCount() == 3);

    preview->Update(msg::TimeTravel{1});
    CHECK(preview->GetState() == 101);

    preview->Update(msg::ChangeParam{0, dynamic::Value::Int32(0)});
    CHECK(preview->GetState() == 1);
    CHECK(preview->GetTimeline() == preview::Timeline{1, 3});

    preview->Update(msg::JumpToPresent{});
    CHECK(preview->GetState() == 6);
}

TEST_CASE("Dynamic stateful previews keep parameters across resets", "[dynamic][stateful]") {
    auto preview = MakeAdjustableCounter();
    preview->Update(msg::ChangeParam{0, dynamic::Value::Int32(50)});
    preview->Update(MakeComponentMessage(Tick{1}));
    REQUIRE(preview->GetState() == 51);

    preview->Update(msg::ResetPreview{});
    CHECK(preview->GetState() == 50);
    CHECK(preview->MessageCount() == 0);
    CHECK(std::get<0>(preview->GetValues()) == 50);

    preview->Update(MakeComponentMessage(Tick{1}));
    preview->Update(msg::ResetParams{});
    CHECK(preview->GetState() == 11);
    CHECK(preview->MessageCount() == 1);
    CHECK(std::get<0>(preview->GetValues()) == 10);
}

} // namespace dynamic_preview
