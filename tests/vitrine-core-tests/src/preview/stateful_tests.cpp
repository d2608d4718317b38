#include <catch2/catch_test_macros.hpp>

#include <vitrine/preview/stateful.hpp>

#include <fmt/format.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace preview_stateful {

struct Step {
    int delta;
};

struct Counter {
    int value = 0;
    std::vector<int> seen;
};

} // namespace preview_stateful

template <>
struct fmt::formatter<preview_stateful::Step> : fmt::formatter<std::string_view> {
    auto format(const preview_stateful::Step &step, format_context &ctx) const {
        return fmt::format_to(ctx.out(), "Step({})", step.delta);
    }
};

using namespace vitrine;
using namespace vitrine::preview;

namespace preview_stateful {

namespace {

    Element<Step> ViewCounter(const Counter &counter) {
        return Element<Step>{[value = counter.value](const Element<Step>::Emit &emit) { emit(Step{value + 1}); }};
    }

    auto MakeCounter() {
        return CreateStateful(
            "Counter", [] { return Counter{}; },
            [](Counter &counter, const Step &step) {
                counter.value += step.delta;
                counter.seen.push_back(step.delta);
            },
            ViewCounter);
    }

    Message Send(int delta) {
        return MakeComponentMessage(Step{delta});
    }

} // namespace

TEST_CASE("Stateful previews apply component messages", "[preview][stateful]") {
    auto preview = MakeCounter();
    CHECK(preview->GetMetadata().label == "Counter");

    preview->Update(Send(2));
    preview->Update(Send(3));

    CHECK(preview->GetState().value == 5);
    CHECK(preview->MessageCount() == 2);
    REQUIRE(preview->VisibleMessages().size() == 2);
    CHECK(preview->VisibleMessages()[0] == "Step(2)");
    CHECK(preview->VisibleMessages()[1] == "Step(3)");
    CHECK(preview->GetTimeline() == Timeline{2, 2});
    CHECK(preview->Params().empty());
}

TEST_CASE("Stateful previews wrap messages emitted by the view", "[preview][stateful]") {
    auto preview = MakeCounter();
    const std::vector<Message> emitted = preview->View().Collect();
    REQUIRE(emitted.size() == 1);

    const auto *component = std::get_if<msg::Component>(&emitted[0]);
    REQUIRE(component != nullptr);
    REQUIRE(component->message.TryGet<Step>() != nullptr);
    CHECK(component->message.TryGet<Step>()->delta == 1);

    preview->Update(emitted[0]);
    CHECK(preview->GetState().value == 1);
}

TEST_CASE("Stateful previews drop messages of foreign types", "[preview][stateful]") {
    auto preview = MakeCounter();
    const Task<Message> task = preview->Update(MakeComponentMessage(std::string{"stray"}));
    CHECK(task.IsNone());
    CHECK(preview->MessageCount() == 0);
    CHECK(preview->GetState().value == 0);
}

TEST_CASE("Stateful previews replay history when travelling in time", "[preview][stateful][time-travel]") {
    auto preview = MakeCounter();
    preview->Update(Send(1));
    preview->Update(Send(2));
    preview->Update(Send(3));
    const Counter before = preview->GetState();
    REQUIRE(before.value == 6);

    preview->Update(msg::TimeTravel{1});
    CHECK(preview->GetState().value == 1);
    CHECK(preview->GetState().seen == std::vector<int>{1});
    CHECK(preview->GetTimeline() == Timeline{1, 3});
    CHECK(preview->VisibleMessages().size() == 1);
    CHECK(preview->MessageCount() == 3);

    preview->Update(msg::TimeTravel{0});
    CHECK(preview->GetState().value == 0);
    CHECK(preview->VisibleMessages().empty());

    preview->Update(msg::JumpToPresent{});
    CHECK(preview->GetState().value == before.value);
    CHECK(preview->GetState().seen == before.seen);
    CHECK(preview->GetTimeline() == Timeline{3, 3});
}

TEST_CASE("Stateful previews ignore messages while historical", "[preview][stateful][time-travel]") {
    auto preview = MakeCounter();
    preview->Update(Send(1));
    preview->Update(Send(2));
    preview->Update(msg::TimeTravel{1});

    const Task<Message> task = preview->Update(Send(10));
    CHECK(task.IsNone());
    CHECK(preview->MessageCount() == 2);
    CHECK(preview->GetState().value == 1);
    CHECK(preview->GetTimeline() == Timeline{1, 2});
}

TEST_CASE("Stateful previews ignore out of range time travel", "[preview][stateful][time-travel]") {
    auto preview = MakeCounter();
    preview->Update(Send(4));
    preview->Update(msg::TimeTravel{5});
    CHECK(preview->GetTimeline() == Timeline{1, 1});
    CHECK(preview->GetState().value == 4);
}

TEST_CASE("Stateful previews reset state, history and performance", "[preview][stateful]") {
    auto preview = MakeCounter();
    preview->Update(Send(4));
    preview->View().Collect();
    REQUIRE(preview->GetPerformance() != nullptr);
    REQUIRE(preview->GetPerformance()->UpdateCount() == 1);

    preview->Update(msg::ResetPreview{});
    CHECK(preview->GetState().value == 0);
    CHECK(preview->MessageCount() == 0);
    CHECK(preview->GetPerformance()->UpdateCount() == 0);
    CHECK(preview->GetPerformance()->ViewCount() == 0);
}

TEST_CASE("Stateful previews time live updates only", "[preview][stateful][performance]") {
    auto preview = MakeCounter();
    preview->Update(Send(1));
    preview->Update(Send(2));
    preview->Update(msg::TimeTravel{0});
    preview->Update(msg::JumpToPresent{});
    preview->View().Collect();

    const Performance *performance = preview->GetPerformance();
    REQUIRE(performance != nullptr);
    CHECK(performance->UpdateCount() == 2);
    CHECK(performance->ViewCount() == 1);
}

TEST_CASE("Stateful previews map update tasks into component messages", "[preview][stateful][task]") {
    int taskRuns = 0;
    auto preview = CreateStateful(
        "Echo", [] { return 0; },
        [&](int &total, const Step &step) -> Task<Step> {
            total += step.delta;
            if (step.delta > 1) {
                return Task<Step>::Perform([&taskRuns, delta = step.delta] {
                    ++taskRuns;
                    return Step{delta - 1};
                });
            }
            return Task<Step>::None();
        },
        [](const int &) { return Element<Step>{}; });

    const Task<Message> task = preview->Update(Send(3));
    const std::vector<Message> produced = task.Run();
    REQUIRE(produced.size() == 1);
    CHECK(taskRuns == 1);

    const auto *component = std::get_if<msg::Component>(&produced[0]);
    REQUIRE(component != nullptr);
    REQUIRE(component->message.TryGet<Step>() != nullptr);
    CHECK(component->message.TryGet<Step>()->delta == 2);

    // Replay folds the state without returning or running any task
    CHECK(preview->Update(msg::TimeTravel{0}).IsNone());
    CHECK(preview->Update(msg::JumpToPresent{}).IsNone());
    CHECK(taskRuns == 1);
    CHECK(preview->GetState() == 3);
}

TEST_CASE("Stateful update functions may return a message", "[preview][stateful][task]") {
    auto preview = CreateStateful(
        "Bounce", [] { return 0; },
        [](int &total, const Step &step) -> std::optional<Step> {
            total += step.delta;
            if (step.delta != 0) {
                return Step{0};
            }
            return std::nullopt;
        },
        [](const int &) { return Element<Step>{}; });

    CHECK(preview->Update(Send(1)).Run().size() == 1);
    CHECK(preview->Update(Send(0)).IsNone());
}

} // namespace preview_stateful
