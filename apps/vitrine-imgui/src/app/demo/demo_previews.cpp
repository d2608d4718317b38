#include "demo_previews.hpp"

#include <vitrine/vitrine.hpp>

#include <imgui.h>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace app::demo {

enum class CounterMessage { Increment, Decrement };

struct Adjust {
    sint32 amount;
};

struct ButtonPressed {
    std::string name;
};

struct QuoteMessage {
    enum class Kind { Fetch, Loaded };

    Kind kind;
    std::string text;
};

} // namespace app::demo

template <>
struct fmt::formatter<app::demo::CounterMessage> : fmt::formatter<std::string_view> {
    auto format(app::demo::CounterMessage message, format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(
            message == app::demo::CounterMessage::Increment ? "Increment" : "Decrement", ctx);
    }
};

template <>
struct fmt::formatter<app::demo::Adjust> : fmt::formatter<std::string_view> {
    auto format(const app::demo::Adjust &message, format_context &ctx) const {
        return fmt::format_to(ctx.out(), "Adjust({:+})", message.amount);
    }
};

template <>
struct fmt::formatter<app::demo::ButtonPressed> : fmt::formatter<std::string_view> {
    auto format(const app::demo::ButtonPressed &message, format_context &ctx) const {
        return fmt::format_to(ctx.out(), "ButtonPressed(\"{}\")", message.name);
    }
};

template <>
struct fmt::formatter<app::demo::QuoteMessage> : fmt::formatter<std::string_view> {
    auto format(const app::demo::QuoteMessage &message, format_context &ctx) const {
        if (message.kind == app::demo::QuoteMessage::Kind::Fetch) {
            return fmt::format_to(ctx.out(), "FetchQuote");
        }
        return fmt::format_to(ctx.out(), "QuoteLoaded(\"{}\")", message.text);
    }
};

using namespace vitrine;

namespace app::demo {

namespace {

    constexpr std::array<std::string_view, 4> kQuotes = {
        "Simplicity is prerequisite for reliability.",
        "Premature optimization is the root of all evil.",
        "Make it work, make it right, make it fast.",
        "There are only two hard things in computer science.",
    };

    auto MakeCounter() {
        return preview::CreateStateful(
            preview::Metadata("Counter")
                .Description("A number that goes up and down. Every click is recorded and can be rewound.")
                .Group("Basics")
                .Tags({"stateful", "time travel"}),
            [] { return 0; },
            [](int &count, CounterMessage message) {
                switch (message) {
                case CounterMessage::Increment: ++count; break;
                case CounterMessage::Decrement: --count; break;
                }
            },
            [](const int &count) {
                return Element<CounterMessage>{[count](const Element<CounterMessage>::Emit &emit) {
                    ImGui::Text("Count: %d", count);
                    if (ImGui::Button("Increment")) {
                        emit(CounterMessage::Increment);
                    }
                    ImGui::SameLine();
                    if (ImGui::Button("Decrement")) {
                        emit(CounterMessage::Decrement);
                    }
                }};
            });
    }

    auto MakeLabel() {
        return preview::CreateStateless(
            preview::Metadata("Label").Description("Static text without any interaction.").Group("Basics").Tags(
                {"stateless"}),
            [] {
                return Element<std::string>{[](const Element<std::string>::Emit &) {
                    ImGui::TextUnformatted("Hello from a stateless preview!");
                }};
            });
    }

    auto MakeButtons() {
        return preview::CreateStateless(
            preview::Metadata("Buttons")
                .Description("Buttons that emit messages. Stateless previews only log what they emit.")
                .Group("Basics")
                .Tags({"stateless", "messages"}),
            [] {
                return Element<ButtonPressed>{[](const Element<ButtonPressed>::Emit &emit) {
                    for (const char *name : {"Primary", "Secondary", "Danger"}) {
                        if (ImGui::Button(name)) {
                            emit(ButtonPressed{name});
                        }
                        ImGui::SameLine();
                    }
                    ImGui::NewLine();
                }};
            });
    }

    auto MakeQuoteFetcher() {
        struct State {
            usize fetches = 0;
            bool loading = false;
            std::optional<std::string> quote;
        };

        return preview::CreateStateful(
            preview::Metadata("Quote fetcher")
                .Description("Requests a quote through a task. The result arrives as a separate message.")
                .Group("Basics")
                .Tags({"stateful", "tasks"}),
            [] { return State{}; },
            [](State &state, const QuoteMessage &message) -> Task<QuoteMessage> {
                if (message.kind == QuoteMessage::Kind::Loaded) {
                    state.loading = false;
                    state.quote = message.text;
                    return Task<QuoteMessage>::None();
                }
                state.loading = true;
                const usize index = state.fetches++ % kQuotes.size();
                return Task<QuoteMessage>::Perform([index] {
                    return QuoteMessage{QuoteMessage::Kind::Loaded, std::string{kQuotes[index]}};
                });
            },
            [](const State &state) {
                return Element<QuoteMessage>{[&state](const Element<QuoteMessage>::Emit &emit) {
                    ImGui::BeginDisabled(state.loading);
                    if (ImGui::Button("Fetch quote")) {
                        emit(QuoteMessage{QuoteMessage::Kind::Fetch, {}});
                    }
                    ImGui::EndDisabled();
                    if (state.loading) {
                        ImGui::TextDisabled("Loading...");
                    } else if (state.quote) {
                        ImGui::TextWrapped("\"%s\"", state.quote->c_str());
                    } else {
                        ImGui::TextDisabled("No quote yet");
                    }
                }};
            });
    }

    auto MakeDynamicLabel() {
        return dynamic::CreateDynamic(dynamic::MakeText("Content", "Hello, Vitrine!"), [](const std::string &content) {
            return preview::CreateStatelessWith(
                preview::Metadata("Dynamic label")
                    .Description("A label whose text is edited from the Parameters tab.")
                    .Group("Parameters")
                    .Tags({"dynamic", "text"}),
                content, [](const std::string &text) {
                    return Element<std::string>{
                        [&text](const Element<std::string>::Emit &) { ImGui::TextUnformatted(text.c_str()); }};
                });
        });
    }

    auto MakeParameterShowcase() {
        auto params = std::tuple{
            dynamic::MakeText("Title", "Showcase"),
            dynamic::MakeNumber("Repeat", 3),
            dynamic::MakeBoolean("Bordered", true),
            dynamic::MakeSelect("Alignment", {"Left", "Center", "Right"}, "Left"),
            dynamic::MakeSlider("Scale", 0.5f, 3.0f, 1.0f),
            dynamic::MakeColor("Color", {.r = 0.40f, .g = 0.70f, .b = 1.00f, .a = 1.00f}),
        };
        using Values = dynamic::ParamValues<decltype(params)>;

        return dynamic::CreateStateless(
            preview::Metadata("Parameter showcase")
                .Description("Every parameter kind driving one view.")
                .Group("Parameters")
                .Tags({"dynamic", "text", "number", "boolean", "select", "slider", "color"}),
            std::move(params), [](const Values &values) {
                return Element<ButtonPressed>{[&values](const Element<ButtonPressed>::Emit &emit) {
                    const auto &[title, repeat, bordered, alignment, scale, color] = values;

                    const ImGuiChildFlags childFlags =
                        ImGuiChildFlags_AutoResizeY | (bordered ? ImGuiChildFlags_Borders : ImGuiChildFlags_None);
                    if (ImGui::BeginChild("##showcase", ImVec2(0.0f, 0.0f), childFlags)) {
                        ImGui::PushFont(nullptr, ImGui::GetStyle().FontSizeBase * scale);
                        const sint32 lines = std::clamp<sint32>(repeat, 0, 32);
                        for (sint32 i = 0; i < lines; ++i) {
                            const float width = ImGui::CalcTextSize(title.c_str()).x;
                            const float avail = ImGui::GetContentRegionAvail().x;
                            if (alignment == "Center") {
                                ImGui::SetCursorPosX(ImGui::GetCursorPosX() + std::max(0.0f, (avail - width) * 0.5f));
                            } else if (alignment == "Right") {
                                ImGui::SetCursorPosX(ImGui::GetCursorPosX() + std::max(0.0f, avail - width));
                            }
                            ImGui::TextColored(ImVec4(color.r, color.g, color.b, color.a), "%s", title.c_str());
                        }
                        ImGui::PopFont();

                        if (ImGui::Button("Press me")) {
                            emit(ButtonPressed{title});
                        }
                    }
                    ImGui::EndChild();
                }};
            });
    }

    auto MakeAdjustableCounter() {
        using Values = std::tuple<sint32, sint32>;

        return dynamic::CreateStateful(
            preview::Metadata("Adjustable counter")
                .Description("A counter whose start value and step are parameters. Changing them replays the "
                             "recorded messages from the new start value.")
                .Group("Parameters")
                .Tags({"dynamic", "stateful", "time travel"}),
            std::tuple{dynamic::MakeNumber("Start", 0), dynamic::MakeNumber("Step", 1)},
            [](const Values &values) { return std::get<0>(values); },
            [](sint32 &count, const Adjust &message) { count += message.amount; },
            [](const sint32 &count, const Values &values) {
                return Element<Adjust>{[count, step = std::get<1>(values)](const Element<Adjust>::Emit &emit) {
                    ImGui::Text("Count: %d", count);
                    if (ImGui::Button(fmt::format("Add {}", step).c_str())) {
                        emit(Adjust{step});
                    }
                    ImGui::SameLine();
                    if (ImGui::Button(fmt::format("Subtract {}", step).c_str())) {
                        emit(Adjust{-step});
                    }
                }};
            });
    }

} // namespace

void RegisterDemoPreviews(registry::Registry &registry) {
    registry.Add(MakeCounter());
    registry.Add(MakeLabel());
    registry.Add(MakeButtons());
    registry.Add(MakeQuoteFetcher());
    registry.Add(MakeDynamicLabel());
    registry.Add(MakeParameterShowcase());
    registry.Add(MakeAdjustableCounter());
}

} // namespace app::demo
