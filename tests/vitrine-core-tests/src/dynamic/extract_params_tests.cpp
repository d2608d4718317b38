#include <catch2/catch_test_macros.hpp>

#include <vitrine/dynamic/extract_params.hpp>

#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

using namespace vitrine;
using namespace vitrine::dynamic;

namespace extract_params {

TEST_CASE("Single parameters extract their typed value", "[params][extract]") {
    using Extractor = ExtractParams<NumberParam>;
    STATIC_REQUIRE(Extractor::kArity == 1);
    STATIC_REQUIRE(std::is_same_v<ParamValues<NumberParam>, sint32>);

    NumberParam param = MakeNumber("Count", 5);
    CHECK(Extractor::ToParams(param).size() == 1);

    CHECK(Extractor::UpdateAt(param, 0, Value::Text("x")));
    CHECK(Extractor::Extract(param) == 5);

    CHECK(Extractor::UpdateAt(param, 0, Value::Int32(9)));
    CHECK(Extractor::Extract(param) == 9);

    CHECK_FALSE(Extractor::UpdateAt(param, 1, Value::Int32(1)));
    CHECK(Extractor::Extract(param) == 9);
}

TEST_CASE("Parameter tuples list parameters in declaration order", "[params][extract]") {
    using Params = std::tuple<TextParam, NumberParam, BoolParam>;
    using Extractor = ExtractParams<Params>;
    STATIC_REQUIRE(Extractor::kArity == 3);
    STATIC_REQUIRE(std::is_same_v<ParamValues<Params>, std::tuple<std::string, sint32, bool>>);

    const Params params{MakeText("Label", "hi"), MakeNumber("Count", 2), MakeBoolean("Enabled", false)};
    const auto list = Extractor::ToParams(params);
    REQUIRE(list.size() == 3);
    CHECK(list[0].name == "Label");
    CHECK(list[1].name == "Count");
    CHECK(list[2].name == "Enabled");
    CHECK(Extractor::Extract(params) == std::tuple<std::string, sint32, bool>{"hi", 2, false});
}

TEST_CASE("Parameter tuple updates only touch one index", "[params][extract]") {
    using Params = std::tuple<NumberParam, NumberParam, NumberParam>;
    using Extractor = ExtractParams<Params>;

    Params params{MakeNumber("A", 1), MakeNumber("B", 2), MakeNumber("C", 3)};
    const auto before = Extractor::ToParams(params);

    CHECK(Extractor::UpdateAt(params, 1, Value::Int32(20)));
    const auto after = Extractor::ToParams(params);
    CHECK(after[0] == before[0]);
    CHECK(after[1].value == Value::Int32(20));
    CHECK(after[2] == before[2]);

    CHECK_FALSE(Extractor::UpdateAt(params, 3, Value::Int32(0)));
    CHECK(Extractor::ToParams(params) == after);
}

TEST_CASE("Parameter tuples support up to eight parameters", "[params][extract]") {
    using Params = std::tuple<TextParam, NumberParam, BoolParam, SliderParam, ColorParam, SelectParam<int>,
                              NumberParam, TextParam>;
    using Extractor = ExtractParams<Params>;
    STATIC_REQUIRE(Extractor::kArity == kMaxParamArity);
    STATIC_REQUIRE(extractable_params<Params>);

    Params params{MakeText("T", "a"),
                  MakeNumber("N", 1),
                  MakeBoolean("B", true),
                  MakeSlider("S", 0.0f, 10.0f, 5.0f),
                  MakeColor("C", Rgba{}),
                  MakeSelect("Sel", std::vector<int>{1, 2, 3}, 2),
                  MakeNumber("N2", 7),
                  MakeText("T2", "z")};
    REQUIRE(Extractor::ToParams(params).size() == 8);

    for (usize index = 0; index < 8; ++index) {
        const auto before = Extractor::ToParams(params);
        Extractor::UpdateAt(params, index, Value::Int32(99));
        const auto after = Extractor::ToParams(params);
        for (usize other = 0; other < 8; ++other) {
            if (other != index) {
                CHECK(after[other] == before[other]);
            }
        }
    }

    CHECK(Extractor::UpdateAt(params, 7, Value::Text("last")));
    CHECK(std::get<7>(Extractor::Extract(params)) == "last");
    CHECK(std::get<1>(Extractor::Extract(params)) == 99);
    CHECK(std::get<6>(Extractor::Extract(params)) == 99);
}

TEST_CASE("Only parameter adapters and their tuples are extractable", "[params][extract]") {
    STATIC_REQUIRE(extractable_params<TextParam>);
    STATIC_REQUIRE(extractable_params<std::tuple<TextParam, BoolParam>>);
    STATIC_REQUIRE_FALSE(extractable_params<int>);
    STATIC_REQUIRE_FALSE(extractable_params<std::string>);
}

} // namespace extract_params
