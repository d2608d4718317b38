#include <catch2/catch_test_macros.hpp>

#include <vitrine/preview/metadata.hpp>

using namespace vitrine::preview;

namespace metadata {

TEST_CASE("Metadata setters chain", "[metadata]") {
    Metadata metadata = Metadata("Counter").Description("Counts clicks").Group("Buttons").Tags({"stateful", "demo"});

    CHECK(metadata.label == "Counter");
    CHECK(metadata.description == "Counts clicks");
    CHECK(metadata.group == "Buttons");
    CHECK(metadata.tags == std::vector<std::string>{"stateful", "demo"});
}

TEST_CASE("Metadata matches case-insensitive substrings", "[metadata][search]") {
    const Metadata metadata = Metadata("Counter").Description("Counts clicks").Group("Buttons").Tags({"Stateful"});

    CHECK(metadata.Matches("count"));
    CHECK(metadata.Matches("COUNTER"));
    CHECK(metadata.Matches("clicks"));
    CHECK(metadata.Matches("butt"));
    CHECK(metadata.Matches("stateful"));
    CHECK(metadata.Matches("  counter  "));
    CHECK_FALSE(metadata.Matches("slider"));
}

TEST_CASE("Empty queries match everything", "[metadata][search]") {
    const Metadata metadata{"Label"};
    CHECK(metadata.Matches(""));
    CHECK(metadata.Matches(" \t "));
}

TEST_CASE("Missing optional fields never match", "[metadata][search]") {
    const Metadata metadata{"Label"};
    CHECK_FALSE(metadata.description.has_value());
    CHECK_FALSE(metadata.group.has_value());
    CHECK_FALSE(metadata.Matches("group"));
}

} // namespace metadata
