#include "utils.hpp"

namespace cpgslice::test {
    using namespace std::string_view_literals;

    TEST_CASE("003: quoted and bare values", "[003][attributes]") {
        auto decoded = graph::parse_attributes(R"(label=METHOD, NAME="main" LINE_NUMBER=12,ORDER=1)"sv);

        CHECK(decoded.skipped_fragments == 0U);
        REQUIRE(decoded.values.size() == 4U);
        CHECK(decoded.values.at("label") == "METHOD");
        CHECK(decoded.values.at("NAME") == "main");
        CHECK(decoded.values.at("LINE_NUMBER") == "12");
        CHECK(decoded.values.at("ORDER") == "1");
    }

    TEST_CASE("003: escape sequences in quoted values", "[003][attributes]") {
        auto decoded = graph::parse_attributes(R"(CODE="a \"b\" \\ c\nd\te\q")"sv);

        REQUIRE(decoded.values.contains("CODE"));
        CHECK(decoded.values.at("CODE") == "a \"b\" \\ c\nd\teq");
    }

    TEST_CASE("003: real newlines survive inside quoted values", "[003][attributes]") {
        auto decoded = graph::parse_attributes("CODE=\"line one\nline two\" label=BLOCK"sv);

        CHECK(decoded.values.at("CODE") == "line one\nline two");
        CHECK(decoded.values.at("label") == "BLOCK");
    }

    TEST_CASE("003: later keys overwrite earlier ones", "[003][attributes]") {
        auto decoded = graph::parse_attributes(R"(NAME="first" NAME=second)"sv);

        CHECK(decoded.values.size() == 1U);
        CHECK(decoded.values.at("NAME") == "second");
    }

    TEST_CASE("003: unrecognized fragments are skipped and counted", "[003][attributes]") {
        auto decoded = graph::parse_attributes(R"(dangling 9lives=x "loose" label=CALL =oops)"sv);

        CHECK(decoded.values.at("label") == "CALL");
        CHECK_FALSE(decoded.values.contains("dangling"));
        CHECK_FALSE(decoded.values.contains("9lives"));
        // dangling, 9lives=x, "loose", =oops
        CHECK(decoded.skipped_fragments == 4U);
    }

    TEST_CASE("003: unterminated quoted value stops decoding", "[003][attributes]") {
        auto decoded = graph::parse_attributes(R"(label=METHOD NAME="open)"sv);

        CHECK(decoded.values.at("label") == "METHOD");
        CHECK_FALSE(decoded.values.contains("NAME"));
        CHECK(decoded.skipped_fragments == 1U);
    }

    TEST_CASE("003: filtered decoding keeps only the requested keys", "[003][attributes]") {
        constexpr std::array<std::string_view, 2> keys{"label"sv, "NAME"sv};
        auto decoded = graph::parse_attributes(R"(label=METHOD CODE="x" NAME="f" FULL_NAME="f")"sv, keys);

        REQUIRE(decoded.values.size() == 2U);
        CHECK(decoded.values.at("label") == "METHOD");
        CHECK(decoded.values.at("NAME") == "f");
    }

    TEST_CASE("003: empty and separator-only text", "[003][attributes]") {
        CHECK(graph::parse_attributes(""sv).values.empty());

        auto decoded = graph::parse_attributes(" ,, \n "sv);
        CHECK(decoded.values.empty());
        CHECK(decoded.skipped_fragments == 0U);

        auto empty_value = graph::parse_attributes(R"(CODE="" label=)"sv);
        CHECK(empty_value.values.at("CODE").empty());
        CHECK(empty_value.values.at("label").empty());
    }

}  // namespace cpgslice::test
