#include "utils.hpp"

namespace cpgslice::test {
    using namespace std::string_view_literals;

    TEST_CASE("004: graph keeps edge order and parallel edges", "[004][graph]") {
        constexpr auto text = R"(digraph g {
"1" [label=METHOD NAME="main"];
"2" [label=BLOCK];
"2" -> "1" [label=AST];
"1" -> "2" [label=CFG];
"1" -> "2" [label=CFG];
}
)"sv;
        auto g = graph::parse_graph(text);

        CHECK(g.nodes.size() == 2U);
        REQUIRE(g.edges.size() == 3U);
        CHECK(g.edges[0].edge_type == "AST");
        CHECK(g.edges[1].edge_type == "CFG");
        CHECK(g.edges[2].edge_type == "CFG");
        CHECK(g.edges[1].raw_text == g.edges[2].raw_text);
        CHECK(g.edges[0].source_id == "2");
        CHECK(g.edges[0].target_id == "1");
        CHECK(g.diagnostics.empty());

        const auto* main = g.find_node("1"sv);
        REQUIRE(main != nullptr);
        CHECK(main->label() == "METHOD"sv);
        CHECK(main->attribute("NAME"sv) == "main"sv);
        CHECK(main->attribute("MISSING"sv).empty());
        CHECK(main->raw_text == R"("1" [label=METHOD NAME="main"];)");
        CHECK(g.find_node("3"sv) == nullptr);
    }

    TEST_CASE("004: later node declarations win", "[004][graph]") {
        constexpr auto text = R"("1" [label=METHOD NAME="old"];
"1" [label=METHOD NAME="new"];
)"sv;
        auto g = graph::parse_graph(text);

        REQUIRE(g.nodes.size() == 1U);
        CHECK(g.superseded_nodes == 1U);
        CHECK(g.find_node("1"sv)->attribute("NAME"sv) == "new"sv);
        CHECK(g.find_node("1"sv)->line == 2U);
        CHECK(g.diagnostics.empty());
    }

    TEST_CASE("004: edges without a label and undecodable fragments are diagnosed", "[004][graph]") {
        constexpr auto text = R"("1" [label=METHOD stray];
"1" -> "2" [weight=3];
)"sv;
        auto g = graph::parse_graph(text);

        REQUIRE(g.edges.size() == 1U);
        CHECK(g.edges[0].edge_type.empty());
        CHECK(g.count_diagnostics(graph::diagnostic_kind::malformed_attribute) == 2U);
        CHECK(g.count_diagnostics(graph::diagnostic_kind::malformed_declaration) == 0U);
        // the dangling target is legal
        CHECK(g.find_node("2"sv) == nullptr);
    }

    TEST_CASE("004: scanner diagnostics carry through", "[004][graph]") {
        constexpr auto text = R"("1" [label=METHOD];
"1" -> [label=CFG];
)"sv;
        auto g = graph::parse_graph(text);

        CHECK(g.nodes.size() == 1U);
        CHECK(g.edges.empty());
        REQUIRE(g.diagnostics.size() == 1U);
        CHECK(g.diagnostics[0].kind == graph::diagnostic_kind::malformed_declaration);
        CHECK(g.diagnostics[0].line == 2U);
        CHECK(graph::to_string(g.diagnostics[0].kind) == "malformed_declaration"sv);
    }

    TEST_CASE("004: dot identifier sanitizing", "[004][graph]") {
        CHECK(graph::sanitize_dot_identifier("subgraph_CFG_CALL"sv) == "subgraph_CFG_CALL");
        CHECK(graph::sanitize_dot_identifier("udf_my-file.v2"sv) == "udf_my_file_v2");
        CHECK(graph::sanitize_dot_identifier("2nd"sv) == "_2nd");
        CHECK(graph::sanitize_dot_identifier(""sv) == "graph");
    }

    TEST_CASE("004: empty input yields an empty graph", "[004][graph]") {
        auto g = graph::parse_graph(""sv);
        CHECK(g.nodes.empty());
        CHECK(g.edges.empty());
        CHECK(g.diagnostics.empty());
    }

}  // namespace cpgslice::test
