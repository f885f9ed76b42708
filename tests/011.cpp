#include "utils.hpp"

namespace cpgslice::test {
    using namespace std::string_view_literals;

    namespace detail {
        inline constexpr std::string_view export_graph = R"(digraph cpg {
"100" [label=METHOD IS_EXTERNAL="false" NAME="main" FULL_NAME="main" FILENAME="main.c" AST_PARENT_FULL_NAME="main.c:<global>" CODE="int main() {
  helper();
  printf(\"done\\n\");
}"];
"101" [label=BLOCK CODE="{...}"];
"102" [label=CALL NAME="helper" CODE="helper()"];
"103" [label=CALL NAME="printf" CODE="printf(\"done\\n\")"];
"104" [label=METHOD_RETURN CODE="RET"];
"200" [label=METHOD IS_EXTERNAL="false" NAME="helper" FULL_NAME="helper" FILENAME="main.c" AST_PARENT_FULL_NAME="main.c:<global>"];
"201" [label=METHOD_RETURN CODE="RET"];
"300" [label=METHOD IS_EXTERNAL="true" NAME="printf" FULL_NAME="printf" FILENAME="<empty>"];
"400" [label=METHOD NAME="<operator>.call" FULL_NAME="<operator>.call" FILENAME="<empty>"];
"100" -> "101" [label=AST];
"100" -> "102" [label=CFG];
"102" -> "103" [label=CFG];
"103" -> "104" [label=CFG];
"102" -> "200" [label=CALL];
"103" -> "300" [label=CALL];
"200" -> "201" [label=CFG];
"102" -> "400" [label=CALL];
"101" -> "102" [label=CDG];
}
)";
    }  // namespace detail

    TEST_CASE("011: process_graph_text runs both stages and both checks", "[011][pipeline]") {
        run_config cfg{};
        auto result = pipeline::process_graph_text(detail::export_graph, cfg);

        CHECK(result.extraction.input_nodes == 9U);
        CHECK(result.extraction.input_edges == 9U);
        CHECK(result.extraction.result.edges.size() == 7U);
        CHECK(result.extraction.result.missing_node_ids.empty());

        CHECK(result.filtering.slice.seeds == udf::id_set{"100", "200"});
        CHECK(result.filtering.slice.kept_node_ids == udf::id_set{"100", "102", "103", "104", "200", "201"});
        REQUIRE(result.filtering.slice.kept_edges.size() == 5U);
        CHECK(result.filtering.slice.kept_edges[3].raw_text == R"("102" -> "200" [label=CALL];)");

        CHECK(result.filtering.text.starts_with("digraph udf_CFG_CALL_original {\n"));
        CHECK(result.extraction_report.overall_passed());
        CHECK(result.udf_report.overall_passed());
        CHECK(result.passed());
    }

    TEST_CASE("011: a dangling CFG reference passes both checks", "[011][pipeline]") {
        constexpr auto text = R"(digraph cpg {
"m" [label=METHOD NAME="f" FILENAME="f.c"];
"m" -> "ghost" [label=CFG];
}
)"sv;
        run_config cfg{};
        auto result = pipeline::process_graph_text(text, cfg);

        CHECK(result.extraction.result.missing_node_ids == extract::id_set{"ghost"});
        CHECK(result.filtering.slice.missing_node_ids == udf::id_set{"ghost"});
        CHECK(result.extraction_report.overall_passed());
        CHECK(result.udf_report.overall_passed());
        CHECK(result.passed());
    }

    TEST_CASE("011: run_graph_file writes every artifact", "[011][pipeline]") {
        detail::temp_dir dir{"cpgslice_011_run"};
        auto input = dir.path / "export.dot";
        detail::write_file(input, detail::export_graph);

        run_config cfg{};
        cfg.output_dir = dir.path / "out";
        auto outcome = pipeline::run_graph_file(input, cfg);

        CHECK(outcome.paths.subgraph == cfg.output_dir / "subgraphs" / "CFG_CALL_original.dot");
        CHECK(outcome.paths.extraction_report == cfg.output_dir / "verify" / "verification.json");
        CHECK(outcome.paths.filtered == cfg.output_dir / "udf" / "CFG_CALL_original_udf_filtered.dot");
        CHECK(outcome.paths.udf_report == cfg.output_dir / "udf" / "udf_verification.json");

        CHECK(detail::read_file(outcome.paths.subgraph) == outcome.result.extraction.text);
        CHECK(detail::read_file(outcome.paths.filtered) == outcome.result.filtering.text);

        auto extraction_doc = report::parse_report_json(detail::read_file(outcome.paths.extraction_report));
        REQUIRE(extraction_doc.has_value());
        CHECK(extraction_doc->overall_passed);
        CHECK(extraction_doc->files.at("original") == input.string());
        CHECK(extraction_doc->verification_results.contains("attributes"));

        auto udf_doc = report::parse_report_json(detail::read_file(outcome.paths.udf_report));
        REQUIRE(udf_doc.has_value());
        CHECK(udf_doc->overall_passed);
        CHECK(udf_doc->counts.filtered_nodes == 6U);
        CHECK(udf_doc->verification_results.contains("node_integrity"));

        auto summary = pipeline::to_json(outcome);
        CHECK(summary.find("\"udf_report\"") != std::string::npos);
        CHECK(summary.find("\"overall_passed\": true") != std::string::npos);
    }

    TEST_CASE("011: reports can be skipped", "[011][pipeline]") {
        detail::temp_dir dir{"cpgslice_011_no_reports"};
        auto input = dir.path / "export.dot";
        detail::write_file(input, detail::export_graph);

        run_config cfg{};
        cfg.output_dir = dir.path / "out";
        cfg.write_reports = false;
        cfg.edge_types = {"CFG"};
        auto outcome = pipeline::run_graph_file(input, cfg);

        CHECK(std::filesystem::exists(dir.path / "out" / "subgraphs" / "CFG_original.dot"));
        CHECK(std::filesystem::exists(dir.path / "out" / "udf" / "CFG_original_udf_filtered.dot"));
        CHECK_FALSE(std::filesystem::exists(outcome.paths.extraction_report));
        CHECK_FALSE(std::filesystem::exists(outcome.paths.udf_report));
        CHECK(pipeline::to_json(outcome).find("\"udf_report\"") == std::string::npos);
        CHECK(outcome.result.filtering.text.find("[label=CALL]") == std::string::npos);
    }

    TEST_CASE("011: unreadable or non-graph input is fatal", "[011][pipeline]") {
        detail::temp_dir dir{"cpgslice_011_bad_input"};
        run_config cfg{};
        cfg.output_dir = dir.path / "out";

        CHECK_THROWS_AS(pipeline::run_graph_file(dir.path / "missing.dot", cfg), std::runtime_error);

        auto not_a_graph = dir.path / "notes.txt";
        detail::write_file(not_a_graph, "\"1\" [label=METHOD];\n");
        CHECK_THROWS_AS(pipeline::read_graph_file(not_a_graph), std::runtime_error);
        CHECK_FALSE(std::filesystem::exists(cfg.output_dir));
    }

    TEST_CASE("011: empty edge type selection is rejected", "[011][pipeline]") {
        run_config cfg{};
        cfg.edge_types = {" "};
        CHECK_THROWS_AS(pipeline::process_graph_text(detail::export_graph, cfg), std::runtime_error);
    }

}  // namespace cpgslice::test
