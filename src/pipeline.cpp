#include "cpgslice/pipeline.hpp"

#include "cpgslice/format.hpp"
#include "cpgslice/utils.hpp"
#include "internal/files.hpp"
#include "internal/types.hpp"

#include <stdexcept>
#include <utility>

using namespace cpgslice::literals;

namespace cpgslice::pipeline {
    namespace fs = std::filesystem;

    std::string read_graph_file(const fs::path& path) {
        auto text = internal::read_text_file(path);
        if (text.find("digraph"sv) == std::string::npos) {
            throw std::runtime_error("{} does not contain a digraph"_format(path.string()));
        }
        return text;
    }

    void write_artifact(std::string_view text, const fs::path& path) {
        internal::write_text_file(text, path);
    }

    extraction_output extract_text(std::string_view original_text, const std::vector<std::string>& edge_types) {
        auto graph = graph::parse_graph(original_text);

        extraction_output out{};
        out.input_nodes = graph.nodes.size();
        out.input_edges = graph.edges.size();
        out.result = extract::extract_subgraph(graph, edge_types);
        out.text = extract::render_subgraph(graph, out.result);
        out.diagnostics = std::move(graph.diagnostics);
        return out;
    }

    filter_output filter_text(std::string_view subgraph_text, std::string_view name) {
        auto graph = graph::parse_graph(subgraph_text);

        filter_output out{};
        out.input_nodes = graph.nodes.size();
        out.input_edges = graph.edges.size();
        out.slice = udf::slice_udf_subgraph(graph);
        out.text = udf::render_udf_subgraph(graph, out.slice, name);
        out.diagnostics = std::move(graph.diagnostics);
        return out;
    }

    std::string artifact_stem(const std::vector<std::string>& edge_types) {
        return "{}_original"_format(edge_types_tag(normalize_edge_types(edge_types)));
    }

    graph_result process_graph_text(std::string_view original_text, const run_config& cfg) {
        verify::verify_options options{.max_issues_per_category = cfg.max_issues_per_category};
        auto edge_types = normalize_edge_types(cfg.edge_types);
        if (edge_types.empty()) {
            throw std::runtime_error("no edge types selected");
        }

        graph_result result{};
        result.extraction = extract_text(original_text, edge_types);
        result.extraction_report =
                verify::check_extraction(original_text, result.extraction.text, edge_types, options);

        result.filtering = filter_text(result.extraction.text, artifact_stem(edge_types));
        result.udf_report = verify::check_udf_filter(result.extraction.text, result.filtering.text, options);

        debug_log("extraction ", result.extraction_report.overall_passed() ? "passed" : "failed", ", udf filter ",
                  result.udf_report.overall_passed() ? "passed" : "failed");
        return result;
    }

    artifact_paths artifact_paths_for(const run_config& cfg) {
        auto stem = artifact_stem(cfg.edge_types);
        return artifact_paths{
                .subgraph = cfg.output_dir / "subgraphs" / "{}.dot"_format(stem),
                .extraction_report = cfg.output_dir / "verify" / "verification.json",
                .filtered = cfg.output_dir / "udf" / "{}_udf_filtered.dot"_format(stem),
                .udf_report = cfg.output_dir / "udf" / "udf_verification.json"};
    }

    run_outcome run_graph_file(const fs::path& input, const run_config& cfg) {
        auto text = read_graph_file(input);

        run_outcome outcome{};
        outcome.input = input;
        outcome.paths = artifact_paths_for(cfg);
        outcome.reports_written = cfg.write_reports;
        outcome.result = process_graph_text(text, cfg);

        const auto& paths = outcome.paths;
        internal::write_text_file(outcome.result.extraction.text, paths.subgraph);
        outcome.extraction_document = report::make_report_document(
                outcome.result.extraction_report,
                {{"original", input.string()}, {"subgraph", paths.subgraph.string()}});
        if (cfg.write_reports) {
            report::write_report_file(outcome.extraction_document, paths.extraction_report);
        }

        internal::write_text_file(outcome.result.filtering.text, paths.filtered);
        outcome.udf_document = report::make_report_document(
                outcome.result.udf_report,
                {{"pre_filter", paths.subgraph.string()}, {"filtered", paths.filtered.string()}});
        if (cfg.write_reports) {
            report::write_report_file(outcome.udf_document, paths.udf_report);
        }
        return outcome;
    }

    std::string to_json(const run_outcome& outcome) {
        internal::run_summary_record record{};
        record.input = outcome.input.string();
        record.artifacts = {
                {"subgraph", outcome.paths.subgraph.string()}, {"filtered", outcome.paths.filtered.string()}};
        if (outcome.reports_written) {
            record.artifacts.emplace("extraction_report", outcome.paths.extraction_report.string());
            record.artifacts.emplace("udf_report", outcome.paths.udf_report.string());
        }
        record.extraction = outcome.extraction_document;
        record.udf_filter = outcome.udf_document;
        record.overall_passed = outcome.result.passed();
        return internal::to_pretty_json(record);
    }

}  // namespace cpgslice::pipeline
