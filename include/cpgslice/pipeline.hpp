#pragma once

#include "config.hpp"
#include "extract.hpp"
#include "graph.hpp"
#include "report.hpp"
#include "udf.hpp"
#include "verify.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cpgslice::pipeline {

    // Reads a graph export. Throws std::runtime_error when the file cannot be
    // read or does not contain a digraph.
    std::string read_graph_file(const std::filesystem::path& path);

    // Writes `text` to `path`, creating parent directories. Throws
    // std::runtime_error on failure.
    void write_artifact(std::string_view text, const std::filesystem::path& path);

    struct extraction_output {
        std::string text{};
        extract::extraction_result result{};
        std::vector<graph::diagnostic> diagnostics{};
        size_t input_nodes{};
        size_t input_edges{};
    };

    extraction_output extract_text(std::string_view original_text, const std::vector<std::string>& edge_types);

    struct filter_output {
        std::string text{};
        udf::slice_result slice{};
        std::vector<graph::diagnostic> diagnostics{};
        size_t input_nodes{};
        size_t input_edges{};
    };

    // `name` becomes part of the output graph name.
    filter_output filter_text(std::string_view subgraph_text, std::string_view name);

    struct graph_result {
        extraction_output extraction{};
        filter_output filtering{};
        verify::verification_report extraction_report{};
        verify::verification_report udf_report{};

        bool passed() const { return extraction_report.overall_passed() && udf_report.overall_passed(); }
    };

    // Extract, check, filter and check one graph held in memory.
    graph_result process_graph_text(std::string_view original_text, const run_config& cfg);

    // Artifact base name, e.g. "CFG_CALL_original".
    std::string artifact_stem(const std::vector<std::string>& edge_types);

    struct artifact_paths {
        std::filesystem::path subgraph{};
        std::filesystem::path extraction_report{};
        std::filesystem::path filtered{};
        std::filesystem::path udf_report{};
    };

    artifact_paths artifact_paths_for(const run_config& cfg);

    struct run_outcome {
        std::filesystem::path input{};
        artifact_paths paths{};
        bool reports_written{};
        graph_result result{};
        report::report_document extraction_document{};
        report::report_document udf_document{};
    };

    /*
     * Processes one export file and writes under cfg.output_dir:
     *   subgraphs/<stem>.dot
     *   verify/verification.json        (when write_reports)
     *   udf/<stem>_udf_filtered.dot
     *   udf/udf_verification.json       (when write_reports)
     * Throws std::runtime_error on unreadable input or failed writes; a failed
     * verification is reported in the outcome.
     */
    run_outcome run_graph_file(const std::filesystem::path& input, const run_config& cfg);

    // One JSON document with the artifact paths and both reports.
    std::string to_json(const run_outcome& outcome);

}  // namespace cpgslice::pipeline
