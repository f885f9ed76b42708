#pragma once

#include "verify.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace cpgslice::report {

    /*
     * Persisted shape of one verification run:
     *
     *   { "files": {...},
     *     "counts": {original_nodes, original_edges, filtered_nodes, filtered_edges},
     *     "verification_results": {"<category>": {"passed": bool, "issues": [...]}},
     *     "overall_passed": bool }
     *
     * `files` maps a role ("original", "subgraph", "filtered", ...) to a path.
     */
    struct report_document {
        std::map<std::string, std::string, std::less<>> files{};
        verify::graph_counts counts{};
        std::map<std::string, verify::check_result, std::less<>> verification_results{};
        bool overall_passed{true};
    };

    report_document make_report_document(
            const verify::verification_report& report, std::map<std::string, std::string, std::less<>> files = {});

    std::string to_json(const report_document& doc);

    // std::nullopt when `json` is not a report document.
    std::optional<report_document> parse_report_json(std::string_view json);

    // Throws std::runtime_error when the file cannot be written.
    void write_report_file(const report_document& doc, const std::filesystem::path& path);

}  // namespace cpgslice::report
