#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace cpgslice::verify {

    using namespace std::string_view_literals;

    // Extraction check categories
    inline constexpr auto edges_category = "edges"sv;
    inline constexpr auto nodes_category = "nodes"sv;
    inline constexpr auto attributes_category = "attributes"sv;

    // UDF-filter check categories
    inline constexpr auto udf_identification_category = "udf_identification"sv;
    inline constexpr auto cfg_reachability_category = "cfg_reachability"sv;
    inline constexpr auto edge_filtering_category = "edge_filtering"sv;
    inline constexpr auto node_integrity_category = "node_integrity"sv;

    struct check_result {
        bool passed{true};
        std::vector<std::string> issues{};
    };

    struct graph_counts {
        size_t original_nodes{};
        size_t original_edges{};
        size_t filtered_nodes{};
        size_t filtered_edges{};
    };

    struct verification_report {
        std::map<std::string, check_result, std::less<>> categories{};
        graph_counts counts{};

        // AND over every category; a report without categories passes.
        bool overall_passed() const {
            for (const auto& [name, result] : categories) {
                if (!result.passed) {
                    return false;
                }
            }
            return true;
        }

        const check_result* find(std::string_view category) const {
            if (auto it = categories.find(category); it != categories.end()) {
                return &it->second;
            }
            return nullptr;
        }
    };

    struct verify_options {
        // 0 lists every issue
        size_t max_issues_per_category{50U};
    };

    /*
     * Recomputes the expected subgraph from the original export and compares it
     * with the produced one:
     * - edges: per-type counts, no unwanted types, (source, target, type)
     *   signature sets (missing and extra listed separately)
     * - nodes: ids of declared endpoints of the expected edges vs the ids
     *   declared in the subgraph
     * - attributes: decoded attribute maps of every id present in both
     * Runs every comparison; never throws on malformed text.
     */
    verification_report check_extraction(
            std::string_view original_text,
            std::string_view extracted_text,
            const std::vector<std::string>& edge_types,
            const verify_options& options = {});

    /*
     * Recomputes seeds and CFG closure from the pre-filter graph and compares
     * them with the filtered output:
     * - udf_identification: every seed present, no other METHOD node present
     * - cfg_reachability: output ids equal the declared part of the closure
     * - edge_filtering: CFG edges stay inside the output, CALL edges leave the
     *   output towards seeds, no other edge types, no retained edge lost
     * - node_integrity: each output declaration is byte-identical to its
     *   pre-filter declaration (one issue per differing node)
     */
    verification_report check_udf_filter(
            std::string_view pre_filter_text, std::string_view filtered_text, const verify_options& options = {});

}  // namespace cpgslice::verify
