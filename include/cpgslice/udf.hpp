#pragma once

#include "graph.hpp"

#include <array>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cpgslice::udf {

    using namespace std::string_view_literals;

    using id_set = std::set<std::string, std::less<>>;

    inline constexpr auto cfg_edge_type = "CFG"sv;
    inline constexpr auto call_edge_type = "CALL"sv;
    inline constexpr auto method_label = "METHOD"sv;

    // Attributes the classifier reads; everything else may stay undecoded.
    inline constexpr std::array<std::string_view, 6> classifier_keys{
            "label"sv, "NAME"sv, "FULL_NAME"sv, "FILENAME"sv, "AST_PARENT_FULL_NAME"sv, "IS_EXTERNAL"sv};

    /*
     * True for a METHOD node written by the user:
     * - label is METHOD
     * - IS_EXTERNAL is not "true" (any case; absent means "false")
     * - neither NAME nor FULL_NAME starts with "<operator>"
     * - NAME is not "<clinit>" or "<global>"
     * - FILENAME is not "<includes>", "<empty>" or empty
     * - AST_PARENT_FULL_NAME does not contain "<includes>"
     * Absent attributes compare as the empty string.
     */
    bool is_udf(const graph::attribute_map& attributes);

    id_set find_udf_seeds(const graph::property_graph& graph);

    // Smallest superset of `seeds` closed under following CFG edges forward.
    // Edges of other types in `edges` are ignored.
    id_set cfg_closure(std::span<const graph::edge_record> edges, const id_set& seeds);

    // CFG edges survive when both ends are kept; CALL edges when the source is
    // kept and the target is a seed. Every other type is dropped. Source order
    // is preserved.
    std::vector<graph::edge_record> retain_edges(
            std::span<const graph::edge_record> edges, const id_set& kept_nodes, const id_set& seeds);

    struct slice_result {
        id_set seeds{};
        id_set kept_node_ids{};
        std::vector<graph::edge_record> kept_edges{};
        // kept ids with no node declaration; absent from the rendered output
        id_set missing_node_ids{};
        size_t method_count{};
    };

    slice_result slice_udf_subgraph(const graph::property_graph& graph);

    // `name` becomes part of the graph name (`udf_<name>`).
    std::string render_udf_subgraph(
            const graph::property_graph& graph, const slice_result& slice, std::string_view name);

}  // namespace cpgslice::udf
