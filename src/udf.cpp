#include "cpgslice/udf.hpp"

#include "cpgslice/format.hpp"
#include "cpgslice/utils.hpp"
#include "cpgslice/writer.hpp"

#include <string_view>
#include <unordered_map>
#include <vector>

using namespace cpgslice::literals;

namespace cpgslice::udf {
    namespace detail {

        static std::string_view lookup(const graph::attribute_map& attributes, std::string_view key) {
            if (auto it = attributes.find(key); it != attributes.end()) {
                return it->second;
            }
            return {};
        }

        using adjacency_map = std::unordered_map<std::string_view, std::vector<std::string_view>>;

        static adjacency_map build_cfg_adjacency(std::span<const graph::edge_record> edges) {
            adjacency_map adjacency{};
            for (const auto& edge : edges) {
                if (edge.edge_type == cfg_edge_type) {
                    adjacency[edge.source_id].push_back(edge.target_id);
                }
            }
            return adjacency;
        }

    }  // namespace detail

    bool is_udf(const graph::attribute_map& attributes) {
        if (detail::lookup(attributes, "label"sv) != method_label) {
            return false;
        }

        auto is_external = attributes.contains("IS_EXTERNAL"sv) ? detail::lookup(attributes, "IS_EXTERNAL"sv)
                                                                   : "false"sv;
        if (utils::str_case_eq(is_external, "true"sv)) {
            return false;
        }

        auto name = detail::lookup(attributes, "NAME"sv);
        auto full_name = detail::lookup(attributes, "FULL_NAME"sv);
        if (name.starts_with("<operator>"sv) || full_name.starts_with("<operator>"sv)) {
            return false;
        }
        if (name == "<clinit>"sv || name == "<global>"sv) {
            return false;
        }

        auto filename = detail::lookup(attributes, "FILENAME"sv);
        if (filename.empty() || filename == "<includes>"sv || filename == "<empty>"sv) {
            return false;
        }

        return !detail::lookup(attributes, "AST_PARENT_FULL_NAME"sv).contains("<includes>"sv);
    }

    id_set find_udf_seeds(const graph::property_graph& graph) {
        id_set seeds{};
        for (const auto& [id, node] : graph.nodes) {
            if (is_udf(node.attributes)) {
                seeds.insert(id);
            }
        }
        return seeds;
    }

    id_set cfg_closure(std::span<const graph::edge_record> edges, const id_set& seeds) {
        auto adjacency = detail::build_cfg_adjacency(edges);

        // one visited set shared by every seed
        id_set visited{};
        std::vector<std::string_view> worklist{};
        for (const auto& seed : seeds) {
            if (visited.insert(seed).second) {
                worklist.push_back(seed);
            }
        }

        for (size_t i = 0U; i < worklist.size(); ++i) {
            auto it = adjacency.find(worklist[i]);
            if (it == adjacency.end()) {
                continue;
            }
            for (auto next : it->second) {
                if (visited.emplace(next).second) {
                    worklist.push_back(next);
                }
            }
        }
        return visited;
    }

    std::vector<graph::edge_record> retain_edges(
            std::span<const graph::edge_record> edges, const id_set& kept_nodes, const id_set& seeds) {
        std::vector<graph::edge_record> kept{};
        for (const auto& edge : edges) {
            if (edge.edge_type == cfg_edge_type) {
                if (kept_nodes.contains(edge.source_id) && kept_nodes.contains(edge.target_id)) {
                    kept.push_back(edge);
                }
            }
            else if (edge.edge_type == call_edge_type) {
                // the target must be a seed; being reachable is not enough
                if (kept_nodes.contains(edge.source_id) && seeds.contains(edge.target_id)) {
                    kept.push_back(edge);
                }
            }
        }
        return kept;
    }

    slice_result slice_udf_subgraph(const graph::property_graph& graph) {
        slice_result result{};
        for (const auto& [id, node] : graph.nodes) {
            if (node.label() == method_label) {
                ++result.method_count;
            }
        }

        result.seeds = find_udf_seeds(graph);
        result.kept_node_ids = cfg_closure(graph.edges, result.seeds);
        result.kept_edges = retain_edges(graph.edges, result.kept_node_ids, result.seeds);

        for (const auto& id : result.kept_node_ids) {
            if (graph.find_node(id) == nullptr) {
                result.missing_node_ids.insert(id);
            }
        }

        debug_log("found ", result.method_count, " METHOD nodes, ", result.seeds.size(), " UDFs; kept ",
                  result.kept_node_ids.size(), " nodes and ", result.kept_edges.size(), " edges");
        return result;
    }

    std::string render_udf_subgraph(
            const graph::property_graph& graph, const slice_result& slice, std::string_view name) {
        graph::dot_document doc{};
        doc.graph_name = graph::sanitize_dot_identifier("udf_{}"_format(name));
        doc.comments.push_back("UDF-filtered subgraph");
        doc.comments.push_back("Only user-defined functions and their bodies");

        for (const auto& id : slice.kept_node_ids) {
            if (const auto* node = graph.find_node(id)) {
                doc.nodes.emplace(id, node->raw_text);
            }
        }
        doc.edges.reserve(slice.kept_edges.size());
        for (const auto& edge : slice.kept_edges) {
            doc.edges.push_back(edge.raw_text);
        }
        return graph::write_dot(doc);
    }

}  // namespace cpgslice::udf
