#include "cpgslice/extract.hpp"

#include "cpgslice/config.hpp"
#include "cpgslice/format.hpp"
#include "cpgslice/utils.hpp"
#include "cpgslice/writer.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace cpgslice::literals;

namespace cpgslice::extract {

    extraction_result extract_subgraph(const graph::property_graph& graph, const std::vector<std::string>& edge_types) {
        extraction_result result{};
        result.edge_types = normalize_edge_types(edge_types);

        for (const auto& edge : graph.edges) {
            if (std::ranges::find(result.edge_types, edge.edge_type) == result.edge_types.end()) {
                continue;
            }
            result.edges.push_back(edge);
            result.node_ids.insert(edge.source_id);
            result.node_ids.insert(edge.target_id);
        }

        for (const auto& id : result.node_ids) {
            if (graph.find_node(id) == nullptr) {
                result.missing_node_ids.insert(id);
            }
        }

        debug_log("extracted ", result.edges.size(), " edges connecting ", result.node_ids.size(), " nodes (",
                  result.missing_node_ids.size(), " without definition)");
        return result;
    }

    std::string render_subgraph(const graph::property_graph& graph, const extraction_result& result) {
        graph::dot_document doc{};
        doc.graph_name = graph::sanitize_dot_identifier("subgraph_{}"_format(edge_types_tag(result.edge_types)));
        doc.comments.push_back("Direct extraction from original DOT file");
        doc.comments.push_back("Edge types: {}"_format(utils::join_with_separator(result.edge_types, ", ")));

        for (const auto& id : result.node_ids) {
            if (const auto* node = graph.find_node(id)) {
                doc.nodes.emplace(id, node->raw_text);
            }
        }
        doc.edges.reserve(result.edges.size());
        for (const auto& edge : result.edges) {
            doc.edges.push_back(edge.raw_text);
        }
        return graph::write_dot(doc);
    }

}  // namespace cpgslice::extract
