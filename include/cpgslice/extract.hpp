#pragma once

#include "graph.hpp"

#include <set>
#include <string>
#include <vector>

namespace cpgslice::extract {

    using id_set = std::set<std::string, std::less<>>;

    struct extraction_result {
        std::vector<std::string> edge_types{};
        std::vector<graph::edge_record> edges{};
        // every endpoint of a kept edge, declared or not
        id_set node_ids{};
        // endpoints with no node declaration; left out of the rendered subgraph
        id_set missing_node_ids{};

        size_t found_node_count() const { return node_ids.size() - missing_node_ids.size(); }
    };

    // Keeps the edges whose type is listed in `edge_types`, in source order,
    // and collects their endpoints.
    extraction_result extract_subgraph(const graph::property_graph& graph, const std::vector<std::string>& edge_types);

    // Renders the extracted subgraph as DOT, copying declarations verbatim.
    std::string render_subgraph(const graph::property_graph& graph, const extraction_result& result);

}  // namespace cpgslice::extract
