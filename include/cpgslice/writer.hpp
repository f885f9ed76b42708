#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace cpgslice::graph {

    /*
     * Input of the DOT writer. Node and edge texts are copied byte for byte;
     * nothing is re-rendered from decoded attributes.
     *
     * - graph_name: emitted as `digraph <graph_name> {` without further escaping.
     * - comments: header lines, each written as `  // <line>`; a
     *   `Nodes: N, Edges: M` line is always appended after them.
     * - nodes: id -> raw declaration text, written in id order.
     * - edges: raw edge texts, written in the given order.
     */
    struct dot_document {
        std::string graph_name{};
        std::vector<std::string> comments{};
        std::map<std::string, std::string_view, std::less<>> nodes{};
        std::vector<std::string_view> edges{};
    };

    // Appends one node declaration: two spaces before its first line, later
    // lines verbatim, one newline at the end.
    void append_node_text(std::string& out, std::string_view raw_text);

    std::string write_dot(const dot_document& doc);

}  // namespace cpgslice::graph
