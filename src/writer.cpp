#include "cpgslice/writer.hpp"

#include "cpgslice/format.hpp"

#include <string>
#include <string_view>

using namespace cpgslice::literals;

namespace cpgslice::graph {

    void append_node_text(std::string& out, std::string_view raw_text) {
        // only the first line is indented; continuation lines follow the
        // embedded newlines untouched
        out.append("  ");
        out.append(raw_text);
        out.push_back('\n');
    }

    std::string write_dot(const dot_document& doc) {
        std::string out{};
        out.append("digraph {} {{\n"_format(doc.graph_name));
        for (const auto& comment : doc.comments) {
            out.append("  // {}\n"_format(comment));
        }
        out.append("  // Nodes: {}, Edges: {}\n\n"_format(doc.nodes.size(), doc.edges.size()));

        out.append("  // Node definitions\n");
        for (const auto& [id, raw_text] : doc.nodes) {
            append_node_text(out, raw_text);
        }

        out.append("\n  // Edge definitions\n");
        for (const auto& raw_text : doc.edges) {
            out.append("  ");
            out.append(raw_text);
            out.push_back('\n');
        }

        out.append("}\n");
        return out;
    }

}  // namespace cpgslice::graph
