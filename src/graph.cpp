#include "cpgslice/graph.hpp"

#include "cpgslice/format.hpp"
#include "cpgslice/utils.hpp"

#include <array>
#include <string>
#include <string_view>
#include <utility>

using namespace cpgslice::literals;

namespace cpgslice::graph {
    namespace detail {

        static constexpr std::array<std::string_view, 1> edge_keys{"label"sv};

        static void note_skipped_fragments(property_graph& graph, const declaration& decl, size_t skipped) {
            if (skipped == 0U) {
                return;
            }
            auto subject = decl.kind == declaration_kind::node
                                 ? "{} \"{}\""_format(decl.kind, decl.id)
                                 : "{} \"{}\" -> \"{}\""_format(decl.kind, decl.id, decl.target_id);
            graph.diagnostics.push_back(
                    diagnostic{
                            .kind = diagnostic_kind::malformed_attribute,
                            .line = decl.line,
                            .message = "skipped {} unrecognized attribute fragment(s) in {}"_format(skipped, subject)});
        }

        static void add_node(property_graph& graph, const declaration& decl) {
            auto decoded = parse_attributes(decl.attr_text);
            note_skipped_fragments(graph, decl, decoded.skipped_fragments);

            node_record record{
                    .id = std::string{decl.id},
                    .attributes = std::move(decoded.values),
                    .raw_text = std::string{decl.raw_text},
                    .line = decl.line};

            if (auto it = graph.nodes.find(decl.id); it != graph.nodes.end()) {
                debug_log("node ", decl.id, " redeclared on line ", decl.line, " (was line ", it->second.line, ")");
                ++graph.superseded_nodes;
                it->second = std::move(record);
                return;
            }
            graph.nodes.emplace(record.id, std::move(record));
        }

        static void add_edge(property_graph& graph, const declaration& decl) {
            auto decoded = parse_attributes(decl.attr_text, edge_keys);
            note_skipped_fragments(graph, decl, decoded.skipped_fragments);

            std::string edge_type{};
            if (auto it = decoded.values.find("label"sv); it != decoded.values.end()) {
                edge_type = std::move(it->second);
            }
            else {
                graph.diagnostics.push_back(
                        diagnostic{
                                .kind = diagnostic_kind::malformed_attribute,
                                .line = decl.line,
                                .message = "edge \"{}\" -> \"{}\" has no label"_format(decl.id, decl.target_id)});
            }

            graph.edges.push_back(
                    edge_record{
                            .source_id = std::string{decl.id},
                            .target_id = std::string{decl.target_id},
                            .edge_type = std::move(edge_type),
                            .raw_text = std::string{decl.raw_text},
                            .line = decl.line});
        }

    }  // namespace detail

    property_graph parse_graph(std::string_view text) {
        auto scanned = scan_declarations(text);

        property_graph graph{};
        graph.diagnostics = std::move(scanned.diagnostics);
        graph.edges.reserve(scanned.declarations.size());

        for (const auto& decl : scanned.declarations) {
            if (decl.kind == declaration_kind::node) {
                detail::add_node(graph, decl);
            }
            else {
                detail::add_edge(graph, decl);
            }
        }

        debug_log("parsed ", graph.nodes.size(), " nodes, ", graph.edges.size(), " edges, ",
                  graph.diagnostics.size(), " diagnostics");
        return graph;
    }

    std::string sanitize_dot_identifier(std::string_view value) {
        std::string ret{};
        ret.reserve(value.size() + 4U);
        for (auto c : value) {
            auto ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
            ret.push_back(ok ? c : '_');
        }
        if (ret.empty()) {
            return "graph";
        }
        if (ret.front() >= '0' && ret.front() <= '9') {
            ret.insert(ret.begin(), '_');
        }
        return ret;
    }

}  // namespace cpgslice::graph
