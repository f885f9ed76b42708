#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cpgslice::graph {

    using namespace std::string_view_literals;

    using attribute_map = std::map<std::string, std::string, std::less<>>;

    struct string_hash {
        using is_transparent = void;
        size_t operator()(std::string_view value) const noexcept { return std::hash<std::string_view>{}(value); }
    };

    enum class declaration_kind : uint8_t { node, edge };

    inline constexpr std::string_view to_string(declaration_kind kind) {
        switch (kind) {
            case declaration_kind::node:
                return "node"sv;
            case declaration_kind::edge:
                return "edge"sv;
        }
        return "node"sv;
    }

    /*
     * One declaration located by the scanner. All views point into the scanned
     * text, which must outlive the declaration.
     *
     * - raw_text: from the opening quote of the (source) id through the
     *   terminating ';', byte for byte, possibly spanning several lines.
     * - attr_text: everything between the first unquoted '[' and the closing
     *   ']', trailing whitespace removed.
     * - id / target_id: id text between the quotes, escapes left as written.
     */
    struct declaration {
        declaration_kind kind{declaration_kind::node};
        std::string_view id{};
        std::string_view target_id{};
        std::string_view attr_text{};
        std::string_view raw_text{};
        size_t line{};
    };

    enum class diagnostic_kind : uint8_t {
        malformed_declaration,
        malformed_attribute,
    };

    inline constexpr std::string_view to_string(diagnostic_kind kind) {
        switch (kind) {
            case diagnostic_kind::malformed_declaration:
                return "malformed_declaration"sv;
            case diagnostic_kind::malformed_attribute:
                return "malformed_attribute"sv;
        }
        return "malformed_declaration"sv;
    }

    struct diagnostic {
        diagnostic_kind kind{diagnostic_kind::malformed_declaration};
        size_t line{};
        std::string message{};
    };

    struct scan_result {
        std::vector<declaration> declarations{};
        std::vector<diagnostic> diagnostics{};
    };

    // Locates every node/edge declaration in `text`, in source order. Never
    // throws on malformed input: the offending declaration is reported and
    // scanning resumes on the line after its start.
    scan_result scan_declarations(std::string_view text);

    struct decoded_attributes {
        attribute_map values{};
        size_t skipped_fragments{};
    };

    // Decodes `key=value` pairs from the text between '[' and ']'.
    decoded_attributes parse_attributes(std::string_view attr_text);

    // Same tokenization, but only keys listed in `keys` are stored.
    decoded_attributes parse_attributes(std::string_view attr_text, std::span<const std::string_view> keys);

    struct node_record {
        std::string id{};
        attribute_map attributes{};
        std::string raw_text{};
        size_t line{};

        // Empty when the attribute is absent.
        std::string_view attribute(std::string_view key) const {
            if (auto it = attributes.find(key); it != attributes.end()) {
                return it->second;
            }
            return {};
        }

        std::string_view label() const { return attribute("label"sv); }
    };

    struct edge_record {
        std::string source_id{};
        std::string target_id{};
        std::string edge_type{};
        std::string raw_text{};
        size_t line{};
    };

    using node_table = std::unordered_map<std::string, node_record, string_hash, std::equal_to<>>;

    struct property_graph {
        std::vector<edge_record> edges{};
        node_table nodes{};
        std::vector<diagnostic> diagnostics{};
        size_t superseded_nodes{};

        const node_record* find_node(std::string_view id) const {
            if (auto it = nodes.find(id); it != nodes.end()) {
                return &it->second;
            }
            return nullptr;
        }

        size_t count_diagnostics(diagnostic_kind kind) const {
            size_t count = 0U;
            for (const auto& d : diagnostics) {
                if (d.kind == kind) {
                    ++count;
                }
            }
            return count;
        }
    };

    // Scans and decodes a whole graph. A node id declared twice keeps the later
    // declaration. Edges keep source order and are never de-duplicated.
    property_graph parse_graph(std::string_view text);

    // "graph" for empty input; non [A-Za-z0-9_] characters become '_', and a
    // leading digit gets a '_' prefix.
    std::string sanitize_dot_identifier(std::string_view value);

}  // namespace cpgslice::graph
