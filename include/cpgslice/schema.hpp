#pragma once

#include "graph.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace cpgslice::schema {

    using key_set = std::set<std::string, std::less<>>;

    // Attribute keys (label excluded) seen on nodes of one type: on any node
    // of the type, and on all of them.
    struct type_keys {
        key_set any{};
        key_set all{};
    };

    struct graph_schema {
        std::map<std::string, type_keys, std::less<>> types{};
        size_t unlabeled_nodes{};
    };

    // Nodes without a label are counted and otherwise ignored.
    graph_schema summarize_graph(const graph::property_graph& graph);

    struct key_views {
        key_set intersection{};
        key_set combined{};
        key_set non_intersection{};
    };

    struct type_summary {
        std::vector<std::string> files_present_in{};
        // over the per-file `any` sets
        key_views lenient{};
        // over the per-file `all` sets
        key_views strict{};
        std::map<std::string, type_keys, std::less<>> by_file{};
    };

    /*
     * Cross-file view of several graph schemas.
     *
     * - intersectional_types: types present in every file
     * - non_intersectional_types: every other type, with the files it occurs in
     * - cross_type_lenient: set views over each type's lenient union
     * - cross_type_strict: set views over each type's strict intersection
     * - global_property_union: every key seen on any node of any type
     */
    struct schema_summary {
        std::vector<std::string> files{};
        std::vector<std::string> intersectional_types{};
        std::map<std::string, std::vector<std::string>, std::less<>> non_intersectional_types{};
        std::map<std::string, type_summary, std::less<>> types{};
        key_views cross_type_lenient{};
        key_views cross_type_strict{};
        key_set global_property_union{};
    };

    // `graphs` pairs a file name with its schema, in the order the files were given.
    schema_summary aggregate_schemas(const std::vector<std::pair<std::string, graph_schema>>& graphs);

    std::string to_json(const schema_summary& summary);

}  // namespace cpgslice::schema
