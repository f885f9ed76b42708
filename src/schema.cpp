#include "cpgslice/schema.hpp"

#include "cpgslice/utils.hpp"
#include "internal/files.hpp"
#include "internal/types.hpp"

#include <algorithm>
#include <iterator>

namespace cpgslice::schema {
    using namespace std::string_view_literals;

    namespace detail {

        static key_set intersect(const key_set& lhs, const key_set& rhs) {
            key_set out{};
            std::ranges::set_intersection(lhs, rhs, std::inserter(out, out.end()));
            return out;
        }

        static key_set subtract(const key_set& lhs, const key_set& rhs) {
            key_set out{};
            std::ranges::set_difference(lhs, rhs, std::inserter(out, out.end()));
            return out;
        }

        // Intersection and union over a non-empty run of sets.
        class key_views_builder {
          public:
            void add(const key_set& keys) {
                if (!seeded_) {
                    views_.intersection = keys;
                    seeded_ = true;
                }
                else {
                    views_.intersection = intersect(views_.intersection, keys);
                }
                views_.combined.insert(keys.begin(), keys.end());
            }

            key_views finish() && {
                views_.non_intersection = subtract(views_.combined, views_.intersection);
                return std::move(views_);
            }

          private:
            bool seeded_{false};
            key_views views_{};
        };

    }  // namespace detail

    graph_schema summarize_graph(const graph::property_graph& graph) {
        graph_schema out{};
        for (const auto& [id, node] : graph.nodes) {
            auto label = node.attributes.find("label"sv);
            if (label == node.attributes.end()) {
                ++out.unlabeled_nodes;
                continue;
            }

            key_set keys{};
            for (const auto& [key, value] : node.attributes) {
                if (key != "label"sv) {
                    keys.insert(key);
                }
            }

            auto [it, first] = out.types.try_emplace(label->second);
            auto& type = it->second;
            type.any.insert(keys.begin(), keys.end());
            type.all = first ? std::move(keys) : detail::intersect(type.all, keys);
        }
        return out;
    }

    schema_summary aggregate_schemas(const std::vector<std::pair<std::string, graph_schema>>& graphs) {
        schema_summary summary{};

        key_set all_types{};
        for (const auto& [file, schema] : graphs) {
            summary.files.push_back(file);
            for (const auto& [type, keys] : schema.types) {
                all_types.insert(type);
            }
        }

        detail::key_views_builder lenient_across_types{};
        detail::key_views_builder strict_across_types{};

        for (const auto& type : all_types) {
            type_summary entry{};
            detail::key_views_builder lenient{};
            detail::key_views_builder strict{};

            for (const auto& [file, schema] : graphs) {
                auto it = schema.types.find(type);
                if (it == schema.types.end()) {
                    continue;
                }
                entry.files_present_in.push_back(file);
                entry.by_file.insert_or_assign(file, it->second);
                lenient.add(it->second.any);
                strict.add(it->second.all);
            }

            entry.lenient = std::move(lenient).finish();
            entry.strict = std::move(strict).finish();
            lenient_across_types.add(entry.lenient.combined);
            strict_across_types.add(entry.strict.intersection);

            if (entry.files_present_in.size() == graphs.size()) {
                summary.intersectional_types.push_back(type);
            }
            else {
                summary.non_intersectional_types.emplace(type, entry.files_present_in);
            }
            summary.types.emplace(type, std::move(entry));
        }

        summary.cross_type_lenient = std::move(lenient_across_types).finish();
        summary.cross_type_strict = std::move(strict_across_types).finish();
        summary.global_property_union = summary.cross_type_lenient.combined;

        debug_log("schema: ", graphs.size(), " files, ", all_types.size(), " node types");
        return summary;
    }

    std::string to_json(const schema_summary& summary) {
        return internal::to_pretty_json(summary);
    }

}  // namespace cpgslice::schema
