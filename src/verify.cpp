#include "cpgslice/verify.hpp"

#include "cpgslice/config.hpp"
#include "cpgslice/format.hpp"
#include "cpgslice/graph.hpp"
#include "cpgslice/utils.hpp"

#include <algorithm>
#include <compare>
#include <queue>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

using namespace cpgslice::literals;

namespace cpgslice::verify {
    namespace detail {

        using name_set = std::set<std::string, std::less<>>;

        struct edge_signature {
            static constexpr bool to_string_formattable = true;

            std::string source{};
            std::string target{};
            std::string type{};

            auto operator<=>(const edge_signature&) const = default;

            std::string to_string() const { return "{} -> {} [{}]"_format(source, target, type); }
        };

        using signature_set = std::set<edge_signature>;

        static edge_signature signature_of(const graph::edge_record& edge) {
            return edge_signature{.source = edge.source_id, .target = edge.target_id, .type = edge.edge_type};
        }

        class category_builder {
          public:
            explicit category_builder(size_t limit) : limit_{limit} {}

            void add_issue(std::string issue) {
                result_.passed = false;
                if (limit_ == 0U || result_.issues.size() < limit_) {
                    result_.issues.push_back(std::move(issue));
                    return;
                }
                ++overflow_;
            }

            check_result finish() && {
                if (overflow_ > 0U) {
                    result_.issues.push_back("... and {} more"_format(overflow_));
                }
                return std::move(result_);
            }

          private:
            size_t limit_{};
            size_t overflow_{};
            check_result result_{};
        };

        static graph_counts count_graphs(const graph::property_graph& original, const graph::property_graph& produced) {
            return graph_counts{
                    .original_nodes = original.nodes.size(),
                    .original_edges = original.edges.size(),
                    .filtered_nodes = produced.nodes.size(),
                    .filtered_edges = produced.edges.size()};
        }

        static name_set node_ids(const graph::property_graph& graph) {
            name_set ids{};
            for (const auto& [id, node] : graph.nodes) {
                ids.insert(id);
            }
            return ids;
        }

        static std::string_view display_type(std::string_view type) {
            return type.empty() ? "<no label>"sv : type;
        }

        // Recomputed here rather than shared with the slicer.
        static bool expected_udf(const graph::attribute_map& attributes) {
            auto get = [&attributes](std::string_view key, std::string_view fallback = {}) -> std::string_view {
                auto it = attributes.find(key);
                return it == attributes.end() ? fallback : std::string_view{it->second};
            };

            if (get("label"sv) != "METHOD"sv) {
                return false;
            }

            std::string external{get("IS_EXTERNAL"sv, "false"sv)};
            std::ranges::transform(external, external.begin(), utils::char_tolower);
            if (external == "true"sv) {
                return false;
            }

            constexpr auto operator_prefix = "<operator>"sv;
            for (auto key : {"NAME"sv, "FULL_NAME"sv}) {
                if (get(key).substr(0U, operator_prefix.size()) == operator_prefix) {
                    return false;
                }
            }
            for (auto reserved : {"<clinit>"sv, "<global>"sv}) {
                if (get("NAME"sv) == reserved) {
                    return false;
                }
            }
            for (auto rejected : {""sv, "<includes>"sv, "<empty>"sv}) {
                if (get("FILENAME"sv) == rejected) {
                    return false;
                }
            }
            return get("AST_PARENT_FULL_NAME"sv).find("<includes>"sv) == std::string_view::npos;
        }

        static name_set expected_seeds(const graph::property_graph& graph) {
            name_set seeds{};
            for (const auto& [id, node] : graph.nodes) {
                if (expected_udf(node.attributes)) {
                    seeds.insert(id);
                }
            }
            return seeds;
        }

        static name_set expected_closure(const graph::property_graph& graph, const name_set& seeds) {
            std::unordered_map<std::string_view, std::vector<std::string_view>> successors{};
            for (const auto& edge : graph.edges) {
                if (edge.edge_type == "CFG"sv) {
                    successors[edge.source_id].push_back(edge.target_id);
                }
            }

            name_set reached{};
            std::queue<std::string_view> pending{};
            for (const auto& seed : seeds) {
                if (!reached.insert(seed).second) {
                    continue;
                }
                pending.push(seed);
                while (!pending.empty()) {
                    auto current = pending.front();
                    pending.pop();
                    auto it = successors.find(current);
                    if (it == successors.end()) {
                        continue;
                    }
                    for (auto next : it->second) {
                        if (reached.emplace(next).second) {
                            pending.push(next);
                        }
                    }
                }
            }
            return reached;
        }

        static size_t first_difference(std::string_view lhs, std::string_view rhs) {
            auto diff = std::ranges::mismatch(lhs, rhs);
            return static_cast<size_t>(diff.in1 - lhs.begin());
        }

        static check_result compare_edges(
                const graph::property_graph& original,
                const graph::property_graph& extracted,
                const std::vector<std::string>& wanted,
                size_t limit) {
            category_builder category{limit};

            std::map<std::string, size_t, std::less<>> expected_by_type{};
            std::map<std::string, size_t, std::less<>> found_by_type{};
            signature_set expected{};
            signature_set found{};

            for (const auto& edge : original.edges) {
                if (std::ranges::find(wanted, edge.edge_type) == wanted.end()) {
                    continue;
                }
                ++expected_by_type[edge.edge_type];
                expected.insert(signature_of(edge));
            }
            for (const auto& edge : extracted.edges) {
                ++found_by_type[edge.edge_type];
                found.insert(signature_of(edge));
            }

            for (const auto& type : wanted) {
                auto expected_count = expected_by_type.contains(type) ? expected_by_type.at(type) : 0U;
                auto found_count = found_by_type.contains(type) ? found_by_type.at(type) : 0U;
                if (expected_count != found_count) {
                    category.add_issue(
                            "{}: count mismatch (expected {}, found {})"_format(type, expected_count, found_count));
                }
            }
            for (const auto& [type, count] : found_by_type) {
                if (std::ranges::find(wanted, type) == wanted.end()) {
                    category.add_issue("unwanted edge type {} ({} edges)"_format(display_type(type), count));
                }
            }

            for (const auto& sig : expected) {
                if (!found.contains(sig)) {
                    category.add_issue("missing edge: {}"_format(sig));
                }
            }
            for (const auto& sig : found) {
                if (!expected.contains(sig)) {
                    category.add_issue("extra edge: {}"_format(sig));
                }
            }
            return std::move(category).finish();
        }

        static check_result compare_nodes(
                const graph::property_graph& original,
                const graph::property_graph& extracted,
                const std::vector<std::string>& wanted,
                size_t limit) {
            category_builder category{limit};

            // endpoints without a declaration cannot appear in any output
            name_set expected{};
            for (const auto& edge : original.edges) {
                if (std::ranges::find(wanted, edge.edge_type) == wanted.end()) {
                    continue;
                }
                for (const auto& id : {edge.source_id, edge.target_id}) {
                    if (original.find_node(id) != nullptr) {
                        expected.insert(id);
                    }
                }
            }
            auto actual = node_ids(extracted);

            for (const auto& id : expected) {
                if (!actual.contains(id)) {
                    category.add_issue("missing node: {}"_format(id));
                }
            }
            for (const auto& id : actual) {
                if (!expected.contains(id)) {
                    category.add_issue("extra node: {}"_format(id));
                }
            }
            return std::move(category).finish();
        }

        static check_result compare_attributes(
                const graph::property_graph& original, const graph::property_graph& extracted, size_t limit) {
            category_builder category{limit};

            for (const auto& id : node_ids(extracted)) {
                const auto* before = original.find_node(id);
                if (before == nullptr) {
                    continue;
                }
                const auto& expected = before->attributes;
                const auto& actual = extracted.find_node(id)->attributes;
                if (expected == actual) {
                    continue;
                }

                for (const auto& [key, value] : expected) {
                    auto it = actual.find(key);
                    if (it == actual.end()) {
                        category.add_issue("node {}: attribute {} missing"_format(id, key));
                    }
                    else if (it->second != value) {
                        category.add_issue("node {}: attribute {} differs"_format(id, key));
                    }
                }
                for (const auto& [key, value] : actual) {
                    if (!expected.contains(key)) {
                        category.add_issue("node {}: unexpected attribute {}"_format(id, key));
                    }
                }
            }
            return std::move(category).finish();
        }

        static check_result check_udf_identification(
                const graph::property_graph& filtered, const name_set& seeds, size_t limit) {
            category_builder category{limit};

            for (const auto& seed : seeds) {
                if (filtered.find_node(seed) == nullptr) {
                    category.add_issue("missing UDF method: {}"_format(seed));
                }
            }
            for (const auto& id : node_ids(filtered)) {
                const auto& node = *filtered.find_node(id);
                if (node.label() == "METHOD"sv && !seeds.contains(id)) {
                    auto name = node.attribute("NAME"sv);
                    category.add_issue(
                            "non-UDF method in output: {} ({})"_format(id, name.empty() ? "UNKNOWN"sv : name));
                }
            }
            return std::move(category).finish();
        }

        static check_result check_reachability(
                const graph::property_graph& pre_filter,
                const graph::property_graph& filtered,
                const name_set& closure,
                size_t limit) {
            category_builder category{limit};

            name_set expected{};
            for (const auto& id : closure) {
                if (pre_filter.find_node(id) != nullptr) {
                    expected.insert(id);
                }
            }
            auto actual = node_ids(filtered);

            for (const auto& id : expected) {
                if (!actual.contains(id)) {
                    category.add_issue("missing CFG-reachable node: {}"_format(id));
                }
            }
            for (const auto& id : actual) {
                if (!expected.contains(id)) {
                    category.add_issue("node not CFG-reachable from any UDF: {}"_format(id));
                }
            }
            return std::move(category).finish();
        }

        static check_result check_edge_filtering(
                const graph::property_graph& pre_filter,
                const graph::property_graph& filtered,
                const name_set& seeds,
                const name_set& closure,
                size_t limit) {
            category_builder category{limit};
            auto kept = node_ids(filtered);

            // undeclared endpoints never appear as nodes; a reachable one still counts as kept
            auto in_output = [&](const std::string& id) {
                return kept.contains(id) || (pre_filter.find_node(id) == nullptr && closure.contains(id));
            };

            signature_set present{};
            for (const auto& edge : filtered.edges) {
                auto sig = signature_of(edge);
                if (edge.edge_type == "CFG"sv) {
                    if (!in_output(edge.source_id) || !in_output(edge.target_id)) {
                        category.add_issue("CFG edge with an endpoint outside the output: {}"_format(sig));
                    }
                }
                else if (edge.edge_type == "CALL"sv) {
                    if (!in_output(edge.source_id) || !seeds.contains(edge.target_id)) {
                        category.add_issue("CALL edge violating the UDF call rule: {}"_format(sig));
                    }
                }
                else {
                    category.add_issue(
                            "edge of type {} in output: {}"_format(display_type(edge.edge_type), sig));
                }
                present.insert(std::move(sig));
            }

            signature_set source_edges{};
            for (const auto& edge : pre_filter.edges) {
                auto sig = signature_of(edge);
                auto retained = (edge.edge_type == "CFG"sv && closure.contains(edge.source_id) &&
                                 closure.contains(edge.target_id)) ||
                                (edge.edge_type == "CALL"sv && closure.contains(edge.source_id) &&
                                 seeds.contains(edge.target_id));
                if (retained && !present.contains(sig)) {
                    category.add_issue("retained edge missing from output: {}"_format(sig));
                    present.insert(sig);
                }
                source_edges.insert(std::move(sig));
            }
            for (const auto& edge : filtered.edges) {
                auto sig = signature_of(edge);
                if (!source_edges.contains(sig)) {
                    category.add_issue("edge not present in the pre-filter graph: {}"_format(sig));
                }
            }
            return std::move(category).finish();
        }

        static check_result check_node_integrity(
                const graph::property_graph& pre_filter, const graph::property_graph& filtered, size_t limit) {
            category_builder category{limit};

            for (const auto& id : node_ids(filtered)) {
                const auto* before = pre_filter.find_node(id);
                if (before == nullptr) {
                    category.add_issue("node {} not found in the pre-filter graph"_format(id));
                    continue;
                }
                const auto& original = before->raw_text;
                const auto& copied = filtered.find_node(id)->raw_text;
                if (original != copied) {
                    category.add_issue(
                            "node {} raw text differs at offset {} (expected length {}, found {})"_format(
                                    id, first_difference(original, copied), original.size(), copied.size()));
                }
            }
            return std::move(category).finish();
        }

    }  // namespace detail

    verification_report check_extraction(
            std::string_view original_text,
            std::string_view extracted_text,
            const std::vector<std::string>& edge_types,
            const verify_options& options) {
        auto original = graph::parse_graph(original_text);
        auto extracted = graph::parse_graph(extracted_text);
        auto wanted = normalize_edge_types(edge_types);
        auto limit = options.max_issues_per_category;

        verification_report report{};
        report.counts = detail::count_graphs(original, extracted);
        report.categories.emplace(edges_category, detail::compare_edges(original, extracted, wanted, limit));
        report.categories.emplace(nodes_category, detail::compare_nodes(original, extracted, wanted, limit));
        report.categories.emplace(attributes_category, detail::compare_attributes(original, extracted, limit));
        return report;
    }

    verification_report check_udf_filter(
            std::string_view pre_filter_text, std::string_view filtered_text, const verify_options& options) {
        auto pre_filter = graph::parse_graph(pre_filter_text);
        auto filtered = graph::parse_graph(filtered_text);
        auto limit = options.max_issues_per_category;

        auto seeds = detail::expected_seeds(pre_filter);
        auto closure = detail::expected_closure(pre_filter, seeds);
        debug_log("oracle: ", seeds.size(), " UDF seeds, closure of ", closure.size(), " nodes");

        verification_report report{};
        report.counts = detail::count_graphs(pre_filter, filtered);
        report.categories.emplace(
                udf_identification_category, detail::check_udf_identification(filtered, seeds, limit));
        report.categories.emplace(
                cfg_reachability_category, detail::check_reachability(pre_filter, filtered, closure, limit));
        report.categories.emplace(
                edge_filtering_category,
                detail::check_edge_filtering(pre_filter, filtered, seeds, closure, limit));
        report.categories.emplace(
                node_integrity_category, detail::check_node_integrity(pre_filter, filtered, limit));
        return report;
    }

}  // namespace cpgslice::verify
