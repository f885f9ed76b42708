#pragma once

#include "cpgslice/report.hpp"
#include "cpgslice/schema.hpp"
#include "cpgslice/verify.hpp"

#include <glaze/glaze.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace cpgslice::internal {

    inline constexpr int supported_schema_version = 1;

    struct persisted_config {
        int schema_version{supported_schema_version};
        std::vector<std::string> edge_types{};
        std::string output_dir{};
        bool write_reports{true};
        size_t max_issues_per_category{50U};
        std::string output{};
        bool quiet{false};
        bool verbose{false};
    };

    struct run_summary_record {
        std::string input{};
        std::map<std::string, std::string, std::less<>> artifacts{};
        report::report_document extraction{};
        report::report_document udf_filter{};
        bool overall_passed{};
    };

}  // namespace cpgslice::internal

namespace glz {

    template <>
    struct meta<cpgslice::internal::persisted_config> {
        using T = cpgslice::internal::persisted_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "edge_types",
                       &T::edge_types,
                       "output_dir",
                       &T::output_dir,
                       "write_reports",
                       &T::write_reports,
                       "max_issues_per_category",
                       &T::max_issues_per_category,
                       "output",
                       &T::output,
                       "quiet",
                       &T::quiet,
                       "verbose",
                       &T::verbose);
    };

    template <>
    struct meta<cpgslice::verify::check_result> {
        using T = cpgslice::verify::check_result;
        static constexpr auto value = object("passed", &T::passed, "issues", &T::issues);
    };

    template <>
    struct meta<cpgslice::verify::graph_counts> {
        using T = cpgslice::verify::graph_counts;
        static constexpr auto value =
                object("original_nodes",
                       &T::original_nodes,
                       "original_edges",
                       &T::original_edges,
                       "filtered_nodes",
                       &T::filtered_nodes,
                       "filtered_edges",
                       &T::filtered_edges);
    };

    template <>
    struct meta<cpgslice::report::report_document> {
        using T = cpgslice::report::report_document;
        static constexpr auto value =
                object("files",
                       &T::files,
                       "counts",
                       &T::counts,
                       "verification_results",
                       &T::verification_results,
                       "overall_passed",
                       &T::overall_passed);
    };

    template <>
    struct meta<cpgslice::internal::run_summary_record> {
        using T = cpgslice::internal::run_summary_record;
        static constexpr auto value =
                object("input",
                       &T::input,
                       "artifacts",
                       &T::artifacts,
                       "extraction",
                       &T::extraction,
                       "udf_filter",
                       &T::udf_filter,
                       "overall_passed",
                       &T::overall_passed);
    };

    template <>
    struct meta<cpgslice::schema::type_keys> {
        using T = cpgslice::schema::type_keys;
        static constexpr auto value = object("any", &T::any, "all", &T::all);
    };

    template <>
    struct meta<cpgslice::schema::key_views> {
        using T = cpgslice::schema::key_views;
        static constexpr auto value =
                object("intersection",
                       &T::intersection,
                       "union",
                       &T::combined,
                       "non_intersection",
                       &T::non_intersection);
    };

    template <>
    struct meta<cpgslice::schema::type_summary> {
        using T = cpgslice::schema::type_summary;
        static constexpr auto value =
                object("files_present_in",
                       &T::files_present_in,
                       "lenient",
                       &T::lenient,
                       "strict",
                       &T::strict,
                       "by_file",
                       &T::by_file);
    };

    template <>
    struct meta<cpgslice::schema::schema_summary> {
        using T = cpgslice::schema::schema_summary;
        static constexpr auto value =
                object("files",
                       &T::files,
                       "intersectional_types",
                       &T::intersectional_types,
                       "non_intersectional_types",
                       &T::non_intersectional_types,
                       "types",
                       &T::types,
                       "cross_type_lenient",
                       &T::cross_type_lenient,
                       "cross_type_strict",
                       &T::cross_type_strict,
                       "global_property_union",
                       &T::global_property_union);
    };

}  // namespace glz
