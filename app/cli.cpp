#include "cli.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cpgslice::cli {

    namespace detail {

        using namespace std::string_view_literals;
        using namespace cpgslice::literals;
        namespace fs = std::filesystem;

        static constexpr size_t missing_ids_preview = 5U;

        static void print_missing_ids(
                std::string_view stage, const std::set<std::string, std::less<>>& ids, bool verbose, std::ostream& err) {
            if (ids.empty()) {
                return;
            }
            err << "warning: " << stage << ": " << ids.size() << " node id(s) without definition:";
            size_t shown = 0U;
            for (const auto& id : ids) {
                if (!verbose && shown == missing_ids_preview) {
                    err << " ...";
                    break;
                }
                err << ' ' << id;
                ++shown;
            }
            err << '\n';
        }

        static void print_diagnostics(
                std::string_view stage, const std::vector<graph::diagnostic>& diagnostics, bool verbose, std::ostream& err) {
            if (diagnostics.empty()) {
                return;
            }
            err << "warning: " << stage << ": " << diagnostics.size() << " parse diagnostic(s)\n";
            if (!verbose) {
                return;
            }
            for (const auto& d : diagnostics) {
                err << "  line {}: {}: {}\n"_format(d.line, d.kind, d.message);
            }
        }

        static void print_report_table(
                std::string_view title, const verify::verification_report& report, bool verbose, std::ostream& os) {
            os << title << ": " << (report.overall_passed() ? "PASSED" : "FAILED") << '\n';
            os << "  nodes {} -> {}, edges {} -> {}\n"_format(
                    report.counts.original_nodes,
                    report.counts.filtered_nodes,
                    report.counts.original_edges,
                    report.counts.filtered_edges);
            for (const auto& [category, result] : report.categories) {
                os << "  {:<20} {}"_format(category, result.passed ? "ok" : "FAIL");
                if (!result.issues.empty()) {
                    os << " (" << result.issues.size() << " issue line(s))";
                }
                os << '\n';
                if (verbose) {
                    for (const auto& issue : result.issues) {
                        os << "    - " << issue << '\n';
                    }
                }
            }
        }

        static void print_report(
                std::string_view title,
                const verify::verification_report& checked,
                const report::report_document& doc,
                const run_config& cfg) {
            if (cfg.output == output_mode::json) {
                std::cout << report::to_json(doc) << '\n';
                return;
            }
            print_report_table(title, checked, cfg.verbose, std::cout);
        }

        static int run_pipeline(const run_config& cfg, const command_request& request) {
            auto outcome = pipeline::run_graph_file(request.inputs.front(), cfg);
            const auto& result = outcome.result;

            if (!cfg.quiet) {
                print_diagnostics("extract", result.extraction.diagnostics, cfg.verbose, std::cerr);
                print_missing_ids("extract", result.extraction.result.missing_node_ids, cfg.verbose, std::cerr);
                print_missing_ids("filter", result.filtering.slice.missing_node_ids, cfg.verbose, std::cerr);
            }

            if (cfg.output == output_mode::json) {
                std::cout << pipeline::to_json(outcome) << '\n';
            }
            else {
                std::cout << "input: " << outcome.input.string() << '\n';
                std::cout << "subgraph: " << outcome.paths.subgraph.string() << '\n';
                std::cout << "filtered: " << outcome.paths.filtered.string() << " ("
                          << result.filtering.slice.seeds.size() << " UDFs of "
                          << result.filtering.slice.method_count << " methods)\n";
                print_report_table("extraction check", result.extraction_report, cfg.verbose, std::cout);
                print_report_table("udf filter check", result.udf_report, cfg.verbose, std::cout);
            }
            return result.passed() ? 0 : 1;
        }

        static int run_extract(const run_config& cfg, const command_request& request) {
            const auto& input = request.inputs.front();
            auto text = pipeline::read_graph_file(input);
            auto out = pipeline::extract_text(text, cfg.edge_types);

            auto path = request.output_path.value_or(pipeline::artifact_paths_for(cfg).subgraph);
            pipeline::write_artifact(out.text, path);

            if (!cfg.quiet) {
                print_diagnostics("extract", out.diagnostics, cfg.verbose, std::cerr);
                print_missing_ids("extract", out.result.missing_node_ids, cfg.verbose, std::cerr);
                std::cerr << "extracted " << out.result.edges.size() << " edges, "
                          << out.result.found_node_count() << " nodes -> " << path.string() << '\n';
            }
            return 0;
        }

        static int run_filter(const run_config& cfg, const command_request& request) {
            const auto& input = request.inputs.front();
            auto text = pipeline::read_graph_file(input);
            auto name = request.graph_name.empty() ? input.stem().string() : request.graph_name;
            auto out = pipeline::filter_text(text, name);

            auto path = request.output_path.value_or(
                    cfg.output_dir / "udf" / "{}_udf_filtered.dot"_format(input.stem().string()));
            pipeline::write_artifact(out.text, path);

            if (!cfg.quiet) {
                print_diagnostics("filter", out.diagnostics, cfg.verbose, std::cerr);
                print_missing_ids("filter", out.slice.missing_node_ids, cfg.verbose, std::cerr);
                std::cerr << "kept " << out.slice.seeds.size() << " UDFs of " << out.slice.method_count
                          << " methods, " << out.slice.kept_node_ids.size() << " nodes, "
                          << out.slice.kept_edges.size() << " edges -> " << path.string() << '\n';
            }
            return 0;
        }

        static int run_verify(const run_config& cfg, const command_request& request) {
            const auto& source = request.inputs[0];
            const auto& produced = request.inputs[1];
            auto source_text = pipeline::read_graph_file(source);
            auto produced_text = pipeline::read_graph_file(produced);

            verify::verify_options options{.max_issues_per_category = cfg.max_issues_per_category};
            verify::verification_report checked{};
            report::report_document doc{};
            if (request.kind == command_kind::verify_extract) {
                checked = verify::check_extraction(source_text, produced_text, cfg.edge_types, options);
                doc = report::make_report_document(
                        checked, {{"original", source.string()}, {"subgraph", produced.string()}});
            }
            else {
                checked = verify::check_udf_filter(source_text, produced_text, options);
                doc = report::make_report_document(
                        checked, {{"pre_filter", source.string()}, {"filtered", produced.string()}});
            }

            if (request.report_path) {
                report::write_report_file(doc, *request.report_path);
            }
            auto title = request.kind == command_kind::verify_extract ? "extraction check"sv : "udf filter check"sv;
            print_report(title, checked, doc, cfg);
            return checked.overall_passed() ? 0 : 1;
        }

        static int run_schema(const run_config& cfg, const command_request& request) {
            std::vector<std::pair<std::string, schema::graph_schema>> graphs{};
            graphs.reserve(request.inputs.size());
            for (const auto& input : request.inputs) {
                auto graph = graph::parse_graph(pipeline::read_graph_file(input));
                auto summary = schema::summarize_graph(graph);
                if (!cfg.quiet && summary.unlabeled_nodes > 0U) {
                    std::cerr << "warning: " << input.string() << ": " << summary.unlabeled_nodes
                              << " node(s) without label\n";
                }
                graphs.emplace_back(input.string(), std::move(summary));
            }

            auto json = schema::to_json(schema::aggregate_schemas(graphs));
            if (request.output_path) {
                json.push_back('\n');
                pipeline::write_artifact(json, *request.output_path);
                return 0;
            }
            std::cout << json << '\n';
            return 0;
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, run_config& cfg, command_request& request) {
        CLI::App app{"cpgslice: slice code property graph exports down to user-defined functions"};
        app.require_subcommand(0, 1);

        bool show_version = false;
        std::string output_arg{std::string{to_string(cfg.output)}};
        std::string config_arg{};
        std::string output_dir_arg{};
        std::vector<std::string> edge_types_arg{};
        size_t max_issues_arg{cfg.max_issues_per_category};
        bool quiet_arg = false;
        bool verbose_arg = false;
        bool no_reports_arg = false;

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--config", config_arg, "JSON config file");
        auto* output_opt = app.add_option("--output", output_arg, "Output mode: table|json");
        auto* edge_types_opt = app.add_option("--edge-types", edge_types_arg, "Edge types to extract (comma separated)")
                                       ->delimiter(',');
        auto* output_dir_opt = app.add_option("--output-dir", output_dir_arg, "Artifact directory");
        auto* max_issues_opt =
                app.add_option("--max-issues", max_issues_arg, "Issues listed per report category (0 = all)");
        auto* no_reports_opt = app.add_flag("--no-reports", no_reports_arg, "Do not write verification reports");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        auto* quiet_opt = app.add_flag("--quiet", quiet_arg, "Suppress non-essential output");
        auto* verbose_opt = app.add_flag("--verbose", verbose_arg, "Enable verbose output");

        std::string input_arg{};
        std::vector<std::string> input_pair{};
        std::vector<std::string> schema_inputs{};
        std::string out_arg{};
        std::string report_arg{};
        std::string name_arg{};

        auto* run_cmd = app.add_subcommand("run", "Extract, filter and verify one graph export");
        run_cmd->add_option("input", input_arg, "Graph export (.dot)")->required();

        auto* extract_cmd = app.add_subcommand("extract", "Keep the edges of the selected types");
        extract_cmd->add_option("input", input_arg, "Graph export (.dot)")->required();
        extract_cmd->add_option("-o,--out", out_arg, "Output file");

        auto* filter_cmd = app.add_subcommand("filter", "Slice a subgraph down to user-defined functions");
        filter_cmd->add_option("input", input_arg, "Extracted subgraph (.dot)")->required();
        filter_cmd->add_option("-o,--out", out_arg, "Output file");
        filter_cmd->add_option("--name", name_arg, "Graph name suffix (default: input file stem)");

        auto* verify_extract_cmd = app.add_subcommand("verify-extract", "Check an extracted subgraph");
        verify_extract_cmd->add_option("files", input_pair, "<original> <subgraph>")->required()->expected(2);
        verify_extract_cmd->add_option("--report", report_arg, "Write the JSON report here");

        auto* verify_udf_cmd = app.add_subcommand("verify-udf", "Check a UDF-filtered subgraph");
        verify_udf_cmd->add_option("files", input_pair, "<pre-filter> <filtered>")->required()->expected(2);
        verify_udf_cmd->add_option("--report", report_arg, "Write the JSON report here");

        auto* schema_cmd = app.add_subcommand("schema", "Summarize node types and attribute keys");
        schema_cmd->add_option("files", schema_inputs, "Graph files")->required();
        schema_cmd->add_option("-o,--out", out_arg, "Output file");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "cpgslice " CPGSLICE_VERSION_STRING "\n";
            return std::optional<int>{0};
        }

        if (quiet_arg && verbose_arg) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (!config_arg.empty()) {
            cfg.config_file = config_arg;
            load_config_file(*cfg.config_file, cfg);
        }

        // flags given on the command line override the config file
        if (output_opt->count() > 0U && !try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{2};
        }
        if (edge_types_opt->count() > 0U) {
            auto types = normalize_edge_types(edge_types_arg);
            if (types.empty()) {
                std::cerr << "invalid --edge-types value: at least one edge type is required\n";
                return std::optional<int>{2};
            }
            cfg.edge_types = std::move(types);
        }
        if (output_dir_opt->count() > 0U) {
            if (output_dir_arg.empty()) {
                std::cerr << "invalid --output-dir value: path must be non-empty\n";
                return std::optional<int>{2};
            }
            cfg.output_dir = output_dir_arg;
        }
        if (max_issues_opt->count() > 0U) {
            cfg.max_issues_per_category = max_issues_arg;
        }
        if (no_reports_opt->count() > 0U) {
            cfg.write_reports = false;
        }
        if (quiet_opt->count() > 0U) {
            cfg.quiet = true;
            cfg.verbose = false;
        }
        if (verbose_opt->count() > 0U) {
            cfg.verbose = true;
            cfg.quiet = false;
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (*run_cmd) {
            request.kind = command_kind::run;
        }
        else if (*extract_cmd) {
            request.kind = command_kind::extract;
        }
        else if (*filter_cmd) {
            request.kind = command_kind::filter;
        }
        else if (*verify_extract_cmd) {
            request.kind = command_kind::verify_extract;
        }
        else if (*verify_udf_cmd) {
            request.kind = command_kind::verify_udf;
        }
        else if (*schema_cmd) {
            request.kind = command_kind::schema;
        }
        else {
            std::cerr << app.help();
            return std::optional<int>{2};
        }

        switch (request.kind) {
            case command_kind::run:
            case command_kind::extract:
            case command_kind::filter:
                request.inputs.emplace_back(input_arg);
                break;
            case command_kind::verify_extract:
            case command_kind::verify_udf:
                request.inputs.assign(input_pair.begin(), input_pair.end());
                break;
            case command_kind::schema:
                request.inputs.assign(schema_inputs.begin(), schema_inputs.end());
                break;
        }
        if (!out_arg.empty()) {
            request.output_path = out_arg;
        }
        if (!report_arg.empty()) {
            request.report_path = report_arg;
        }
        request.graph_name = name_arg;

        return std::nullopt;
    }

    int run_command(const run_config& cfg, const command_request& request) {
        switch (request.kind) {
            case command_kind::run:
                return detail::run_pipeline(cfg, request);
            case command_kind::extract:
                return detail::run_extract(cfg, request);
            case command_kind::filter:
                return detail::run_filter(cfg, request);
            case command_kind::verify_extract:
            case command_kind::verify_udf:
                return detail::run_verify(cfg, request);
            case command_kind::schema:
                return detail::run_schema(cfg, request);
        }
        return 2;
    }

}  // namespace cpgslice::cli
