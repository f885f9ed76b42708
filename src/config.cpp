#include "cpgslice/config.hpp"

#include "internal/files.hpp"
#include "internal/types.hpp"

#include <stdexcept>

namespace cpgslice {
    namespace detail {

        static internal::persisted_config make_persisted_config(const run_config& cfg) {
            internal::persisted_config data{};
            data.edge_types = cfg.edge_types;
            data.output_dir = cfg.output_dir.string();
            data.write_reports = cfg.write_reports;
            data.max_issues_per_category = cfg.max_issues_per_category;
            data.output = std::string(to_string(cfg.output));
            data.quiet = cfg.quiet;
            data.verbose = cfg.verbose;
            return data;
        }

        static void apply_persisted_config(const internal::persisted_config& data, run_config& cfg) {
            if (!try_parse_output_mode(data.output, cfg.output)) {
                throw std::runtime_error("invalid output in config file: " + data.output);
            }

            auto edge_types = normalize_edge_types(data.edge_types);
            if (edge_types.empty()) {
                throw std::runtime_error("config file lists no edge_types");
            }
            cfg.edge_types = std::move(edge_types);

            if (data.output_dir.empty()) {
                throw std::runtime_error("config file sets an empty output_dir");
            }
            cfg.output_dir = data.output_dir;
            cfg.write_reports = data.write_reports;
            cfg.max_issues_per_category = data.max_issues_per_category;
            cfg.quiet = data.quiet;
            cfg.verbose = data.verbose;
        }

    }  // namespace detail

    void load_config_file(const std::filesystem::path& path, run_config& cfg) {
        auto data = detail::make_persisted_config(cfg);
        internal::read_json_file(path, data);
        internal::validate_supported_schema_version(data.schema_version, internal::supported_schema_version, path);
        detail::apply_persisted_config(data, cfg);
        debug_log("loaded config from ", path.string());
    }

    void print_config(const run_config& cfg, std::ostream& os) {
        os << "edge_types=" << utils::join_with_separator(cfg.edge_types, ","sv) << '\n';
        os << "output_dir=" << cfg.output_dir.string() << '\n';
        os << "write_reports=" << (cfg.write_reports ? "true" : "false") << '\n';
        os << "max_issues_per_category=" << cfg.max_issues_per_category << '\n';
        os << "output=" << to_string(cfg.output) << '\n';
        os << "quiet=" << (cfg.quiet ? "true" : "false") << '\n';
        os << "verbose=" << (cfg.verbose ? "true" : "false") << '\n';
        os << "config=" << (cfg.config_file ? cfg.config_file->string() : "<none>") << '\n';
    }

}  // namespace cpgslice
