#pragma once

#include "utils.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cpgslice {

    using namespace std::string_view_literals;

    /*
     * cpgslice Run Config Options
     *
     * Slicing
     * - edge_types: Edge labels kept by the extraction stage, in the order given
     *   (duplicates dropped). Also names the artifacts ("CFG_CALL_original.dot").
     *
     * Artifacts
     * - output_dir: Root directory for the artifacts of a `run` invocation
     *   (subgraphs/, verify/, udf/).
     * - write_reports: Persist verification reports next to the artifacts.
     *
     * Verification
     * - max_issues_per_category: Itemized issues kept per report category before
     *   the remainder is folded into a single "... and N more" line.
     *
     * Output and UX
     * - output: Shape of what is printed to stdout ("table" or "json").
     * - quiet/verbose: Coarse verbosity knobs for progress and diagnostics on stderr.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved config and exit.
     */

    enum class output_mode { table, json };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline std::vector<std::string> default_edge_types() {
        return {"CFG", "CALL"};
    }

    // Drops empty and repeated labels, keeping first occurrence order.
    inline std::vector<std::string> normalize_edge_types(const std::vector<std::string>& types) {
        std::vector<std::string> out{};
        for (const auto& type : types) {
            auto trimmed = utils::trim_ascii(type);
            if (trimmed.empty()) {
                continue;
            }
            if (std::ranges::find(out, trimmed) != out.end()) {
                continue;
            }
            out.emplace_back(trimmed);
        }
        return out;
    }

    // "CFG_CALL" for {"CFG", "CALL"}; used in graph and artifact names.
    inline std::string edge_types_tag(const std::vector<std::string>& types) {
        return utils::join_with_separator(types, "_"sv);
    }

    struct run_config {
        std::vector<std::string> edge_types{default_edge_types()};

        std::filesystem::path output_dir{"cpgslice-out"};
        bool write_reports{true};

        std::size_t max_issues_per_category{50U};

        output_mode output{output_mode::table};
        bool quiet{false};
        bool verbose{false};

        std::optional<std::filesystem::path> config_file{};
        bool print_config{false};
    };

    // Loads a JSON config file onto `cfg`; keys absent from the file keep their
    // current values. Throws std::runtime_error when the file is unreadable,
    // malformed, or declares a newer schema_version.
    void load_config_file(const std::filesystem::path& path, run_config& cfg);

    void print_config(const run_config& cfg, std::ostream& os);

}  // namespace cpgslice
