#pragma once

#include "cpgslice/cpgslice.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cpgslice::cli {

    enum class command_kind { run, extract, filter, verify_extract, verify_udf, schema };

    struct command_request {
        command_kind kind{command_kind::run};
        std::vector<std::filesystem::path> inputs{};
        std::optional<std::filesystem::path> output_path{};
        std::optional<std::filesystem::path> report_path{};
        std::string graph_name{};
    };

    // Returns an exit code when the process should stop after parsing
    // (--help, --version, --print-config, invalid values).
    std::optional<int> parse_cli(int argc, char** argv, run_config& cfg, command_request& request);

    int run_command(const run_config& cfg, const command_request& request);

}  // namespace cpgslice::cli
