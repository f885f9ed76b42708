#pragma once

#include "cpgslice/cpgslice.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/files.hpp"
#include "../src/internal/types.hpp"

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cpgslice::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(const std::string& prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline std::string read_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline void write_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        out << text;
    }

    // A: user method, B: external printf, C: block inside A.
    //   A -> C [CFG], C -> A [CFG], A -> B [CALL]
    inline constexpr std::string_view scenario_graph = R"(digraph cpg {
"A" [label=METHOD IS_EXTERNAL="false" NAME="foo" FULL_NAME="foo" FILENAME="main.c" AST_PARENT_FULL_NAME="main.c:<global>" CODE="int foo() { return 0; }"];
"B" [label=METHOD IS_EXTERNAL="true" NAME="printf" FULL_NAME="printf" FILENAME="<empty>"];
"C" [label=BLOCK CODE="{ }"];
"A" -> "C" [label=CFG];
"C" -> "A" [label=CFG];
"A" -> "B" [label=CALL];
}
)";

    inline std::vector<std::string> edge_texts(const graph::property_graph& g) {
        std::vector<std::string> out{};
        for (const auto& edge : g.edges) {
            out.push_back(edge.raw_text);
        }
        return out;
    }

}  // namespace cpgslice::test::detail
