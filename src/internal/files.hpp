#pragma once

#include "cpgslice/format.hpp"

#include <glaze/glaze.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace cpgslice::internal {

    namespace fs = std::filesystem;
    using namespace cpgslice::literals;

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw std::runtime_error("failed to open " + path.string());
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw std::runtime_error("failed to read " + path.string());
        }
        return ss.str();
    }

    // Creates missing parent directories.
    inline void write_text_file(std::string_view text, const fs::path& path) {
        if (path.has_parent_path()) {
            std::error_code ec{};
            fs::create_directories(path.parent_path(), ec);
            if (ec) {
                throw std::runtime_error(
                        "failed to create directory {}: {}"_format(path.parent_path().string(), ec.message()));
            }
        }

        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        out << text;
        if (!out) {
            throw std::runtime_error("failed to write {}"_format(path.string()));
        }
    }

    template <typename T>
    std::string to_pretty_json(const T& value) {
        std::string json{};
        auto ec = glz::write<glz::opts{.prettify = true}>(value, json);
        if (ec) {
            throw std::runtime_error("failed to serialize json");
        }
        return json;
    }

    template <typename T>
    void write_json_file(const T& value, const fs::path& path) {
        auto json = to_pretty_json(value);
        json.push_back('\n');
        write_text_file(json, path);
    }

    // Fields missing from the document keep the values already in `value`.
    template <typename T>
    void read_json_file(const fs::path& path, T& value) {
        auto json = read_text_file(path);
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, json);
        if (ec) {
            throw std::runtime_error("failed to parse json file {}"_format(path.string()));
        }
    }

    inline void validate_supported_schema_version(int schema_version, int supported, const fs::path& path) {
        if (schema_version > supported) {
            throw std::runtime_error(
                    "unsupported schema_version in {}: {} > {}"_format(path.string(), schema_version, supported));
        }
    }

}  // namespace cpgslice::internal
