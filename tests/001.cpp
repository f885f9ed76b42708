#include "utils.hpp"

namespace cpgslice::test {
    using namespace std::string_view_literals;

    TEST_CASE("001: output mode parsing", "[001][config]") {
        output_mode mode = output_mode::table;

        REQUIRE(try_parse_output_mode("JSON"sv, mode));
        CHECK(mode == output_mode::json);
        REQUIRE(try_parse_output_mode("table"sv, mode));
        CHECK(mode == output_mode::table);
        CHECK_FALSE(try_parse_output_mode("yaml"sv, mode));
        CHECK(mode == output_mode::table);

        CHECK(to_string(output_mode::table) == "table"sv);
        CHECK(to_string(output_mode::json) == "json"sv);
    }

    TEST_CASE("001: edge type normalization keeps first occurrence order", "[001][config]") {
        CHECK(normalize_edge_types({"CALL", " CFG ", "", "CALL", "AST"}) ==
              std::vector<std::string>{"CALL", "CFG", "AST"});
        CHECK(normalize_edge_types({" ", ""}).empty());

        CHECK(edge_types_tag(default_edge_types()) == "CFG_CALL");
        CHECK(edge_types_tag({"CDG"}) == "CDG");
    }

    TEST_CASE("001: run config defaults", "[001][config]") {
        run_config cfg{};
        CHECK(cfg.edge_types == std::vector<std::string>{"CFG", "CALL"});
        CHECK(cfg.output_dir == std::filesystem::path{"cpgslice-out"});
        CHECK(cfg.write_reports);
        CHECK(cfg.max_issues_per_category == 50U);
        CHECK(cfg.output == output_mode::table);
        CHECK_FALSE(cfg.quiet);
        CHECK_FALSE(cfg.verbose);
        CHECK_FALSE(cfg.config_file.has_value());
    }

    TEST_CASE("001: config file overrides only the keys it names", "[001][config]") {
        detail::temp_dir dir{"cpgslice_001_config"};
        auto path = dir.path / "cpgslice.json";
        detail::write_file(path, R"({"edge_types": ["CALL", "CFG", "CALL"], "output": "json", "extra": 1})");

        run_config cfg{};
        cfg.output_dir = "custom-out";
        load_config_file(path, cfg);

        CHECK(cfg.edge_types == std::vector<std::string>{"CALL", "CFG"});
        CHECK(cfg.output == output_mode::json);
        CHECK(cfg.output_dir == std::filesystem::path{"custom-out"});
        CHECK(cfg.max_issues_per_category == 50U);
    }

    TEST_CASE("001: config file errors are fatal", "[001][config]") {
        detail::temp_dir dir{"cpgslice_001_errors"};
        run_config cfg{};

        CHECK_THROWS_AS(load_config_file(dir.path / "missing.json", cfg), std::runtime_error);

        auto newer = dir.path / "newer.json";
        detail::write_file(newer, R"({"schema_version": 2})");
        CHECK_THROWS_AS(load_config_file(newer, cfg), std::runtime_error);

        auto bad_output = dir.path / "bad_output.json";
        detail::write_file(bad_output, R"({"output": "yaml"})");
        CHECK_THROWS_AS(load_config_file(bad_output, cfg), std::runtime_error);

        auto no_types = dir.path / "no_types.json";
        detail::write_file(no_types, R"({"edge_types": []})");
        CHECK_THROWS_AS(load_config_file(no_types, cfg), std::runtime_error);

        auto garbage = dir.path / "garbage.json";
        detail::write_file(garbage, "{not json");
        CHECK_THROWS_AS(load_config_file(garbage, cfg), std::runtime_error);

        CHECK(cfg.output == output_mode::table);
        CHECK(cfg.edge_types == default_edge_types());
    }

    TEST_CASE("001: print_config lists resolved values", "[001][config]") {
        run_config cfg{};
        cfg.edge_types = {"CFG"};
        cfg.max_issues_per_category = 0U;

        std::ostringstream os{};
        print_config(cfg, os);
        auto text = os.str();

        CHECK(text.find("edge_types=CFG\n") != std::string::npos);
        CHECK(text.find("output_dir=cpgslice-out\n") != std::string::npos);
        CHECK(text.find("max_issues_per_category=0\n") != std::string::npos);
        CHECK(text.find("output=table\n") != std::string::npos);
        CHECK(text.find("config=<none>\n") != std::string::npos);
    }

}  // namespace cpgslice::test
