#include "utils.hpp"

namespace cpgslice::test {
    using namespace std::string_view_literals;

    namespace detail {
        inline graph::attribute_map user_method() {
            return graph::attribute_map{
                    {"label", "METHOD"},
                    {"IS_EXTERNAL", "false"},
                    {"NAME", "parse"},
                    {"FULL_NAME", "parse"},
                    {"FILENAME", "src/parse.c"},
                    {"AST_PARENT_FULL_NAME", "src/parse.c:<global>"}};
        }
    }  // namespace detail

    TEST_CASE("006: a user method is a UDF", "[006][udf]") {
        CHECK(udf::is_udf(detail::user_method()));

        auto no_external = detail::user_method();
        no_external.erase("IS_EXTERNAL");
        CHECK(udf::is_udf(no_external));
    }

    TEST_CASE("006: only METHOD nodes qualify", "[006][udf]") {
        auto attrs = detail::user_method();
        attrs["label"] = "BLOCK";
        CHECK_FALSE(udf::is_udf(attrs));

        attrs["label"] = "method";
        CHECK_FALSE(udf::is_udf(attrs));

        attrs.erase("label");
        CHECK_FALSE(udf::is_udf(attrs));
    }

    TEST_CASE("006: external methods are rejected in any case", "[006][udf]") {
        for (auto value : {"true"sv, "TRUE"sv, "True"sv}) {
            auto attrs = detail::user_method();
            attrs["IS_EXTERNAL"] = std::string{value};
            CHECK_FALSE(udf::is_udf(attrs));
        }

        auto attrs = detail::user_method();
        attrs["IS_EXTERNAL"] = "yes";
        CHECK(udf::is_udf(attrs));
    }

    TEST_CASE("006: operators and synthetic methods are rejected", "[006][udf]") {
        auto op_name = detail::user_method();
        op_name["NAME"] = "<operator>.assignment";
        CHECK_FALSE(udf::is_udf(op_name));

        auto op_full = detail::user_method();
        op_full["FULL_NAME"] = "<operator>.addition";
        CHECK_FALSE(udf::is_udf(op_full));

        auto embedded = detail::user_method();
        embedded["NAME"] = "not<operator>";
        CHECK(udf::is_udf(embedded));

        for (auto name : {"<clinit>"sv, "<global>"sv}) {
            auto attrs = detail::user_method();
            attrs["NAME"] = std::string{name};
            CHECK_FALSE(udf::is_udf(attrs));
        }
    }

    TEST_CASE("006: filename and parent rules", "[006][udf]") {
        for (auto filename : {""sv, "<includes>"sv, "<empty>"sv}) {
            auto attrs = detail::user_method();
            attrs["FILENAME"] = std::string{filename};
            CHECK_FALSE(udf::is_udf(attrs));
        }

        auto no_filename = detail::user_method();
        no_filename.erase("FILENAME");
        CHECK_FALSE(udf::is_udf(no_filename));

        auto included = detail::user_method();
        included["AST_PARENT_FULL_NAME"] = "/usr/include/stdio.h:<includes>:<global>";
        CHECK_FALSE(udf::is_udf(included));

        auto no_parent = detail::user_method();
        no_parent.erase("AST_PARENT_FULL_NAME");
        CHECK(udf::is_udf(no_parent));
    }

    TEST_CASE("006: seeds are the UDF nodes of a graph", "[006][udf]") {
        auto g = graph::parse_graph(detail::scenario_graph);
        CHECK(udf::find_udf_seeds(g) == udf::id_set{"A"});
    }

}  // namespace cpgslice::test
