#include "utils.hpp"

namespace patchscript::test {
    using namespace std::string_view_literals;

    TEST_CASE("002: null leaves remove and nested leaves flatten", "[002][merge]") {
        auto operations = merge_to_operations(detail::json(R"({"a": {"b": "one", "c": null}})"));

        REQUIRE(operations.size() == 2U);
        CHECK(operations[0].op == op_kind::add);
        CHECK(operations[0].path == "a.b");
        CHECK_FALSE(operations[0].from.has_value());
        CHECK(write_json_value(operations[0].value) == R"("one")");

        CHECK(operations[1].op == op_kind::remove);
        CHECK(operations[1].path == "a.c");
    }

    TEST_CASE("002: arrays and scalars are added verbatim", "[002][merge]") {
        auto operations = merge_to_operations(
                detail::json(R"({"properties": {"eo": {"cloud": null, "bands": ["b1", "b2"]}}, "title": "t", "draft": false})"));

        REQUIRE(operations.size() == 4U);

        CHECK(operations[0].op == op_kind::add);
        CHECK(operations[0].path == "draft");
        CHECK(write_json_value(operations[0].value) == "false");

        CHECK(operations[1].op == op_kind::add);
        CHECK(operations[1].path == "properties.eo.bands");
        CHECK(write_json_value(operations[1].value) == R"(["b1","b2"])");

        CHECK(operations[2].op == op_kind::remove);
        CHECK(operations[2].path == "properties.eo.cloud");

        CHECK(operations[3].op == op_kind::add);
        CHECK(operations[3].path == "title");
        CHECK(operations[3].display_value() == R"("t")");
    }

    TEST_CASE("002: empty documents produce no operations", "[002][merge]") {
        CHECK(merge_to_operations(detail::json("{}")).empty());
        CHECK(merge_to_operations(detail::json(R"({"a": {}})")).empty());
        CHECK(merge_to_operations(detail::json(R"(["not", "an", "object"])")).empty());
        CHECK(merge_to_operations(json_value{}).empty());
    }

    TEST_CASE("002: input document is left untouched", "[002][merge]") {
        auto document = detail::json(R"({"a": {"b": null}})");
        auto before = write_json_value(document);

        auto operations = merge_to_operations(document);
        REQUIRE(operations.size() == 1U);
        CHECK(operations[0].path == "a.b");
        CHECK(write_json_value(document) == before);
    }

    TEST_CASE("002: operation builders", "[002][operation]") {
        auto move = make_move("x", "y");
        CHECK(move.op == op_kind::move);
        CHECK(move.path == "y");
        REQUIRE(move.from.has_value());
        CHECK(*move.from == "x");

        auto test = make_test("a", detail::json(R"("it's")"));
        CHECK(test.op == op_kind::test);
        CHECK(test.display_value() == R"("it's")");

        op_kind kind = op_kind::add;
        REQUIRE(try_parse_op_kind("copy"sv, kind));
        CHECK(kind == op_kind::copy);
        CHECK_FALSE(try_parse_op_kind("COPY"sv, kind));
        CHECK_FALSE(try_parse_op_kind("merge"sv, kind));
        CHECK(to_string(op_kind::replace) == "replace"sv);
    }
}  // namespace patchscript::test
