#include "utils.hpp"

#include <stdexcept>

namespace patchscript::test {
    using namespace std::string_view_literals;

    TEST_CASE("003: nested key path resolves nest chain and accessors", "[003][path]") {
        path_resolver resolver{};
        auto path = resolver.resolve("a.b.c"sv);

        CHECK(path.path() == "a.b.c");
        REQUIRE(path.nest().has_value());
        CHECK(*path.nest() == "a.b");
        CHECK(path.key() == "c");
        CHECK_FALSE(path.has_index());

        REQUIRE(path.nest_chain().size() == 2U);
        CHECK(path.nest_chain()[0].path == "a");
        CHECK(path.nest_chain()[0].container_accessor == "ctx._source");
        CHECK(path.nest_chain()[0].key == "a");
        CHECK(path.nest_chain()[1].path == "a.b");
        CHECK(path.nest_chain()[1].container_accessor == "ctx._source.a");
        CHECK(path.nest_chain()[1].key == "b");

        CHECK(path.nest_accessor() == "ctx._source.a.b");
        CHECK(path.location_accessor() == "ctx._source.a.b.c");
        CHECK(path.full_accessor() == "ctx._source.a.b.c");
        CHECK(path.param_key() == "a_b_c_0");
        CHECK(path.scratch_var() == "removed_a_b_c_0");
    }

    TEST_CASE("003: json pointer with array index", "[003][path]") {
        path_resolver resolver{};
        auto path = resolver.resolve("/tags/0"sv);

        CHECK(path.path() == "tags.0");
        CHECK_FALSE(path.nest().has_value());
        CHECK(path.nest_chain().empty());
        CHECK(path.key() == "tags");
        REQUIRE(path.has_index());
        CHECK(*path.index() == "0");
        CHECK(*path.index_token() == "0");
        CHECK(path.nest_accessor() == "ctx._source");
        CHECK(path.location_accessor() == "ctx._source.tags");
        CHECK(path.full_accessor() == "ctx._source.tags[0]");
    }

    TEST_CASE("003: append and from-end indexes", "[003][path]") {
        path_resolver resolver{};

        auto append = resolver.resolve("item.links.-"sv);
        REQUIRE(append.has_index());
        CHECK(*append.index() == "ctx._source.item.links.size()");
        CHECK(*append.index_token() == "-");
        CHECK(append.full_accessor() == "ctx._source.item.links[ctx._source.item.links.size()]");

        auto last = resolver.resolve("links.-1"sv);
        REQUIRE(last.has_index());
        CHECK(*last.index() == "ctx._source.links.size() - 1");

        auto padded = resolver.resolve("links.007"sv);
        REQUIRE(padded.has_index());
        CHECK(*padded.index() == "7");
    }

    TEST_CASE("003: non-identifier segments use bracket access", "[003][path]") {
        path_resolver resolver{};

        auto bands = resolver.resolve("properties.eo:bands"sv);
        CHECK(bands.location_accessor() == "ctx._source.properties['eo:bands']");
        CHECK(bands.param_key() == "properties_eo_bands_0");

        auto quoted = resolver.resolve("it's"sv);
        CHECK(quoted.location_accessor() == R"(ctx._source['it\'s'])");

        auto numeric_parent = resolver.resolve("0.name"sv);
        CHECK(numeric_parent.location_accessor() == "ctx._source['0'].name");
        CHECK(numeric_parent.param_key() == "_0_name_2");
    }

    TEST_CASE("003: digit segments below the root step into list elements", "[003][path]") {
        path_resolver resolver{};
        auto path = resolver.resolve("/links/0/href"sv);

        CHECK(path.path() == "links.0.href");
        REQUIRE(path.nest().has_value());
        CHECK(*path.nest() == "links.0");
        CHECK(path.key() == "href");
        CHECK_FALSE(path.has_index());

        REQUIRE(path.nest_chain().size() == 2U);
        CHECK_FALSE(path.nest_chain()[0].index.has_value());
        CHECK(path.nest_chain()[1].path == "links.0");
        CHECK(path.nest_chain()[1].container_accessor == "ctx._source.links");
        REQUIRE(path.nest_chain()[1].index.has_value());
        CHECK(*path.nest_chain()[1].index == "0");

        CHECK(path.nest_accessor() == "ctx._source.links[0]");
        CHECK(path.full_accessor() == "ctx._source.links[0].href");

        auto deep = resolver.resolve("a.12.b.c"sv);
        CHECK(deep.nest_accessor() == "ctx._source.a[12].b");
        CHECK(deep.full_accessor() == "ctx._source.a[12].b.c");

        auto element_list = resolver.resolve("a.0.tags.-"sv);
        CHECK(element_list.full_accessor() == "ctx._source.a[0].tags[ctx._source.a[0].tags.size()]");
    }

    TEST_CASE("003: list positions must fit a painless int", "[003][path]") {
        path_resolver resolver{};

        auto largest = resolver.resolve("a.2147483647"sv);
        REQUIRE(largest.has_index());
        CHECK(*largest.index() == "2147483647");

        CHECK_THROWS_AS(resolver.resolve("a.2147483648"sv), std::invalid_argument);
        CHECK_THROWS_AS(resolver.resolve("a.-2147483648"sv), std::invalid_argument);
        CHECK_THROWS_AS(resolver.resolve("a.99999999999.b"sv), std::invalid_argument);
    }

    TEST_CASE("003: tokens are unique per occurrence and deterministic", "[003][path]") {
        path_resolver first{};
        auto a0 = first.resolve("a"sv);
        auto a1 = first.resolve("a"sv);
        CHECK(a0.param_key() != a1.param_key());
        CHECK(a0.scratch_var() != a1.scratch_var());
        CHECK(first.occurrences() == 2U);

        path_resolver second{};
        CHECK(second.resolve("a"sv).param_key() == a0.param_key());
        CHECK(second.resolve("a"sv).scratch_var() == a1.scratch_var());
    }

    TEST_CASE("003: malformed paths are rejected", "[003][path]") {
        path_resolver resolver{};

        CHECK_THROWS_AS(resolver.resolve(""sv), std::invalid_argument);
        CHECK_THROWS_AS(resolver.resolve("/"sv), std::invalid_argument);
        CHECK_THROWS_AS(resolver.resolve("a..b"sv), std::invalid_argument);
        CHECK_THROWS_AS(resolver.resolve("a."sv), std::invalid_argument);
        CHECK_THROWS_AS(resolver.resolve("0"sv), std::invalid_argument);
        CHECK_THROWS_AS(resolver.resolve("-"sv), std::invalid_argument);
        CHECK_THROWS_AS(resolver.resolve("a.99999999999999999999999"sv), std::invalid_argument);
    }

    TEST_CASE("003: path normalization", "[003][path]") {
        CHECK(normalize_path("/a/b/0"sv) == "a.b.0");
        CHECK(normalize_path("//a"sv) == "a");
        CHECK(normalize_path("a.b"sv) == "a.b");
        CHECK(normalize_path("/"sv).empty());
    }

    TEST_CASE("003: descriptors format as their path", "[003][path]") {
        using namespace patchscript::literals;
        path_resolver resolver{};
        auto path = resolver.resolve("/a/b"sv);
        CHECK("at {}"_format(path) == "at a.b");
    }
}  // namespace patchscript::test
