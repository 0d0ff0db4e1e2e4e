#pragma once

#include "patchscript/patchscript.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchscript::test::detail {

    inline json_value json(std::string_view text) {
        json_value value{};
        auto ec = glz::read_json(value, text);
        REQUIRE_FALSE(ec);
        return value;
    }

    inline size_t count_occurrences(std::string_view haystack, std::string_view needle) {
        size_t count = 0;
        for (auto pos = haystack.find(needle); pos != std::string_view::npos;
             pos = haystack.find(needle, pos + needle.size())) {
            ++count;
        }
        return count;
    }

    inline size_t position_of(std::string_view haystack, std::string_view needle) {
        auto pos = haystack.find(needle);
        REQUIRE(pos != std::string_view::npos);
        return pos;
    }

    struct captured_warnings {
        std::vector<std::string> messages{};

        warning_sink sink() {
            return [this](std::string_view message) { messages.emplace_back(message); };
        }
    };

}  // namespace patchscript::test::detail
